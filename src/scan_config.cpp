#include "scan_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace claimscan {
namespace anomaly {

namespace {

template <typename T>
void ReadField(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) {
        return;
    }
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("Config field '") + key + "' has wrong type: " + e.what());
    }
}

template <typename T, typename Parse>
void ReadEnv(const char* name, T& out, Parse parse) {
    const char* raw = std::getenv(name);
    if (!raw || std::string(raw).empty()) {
        return;
    }
    try {
        out = parse(raw);
        spdlog::info("Config override {}={}", name, raw);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid value for ") + name + ": " + raw);
    }
}

} // namespace

auto ParseScanConfig(const std::string& json_text) -> ScanConfig {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::invalid_argument("Config root must be a JSON object");
    }

    ScanConfig config;
    ReadField(j, "volume_ceiling", config.volume_ceiling);
    ReadField(j, "revenue_z_threshold", config.revenue_z_threshold);
    ReadField(j, "spike_multiplier", config.spike_multiplier);
    ReadField(j, "spike_min_months", config.spike_min_months);
    ReadField(j, "consistency_ratio", config.consistency_ratio);
    ReadField(j, "consistency_min_rows", config.consistency_min_rows);
    ReadField(j, "min_total_paid", config.min_total_paid);
    ReadField(j, "parallel_detectors", config.parallel_detectors);
    return config;
}

auto LoadScanConfig(const std::string& path) -> ScanConfig {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::invalid_argument("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return ParseScanConfig(buffer.str());
}

auto ApplyEnvOverrides(ScanConfig& config) -> void {
    auto to_ll = [](const char* s) { return std::stoll(s); };
    auto to_d = [](const char* s) { return std::stod(s); };
    ReadEnv("CLAIMSCAN_VOLUME_CEILING", config.volume_ceiling, to_ll);
    ReadEnv("CLAIMSCAN_REVENUE_Z_THRESHOLD", config.revenue_z_threshold, to_d);
    ReadEnv("CLAIMSCAN_SPIKE_MULTIPLIER", config.spike_multiplier, to_d);
    ReadEnv("CLAIMSCAN_SPIKE_MIN_MONTHS", config.spike_min_months, [](const char* s) { return std::stoi(s); });
    ReadEnv("CLAIMSCAN_CONSISTENCY_RATIO", config.consistency_ratio, to_d);
    ReadEnv("CLAIMSCAN_CONSISTENCY_MIN_ROWS", config.consistency_min_rows, to_ll);
    ReadEnv("CLAIMSCAN_MIN_TOTAL_PAID", config.min_total_paid, to_d);
}

auto ValidateScanConfig(const ScanConfig& config) -> void {
    if (config.volume_ceiling <= 0) {
        throw std::invalid_argument("volume_ceiling must be positive");
    }
    if (!(config.revenue_z_threshold >= 0.0)) {
        throw std::invalid_argument("revenue_z_threshold must be non-negative");
    }
    if (!(config.spike_multiplier > 0.0)) {
        throw std::invalid_argument("spike_multiplier must be positive");
    }
    if (config.spike_min_months < 3) {
        throw std::invalid_argument("spike_min_months must be at least 3");
    }
    if (!(config.consistency_ratio > 0.0 && config.consistency_ratio <= 1.0)) {
        throw std::invalid_argument("consistency_ratio must be in (0, 1]");
    }
    if (config.consistency_min_rows <= 0) {
        throw std::invalid_argument("consistency_min_rows must be positive");
    }
    if (!(config.min_total_paid >= 0.0)) {
        throw std::invalid_argument("min_total_paid must be non-negative");
    }
}

} // namespace anomaly
} // namespace claimscan
