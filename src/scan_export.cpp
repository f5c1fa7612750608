#include "scan_export.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

namespace claimscan::anomaly {

namespace {

// Entity ids are opaque; quote them when they could break the row.
auto CsvField(const std::string& value) -> std::string {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

auto JoinFlagKinds(const ScanResult& result, const std::string& separator) -> std::string {
    std::string joined;
    for (auto kind : result.DistinctKinds()) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += FlagKindName(kind);
    }
    return joined;
}

auto WriteScanResultsCsv(std::ostream& out, const std::vector<ScanResult>& results) -> void {
    out << "rank,entity_id,score,num_flags,flag_kinds\n";
    size_t rank = 1;
    for (const auto& r : results) {
        out << fmt::format("{},{},{:.3f},{},{}\n",
                           rank++, CsvField(r.entity_id), r.overall_score, r.flags.size(),
                           JoinFlagKinds(r, ";"));
    }
}

auto WriteScanResultsCsvFile(const std::string& path, const std::vector<ScanResult>& results) -> void {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    std::ofstream out(p);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output path: " + path);
    }
    WriteScanResultsCsv(out, results);
    if (!out) {
        throw std::runtime_error("Failed writing scan results to " + path);
    }
}

} // namespace claimscan::anomaly
