#pragma once

#include <map>
#include <mutex>
#include <string>

namespace claimscan::metrics {

class MetricsRegistry {
public:
    static MetricsRegistry& Instance() {
        static MetricsRegistry instance;
        return instance;
    }

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    // Counters with labels
    void Increment(const std::string& name, const std::map<std::string, std::string>& labels, long value = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[SerializeKey(name, labels)] += value;
    }

    void SetGauge(const std::string& name, const std::map<std::string, std::string>& labels, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[SerializeKey(name, labels)] = value;
    }

    // Histograms
    void RecordLatency(const std::string& name, const std::map<std::string, std::string>& labels, double ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& h = histograms_[SerializeKey(name, labels)];
        h.count++;
        h.sum += ms;
        if (ms < h.min) h.min = ms;
        if (ms > h.max) h.max = ms;
    }

    struct HistogramStats {
        long count = 0;
        double sum = 0.0;
        double min = 1e9;
        double max = 0.0;
    };

    long CounterValue(const std::string& name, const std::map<std::string, std::string>& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(SerializeKey(name, labels));
        return it == counters_.end() ? 0 : it->second;
    }

    // To Prometheus text format
    std::string ToPrometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (const auto& kv : counters_) {
            out += kv.first + " " + std::to_string(kv.second) + "\n";
        }
        for (const auto& kv : gauges_) {
            out += kv.first + " " + std::to_string(kv.second) + "\n";
        }
        for (const auto& kv : histograms_) {
            out += SuffixKey(kv.first, "_count") + " " + std::to_string(kv.second.count) + "\n";
            out += SuffixKey(kv.first, "_sum") + " " + std::to_string(kv.second.sum) + "\n";
        }
        return out;
    }

private:
    MetricsRegistry() = default;
    std::mutex mutex_;
    std::map<std::string, long> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, HistogramStats> histograms_;

    static std::string SerializeKey(const std::string& name, const std::map<std::string, std::string>& labels) {
        if (labels.empty()) return name;
        std::string key = name + "{";
        bool first = true;
        for (const auto& lp : labels) {
            if (!first) key += ",";
            key += lp.first + "=\"" + lp.second + "\"";
            first = false;
        }
        key += "}";
        return key;
    }

    // Inserts the suffix before the label block: name{a="b"} -> name_sum{a="b"}
    static std::string SuffixKey(const std::string& key, const std::string& suffix) {
        auto brace = key.find('{');
        if (brace == std::string::npos) return key + suffix;
        return key.substr(0, brace) + suffix + key.substr(brace);
    }
};

} // namespace claimscan::metrics
