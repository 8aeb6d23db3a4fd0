#pragma once

#include <string>
#include <map>
#include <set>
#include <mutex>
#include <sstream>

namespace powgate {


// Singleton Metrics Registry for operational visibility.
// Provides thread-safe counters and gauges that can be exported in Prometheus format.
// Names may carry a label set, e.g. powgate_verifications_total{result="expired"};
// series sharing a base name are grouped under one TYPE line.
class MetricsRegistry {
public:
    /**
     * Access the global instance of the metrics registry.
     */
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Increment a cumulative counter (Only increases).
    void increment_counter(const std::string& name, double value = 1.0) {
        if (value < 0) return;
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    // Sets a gauge to a specific instantaneous value.
    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    // Adjusts a gauge by a specific offset.
    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] -= value;
    }

    // Retrieves current value of a gauge.
    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        write_family(ss, counters_, "counter");
        write_family(ss, gauges_, "gauge");

        return ss.str();
    }

private:
    MetricsRegistry() = default;

    static std::string base_name(const std::string& name) {
        return name.substr(0, name.find('{'));
    }

    static void write_family(std::stringstream& ss, const std::map<std::string, double>& series, const char* type) {
        std::set<std::string> typed;
        for (const auto& [name, val] : series) {
            std::string base = base_name(name);
            if (typed.insert(base).second) {
                ss << "# TYPE " << base << " " << type << "\n";
            }
            ss << name << " " << val << "\n";
        }
    }

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_; // Ensures consistency across high-concurrency threads
};

}
