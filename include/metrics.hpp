#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace obscure {

/**
 * Process-wide counters and gauges for the generator.
 * A metric is a family of series told apart by labels
 * (e.g. obscure_tokens_generated{encoding="hex"}); reads by name alone sum
 * every series of the family. Exported in Prometheus text format.
 */
class MetricsRegistry {
public:
    using Labels = std::map<std::string, std::string>;

    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Attaches a # HELP line to a counter or gauge family.
    void describe(const std::string& name, const std::string& help) {
        std::lock_guard<std::mutex> lock(mutex_);
        help_[name] = help;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        increment_counter(name, Labels{}, value);
    }

    void increment_counter(const std::string& name, const Labels& labels, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name][render_labels(labels)] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return sum(counters_, name);
    }

    double get_counter(const std::string& name, const Labels& labels) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(counters_, name, render_labels(labels));
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] = value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(gauges_, name, "");
    }

    // Drops every recorded value; HELP descriptions are kept.
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
        write_families(ss, counters_, "counter");
        write_families(ss, gauges_, "gauge");
        return ss.str();
    }

    // Renders {k="v",...} with Prometheus escaping; empty labels render as "".
    static std::string render_labels(const Labels& labels) {
        if (labels.empty()) return "";
        std::string out = "{";
        bool first = true;
        for (const auto& [key, value] : labels) {
            if (!first) out += ",";
            first = false;
            out += key + "=\"";
            for (char c : value) {
                if (c == '\\') out += "\\\\";
                else if (c == '"') out += "\\\"";
                else if (c == '\n') out += "\\n";
                else out += c;
            }
            out += "\"";
        }
        out += "}";
        return out;
    }

private:
    // family name -> rendered label set -> value
    using Families = std::map<std::string, std::map<std::string, double>>;

    MetricsRegistry() = default;

    static double sum(const Families& families, const std::string& name) {
        auto it = families.find(name);
        if (it == families.end()) return 0.0;
        double total = 0.0;
        for (const auto& [labels, val] : it->second) total += val;
        return total;
    }

    static double lookup(const Families& families, const std::string& name, const std::string& labels) {
        auto it = families.find(name);
        if (it == families.end()) return 0.0;
        auto series = it->second.find(labels);
        return (series != it->second.end()) ? series->second : 0.0;
    }

    void write_families(std::stringstream& ss, const Families& families, const char* type) const {
        for (const auto& [name, series] : families) {
            auto help = help_.find(name);
            if (help != help_.end()) {
                ss << "# HELP " << name << " " << help->second << "\n";
            }
            ss << "# TYPE " << name << " " << type << "\n";
            for (const auto& [labels, val] : series) {
                ss << name << labels << " " << val << "\n";
            }
        }
    }

    Families counters_;
    Families gauges_;
    std::map<std::string, std::string> help_;
    std::mutex mutex_;
};

}
