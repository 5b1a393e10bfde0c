#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace obscure {

// Levelled event log. Generated identifiers must never be passed in here.
class Logger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class Event {
        DIGEST_SELECTED,
        DIGEST_UNAVAILABLE,
        DIGEST_FAILURE,
        INVALID_ARGUMENT,
        CONFIG
    };

    /**
     * Records an event.
     * @param level Severity; ERROR and CRITICAL go to stderr, the rest to stdout.
     * @param event Category of the event.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, Event event, const std::string& message = "") {
        if (static_cast<int>(level) < static_cast<int>(min_level_ref().load())) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "]";

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Events below this level are dropped.
    static void set_min_level(Level level) {
        min_level_ref().store(level);
    }

    static Level min_level() {
        return min_level_ref().load();
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(Event event) {
        switch (event) {
            case Event::DIGEST_SELECTED: return "DIGEST_SELECTED";
            case Event::DIGEST_UNAVAILABLE: return "DIGEST_UNAVAILABLE";
            case Event::DIGEST_FAILURE: return "DIGEST_FAILURE";
            case Event::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case Event::CONFIG: return "CONFIG";
            default: return "UNKNOWN_EVENT";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::atomic<Level>& min_level_ref() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }
};

}
