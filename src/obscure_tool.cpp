#include <boost/json.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "generator_config.hpp"
#include "input_validator.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include "token_generator.hpp"

namespace json = boost::json;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "Options:\n"
              << "  --encoding=E, -e E   hex (default), bin or b64\n"
              << "  --length=N, -l N     Exact output length (characters, bytes for bin)\n"
              << "  --count=N, -c N      Number of values to print (default 1)\n"
              << "  --digest=A[,B...]    Digest preference list (default SHA-1,SHA-256,MD5)\n"
              << "  --json               Print one JSON object per value\n"
              << "  --metrics            Print counters to stderr when done\n"
              << "  --verbose, -v        Log the digest selection (to stdout)\n"
              << "  --quiet, -q          Only log errors\n"
              << "  --help, -h           Show this help\n";
}

// Returns the value of "--name=value", or of "-x value" by consuming the next argument.
bool take_value(int argc, char* argv[], int& i, const std::string& long_name,
                const std::string& short_name, std::string& value) {
    std::string arg = argv[i];
    std::string prefix = long_name + "=";
    if (arg.rfind(prefix, 0) == 0) {
        value = arg.substr(prefix.size());
        return true;
    }
    if (!short_name.empty() && arg == short_name && i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    return false;
}

}

int main(int argc, char* argv[]) {
    using obscure::Logger;
    try {
        obscure::GeneratorConfig config;
        obscure::Length length;
        long long count = 1;
        bool as_json = false;
        bool show_metrics = false;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string value;
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--json") {
                as_json = true;
            } else if (arg == "--metrics") {
                show_metrics = true;
            } else if (arg == "--verbose" || arg == "-v") {
                config.log_selection = true;
            } else if (arg == "--quiet" || arg == "-q") {
                Logger::set_min_level(Logger::Level::ERROR);
            } else if (take_value(argc, argv, i, "--encoding", "-e", value)) {
                auto encoding = obscure::parse_encoding(value);
                if (!encoding) {
                    std::cerr << "Unknown encoding '" << value << "'\n";
                    return 2;
                }
                config.default_encoding = *encoding;
            } else if (take_value(argc, argv, i, "--length", "-l", value)) {
                long long parsed = 0;
                if (!obscure::InputValidator::parse_integer(value, parsed)) {
                    std::cerr << "Invalid length '" << value << "'\n";
                    return 2;
                }
                length = parsed;
            } else if (take_value(argc, argv, i, "--count", "-c", value)) {
                if (!obscure::InputValidator::parse_integer(value, count)) {
                    std::cerr << "Invalid count '" << value << "'\n";
                    return 2;
                }
            } else if (take_value(argc, argv, i, "--digest", "", value)) {
                config.digest_preferences = obscure::InputValidator::split_list(value);
            } else {
                std::cerr << "Unknown option '" << arg << "'\n";
                print_usage(argv[0]);
                return 2;
            }
        }

        if (count < 1) {
            std::cerr << "Count must be at least 1\n";
            return 2;
        }

        if (config.log_selection) {
            Logger::log(Logger::Level::INFO, Logger::Event::CONFIG,
                        "encoding=" + obscure::encoding_name(config.default_encoding) +
                        " length=" + (length ? std::to_string(*length) : std::string("natural")) +
                        " count=" + std::to_string(count));
        }

        obscure::TokenGenerator generator(config);

        for (long long n = 0; n < count; ++n) {
            std::string token;
            try {
                token = generator.create(length);
            } catch (const std::invalid_argument& e) {
                std::cerr << "[!] " << e.what() << "\n";
                return 2;
            }

            if (as_json) {
                json::object out;
                out["algorithm"] = generator.algorithm_name();
                out["encoding"] = obscure::encoding_name(config.default_encoding);
                out["length"] = static_cast<std::int64_t>(token.size());
                // Raw bytes are not valid JSON string content.
                if (config.default_encoding == obscure::Encoding::Binary) {
                    out["value_hex"] = obscure::to_hex(token);
                } else {
                    out["value"] = token;
                }
                std::cout << json::serialize(out) << "\n";
            } else if (config.default_encoding == obscure::Encoding::Binary) {
                std::cout.write(token.data(), static_cast<std::streamsize>(token.size()));
            } else {
                std::cout << token << "\n";
            }
        }

        if (show_metrics) {
            std::cerr << obscure::MetricsRegistry::instance().collect_prometheus();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
