#pragma once

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace obscure {

// Validation of command-line values before they reach the generator.
class InputValidator {
public:
    /**
     * Parses a whole string as a base-10 integer.
     * Leading whitespace, trailing characters ("12abc") and out-of-range
     * values are rejected.
     * @return true and sets `out` on success; `out` is untouched otherwise.
     */
    static bool parse_integer(const std::string& text, long long& out) {
        if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) return false;

        size_t pos = 0;
        long long value = 0;
        try {
            value = std::stoll(text, &pos, 10);
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::out_of_range&) {
            return false;
        }

        if (pos != text.size()) return false;
        out = value;
        return true;
    }

    // Splits "a,b,c" into its non-empty items.
    static std::vector<std::string> split_list(std::string list) {
        std::vector<std::string> out;
        size_t pos = 0;
        while ((pos = list.find(',')) != std::string::npos) {
            if (pos > 0) out.push_back(list.substr(0, pos));
            list.erase(0, pos + 1);
        }
        if (!list.empty()) {
            out.push_back(list);
        }
        return out;
    }
};

}
