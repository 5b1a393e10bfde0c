#pragma once

#include <string>
#include <vector>

#include "encoding.hpp"

namespace obscure {

// Construction-time settings for a TokenGenerator.
struct GeneratorConfig {
    // --- Digest selection ---
    // Tried in order; the first digest the crypto provider can fetch wins.
    std::vector<std::string> digest_preferences = {"SHA-1", "SHA-256", "MD5"};

    // --- Output ---
    Encoding default_encoding = Encoding::Hexadecimal; // used by TokenGenerator::create()

    // --- Logging ---
    bool log_selection = false; // INFO line on stdout naming the selected digest
};

}
