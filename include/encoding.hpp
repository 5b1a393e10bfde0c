#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace obscure {

// Output encodings for a digest round.
enum class Encoding {
    Binary,
    Hexadecimal,
    Base64
};

// Short name used by the tool and in log lines ("bin", "hex", "b64").
std::string encoding_name(Encoding encoding);

// Accepts the short names as well as "binary", "hexadecimal" and "base64".
std::optional<Encoding> parse_encoding(std::string_view name);

// Lowercase hex, two characters per byte.
std::string to_hex(const std::string& bytes);

/**
 * Standard-alphabet base64.
 * @param bytes Raw input.
 * @param pad When false the trailing '=' characters are dropped, matching
 *            the unpadded form digest libraries return for b64 digests.
 */
std::string to_base64(const std::string& bytes, bool pad = false);

// Encodes one raw digest according to the requested encoding.
std::string encode(Encoding encoding, const std::string& raw);

// Number of characters encode() produces for an input of raw_size bytes.
std::size_t encoded_size(Encoding encoding, std::size_t raw_size);

}
