#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <boost/json.hpp>

#include "digest_algorithm.hpp"
#include "encoding.hpp"
#include "generator_config.hpp"
#include "seeder.hpp"

namespace obscure {

// Requested output length; empty means one digest round at its natural size.
using Length = std::optional<long long>;

/**
 * Turns seeds into obscure identifiers.
 * Each round hashes one fresh seed and encodes the digest; when a length is
 * requested, rounds are concatenated until there is enough material and the
 * result is cut to exactly that many characters (bytes for binary).
 * Truncated hex may have odd length and truncated base64 may be badly
 * padded; neither is an error.
 *
 * Safe to share between threads: the digest is selected once in the
 * constructor and the default seeder is internally synchronized.
 */
class TokenGenerator {
public:
    /**
     * Selects the digest and installs the seed source.
     * @param config Digest preferences and defaults.
     * @param seeder Seed source; a DefaultSeeder when null.
     * @throws DigestUnavailableError when no preferred digest can be fetched.
     */
    explicit TokenGenerator(const GeneratorConfig& config = {},
                            std::shared_ptr<SeedSource> seeder = nullptr);

    TokenGenerator(const TokenGenerator&) = delete;
    TokenGenerator& operator=(const TokenGenerator&) = delete;

    // @throws std::invalid_argument if `length` holds a value <= 0, or one too
    //         large for a std::string plus one extra round.
    std::string generate(Encoding encoding, Length length = std::nullopt);

    /**
     * Loose-options form: `{}` gives a natural-size result, `{"length": N}`
     * behaves like generate(encoding, N). Other keys next to `length` are
     * ignored.
     * @throws std::invalid_argument for a non-empty object without `length`
     *         or a non-integer length.
     */
    std::string generate_from_options(Encoding encoding, const boost::json::object& options);

    // Uses the configured default encoding.
    std::string create(Length length = std::nullopt) { return generate(config_.default_encoding, length); }

    std::string hex(Length length = std::nullopt) { return generate(Encoding::Hexadecimal, length); }
    std::string binary(Length length = std::nullopt) { return generate(Encoding::Binary, length); }
    std::string base64(Length length = std::nullopt) { return generate(Encoding::Base64, length); }

    const std::string& algorithm_name() const { return digest_.name(); }
    std::size_t digest_size() const { return digest_.size(); }

    // Characters (or bytes) produced by a single round.
    std::size_t chunk_size(Encoding encoding) const { return encoded_size(encoding, digest_.size()); }

    const GeneratorConfig& config() const { return config_; }

private:
    std::string generate_round(Encoding encoding);
    std::string generate_to_length(Encoding encoding, long long length);

    GeneratorConfig config_;
    DigestAlgorithm digest_;
    std::shared_ptr<SeedSource> seeder_;
};

}
