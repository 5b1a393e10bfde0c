#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace obscure {

// None of the preferred digests could be instantiated by the crypto provider.
// Retrying without changing the environment fails the same way.
class DigestUnavailableError : public std::runtime_error {
public:
    explicit DigestUnavailableError(const std::string& what)
        : std::runtime_error(what) {}
};

// A fetched OpenSSL message digest, chosen once and reused for every round.
class DigestAlgorithm {
public:
    /**
     * Fetches the first digest in `preferences` the provider can instantiate.
     * @param preferences Algorithm names in priority order (e.g. "SHA-1").
     * @throws DigestUnavailableError when none of them is available.
     */
    static DigestAlgorithm select(const std::vector<std::string>& preferences);

    DigestAlgorithm(DigestAlgorithm&&) noexcept = default;
    DigestAlgorithm& operator=(DigestAlgorithm&&) noexcept = default;

    DigestAlgorithm(const DigestAlgorithm&) = delete;
    DigestAlgorithm& operator=(const DigestAlgorithm&) = delete;

    // Name as it appeared in the preference list.
    const std::string& name() const { return name_; }

    // Native output size in bytes (20 for SHA-1).
    std::size_t size() const { return size_; }

    // Hashes `data` in a fresh context and returns the raw digest bytes.
    std::string digest(const std::string& data) const;

private:
    struct MdDeleter {
        void operator()(EVP_MD* md) const { EVP_MD_free(md); }
    };

    DigestAlgorithm(std::string name, EVP_MD* md);

    std::string name_;
    std::unique_ptr<EVP_MD, MdDeleter> md_;
    std::size_t size_ = 0;
};

}
