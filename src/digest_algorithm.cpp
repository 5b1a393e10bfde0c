#include "digest_algorithm.hpp"
#include "logger.hpp"
#include <openssl/err.h>
#include <sstream>

namespace obscure {

DigestAlgorithm::DigestAlgorithm(std::string name, EVP_MD* md)
    : name_(std::move(name))
    , md_(md)
    , size_(static_cast<std::size_t>(EVP_MD_get_size(md)))
{}

// Probes each name against the default provider. A failed fetch only leaves
// entries on the OpenSSL error queue, which are cleared before the next try.
DigestAlgorithm DigestAlgorithm::select(const std::vector<std::string>& preferences) {
    for (const auto& name : preferences) {
        EVP_MD* md = EVP_MD_fetch(nullptr, name.c_str(), nullptr);
        if (md != nullptr && EVP_MD_get_size(md) > 0) {
            return DigestAlgorithm(name, md);
        }
        EVP_MD_free(md);
        ERR_clear_error();
    }

    std::stringstream ss;
    ss << "Could not find a suitable digest algorithm (tried:";
    for (const auto& name : preferences) ss << " " << name;
    ss << ")";

    Logger::log(Logger::Level::CRITICAL, Logger::Event::DIGEST_UNAVAILABLE, ss.str());
    throw DigestUnavailableError(ss.str());
}

std::string DigestAlgorithm::digest(const std::string& data) const {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), md_.get(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        ERR_clear_error();
        Logger::log(Logger::Level::ERROR, Logger::Event::DIGEST_FAILURE, name_ + " digest round failed");
        throw std::runtime_error(name_ + " digest computation failed");
    }

    return std::string(reinterpret_cast<const char*>(out), out_len);
}

}
