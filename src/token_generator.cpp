#include "token_generator.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include <stdexcept>

namespace obscure {

namespace {

// Rejects the request before any seed is drawn.
[[noreturn]] void reject(const std::string& reason) {
    MetricsRegistry::instance().increment_counter("obscure_invalid_requests");
    Logger::log(Logger::Level::WARNING, Logger::Event::INVALID_ARGUMENT, reason);
    throw std::invalid_argument(reason);
}

}

TokenGenerator::TokenGenerator(const GeneratorConfig& config, std::shared_ptr<SeedSource> seeder)
    : config_(config)
    , digest_(DigestAlgorithm::select(config.digest_preferences))
    , seeder_(seeder ? std::move(seeder) : std::make_shared<DefaultSeeder>())
{
    auto& metrics = MetricsRegistry::instance();
    metrics.describe("obscure_tokens_generated", "Identifiers returned to callers");
    metrics.describe("obscure_digest_rounds", "Seed-digest-encode rounds run");
    metrics.describe("obscure_invalid_requests", "Requests rejected before any round ran");
    metrics.describe("obscure_digest_size_bytes", "Native output size of the selected digest");
    metrics.set_gauge("obscure_digest_size_bytes", static_cast<double>(digest_.size()));
    if (config_.log_selection) {
        Logger::log(Logger::Level::INFO, Logger::Event::DIGEST_SELECTED,
                    "Using " + digest_.name() + " (" + std::to_string(digest_.size()) + " bytes per round)");
    }
}

std::string TokenGenerator::generate(Encoding encoding, Length length) {
    std::string result = length ? generate_to_length(encoding, *length) : generate_round(encoding);
    MetricsRegistry::instance().increment_counter("obscure_tokens_generated", {{"encoding", encoding_name(encoding)}});
    return result;
}

std::string TokenGenerator::generate_from_options(Encoding encoding, const boost::json::object& options) {
    if (options.empty()) {
        return generate(encoding);
    }

    auto it = options.find("length");
    if (it == options.end()) {
        reject("Don't know what you want to do: length wasn't specified, but options were non-empty");
    }

    const boost::json::value& value = it->value();
    if (value.is_int64()) {
        return generate(encoding, Length{value.as_int64()});
    }
    if (value.is_uint64()) {
        reject("length is out of range");
    }
    reject("length must be an integer");
}

// One round: fresh seed, fresh digest context, fresh encoding.
std::string TokenGenerator::generate_round(Encoding encoding) {
    std::string raw = digest_.digest(seeder_->next_seed());
    MetricsRegistry::instance().increment_counter("obscure_digest_rounds", {{"algorithm", digest_.name()}});
    return encode(encoding, raw);
}

std::string TokenGenerator::generate_to_length(Encoding encoding, long long length) {
    if (length <= 0) {
        reject("You need to specify a length greater than 0");
    }

    std::string result;
    if (static_cast<unsigned long long>(length) > result.max_size() - chunk_size(encoding)) {
        reject("length is too large");
    }

    const auto wanted = static_cast<std::size_t>(length);
    result.reserve(wanted + chunk_size(encoding));

    while (result.size() < wanted) {
        result += generate_round(encoding);
    }

    result.resize(wanted);
    return result;
}

}
