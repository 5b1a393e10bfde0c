#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace obscure {

// Supplies the input material hashed in each digest round.
class SeedSource {
public:
    virtual ~SeedSource() = default;

    // Returns a fresh seed; called exactly once per round.
    virtual std::string next_seed() = 0;
};

/**
 * Mixes weak process-local entropy into a seed:
 * counter, wall-clock seconds, a PRNG fraction, the pid, and the address of
 * a fresh heap allocation followed by a steady-clock tick.
 * Values are probably different on every call, never unpredictable.
 */
class DefaultSeeder : public SeedSource {
public:
    DefaultSeeder();

    std::string next_seed() override;

    // Number of seeds handed out so far.
    std::uint64_t count() const { return counter_.load(); }

private:
    double next_fraction();

    std::atomic<std::uint64_t> counter_{0};
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> fraction_{0.0, 1.0};
    std::mutex rng_mutex_;
};

}
