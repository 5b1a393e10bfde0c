#include "seeder.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <unordered_map>
#include <unistd.h>

namespace obscure {

DefaultSeeder::DefaultSeeder()
    : rng_(std::random_device{}())
{}

double DefaultSeeder::next_fraction() {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return fraction_(rng_);
}

std::string DefaultSeeder::next_seed() {
    const std::uint64_t count = ++counter_;

    auto allocation = std::make_unique<std::unordered_map<std::string, std::string>>();
    auto tick = std::chrono::steady_clock::now().time_since_epoch().count();

    std::stringstream ss;
    ss << count
       << std::time(nullptr)
       << std::setprecision(15) << next_fraction()
       << ::getpid()
       << "@" << std::hex << reinterpret_cast<std::uintptr_t>(allocation.get())
       << std::dec << tick;
    return ss.str();
}

}
