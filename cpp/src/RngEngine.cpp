#include "RngEngine.h"

#include <chrono>
#include <functional>
#include <thread>


using namespace ensemble;


//------------------------------------------------------------------------------
// defaultSeed(): mix high-res clock and thread ID for initial seeding
//------------------------------------------------------------------------------
uint64_t RngEngine::defaultSeed() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const auto tid = std::hash<std::thread::id>()(std::this_thread::get_id());
    return static_cast<uint64_t>(now) ^ (static_cast<uint64_t>(tid) << 1);
}

//------------------------------------------------------------------------------
// Constructor: initialize PCG state
//------------------------------------------------------------------------------
RngEngine::RngEngine(const uint64_t seed) : state_(0), increment_(seed << 1 | 1) {
    // Advance state at least once
    state_ = seed + increment_;
    state_ = state_ * 6364136223846793005ULL + increment_;
}

//------------------------------------------------------------------------------
// derive(): FNV-1a hash of the stream name, folded into the seed by splitmix64
//------------------------------------------------------------------------------
RngEngine RngEngine::derive(const uint64_t seed, const std::string& stream) {
    uint64_t h = 14695981039346656037ULL;
    for (const unsigned char c : stream) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    uint64_t z = seed ^ h;
    z += 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    z ^= z >> 31;
    return RngEngine(z);
}

//------------------------------------------------------------------------------
// nextUInt32(): PCG-XSH-RR 32-bit generator
//------------------------------------------------------------------------------
uint32_t RngEngine::nextUInt32() {
    const uint64_t old = state_;
    state_ = old * 6364136223846793005ULL + increment_;
    const auto xorshifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
    const auto rot = static_cast<uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}

//------------------------------------------------------------------------------
// uniform(): convert nextUInt32() into [0,1)
//------------------------------------------------------------------------------
double RngEngine::uniform() {
    return nextUInt32() * (1.0 / 4294967296.0);
}
