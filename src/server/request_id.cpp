#include "request_id.hpp"

#include <cstdint>
#include <format>
#include <random>

std::string generate_request_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi = rng();
    uint64_t lo = rng();

    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(hi >> 32),
                       static_cast<uint16_t>(hi >> 16),
                       static_cast<uint16_t>(hi),
                       static_cast<uint16_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}
