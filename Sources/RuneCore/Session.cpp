#include "Session.hpp"

#include <random>

namespace rune {

Session::Session(std::size_t ring_capacity)
    : started(std::chrono::steady_clock::now()), ring(ring_capacity) {}

std::string generate_session_id() {
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist(0, 15);

    const char* hex = "0123456789abcdef";
    // Format: 8-4-4-4-12
    constexpr int kPattern[] = {
        8, -1, 4, -1, 4, -1, 4, -1, 12
    };

    std::string uuid;
    uuid.reserve(36);

    for (int group : kPattern) {
        if (group == -1) {
            uuid += '-';
        } else {
            for (int i = 0; i < group; ++i) {
                uuid += hex[dist(rng)];
            }
        }
    }

    // Version 4, variant 10xx.
    uuid[14] = '4';
    uuid[19] = hex[(dist(rng) & 0x3) | 0x8];

    return uuid;
}

} // namespace rune
