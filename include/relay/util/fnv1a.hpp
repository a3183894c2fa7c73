#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace relay {

/**
 * 64-bit FNV-1a hash utility functions.
 *
 * Stable across processes and platforms, unlike std::hash.
 */
class FNV1a {
public:
    static constexpr uint64_t OFFSET_BASIS = 14695981039346656037ULL;
    static constexpr uint64_t PRIME = 1099511628211ULL;

    /**
     * Compute the hash of data.
     */
    static uint64_t compute(const uint8_t* data, size_t len);
    static uint64_t compute(const char* data, size_t len);
    static uint64_t compute(const std::string& data);

    /**
     * Update a running hash with more data.
     * Start from OFFSET_BASIS.
     */
    static uint64_t update(uint64_t hash, const uint8_t* data, size_t len);
    static uint64_t update(uint64_t hash, const std::string& data);
};

}  // namespace relay
