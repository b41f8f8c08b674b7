#pragma once

#include "murmur/common.hpp"
#include <string>

namespace murmur::crypto {

/**
 * Random number generation (CSPRNG)
 * Backed by libsodium; initializes the library on first use
 */
class Random {
public:
    /**
     * Generate uniform random integer in range [0, upper_bound)
     * @param upper_bound Exclusive upper bound
     */
    static uint32_t uniform(uint32_t upper_bound);
    
    /**
     * Generate a string of `length` characters drawn uniformly from `alphabet`
     */
    static std::string token(size_t length, const std::string& alphabet);
    
private:
    static void ensure_initialized();
};

} // namespace murmur::crypto
