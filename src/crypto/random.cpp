#include "random.hpp"
#include "murmur/error.hpp"
#include <sodium.h>
#include <mutex>

namespace murmur::crypto {

void Random::ensure_initialized() {
    static std::once_flag once;
    static int init_result = 0;
    std::call_once(once, []() { init_result = sodium_init(); });
    
    // sodium_init returns 1 when already initialized elsewhere
    if (init_result < 0) {
        throw MurmurException(ErrorCode::InitializationFailed, "libsodium initialization failed");
    }
}

uint32_t Random::uniform(uint32_t upper_bound) {
    ensure_initialized();
    return randombytes_uniform(upper_bound);
}

std::string Random::token(size_t length, const std::string& alphabet) {
    if (alphabet.empty()) {
        throw MurmurException(ErrorCode::InvalidArgument, "Random::token requires a non-empty alphabet");
    }
    
    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result.push_back(alphabet[uniform(static_cast<uint32_t>(alphabet.size()))]);
    }
    return result;
}

} // namespace murmur::crypto
