#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace SQLChat {
namespace CryptoHelpers {
    // Generate `n` random bytes from the OS-seeded pool
    std::vector<uint8_t> randomBytes(size_t n);
    // URL-safe base64 (RFC 4648 section 5) without padding
    std::string base64UrlEncode(const std::vector<uint8_t>& data);
    // Random URL-safe token carrying `nbytes` bytes of entropy
    std::string generateTokenUrlSafe(size_t nbytes = 32);
}
} // namespace SQLChat
