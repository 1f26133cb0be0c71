#include "CryptoHelpers.hpp"
#include <cryptopp/osrng.h>
#include <cryptopp/filters.h>
#include <cryptopp/secblock.h>
#include <cryptopp/base64.h>
#include <string>
#include <vector>

using namespace CryptoPP;

namespace SQLChat {
namespace CryptoHelpers {

std::vector<uint8_t> randomBytes(size_t n){
    AutoSeededRandomPool prng;
    SecByteBlock block(n);
    prng.GenerateBlock(block, block.size());
    return std::vector<uint8_t>(block.begin(), block.end());
}

std::string base64UrlEncode(const std::vector<uint8_t>& data){
    std::string out;
    StringSource ss(data.data(), data.size(), true,
        new Base64URLEncoder(new StringSink(out), false /* do not insert newlines */));
    while(!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

std::string generateTokenUrlSafe(size_t nbytes){
    return base64UrlEncode(randomBytes(nbytes));
}

} // namespace CryptoHelpers
} // namespace SQLChat
