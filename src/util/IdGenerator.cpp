#include "flotilla/util/IdGenerator.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <stdexcept>

namespace flotilla {

std::string IdGenerator::generate(std::string_view prefix) {
    std::array<unsigned char, kRandomBytes> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        char err_buf[256];
        ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
        throw std::runtime_error("IdGenerator: RAND_bytes failed: " + std::string(err_buf));
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string id;
    id.reserve(prefix.size() + 1 + bytes.size() * 2);
    id.append(prefix);
    id.push_back('-');
    for (unsigned char b : bytes) {
        id.push_back(kHex[b >> 4]);
        id.push_back(kHex[b & 0x0f]);
    }
    return id;
}

} // namespace flotilla
