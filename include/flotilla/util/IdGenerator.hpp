#pragma once

#include <string>
#include <string_view>

namespace flotilla {

/**
 * Opaque identifiers for instances and jobs: "<prefix>-<16 hex chars>".
 * Randomness comes from OpenSSL's CSPRNG so ids stay unguessable when they
 * are handed out to callers by the surrounding service.
 */
class IdGenerator {
public:
    static constexpr size_t kRandomBytes = 8;

    /**
     * @throws std::runtime_error if the CSPRNG cannot produce bytes
     */
    static std::string generate(std::string_view prefix);
};

} // namespace flotilla
