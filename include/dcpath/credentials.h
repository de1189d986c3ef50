#ifndef DCPATH_CREDENTIALS_H
#define DCPATH_CREDENTIALS_H

#include <dcpath/config.h>
#include <dcpath/varint.h>
#include <array>
#include <cstdint>
#include <string>

namespace dcpath {

constexpr size_t ID_LEN = 16;

/**
 * Stable identifier of a path secret, derived from the exported secret.
 */
struct Id {
    std::array<uint8_t, ID_LEN> bytes{};

    bool operator==(const Id& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const Id& other) const noexcept { return bytes != other.bytes; }
    bool operator<(const Id& other) const noexcept { return bytes < other.bytes; }
};

struct DCPATH_API IdHash {
    size_t operator()(const Id& id) const noexcept;
};

// Key ids travel as varints so they are bounded to 62 bits
using KeyId = uint64_t;
constexpr KeyId MAX_KEY_ID = VARINT_MAX;

struct Credentials {
    Id id;
    KeyId key_id = 0;

    bool operator==(const Credentials& other) const noexcept {
        return id == other.id && key_id == other.key_id;
    }
    bool operator!=(const Credentials& other) const noexcept { return !(*this == other); }
};

DCPATH_API std::string to_string(const Id& id);
DCPATH_API std::string to_string(const Credentials& credentials);

} // namespace dcpath

#endif // DCPATH_CREDENTIALS_H
