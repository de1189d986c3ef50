#include <dcpath/credentials.h>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace dcpath {

size_t IdHash::operator()(const Id& id) const noexcept {
    // Ids are HKDF output, so any 8 bytes are uniformly distributed
    uint64_t value;
    std::memcpy(&value, id.bytes.data(), sizeof(value));
    return static_cast<size_t>(value);
}

std::string to_string(const Id& id) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : id.bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::string to_string(const Credentials& credentials) {
    return to_string(credentials.id) + "/" + std::to_string(credentials.key_id);
}

} // namespace dcpath
