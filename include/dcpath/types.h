#ifndef DCPATH_TYPES_H
#define DCPATH_TYPES_H

#include <dcpath/config.h>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <chrono>
#include <functional>

namespace dcpath {

// Version of the dc wire protocol negotiated alongside TLS
using DcVersion = uint32_t;
constexpr DcVersion DC_VERSION_V1 = 1;

// TLS 1.3 cipher suites as reported by the TLS layer
enum class CipherSuite : uint16_t {
    TLS_AES_128_GCM_SHA256 = 0x1301,
    TLS_AES_256_GCM_SHA384 = 0x1302,
    TLS_CHACHA20_POLY1305_SHA256 = 0x1303,
    TLS_AES_128_CCM_SHA256 = 0x1304,
    TLS_AES_128_CCM_8_SHA256 = 0x1305
};

enum class HashAlgorithm : uint8_t {
    NONE = 0,
    SHA256 = 4,
    SHA384 = 5
};

enum class AEADCipher : uint8_t {
    AES_128_GCM = 1,
    AES_256_GCM = 2
};

// Role of the local endpoint in the TLS handshake
enum class EndpointType : uint8_t {
    CLIENT = 0,
    SERVER = 1
};

// Which side opened a bidirectional stream
enum class Initiator : uint8_t {
    LOCAL = 0,
    REMOTE = 1
};

enum class Direction : uint8_t {
    SEND = 0,
    RECEIVE = 1
};

struct NetworkAddress {
    enum class Family : uint8_t {
        IPv4 = 4,
        IPv6 = 6
    };

    Family family = Family::IPv4;
    std::array<uint8_t, 16> address{}; // IPv6 size covers IPv4
    uint16_t port{0};

    bool is_ipv4() const noexcept { return family == Family::IPv4; }
    bool is_ipv6() const noexcept { return family == Family::IPv6; }

    bool operator==(const NetworkAddress& other) const noexcept;
    bool operator!=(const NetworkAddress& other) const noexcept;

    static NetworkAddress from_ipv4(uint32_t ipv4_addr, uint16_t port_num);
    static NetworkAddress from_ipv6(const std::array<uint8_t, 16>& ipv6_addr, uint16_t port_num);
};

struct DCPATH_API NetworkAddressHash {
    size_t operator()(const NetworkAddress& addr) const noexcept;
};

// Largest datagram a path will ever be configured for
constexpr uint16_t MAX_DATAGRAM_SIZE = 1 << 15;
constexpr uint16_t DEFAULT_MAX_DATAGRAM_SIZE = 1472;

/**
 * Transport parameters negotiated for a path and carried with its secrets.
 */
struct ApplicationParams {
    uint16_t max_datagram_size = DEFAULT_MAX_DATAGRAM_SIZE;
    std::chrono::milliseconds max_idle_timeout{30000};
};

// AEAD framing constants shared by every supported cipher suite
constexpr size_t NONCE_LEN = 12;
constexpr size_t TAG_LEN = 16;

DCPATH_API std::string to_string(CipherSuite suite);
DCPATH_API std::string to_string(EndpointType endpoint);
DCPATH_API std::string to_string(const NetworkAddress& addr);

inline EndpointType peer_type(EndpointType endpoint) noexcept {
    return endpoint == EndpointType::CLIENT ? EndpointType::SERVER : EndpointType::CLIENT;
}

} // namespace dcpath

#endif // DCPATH_TYPES_H
