#include <dcpath/types.h>
#include <sstream>

namespace dcpath {

std::string to_string(CipherSuite suite) {
    switch (suite) {
        case CipherSuite::TLS_AES_128_GCM_SHA256: return "TLS_AES_128_GCM_SHA256";
        case CipherSuite::TLS_AES_256_GCM_SHA384: return "TLS_AES_256_GCM_SHA384";
        case CipherSuite::TLS_CHACHA20_POLY1305_SHA256: return "TLS_CHACHA20_POLY1305_SHA256";
        case CipherSuite::TLS_AES_128_CCM_SHA256: return "TLS_AES_128_CCM_SHA256";
        case CipherSuite::TLS_AES_128_CCM_8_SHA256: return "TLS_AES_128_CCM_8_SHA256";
        default: return "UNKNOWN_CIPHER_SUITE(" + std::to_string(static_cast<int>(suite)) + ")";
    }
}

std::string to_string(EndpointType endpoint) {
    switch (endpoint) {
        case EndpointType::CLIENT: return "client";
        case EndpointType::SERVER: return "server";
        default: return "unknown";
    }
}

std::string to_string(const NetworkAddress& addr) {
    std::ostringstream oss;
    if (addr.is_ipv6()) {
        // Full form, no zero-run compression
        oss << '[' << std::hex;
        for (size_t i = 0; i < addr.address.size(); i += 2) {
            oss << (i ? ":" : "") << ((addr.address[i] << 8) | addr.address[i + 1]);
        }
        oss << std::dec << ']';
    } else {
        oss << +addr.address[0] << '.' << +addr.address[1] << '.'
            << +addr.address[2] << '.' << +addr.address[3];
    }
    oss << ':' << addr.port;
    return oss.str();
}

bool NetworkAddress::operator==(const NetworkAddress& other) const noexcept {
    return port == other.port && family == other.family && address == other.address;
}

bool NetworkAddress::operator!=(const NetworkAddress& other) const noexcept {
    return !(*this == other);
}

NetworkAddress NetworkAddress::from_ipv4(uint32_t ipv4_addr, uint16_t port_num) {
    NetworkAddress addr;
    addr.port = port_num;
    for (size_t i = 0; i < 4; ++i) {
        addr.address[i] = static_cast<uint8_t>(ipv4_addr >> (24 - 8 * i));
    }
    return addr;
}

NetworkAddress NetworkAddress::from_ipv6(const std::array<uint8_t, 16>& ipv6_addr, uint16_t port_num) {
    NetworkAddress addr;
    addr.family = Family::IPv6;
    addr.address = ipv6_addr;
    addr.port = port_num;
    return addr;
}

size_t NetworkAddressHash::operator()(const NetworkAddress& addr) const noexcept {
    // FNV-1a over family, port and address bytes
    uint64_t hash = 0xcbf29ce484222325ULL;
    auto mix = [&hash](uint8_t byte) {
        hash ^= byte;
        hash *= 0x100000001b3ULL;
    };
    mix(static_cast<uint8_t>(addr.family));
    mix(static_cast<uint8_t>(addr.port >> 8));
    mix(static_cast<uint8_t>(addr.port & 0xFF));
    for (uint8_t byte : addr.address) {
        mix(byte);
    }
    return static_cast<size_t>(hash);
}

} // namespace dcpath
