#ifndef DCPATH_PATH_SECRET_CONTROL_PACKET_H
#define DCPATH_PATH_SECRET_CONTROL_PACKET_H

#include <dcpath/config.h>
#include <dcpath/result.h>
#include <dcpath/credentials.h>
#include <dcpath/crypto/aead.h>
#include <dcpath/crypto/stateless_reset.h>
#include <cstdint>
#include <variant>
#include <vector>

namespace dcpath {
namespace path {
namespace secret {
namespace control {

/**
 * Secret control packets.
 *
 *   tag(1) | wire_version(varint) | credential_id(16) | [key_id(varint)] | auth(16)
 *
 * StaleKey and ReplayDetected carry an AEAD tag computed with the path's
 * control key over the preceding bytes, with a nonce built from the packet
 * kind and key id. UnknownPathSecret is sent by a node
 * that no longer has the secret, so it carries the stateless reset token
 * for the id instead.
 */
enum class PacketTag : uint8_t {
    UNKNOWN_PATH_SECRET = 0x60,
    STALE_KEY = 0x61,
    REPLAY_DETECTED = 0x62
};

constexpr uint64_t WIRE_VERSION = 0;

struct DCPATH_API UnknownPathSecret {
    uint64_t wire_version{WIRE_VERSION};
    Id credential_id;
    stateless_reset::Token stateless_reset_tag;

    std::vector<uint8_t> encode() const;

    // Constant-time comparison against the token stored for credential_id
    bool authenticate(const stateless_reset::Token& expected) const;
};

struct DCPATH_API StaleKey {
    uint64_t wire_version{WIRE_VERSION};
    Id credential_id;
    KeyId min_key_id{0};
    crypto::Tag tag{};

    /**
     * Encode and authenticate with the control sealer of the path.
     * @return INVALID_PARAMETER for an out of range key id or wire version
     */
    Result<std::vector<uint8_t>> encode(const crypto::EncryptKey& control_sealer) const;

    /**
     * @return AUTHENTICATION_FAILED if the tag does not verify
     */
    Result<void> authenticate(const crypto::DecryptKey& control_opener) const;
};

struct DCPATH_API ReplayDetected {
    uint64_t wire_version{WIRE_VERSION};
    Id credential_id;
    KeyId rejected_key_id{0};
    crypto::Tag tag{};

    Result<std::vector<uint8_t>> encode(const crypto::EncryptKey& control_sealer) const;
    Result<void> authenticate(const crypto::DecryptKey& control_opener) const;
};

using Packet = std::variant<UnknownPathSecret, StaleKey, ReplayDetected>;

struct DecodedPacket {
    Packet packet;
    size_t consumed;
};

/**
 * Decode a secret control packet from the front of a datagram.
 * @return UNKNOWN_PACKET_TAG when the first byte is not a control tag,
 *         DECODE_ERROR when the packet is truncated
 */
DCPATH_API Result<DecodedPacket> decode(const uint8_t* data, size_t length);

DCPATH_API const Id& credential_id(const Packet& packet);

DCPATH_API bool is_control_tag(uint8_t first_byte);

} // namespace control
} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_CONTROL_PACKET_H
