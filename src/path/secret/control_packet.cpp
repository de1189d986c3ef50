#include <dcpath/path/secret/control_packet.h>
#include <dcpath/varint.h>
#include <cstring>

namespace dcpath {
namespace path {
namespace secret {
namespace control {

namespace {

// A control key seals at most one message per (kind, key id), so the pair
// forms a unique nonce: the kind occupies the two bits above the varint range.
uint64_t control_nonce(PacketTag tag, KeyId key_id) {
    uint64_t kind = static_cast<uint64_t>(tag) - static_cast<uint64_t>(PacketTag::UNKNOWN_PATH_SECRET);
    return (kind << 62) | (key_id & MAX_KEY_ID);
}

std::vector<uint8_t> encode_header(PacketTag tag, uint64_t wire_version, const Id& id,
                                   const KeyId* key_id) {
    std::vector<uint8_t> out;
    out.push_back(static_cast<uint8_t>(tag));
    encode_varint(out, wire_version);
    out.insert(out.end(), id.bytes.begin(), id.bytes.end());
    if (key_id != nullptr) {
        encode_varint(out, *key_id);
    }
    return out;
}

Result<crypto::Tag> seal_header(const crypto::EncryptKey& sealer, uint64_t nonce,
                                const std::vector<uint8_t>& header) {
    std::vector<uint8_t> tag_buffer(TAG_LEN);
    DCPATH_TRY_VOID(sealer.encrypt(nonce, header, {}, tag_buffer));
    crypto::Tag tag;
    std::memcpy(tag.data(), tag_buffer.data(), TAG_LEN);
    return make_result(tag);
}

Result<void> verify_header(const crypto::DecryptKey& opener, uint64_t nonce,
                           const std::vector<uint8_t>& header, const crypto::Tag& tag) {
    std::vector<uint8_t> empty_out;
    auto result = opener.decrypt(nonce, header, {}, tag, empty_out);
    if (result.is_error()) {
        return make_error<void>(DCError::AUTHENTICATION_FAILED);
    }
    return make_result();
}

Result<std::vector<uint8_t>> encode_authenticated(PacketTag packet_tag, uint64_t wire_version,
                                                  const Id& id, KeyId key_id,
                                                  const crypto::EncryptKey& sealer) {
    if (key_id > MAX_KEY_ID || wire_version != WIRE_VERSION) {
        return make_error<std::vector<uint8_t>>(DCError::INVALID_PARAMETER);
    }
    std::vector<uint8_t> out = encode_header(packet_tag, wire_version, id, &key_id);
    DCPATH_TRY_ASSIGN(crypto::Tag tag, seal_header(sealer, control_nonce(packet_tag, key_id), out));
    out.insert(out.end(), tag.begin(), tag.end());
    return make_result(std::move(out));
}

bool read_bytes(const uint8_t* data, size_t length, size_t& offset, uint8_t* out, size_t count) {
    if (length - offset < count) {
        return false;
    }
    std::memcpy(out, data + offset, count);
    offset += count;
    return true;
}

} // anonymous namespace

std::vector<uint8_t> UnknownPathSecret::encode() const {
    std::vector<uint8_t> out = encode_header(PacketTag::UNKNOWN_PATH_SECRET, wire_version,
                                             credential_id, nullptr);
    out.insert(out.end(), stateless_reset_tag.bytes.begin(), stateless_reset_tag.bytes.end());
    return out;
}

bool UnknownPathSecret::authenticate(const stateless_reset::Token& expected) const {
    return stateless_reset_tag == expected;
}

Result<std::vector<uint8_t>> StaleKey::encode(const crypto::EncryptKey& control_sealer) const {
    return encode_authenticated(PacketTag::STALE_KEY, wire_version, credential_id, min_key_id,
                                control_sealer);
}

Result<void> StaleKey::authenticate(const crypto::DecryptKey& control_opener) const {
    return verify_header(control_opener, control_nonce(PacketTag::STALE_KEY, min_key_id),
                         encode_header(PacketTag::STALE_KEY, wire_version, credential_id, &min_key_id),
                         tag);
}

Result<std::vector<uint8_t>> ReplayDetected::encode(const crypto::EncryptKey& control_sealer) const {
    return encode_authenticated(PacketTag::REPLAY_DETECTED, wire_version, credential_id,
                                rejected_key_id, control_sealer);
}

Result<void> ReplayDetected::authenticate(const crypto::DecryptKey& control_opener) const {
    return verify_header(control_opener, control_nonce(PacketTag::REPLAY_DETECTED, rejected_key_id),
                         encode_header(PacketTag::REPLAY_DETECTED, wire_version, credential_id,
                                       &rejected_key_id),
                         tag);
}

bool is_control_tag(uint8_t first_byte) {
    switch (static_cast<PacketTag>(first_byte)) {
        case PacketTag::UNKNOWN_PATH_SECRET:
        case PacketTag::STALE_KEY:
        case PacketTag::REPLAY_DETECTED:
            return true;
        default:
            return false;
    }
}

Result<DecodedPacket> decode(const uint8_t* data, size_t length) {
    if (data == nullptr || length == 0) {
        return make_error<DecodedPacket>(DCError::DECODE_ERROR);
    }
    if (!is_control_tag(data[0])) {
        return make_error<DecodedPacket>(DCError::UNKNOWN_PACKET_TAG);
    }

    PacketTag packet_tag = static_cast<PacketTag>(data[0]);
    size_t offset = 1;

    DCPATH_TRY_ASSIGN(uint64_t wire_version, decode_varint(data, length, offset));

    Id id;
    if (!read_bytes(data, length, offset, id.bytes.data(), id.bytes.size())) {
        return make_error<DecodedPacket>(DCError::DECODE_ERROR);
    }

    if (packet_tag == PacketTag::UNKNOWN_PATH_SECRET) {
        UnknownPathSecret packet;
        packet.wire_version = wire_version;
        packet.credential_id = id;
        if (!read_bytes(data, length, offset, packet.stateless_reset_tag.bytes.data(),
                        stateless_reset::TOKEN_LEN)) {
            return make_error<DecodedPacket>(DCError::DECODE_ERROR);
        }
        return make_result(DecodedPacket{Packet(packet), offset});
    }

    DCPATH_TRY_ASSIGN(KeyId key_id, decode_varint(data, length, offset));

    crypto::Tag tag{};
    if (!read_bytes(data, length, offset, tag.data(), tag.size())) {
        return make_error<DecodedPacket>(DCError::DECODE_ERROR);
    }

    if (packet_tag == PacketTag::STALE_KEY) {
        StaleKey packet;
        packet.wire_version = wire_version;
        packet.credential_id = id;
        packet.min_key_id = key_id;
        packet.tag = tag;
        return make_result(DecodedPacket{Packet(packet), offset});
    }

    ReplayDetected packet;
    packet.wire_version = wire_version;
    packet.credential_id = id;
    packet.rejected_key_id = key_id;
    packet.tag = tag;
    return make_result(DecodedPacket{Packet(packet), offset});
}

const Id& credential_id(const Packet& packet) {
    return std::visit([](const auto& p) -> const Id& { return p.credential_id; }, packet);
}

} // namespace control
} // namespace secret
} // namespace path
} // namespace dcpath
