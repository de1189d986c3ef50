#include <dcpath/path/secret/entry.h>
#include <dcpath/path/secret/control_packet.h>
#include <algorithm>

namespace dcpath {
namespace path {
namespace secret {

Entry::Entry(const NetworkAddress& peer,
             Secret secret,
             const stateless_reset::Token& peer_stateless_reset,
             const ApplicationParams& parameters,
             std::chrono::seconds rehandshake_period,
             ApplicationData application_data,
             const receiver::State::Config& receiver_config)
    : peer_(peer)
    , secret_(std::move(secret))
    , sender_(peer_stateless_reset)
    , receiver_(receiver_config)
    , parameters_(parameters)
    , max_datagram_size_(std::min(parameters.max_datagram_size, MAX_DATAGRAM_SIZE))
    , rehandshake_period_(rehandshake_period)
    , created_at_(std::chrono::steady_clock::now())
    , application_data_(std::move(application_data)) {}

ApplicationParams Entry::parameters() const {
    ApplicationParams params = parameters_;
    params.max_datagram_size = max_datagram_size();
    return params;
}

void Entry::update_max_datagram_size(uint16_t mtu) {
    max_datagram_size_.store(std::min(mtu, MAX_DATAGRAM_SIZE), std::memory_order_relaxed);
}

bool Entry::rehandshake_due(std::chrono::steady_clock::time_point now) const {
    return now - created_at_ >= rehandshake_period_;
}

bool Entry::mark_rehandshake_requested() {
    return !rehandshake_requested_.exchange(true, std::memory_order_acq_rel);
}

Result<crypto::EncryptKey> Entry::uni_sealer() {
    return sender_.next_key_id().map([this](KeyId key_id) {
        return secret_.application_sealer(key_id);
    });
}

crypto::DecryptKey Entry::uni_opener(KeyId key_id) const {
    return secret_.application_opener(key_id);
}

Result<Entry::Bidirectional> Entry::bidi_local() {
    return sender_.next_key_id().map([this](KeyId key_id) {
        auto keys = secret_.application_pair(key_id, Initiator::LOCAL);
        return Bidirectional{Credentials{id(), key_id}, std::move(keys.first), std::move(keys.second)};
    });
}

Entry::Bidirectional Entry::bidi_remote(KeyId key_id) const {
    auto keys = secret_.application_pair(key_id, Initiator::REMOTE);
    return Bidirectional{Credentials{id(), key_id}, std::move(keys.first), std::move(keys.second)};
}

Result<std::vector<uint8_t>> Entry::replay_error_packet(const Credentials& credentials,
                                                        DCError error) const {
    switch (error) {
        case DCError::KEY_ID_ALREADY_SEEN: {
            control::ReplayDetected packet;
            packet.credential_id = credentials.id;
            packet.rejected_key_id = credentials.key_id;
            return packet.encode(control_sealer());
        }
        case DCError::KEY_ID_UNKNOWN: {
            control::StaleKey packet;
            packet.credential_id = credentials.id;
            packet.min_key_id = std::min<KeyId>(receiver_.minimum_unseen_key_id(), MAX_KEY_ID);
            return packet.encode(control_sealer());
        }
        default:
            return make_error<std::vector<uint8_t>>(DCError::INVALID_PARAMETER);
    }
}

} // namespace secret
} // namespace path
} // namespace dcpath
