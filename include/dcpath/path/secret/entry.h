#ifndef DCPATH_PATH_SECRET_ENTRY_H
#define DCPATH_PATH_SECRET_ENTRY_H

#include <dcpath/config.h>
#include <dcpath/types.h>
#include <dcpath/result.h>
#include <dcpath/credentials.h>
#include <dcpath/crypto/aead.h>
#include <dcpath/crypto/stateless_reset.h>
#include <dcpath/path/secret/schedule.h>
#include <dcpath/path/secret/sender.h>
#include <dcpath/path/secret/receiver.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

namespace dcpath {
namespace path {
namespace secret {

// Opaque value an application attaches to a path when its handshake completes
using ApplicationData = std::shared_ptr<const void>;

/**
 * An established path secret and everything needed to send and receive
 * under it. Shared between the connection that created it and the map.
 */
class DCPATH_API Entry {
public:
    struct Bidirectional {
        Credentials credentials;
        crypto::EncryptKey sealer;
        crypto::DecryptKey opener;
    };

    Entry(const NetworkAddress& peer,
          Secret secret,
          const stateless_reset::Token& peer_stateless_reset,
          const ApplicationParams& parameters,
          std::chrono::seconds rehandshake_period,
          ApplicationData application_data = nullptr,
          const receiver::State::Config& receiver_config = receiver::State::Config{});

    Entry(const Entry&) = delete;
    Entry& operator=(const Entry&) = delete;

    const NetworkAddress& peer() const noexcept { return peer_; }
    const Id& id() const noexcept { return secret_.id(); }
    const Secret& secret() const noexcept { return secret_; }

    sender::State& sender() noexcept { return sender_; }
    const sender::State& sender() const noexcept { return sender_; }
    receiver::State& receiver() noexcept { return receiver_; }
    const receiver::State& receiver() const noexcept { return receiver_; }

    ApplicationParams parameters() const;
    uint16_t max_datagram_size() const noexcept { return max_datagram_size_.load(std::memory_order_relaxed); }

    /**
     * Clamped to MAX_DATAGRAM_SIZE.
     */
    void update_max_datagram_size(uint16_t mtu);

    const ApplicationData& application_data() const noexcept { return application_data_; }

    std::chrono::seconds rehandshake_period() const noexcept { return rehandshake_period_; }
    std::chrono::steady_clock::time_point created_at() const noexcept { return created_at_; }
    bool rehandshake_due(std::chrono::steady_clock::time_point now) const;

    /**
     * @return true for the first caller only
     */
    bool mark_rehandshake_requested();

    void retire() noexcept { retired_.store(true, std::memory_order_release); }
    bool is_retired() const noexcept { return retired_.load(std::memory_order_acquire); }

    /**
     * Allocate the next key id and derive its unidirectional sealer.
     * @return KEY_ID_EXHAUSTED when the key id space is used up
     */
    Result<crypto::EncryptKey> uni_sealer();
    crypto::DecryptKey uni_opener(KeyId key_id) const;

    /**
     * Bidirectional keys for a stream opened locally, with a fresh key id.
     */
    Result<Bidirectional> bidi_local();

    /**
     * Bidirectional keys for a stream the peer opened with key_id.
     */
    Bidirectional bidi_remote(KeyId key_id) const;

    crypto::EncryptKey control_sealer() const { return secret_.control_sealer(); }
    crypto::DecryptKey control_opener() const { return secret_.control_opener(); }

    /**
     * Encode the control packet telling the peer about a replay decision:
     * KEY_ID_ALREADY_SEEN yields ReplayDetected, KEY_ID_UNKNOWN yields
     * StaleKey carrying receiver().minimum_unseen_key_id().
     * @return INVALID_PARAMETER for any other error
     */
    Result<std::vector<uint8_t>> replay_error_packet(const Credentials& credentials,
                                                     DCError error) const;

private:
    NetworkAddress peer_;
    Secret secret_;
    sender::State sender_;
    receiver::State receiver_;
    ApplicationParams parameters_;
    std::atomic<uint16_t> max_datagram_size_;
    std::chrono::seconds rehandshake_period_;
    std::chrono::steady_clock::time_point created_at_;
    ApplicationData application_data_;
    std::atomic<bool> retired_{false};
    std::atomic<bool> rehandshake_requested_{false};
};

} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_ENTRY_H
