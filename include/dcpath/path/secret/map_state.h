#ifndef DCPATH_PATH_SECRET_MAP_STATE_H
#define DCPATH_PATH_SECRET_MAP_STATE_H

#include <dcpath/config.h>
#include <dcpath/path/secret/store.h>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace dcpath {
namespace path {
namespace secret {

/**
 * In-memory Store: two hash directories behind reader/writer locks and a
 * FIFO of weak references that bounds how many secrets are retained.
 */
class DCPATH_API MapState : public Store {
public:
    struct Config {
        size_t capacity = 500000;
        std::chrono::seconds rehandshake_period{std::chrono::hours(24)};
        receiver::State::Config receiver;
        std::shared_ptr<ErrorReporter> reporter;
    };

    /**
     * @throws DCException(INVALID_PARAMETER) if capacity is zero
     */
    MapState(stateless_reset::Signer signer, const Config& config);
    ~MapState() override;

    MapState(const MapState&) = delete;
    MapState& operator=(const MapState&) = delete;

    size_t secrets_capacity() const override { return config_.capacity; }
    size_t secrets_len() const override;
    size_t peers_len() const override;

    bool contains(const NetworkAddress& peer) const override;
    std::shared_ptr<Entry> get_by_id(const Id& id) const override;
    std::shared_ptr<Entry> get_by_peer(const NetworkAddress& peer) const override;

    void on_new_path_secrets(std::shared_ptr<Entry> entry) override;
    void on_handshake_complete(std::shared_ptr<Entry> entry) override;

    Result<ApplicationData> application_data(const TlsSession& session) const override;

    std::chrono::seconds rehandshake_period() const override { return config_.rehandshake_period; }
    receiver::State::Config receiver_config() const override { return config_.receiver; }
    const stateless_reset::Signer& signer() const override { return signer_; }
    std::shared_ptr<ErrorReporter> reporter() const override { return config_.reporter; }

    void register_make_application_data(MakeApplicationData callback) override;
    void register_request_handshake(RequestHandshake callback) override;
    void request_handshake(const NetworkAddress& peer) override;

    Result<void> handle_control_packet(const control::Packet& packet,
                                       const NetworkAddress& peer) override;

    size_t request_due_handshakes(std::chrono::steady_clock::time_point now) override;

private:
    Result<void> handle_stale_key(const control::StaleKey& packet, const NetworkAddress& peer);
    Result<void> handle_replay_detected(const control::ReplayDetected& packet,
                                        const NetworkAddress& peer);
    Result<void> handle_unknown_path_secret(const control::UnknownPathSecret& packet,
                                            const NetworkAddress& peer);

    void note_peer_mismatch(const std::shared_ptr<Entry>& entry, const NetworkAddress& peer) const;
    void evict(const std::shared_ptr<Entry>& entry);

    stateless_reset::Signer signer_;
    Config config_;

    mutable std::shared_mutex ids_mutex_;
    std::unordered_map<Id, std::shared_ptr<Entry>, IdHash> ids_;

    mutable std::shared_mutex peers_mutex_;
    std::unordered_map<NetworkAddress, std::shared_ptr<Entry>, NetworkAddressHash> peers_;

    std::mutex eviction_mutex_;
    std::deque<std::weak_ptr<Entry>> eviction_queue_;

    mutable std::mutex hooks_mutex_;
    MakeApplicationData make_application_data_;
    RequestHandshake request_handshake_;
};

} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_MAP_STATE_H
