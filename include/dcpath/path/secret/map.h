#ifndef DCPATH_PATH_SECRET_MAP_H
#define DCPATH_PATH_SECRET_MAP_H

#include <dcpath/config.h>
#include <dcpath/path/secret/store.h>
#include <dcpath/path/secret/map_state.h>
#include <memory>
#include <vector>

namespace dcpath {
namespace path {
namespace secret {

/**
 * Handle to the process-wide path secret directory.
 *
 * Copies share the same Store, so a Map can be handed to every connection
 * and to the datagram receive loop.
 */
class DCPATH_API Map {
public:
    using Config = MapState::Config;

    Map(stateless_reset::Signer signer, const Config& config);
    explicit Map(std::shared_ptr<Store> store);

    Store& store() const noexcept { return *store_; }

    size_t secrets_capacity() const { return store_->secrets_capacity(); }
    size_t secrets_len() const { return store_->secrets_len(); }
    size_t peers_len() const { return store_->peers_len(); }

    bool contains(const NetworkAddress& peer) const { return store_->contains(peer); }
    std::shared_ptr<Entry> get_by_id(const Id& id) const { return store_->get_by_id(id); }
    std::shared_ptr<Entry> get_by_peer(const NetworkAddress& peer) const { return store_->get_by_peer(peer); }

    void on_new_path_secrets(std::shared_ptr<Entry> entry) { store_->on_new_path_secrets(std::move(entry)); }
    void on_handshake_complete(std::shared_ptr<Entry> entry) { store_->on_handshake_complete(std::move(entry)); }

    Result<ApplicationData> application_data(const TlsSession& session) const {
        return store_->application_data(session);
    }

    std::chrono::seconds rehandshake_period() const { return store_->rehandshake_period(); }
    const stateless_reset::Signer& signer() const { return store_->signer(); }

    void register_make_application_data(MakeApplicationData callback) {
        store_->register_make_application_data(std::move(callback));
    }

    void register_request_handshake(RequestHandshake callback) {
        store_->register_request_handshake(std::move(callback));
    }

    size_t request_due_handshakes(std::chrono::steady_clock::time_point now) {
        return store_->request_due_handshakes(now);
    }

    /**
     * Offer a datagram that may be a secret control packet.
     *
     * @return true if the datagram was a complete control packet and was
     *         dispatched (whether or not it authenticated); false if it
     *         should go through ordinary packet processing
     */
    bool on_possible_secret_control_packet(const NetworkAddress& peer,
                                           const uint8_t* data, size_t length);
    bool on_possible_secret_control_packet(const NetworkAddress& peer,
                                           const std::vector<uint8_t>& datagram);

    /**
     * Receive path, before decryption: find the entry for the credentials
     * and run the replay window's cheap check.
     *
     * On UNKNOWN_PATH_SECRET control_out holds an UnknownPathSecret packet
     * signed by this map; on a replay error it holds the packet from
     * Entry::replay_error_packet. Otherwise control_out is left empty.
     */
    Result<std::shared_ptr<Entry>> pre_authentication(const Credentials& credentials,
                                                      std::vector<uint8_t>& control_out) const;

    /**
     * Receive path, after the payload authenticated. Fills control_out as
     * pre_authentication does when the packet is a replay.
     */
    Result<void> post_authentication(Entry& entry,
                                     const Credentials& credentials,
                                     std::vector<uint8_t>& control_out) const;

private:
    std::shared_ptr<Store> store_;
};

} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_MAP_H
