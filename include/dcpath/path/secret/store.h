#ifndef DCPATH_PATH_SECRET_STORE_H
#define DCPATH_PATH_SECRET_STORE_H

#include <dcpath/config.h>
#include <dcpath/types.h>
#include <dcpath/result.h>
#include <dcpath/credentials.h>
#include <dcpath/error_reporter.h>
#include <dcpath/crypto/stateless_reset.h>
#include <dcpath/path/secret/entry.h>
#include <dcpath/path/secret/control_packet.h>
#include <dcpath/path/secret/tls_session.h>
#include <chrono>
#include <functional>
#include <memory>

namespace dcpath {
namespace path {
namespace secret {

using MakeApplicationData = std::function<Result<ApplicationData>(const TlsSession&)>;
using RequestHandshake = std::function<void(const NetworkAddress&)>;

/**
 * Directory of path secrets shared by every connection of a process.
 *
 * Implementations must be safe to call from any thread, including from
 * inside a HandshakingPath transition.
 */
class DCPATH_API Store {
public:
    virtual ~Store() = default;

    virtual size_t secrets_capacity() const = 0;
    virtual size_t secrets_len() const = 0;
    virtual size_t peers_len() const = 0;

    virtual bool contains(const NetworkAddress& peer) const = 0;
    virtual std::shared_ptr<Entry> get_by_id(const Id& id) const = 0;
    virtual std::shared_ptr<Entry> get_by_peer(const NetworkAddress& peer) const = 0;

    /**
     * Publish an entry by id. The oldest entries beyond capacity are evicted.
     */
    virtual void on_new_path_secrets(std::shared_ptr<Entry> entry) = 0;

    /**
     * Publish an entry by peer address, retiring the entry it replaces.
     */
    virtual void on_handshake_complete(std::shared_ptr<Entry> entry) = 0;

    /**
     * Application data for a completed TLS session. A null value means the
     * application attached nothing.
     */
    virtual Result<ApplicationData> application_data(const TlsSession& session) const = 0;

    virtual std::chrono::seconds rehandshake_period() const = 0;
    virtual receiver::State::Config receiver_config() const = 0;
    virtual const stateless_reset::Signer& signer() const = 0;
    virtual std::shared_ptr<ErrorReporter> reporter() const = 0;

    virtual void register_make_application_data(MakeApplicationData callback) = 0;
    virtual void register_request_handshake(RequestHandshake callback) = 0;
    virtual void request_handshake(const NetworkAddress& peer) = 0;

    /**
     * Authenticate and act on a decoded control packet from peer.
     */
    virtual Result<void> handle_control_packet(const control::Packet& packet,
                                               const NetworkAddress& peer) = 0;

    /**
     * Request a handshake with every peer whose entry outlived the
     * rehandshake period. Each entry is requested once.
     * @return Number of handshakes requested
     */
    virtual size_t request_due_handshakes(std::chrono::steady_clock::time_point now) = 0;
};

} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_STORE_H
