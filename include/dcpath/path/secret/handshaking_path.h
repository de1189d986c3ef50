#ifndef DCPATH_PATH_SECRET_HANDSHAKING_PATH_H
#define DCPATH_PATH_SECRET_HANDSHAKING_PATH_H

#include <dcpath/config.h>
#include <dcpath/types.h>
#include <dcpath/result.h>
#include <dcpath/crypto/stateless_reset.h>
#include <dcpath/path/secret/map.h>
#include <dcpath/path/secret/tls_session.h>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace dcpath {
namespace path {
namespace secret {

struct ConnectionInfo {
    NetworkAddress remote_address;
    DcVersion dc_version = DC_VERSION_V1;
    ApplicationParams application_params;
    EndpointType endpoint_type = EndpointType::CLIENT;
};

/**
 * Drives one connection attempt from TLS completion to a published Entry.
 *
 *   AWAITING_SECRETS -> SECRETS_READY -> ENTRY_CREATED -> COMPLETE
 *
 * Any failure, including a transition called out of order, moves the path
 * to FAILED, which absorbs every later transition. Copies share state so
 * the TLS callbacks and the dc path manager can each hold one.
 */
class DCPATH_API HandshakingPath {
public:
    enum class State {
        AWAITING_SECRETS,
        SECRETS_READY,
        ENTRY_CREATED,
        COMPLETE,
        FAILED
    };

    HandshakingPath(const ConnectionInfo& info, Map map);

    /**
     * Export the path secret from the finished TLS session.
     *
     * @return the stateless reset tokens to send to the peer (exactly one);
     *         APPLICATION_ERROR if the application data hook fails,
     *         INTERNAL_ERROR if the exporter fails or the cipher suite is
     *         not supported, INVALID_STATE if secrets were already exported
     */
    Result<std::vector<stateless_reset::Token>> on_path_secrets_ready(const TlsSession& session);

    /**
     * Build the Entry from the peer's token and publish it by id. Only the
     * first token is used.
     *
     * @return INVALID_STATE if secrets are not ready yet,
     *         INVALID_PARAMETER if tokens is empty
     */
    Result<void> on_peer_stateless_reset_tokens(const std::vector<stateless_reset::Token>& tokens);

    /**
     * Publish the Entry by peer address.
     * @return INVALID_STATE if no entry was created
     */
    Result<void> on_dc_handshake_complete();

    /**
     * Forward an MTU change to the entry; ignored before the entry exists.
     */
    void on_mtu_updated(uint16_t mtu);

    /**
     * Return and clear the error that moved this path to FAILED.
     */
    std::optional<DCError> take_error();

    State state() const;
    std::shared_ptr<Entry> entry() const;

private:
    struct Inner {
        std::mutex mutex;
        ConnectionInfo info;
        Map map;
        State state = State::AWAITING_SECRETS;
        std::optional<Secret> secret;
        std::shared_ptr<Entry> entry;
        ApplicationData application_data;
        std::optional<DCError> error;

        Inner(const ConnectionInfo& connection_info, Map path_map)
            : info(connection_info), map(std::move(path_map)) {}
    };

    static DCError fail(Inner& inner, DCError error, const std::string& message);
    static DCError ordering_violation(Inner& inner, const char* transition);
    static DCError sticky_error(const Inner& inner);

    std::shared_ptr<Inner> inner_;
};

DCPATH_API std::string to_string(HandshakingPath::State state);

} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_HANDSHAKING_PATH_H
