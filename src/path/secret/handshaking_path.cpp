#include <dcpath/path/secret/handshaking_path.h>
#include <openssl/crypto.h>
#include <cstring>

namespace dcpath {
namespace path {
namespace secret {

namespace {

// Wipes a buffer of key material on scope exit, including by exception.
// The buffer is read at destruction, so it may be resized in between.
template<typename Buffer>
class KeyMaterialWipe {
public:
    explicit KeyMaterialWipe(Buffer& buffer) : buffer_(buffer) {}
    ~KeyMaterialWipe() { OPENSSL_cleanse(buffer_.data(), buffer_.size()); }

    KeyMaterialWipe(const KeyMaterialWipe&) = delete;
    KeyMaterialWipe& operator=(const KeyMaterialWipe&) = delete;

private:
    Buffer& buffer_;
};

} // anonymous namespace

HandshakingPath::HandshakingPath(const ConnectionInfo& info, Map map)
    : inner_(std::make_shared<Inner>(info, std::move(map))) {}

Result<std::vector<stateless_reset::Token>>
HandshakingPath::on_path_secrets_ready(const TlsSession& session) {
    using Tokens = std::vector<stateless_reset::Token>;
    std::lock_guard<std::mutex> lock(inner_->mutex);
    Inner& inner = *inner_;

    if (inner.state == State::FAILED) {
        return make_error<Tokens>(sticky_error(inner));
    }
    if (inner.state != State::AWAITING_SECRETS) {
        return make_error<Tokens>(ordering_violation(inner, "on_path_secrets_ready"));
    }

    auto application_data = inner.map.application_data(session);
    if (application_data.is_error()) {
        return make_error<Tokens>(fail(inner, DCError::APPLICATION_ERROR,
                                       "application data hook rejected the session: " +
                                       error_message(application_data.error())));
    }
    inner.application_data = *application_data;

    std::vector<uint8_t> exported(EXPORT_SECRET_LEN);
    ExportSecret export_secret{};
    KeyMaterialWipe<std::vector<uint8_t>> wipe_exported(exported);
    KeyMaterialWipe<ExportSecret> wipe_export_secret(export_secret);

    Tokens tokens;
    try {
        auto export_result = session.tls_exporter(TLS_EXPORTER_LABEL, {}, exported);
        if (export_result.is_error() || exported.size() != EXPORT_SECRET_LEN) {
            return make_error<Tokens>(fail(inner, DCError::INTERNAL_ERROR, "TLS exporter failed"));
        }

        auto ciphersuite = ciphersuite_from_tls(session.cipher_suite());
        if (ciphersuite.is_error()) {
            return make_error<Tokens>(fail(inner, DCError::INTERNAL_ERROR,
                                           "unsupported cipher suite " +
                                           dcpath::to_string(session.cipher_suite())));
        }

        std::memcpy(export_secret.data(), exported.data(), EXPORT_SECRET_LEN);
        inner.secret.emplace(*ciphersuite, inner.info.dc_version, inner.info.endpoint_type,
                             export_secret);
        tokens.push_back(inner.map.signer().sign(inner.secret->id()));
    } catch (const DCException& e) {
        return make_error<Tokens>(fail(inner, DCError::INTERNAL_ERROR,
                                       std::string("path secret derivation failed: ") + e.what()));
    }

    inner.state = State::SECRETS_READY;
    return make_result(std::move(tokens));
}

Result<void> HandshakingPath::on_peer_stateless_reset_tokens(
        const std::vector<stateless_reset::Token>& tokens) {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    Inner& inner = *inner_;

    if (inner.state == State::FAILED) {
        return make_error<void>(sticky_error(inner));
    }
    if (inner.state != State::SECRETS_READY || !inner.secret) {
        return make_error<void>(ordering_violation(inner, "on_peer_stateless_reset_tokens"));
    }
    if (tokens.empty()) {
        return make_error<void>(fail(inner, DCError::INVALID_PARAMETER,
                                     "peer sent no stateless reset token"));
    }

    // TODO: keep every token once the sender rotates through them
    auto entry = std::make_shared<Entry>(inner.info.remote_address,
                                         std::move(*inner.secret),
                                         tokens.front(),
                                         inner.info.application_params,
                                         inner.map.rehandshake_period(),
                                         inner.application_data,
                                         inner.map.store().receiver_config());
    inner.secret.reset();

    inner.map.on_new_path_secrets(entry);
    inner.entry = std::move(entry);
    inner.state = State::ENTRY_CREATED;
    return make_result();
}

Result<void> HandshakingPath::on_dc_handshake_complete() {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    Inner& inner = *inner_;

    if (inner.state == State::FAILED) {
        return make_error<void>(sticky_error(inner));
    }
    if (inner.state != State::ENTRY_CREATED || !inner.entry) {
        return make_error<void>(ordering_violation(inner, "on_dc_handshake_complete"));
    }

    inner.map.on_handshake_complete(inner.entry);
    inner.state = State::COMPLETE;
    return make_result();
}

void HandshakingPath::on_mtu_updated(uint16_t mtu) {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    if (inner_->entry) {
        inner_->entry->update_max_datagram_size(mtu);
    }
}

std::optional<DCError> HandshakingPath::take_error() {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    std::optional<DCError> error = inner_->error;
    inner_->error.reset();
    return error;
}

HandshakingPath::State HandshakingPath::state() const {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    return inner_->state;
}

std::shared_ptr<Entry> HandshakingPath::entry() const {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    return inner_->entry;
}

// Private method implementations (mutex held)

DCError HandshakingPath::fail(Inner& inner, DCError error, const std::string& message) {
    inner.state = State::FAILED;
    inner.error = error;
    inner.secret.reset();
    DCPATH_REPORT_ERROR(inner.map.store().reporter(), ErrorReporter::LogLevel::ERROR,
                        error, message);
    return error;
}

DCError HandshakingPath::ordering_violation(Inner& inner, const char* transition) {
    std::string message = std::string(transition) + " called in state " + to_string(inner.state);
    inner.state = State::FAILED;
    inner.error = DCError::INVALID_STATE;
    inner.secret.reset();
    DCPATH_REPORT_ERROR(inner.map.store().reporter(), ErrorReporter::LogLevel::CRITICAL,
                        DCError::INVALID_STATE, message);
    return DCError::INVALID_STATE;
}

DCError HandshakingPath::sticky_error(const Inner& inner) {
    return inner.error.value_or(DCError::INVALID_STATE);
}

std::string to_string(HandshakingPath::State state) {
    switch (state) {
        case HandshakingPath::State::AWAITING_SECRETS: return "AWAITING_SECRETS";
        case HandshakingPath::State::SECRETS_READY: return "SECRETS_READY";
        case HandshakingPath::State::ENTRY_CREATED: return "ENTRY_CREATED";
        case HandshakingPath::State::COMPLETE: return "COMPLETE";
        case HandshakingPath::State::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace secret
} // namespace path
} // namespace dcpath
