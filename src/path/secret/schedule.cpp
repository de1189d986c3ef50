#include <dcpath/path/secret/schedule.h>
#include <dcpath/error.h>
#include <openssl/crypto.h>
#include <cstring>

namespace dcpath {
namespace path {
namespace secret {

namespace {

constexpr const char* LABEL_CLIENT = " client";
constexpr const char* LABEL_SERVER = " server";

const char* initiator_label(EndpointType endpoint, Initiator initiator) {
    bool client = (endpoint == EndpointType::CLIENT && initiator == Initiator::LOCAL) ||
                  (endpoint == EndpointType::SERVER && initiator == Initiator::REMOTE);
    return client ? LABEL_CLIENT : LABEL_SERVER;
}

const char* direction_label(EndpointType endpoint, Direction direction) {
    bool client = (endpoint == EndpointType::CLIENT && direction == Direction::SEND) ||
                  (endpoint == EndpointType::SERVER && direction == Direction::RECEIVE);
    return client ? LABEL_CLIENT : LABEL_SERVER;
}

void append(std::vector<uint8_t>& info, const char* label) {
    info.insert(info.end(), label, label + std::strlen(label));
}

void append_u16(std::vector<uint8_t>& info, size_t value) {
    info.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    info.push_back(static_cast<uint8_t>(value & 0xFF));
}

void append_u64(std::vector<uint8_t>& info, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        info.push_back(static_cast<uint8_t>(value >> shift));
    }
}

// Zeroes derived key material on scope exit
struct ScopedCleanse {
    std::vector<uint8_t>& bytes;
    ~ScopedCleanse() {
        if (!bytes.empty()) {
            OPENSSL_cleanse(bytes.data(), bytes.size());
        }
    }
};

} // anonymous namespace

AEADCipher aead_of(Ciphersuite ciphersuite) {
    switch (ciphersuite) {
        case Ciphersuite::AES_GCM_128_SHA256:
            return AEADCipher::AES_128_GCM;
        case Ciphersuite::AES_GCM_256_SHA384:
            return AEADCipher::AES_256_GCM;
        default:
            throw DCException(DCError::CIPHER_SUITE_NOT_SUPPORTED);
    }
}

HashAlgorithm hash_of(Ciphersuite ciphersuite) {
    switch (ciphersuite) {
        case Ciphersuite::AES_GCM_128_SHA256:
            return HashAlgorithm::SHA256;
        case Ciphersuite::AES_GCM_256_SHA384:
            return HashAlgorithm::SHA384;
        default:
            throw DCException(DCError::CIPHER_SUITE_NOT_SUPPORTED);
    }
}

size_t key_len_of(Ciphersuite ciphersuite) {
    return crypto::key_len(aead_of(ciphersuite));
}

Result<Ciphersuite> ciphersuite_from_tls(CipherSuite suite) {
    switch (suite) {
        case CipherSuite::TLS_AES_128_GCM_SHA256:
            return make_result(Ciphersuite::AES_GCM_128_SHA256);
        case CipherSuite::TLS_AES_256_GCM_SHA384:
            return make_result(Ciphersuite::AES_GCM_256_SHA384);
        default:
            return make_error<Ciphersuite>(DCError::CIPHER_SUITE_NOT_SUPPORTED);
    }
}

std::string to_string(Ciphersuite ciphersuite) {
    switch (ciphersuite) {
        case Ciphersuite::AES_GCM_128_SHA256: return "AES_GCM_128_SHA256";
        case Ciphersuite::AES_GCM_256_SHA384: return "AES_GCM_256_SHA384";
        default: return "UNKNOWN";
    }
}

Secret::Secret(Ciphersuite ciphersuite,
               DcVersion version,
               EndpointType endpoint,
               const ExportSecret& export_secret)
    : prk_(hash_of(ciphersuite), export_secret.data(), export_secret.size())
    , endpoint_(endpoint)
    , ciphersuite_(ciphersuite)
    , version_(version) {
    std::vector<uint8_t> info;
    info.push_back(static_cast<uint8_t>(ID_LEN));
    append(info, " pid");
    prk_.expand_into(info, id_.bytes.data(), id_.bytes.size());
}

std::pair<crypto::EncryptKey, crypto::DecryptKey>
Secret::application_pair(KeyId key_id, Initiator initiator) const {
    size_t key_len = key_len_of(ciphersuite_);
    size_t out_len = (key_len + NONCE_LEN) * 2;

    std::vector<uint8_t> info;
    append_u16(info, out_len);
    append(info, " bidi");
    append(info, initiator_label(endpoint_, initiator));
    append(info, " app");
    append_u64(info, key_id);

    std::vector<uint8_t> out = prk_.expand(info, out_len);
    ScopedCleanse cleanse{out};

    // More secret material first: (client_key, server_key, client_iv, server_iv)
    const uint8_t* client_key = out.data();
    const uint8_t* server_key = client_key + key_len;
    const uint8_t* client_iv = server_key + key_len;
    const uint8_t* server_iv = client_iv + NONCE_LEN;

    bool is_client = endpoint_ == EndpointType::CLIENT;
    const uint8_t* sealer_key = is_client ? client_key : server_key;
    const uint8_t* sealer_iv = is_client ? client_iv : server_iv;
    const uint8_t* opener_key = is_client ? server_key : client_key;
    const uint8_t* opener_iv = is_client ? server_iv : client_iv;

    AEADCipher cipher = aead_of(ciphersuite_);
    Credentials credentials{id_, key_id};
    return std::make_pair(
        crypto::EncryptKey(cipher, sealer_key, crypto::Iv(sealer_iv, NONCE_LEN), credentials),
        crypto::DecryptKey(cipher, opener_key, crypto::Iv(opener_iv, NONCE_LEN), credentials));
}

crypto::EncryptKey Secret::application_sealer(KeyId key_id) const {
    auto derived = derive_directional(" uni", Direction::SEND, &key_id);
    ScopedCleanse cleanse{derived.first};
    return crypto::EncryptKey(aead_of(ciphersuite_), derived.first.data(), derived.second,
                              Credentials{id_, key_id});
}

crypto::DecryptKey Secret::application_opener(KeyId key_id) const {
    auto derived = derive_directional(" uni", Direction::RECEIVE, &key_id);
    ScopedCleanse cleanse{derived.first};
    return crypto::DecryptKey(aead_of(ciphersuite_), derived.first.data(), derived.second,
                              Credentials{id_, key_id});
}

crypto::EncryptKey Secret::control_sealer() const {
    auto derived = derive_directional(" ctl", Direction::SEND, nullptr);
    ScopedCleanse cleanse{derived.first};
    return crypto::EncryptKey(aead_of(ciphersuite_), derived.first.data(), derived.second,
                              Credentials{id_, 0});
}

crypto::DecryptKey Secret::control_opener() const {
    auto derived = derive_directional(" ctl", Direction::RECEIVE, nullptr);
    ScopedCleanse cleanse{derived.first};
    return crypto::DecryptKey(aead_of(ciphersuite_), derived.first.data(), derived.second,
                              Credentials{id_, 0});
}

std::pair<std::vector<uint8_t>, crypto::Iv>
Secret::derive_directional(const char* purpose, Direction direction, const KeyId* key_id) const {
    size_t key_len = key_len_of(ciphersuite_);
    size_t out_len = key_len + NONCE_LEN;

    std::vector<uint8_t> info;
    append_u16(info, out_len);
    append(info, purpose);
    append(info, direction_label(endpoint_, direction));
    if (key_id != nullptr) {
        append_u64(info, *key_id);
    }

    // (key, iv)
    std::vector<uint8_t> out = prk_.expand(info, out_len);
    crypto::Iv iv(out.data() + key_len, NONCE_LEN);
    OPENSSL_cleanse(out.data() + key_len, NONCE_LEN);
    out.resize(key_len);
    return std::make_pair(std::move(out), iv);
}

} // namespace secret
} // namespace path
} // namespace dcpath
