#ifndef DCPATH_PATH_SECRET_SCHEDULE_H
#define DCPATH_PATH_SECRET_SCHEDULE_H

#include <dcpath/config.h>
#include <dcpath/types.h>
#include <dcpath/result.h>
#include <dcpath/credentials.h>
#include <dcpath/crypto/hkdf.h>
#include <dcpath/crypto/aead.h>
#include <array>
#include <utility>

namespace dcpath {
namespace path {
namespace secret {

/**
 * Cipher suites a path secret can be negotiated with. Each one selects the
 * AEAD used for traffic keys and the hash used by HKDF.
 */
enum class Ciphersuite : uint8_t {
    AES_GCM_128_SHA256 = 0,
    AES_GCM_256_SHA384 = 1
};

DCPATH_API AEADCipher aead_of(Ciphersuite ciphersuite);
DCPATH_API HashAlgorithm hash_of(Ciphersuite ciphersuite);
DCPATH_API size_t key_len_of(Ciphersuite ciphersuite);

/**
 * Map the TLS negotiated suite onto a path ciphersuite.
 * @return CIPHER_SUITE_NOT_SUPPORTED for anything but the two AES-GCM suites
 */
DCPATH_API Result<Ciphersuite> ciphersuite_from_tls(CipherSuite suite);

DCPATH_API std::string to_string(Ciphersuite ciphersuite);

constexpr size_t EXPORT_SECRET_LEN = 32;
using ExportSecret = std::array<uint8_t, EXPORT_SECRET_LEN>;

constexpr const char* TLS_EXPORTER_LABEL = "EXPERIMENTAL EXPORTER s2n-quic-dc";

/**
 * Key schedule of a single path secret.
 *
 * Every derivation is an HKDF-Expand whose info is the concatenation of
 * [u16 output length][purpose][role label][key id], so keys for different
 * purposes, directions or key ids never collide. The role labels are chosen
 * so the client sealer and the server opener derive the same bytes.
 *
 * Immutable after construction.
 */
class DCPATH_API Secret {
public:
    /**
     * Build a schedule from the TLS exporter output and derive the id.
     * @throws DCException(KEY_DERIVATION_FAILED) on an invalid ciphersuite
     */
    Secret(Ciphersuite ciphersuite,
           DcVersion version,
           EndpointType endpoint,
           const ExportSecret& export_secret);

    const Id& id() const noexcept { return id_; }
    EndpointType endpoint() const noexcept { return endpoint_; }
    Ciphersuite ciphersuite() const noexcept { return ciphersuite_; }
    DcVersion version() const noexcept { return version_; }

    /**
     * Derive both directions of a bidirectional stream key.
     * @return (sealer, opener) as seen by the local endpoint
     */
    std::pair<crypto::EncryptKey, crypto::DecryptKey>
    application_pair(KeyId key_id, Initiator initiator) const;

    crypto::EncryptKey application_sealer(KeyId key_id) const;
    crypto::DecryptKey application_opener(KeyId key_id) const;

    // Keys for secret control packets, always key id 0
    crypto::EncryptKey control_sealer() const;
    crypto::DecryptKey control_opener() const;

private:
    std::pair<std::vector<uint8_t>, crypto::Iv>
    derive_directional(const char* purpose, Direction direction, const KeyId* key_id) const;

    Id id_;
    crypto::Prk prk_;
    EndpointType endpoint_;
    Ciphersuite ciphersuite_;
    DcVersion version_;
};

} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_SCHEDULE_H
