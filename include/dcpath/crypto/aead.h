#ifndef DCPATH_CRYPTO_AEAD_H
#define DCPATH_CRYPTO_AEAD_H

#include <dcpath/config.h>
#include <dcpath/types.h>
#include <dcpath/result.h>
#include <dcpath/credentials.h>
#include <array>
#include <cstdint>
#include <vector>

namespace dcpath {
namespace crypto {

using Nonce = std::array<uint8_t, NONCE_LEN>;
using Tag = std::array<uint8_t, TAG_LEN>;

/**
 * Base IV of a traffic key. Per-packet nonces are the big-endian packet
 * number left padded to NONCE_LEN and XORed with the IV.
 */
class DCPATH_API Iv {
public:
    Iv() = default;
    explicit Iv(const Nonce& bytes) : bytes_(bytes) {}
    Iv(const uint8_t* bytes, size_t length);

    Nonce nonce(uint64_t packet_number) const noexcept;

    const Nonce& bytes() const noexcept { return bytes_; }

private:
    Nonce bytes_{};
};

DCPATH_API size_t key_len(AEADCipher cipher);

class DecryptKey;

/**
 * Sealing half of an AES-GCM traffic key.
 *
 * Immutable after construction and safe to share across threads; every call
 * uses its own cipher context. The caller must never reuse a nonce value.
 */
class DCPATH_API EncryptKey {
public:
    EncryptKey(AEADCipher cipher, const uint8_t* key, Iv iv, Credentials credentials);
    ~EncryptKey();

    EncryptKey(const EncryptKey&) = default;
    EncryptKey& operator=(const EncryptKey&) = default;
    EncryptKey(EncryptKey&&) noexcept = default;
    EncryptKey& operator=(EncryptKey&&) noexcept = default;

    /**
     * Seal in place with scatter output.
     *
     * payload_and_tag is laid out as [payload][extra][tag]: the leading bytes
     * hold the plaintext and are encrypted in place, extra_payload is
     * encrypted into the following extra_payload.size() bytes and the tag is
     * written to the final TAG_LEN bytes. All three are covered by one tag.
     *
     * @return BUFFER_TOO_SMALL if payload_and_tag is shorter than
     *         tag_len() + extra_payload.size()
     */
    Result<void> encrypt(uint64_t nonce,
                         const std::vector<uint8_t>& header,
                         const std::vector<uint8_t>& extra_payload,
                         std::vector<uint8_t>& payload_and_tag) const;

    /**
     * XOR a tag binding original_pn to retransmission_pn into tag_out.
     */
    Result<void> retransmission_tag(uint64_t original_pn,
                                    uint64_t retransmission_pn,
                                    Tag& tag_out) const;

    size_t tag_len() const noexcept { return TAG_LEN; }
    AEADCipher cipher() const noexcept { return cipher_; }
    const Credentials& credentials() const noexcept { return credentials_; }

private:
    friend bool same_key_material(const EncryptKey&, const DecryptKey&);

    AEADCipher cipher_;
    std::vector<uint8_t> key_;
    Iv iv_;
    Credentials credentials_;
};

/**
 * Opening half of an AES-GCM traffic key.
 *
 * Every authentication failure is reported as INVALID_TAG without saying
 * which input was wrong.
 */
class DCPATH_API DecryptKey {
public:
    DecryptKey(AEADCipher cipher, const uint8_t* key, Iv iv, Credentials credentials);
    ~DecryptKey();

    DecryptKey(const DecryptKey&) = default;
    DecryptKey& operator=(const DecryptKey&) = default;
    DecryptKey(DecryptKey&&) noexcept = default;
    DecryptKey& operator=(DecryptKey&&) noexcept = default;

    /**
     * Open payload_in with tag into payload_out (resized to payload_in.size()).
     * payload_out is zeroed when authentication fails.
     */
    Result<void> decrypt(uint64_t nonce,
                         const std::vector<uint8_t>& header,
                         const std::vector<uint8_t>& payload_in,
                         const Tag& tag,
                         std::vector<uint8_t>& payload_out) const;

    /**
     * Open [ciphertext][tag] in place. On success payload_and_tag is
     * truncated to the plaintext.
     */
    Result<void> decrypt_in_place(uint64_t nonce,
                                  const std::vector<uint8_t>& header,
                                  std::vector<uint8_t>& payload_and_tag) const;

    Result<void> retransmission_tag(uint64_t original_pn,
                                    uint64_t retransmission_pn,
                                    Tag& tag_out) const;

    size_t tag_len() const noexcept { return TAG_LEN; }
    AEADCipher cipher() const noexcept { return cipher_; }
    const Credentials& credentials() const noexcept { return credentials_; }

private:
    friend bool same_key_material(const EncryptKey&, const DecryptKey&);

    AEADCipher cipher_;
    std::vector<uint8_t> key_;
    Iv iv_;
    Credentials credentials_;
};

/**
 * Constant-time check that a sealer and opener hold the same key and IV.
 */
DCPATH_API bool same_key_material(const EncryptKey& sealer, const DecryptKey& opener);

} // namespace crypto
} // namespace dcpath

#endif // DCPATH_CRYPTO_AEAD_H
