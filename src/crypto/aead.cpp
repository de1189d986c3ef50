#include <dcpath/crypto/aead.h>
#include <dcpath/error.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <climits>
#include <cstring>

namespace dcpath {
namespace crypto {

namespace {

const EVP_CIPHER* aead_cipher(AEADCipher cipher) {
    switch (cipher) {
        case AEADCipher::AES_128_GCM:
            return EVP_aes_128_gcm();
        case AEADCipher::AES_256_GCM:
            return EVP_aes_256_gcm();
        default:
            return nullptr;
    }
}

bool fits_int(size_t length) {
    return length <= static_cast<size_t>(INT_MAX);
}

std::array<uint8_t, 8> to_be_bytes(uint64_t value) {
    std::array<uint8_t, 8> out{};
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(value >> (56 - 8 * i));
    }
    return out;
}

/**
 * One-shot GCM seal over two plaintext segments.
 * inline_data is encrypted in place; extra_in is encrypted into extra_out.
 */
int seal_aead(AEADCipher cipher, const std::vector<uint8_t>& key, const Nonce& nonce,
         const uint8_t* aad, size_t aad_len,
         uint8_t* inline_data, size_t inline_len,
         const uint8_t* extra_in, uint8_t* extra_out, size_t extra_len,
         uint8_t* tag) {
    const EVP_CIPHER* evp_cipher = aead_cipher(cipher);
    if (!evp_cipher) {
        return 0;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return 0;
    }

    int outlen = 0;
    int result = 1;

    if (result == 1) {
        result = EVP_EncryptInit_ex(ctx, evp_cipher, nullptr, nullptr, nullptr);
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN,
                                     static_cast<int>(nonce.size()), nullptr);
    }

    if (result == 1) {
        result = EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data());
    }

    if (result == 1 && aad_len > 0) {
        result = EVP_EncryptUpdate(ctx, nullptr, &outlen, aad, static_cast<int>(aad_len));
    }

    if (result == 1 && inline_len > 0) {
        result = EVP_EncryptUpdate(ctx, inline_data, &outlen, inline_data,
                                   static_cast<int>(inline_len));
    }

    if (result == 1 && extra_len > 0) {
        result = EVP_EncryptUpdate(ctx, extra_out, &outlen, extra_in,
                                   static_cast<int>(extra_len));
    }

    // GCM is a stream mode so Final never emits bytes
    uint8_t final_block[EVP_MAX_BLOCK_LENGTH];
    int final_len = 0;
    if (result == 1) {
        result = EVP_EncryptFinal_ex(ctx, final_block, &final_len);
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG,
                                     static_cast<int>(TAG_LEN), tag);
    }

    EVP_CIPHER_CTX_free(ctx);
    return result;
}

int open_aead(AEADCipher cipher, const std::vector<uint8_t>& key, const Nonce& nonce,
         const uint8_t* aad, size_t aad_len,
         const uint8_t* in, uint8_t* out, size_t len,
         const Tag& tag) {
    const EVP_CIPHER* evp_cipher = aead_cipher(cipher);
    if (!evp_cipher) {
        return 0;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return 0;
    }

    // OpenSSL takes a mutable pointer for SET_TAG
    Tag expected = tag;
    int outlen = 0;
    int result = 1;

    if (result == 1) {
        result = EVP_DecryptInit_ex(ctx, evp_cipher, nullptr, nullptr, nullptr);
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN,
                                     static_cast<int>(nonce.size()), nullptr);
    }

    if (result == 1) {
        result = EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data());
    }

    if (result == 1 && aad_len > 0) {
        result = EVP_DecryptUpdate(ctx, nullptr, &outlen, aad, static_cast<int>(aad_len));
    }

    if (result == 1 && len > 0) {
        result = EVP_DecryptUpdate(ctx, out, &outlen, in, static_cast<int>(len));
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG,
                                     static_cast<int>(expected.size()), expected.data());
    }

    uint8_t final_block[EVP_MAX_BLOCK_LENGTH];
    int final_len = 0;
    if (result == 1) {
        result = EVP_DecryptFinal_ex(ctx, final_block, &final_len) > 0 ? 1 : 0;
    }

    EVP_CIPHER_CTX_free(ctx);
    return result;
}

Result<void> compute_retransmission_tag(AEADCipher cipher, const std::vector<uint8_t>& key,
                                        const Iv& iv, uint64_t original_pn,
                                        uint64_t retransmission_pn, Tag& tag_out) {
    auto aad = to_be_bytes(original_pn);
    Tag tag{};
    int result = seal_aead(cipher, key, iv.nonce(retransmission_pn), aad.data(), aad.size(),
                      nullptr, 0, nullptr, nullptr, 0, tag.data());
    if (result != 1) {
        return make_error<void>(DCError::CRYPTO_PROVIDER_ERROR);
    }

    for (size_t i = 0; i < tag_out.size(); ++i) {
        tag_out[i] ^= tag[i];
    }
    return make_result();
}

} // anonymous namespace

Iv::Iv(const uint8_t* bytes, size_t length) {
    if (bytes == nullptr || length != NONCE_LEN) {
        throw DCException(DCError::INVALID_KEY_MATERIAL, "IV must be NONCE_LEN bytes");
    }
    std::memcpy(bytes_.data(), bytes, NONCE_LEN);
}

Nonce Iv::nonce(uint64_t packet_number) const noexcept {
    Nonce out = bytes_;
    for (size_t i = 0; i < 8; ++i) {
        out[NONCE_LEN - 1 - i] ^= static_cast<uint8_t>(packet_number >> (8 * i));
    }
    return out;
}

size_t key_len(AEADCipher cipher) {
    switch (cipher) {
        case AEADCipher::AES_128_GCM:
            return 16;
        case AEADCipher::AES_256_GCM:
            return 32;
        default:
            throw DCException(DCError::CIPHER_SUITE_NOT_SUPPORTED);
    }
}

// EncryptKey

EncryptKey::EncryptKey(AEADCipher cipher, const uint8_t* key, Iv iv, Credentials credentials)
    : cipher_(cipher), key_(key, key + key_len(cipher)), iv_(iv), credentials_(credentials) {}

EncryptKey::~EncryptKey() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

Result<void> EncryptKey::encrypt(uint64_t nonce,
                                 const std::vector<uint8_t>& header,
                                 const std::vector<uint8_t>& extra_payload,
                                 std::vector<uint8_t>& payload_and_tag) const {
    if (payload_and_tag.size() < TAG_LEN + extra_payload.size()) {
        return make_error<void>(DCError::BUFFER_TOO_SMALL);
    }
    if (!fits_int(header.size()) || !fits_int(payload_and_tag.size())) {
        return make_error<void>(DCError::INVALID_PARAMETER);
    }

    size_t inline_len = payload_and_tag.size() - TAG_LEN - extra_payload.size();
    uint8_t* inline_data = payload_and_tag.data();
    uint8_t* extra_out = inline_data + inline_len;
    uint8_t* tag = extra_out + extra_payload.size();

    int result = seal_aead(cipher_, key_, iv_.nonce(nonce), header.data(), header.size(),
                      inline_data, inline_len,
                      extra_payload.data(), extra_out, extra_payload.size(),
                      tag);
    if (result != 1) {
        return make_error<void>(DCError::CRYPTO_PROVIDER_ERROR);
    }
    return make_result();
}

Result<void> EncryptKey::retransmission_tag(uint64_t original_pn,
                                            uint64_t retransmission_pn,
                                            Tag& tag_out) const {
    return compute_retransmission_tag(cipher_, key_, iv_, original_pn, retransmission_pn, tag_out);
}

// DecryptKey

DecryptKey::DecryptKey(AEADCipher cipher, const uint8_t* key, Iv iv, Credentials credentials)
    : cipher_(cipher), key_(key, key + key_len(cipher)), iv_(iv), credentials_(credentials) {}

DecryptKey::~DecryptKey() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

Result<void> DecryptKey::decrypt(uint64_t nonce,
                                 const std::vector<uint8_t>& header,
                                 const std::vector<uint8_t>& payload_in,
                                 const Tag& tag,
                                 std::vector<uint8_t>& payload_out) const {
    if (!fits_int(header.size()) || !fits_int(payload_in.size())) {
        return make_error<void>(DCError::INVALID_TAG);
    }

    payload_out.resize(payload_in.size());
    int result = open_aead(cipher_, key_, iv_.nonce(nonce), header.data(), header.size(),
                      payload_in.data(), payload_out.data(), payload_in.size(), tag);
    if (result != 1) {
        if (!payload_out.empty()) {
            OPENSSL_cleanse(payload_out.data(), payload_out.size());
        }
        return make_error<void>(DCError::INVALID_TAG);
    }
    return make_result();
}

Result<void> DecryptKey::decrypt_in_place(uint64_t nonce,
                                          const std::vector<uint8_t>& header,
                                          std::vector<uint8_t>& payload_and_tag) const {
    if (payload_and_tag.size() < TAG_LEN || !fits_int(header.size()) ||
        !fits_int(payload_and_tag.size())) {
        return make_error<void>(DCError::INVALID_TAG);
    }

    size_t payload_len = payload_and_tag.size() - TAG_LEN;
    Tag tag{};
    std::memcpy(tag.data(), payload_and_tag.data() + payload_len, TAG_LEN);

    int result = open_aead(cipher_, key_, iv_.nonce(nonce), header.data(), header.size(),
                      payload_and_tag.data(), payload_and_tag.data(), payload_len, tag);
    if (result != 1) {
        OPENSSL_cleanse(payload_and_tag.data(), payload_and_tag.size());
        return make_error<void>(DCError::INVALID_TAG);
    }

    payload_and_tag.resize(payload_len);
    return make_result();
}

Result<void> DecryptKey::retransmission_tag(uint64_t original_pn,
                                            uint64_t retransmission_pn,
                                            Tag& tag_out) const {
    return compute_retransmission_tag(cipher_, key_, iv_, original_pn, retransmission_pn, tag_out);
}

bool same_key_material(const EncryptKey& sealer, const DecryptKey& opener) {
    if (sealer.cipher_ != opener.cipher_ || sealer.key_.size() != opener.key_.size()) {
        return false;
    }
    int key_diff = CRYPTO_memcmp(sealer.key_.data(), opener.key_.data(), sealer.key_.size());
    int iv_diff = CRYPTO_memcmp(sealer.iv_.bytes().data(), opener.iv_.bytes().data(), NONCE_LEN);
    return key_diff == 0 && iv_diff == 0;
}

} // namespace crypto
} // namespace dcpath
