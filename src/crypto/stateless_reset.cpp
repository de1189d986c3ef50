#include <dcpath/crypto/stateless_reset.h>
#include <dcpath/error.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <cstring>

namespace dcpath {
namespace stateless_reset {

bool Token::operator==(const Token& other) const noexcept {
    return CRYPTO_memcmp(bytes.data(), other.bytes.data(), TOKEN_LEN) == 0;
}

Signer::Signer(const std::vector<uint8_t>& key) : key_(key) {
    if (key_.empty()) {
        throw DCException(DCError::INVALID_KEY_MATERIAL, "stateless reset key is empty");
    }
}

Signer::~Signer() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

Signer Signer::random() {
    std::vector<uint8_t> key(KEY_LEN);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        throw DCException(DCError::RANDOM_GENERATION_FAILED);
    }
    Signer signer(key);
    OPENSSL_cleanse(key.data(), key.size());
    return signer;
}

Token Signer::sign(const Id& id) const {
    uint8_t mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;

    unsigned char* result = HMAC(EVP_sha256(),
                                 key_.data(), static_cast<int>(key_.size()),
                                 id.bytes.data(), id.bytes.size(),
                                 mac, &mac_len);
    if (result == nullptr || mac_len < TOKEN_LEN) {
        throw DCException(DCError::CRYPTO_PROVIDER_ERROR, "HMAC failed");
    }

    Token token;
    std::memcpy(token.bytes.data(), mac, TOKEN_LEN);
    OPENSSL_cleanse(mac, sizeof(mac));
    return token;
}

} // namespace stateless_reset
} // namespace dcpath
