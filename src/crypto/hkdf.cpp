#include <dcpath/crypto/hkdf.h>
#include <dcpath/error.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/crypto.h>

namespace dcpath {
namespace crypto {

namespace {

const EVP_MD* hash_to_md(HashAlgorithm hash) {
    switch (hash) {
        case HashAlgorithm::SHA256:
            return EVP_sha256();
        case HashAlgorithm::SHA384:
            return EVP_sha384();
        default:
            return nullptr;
    }
}

} // anonymous namespace

Prk::Prk(HashAlgorithm hash, const uint8_t* secret, size_t length)
    : hash_(hash), prk_(secret, secret + length) {
    if (hash_to_md(hash) == nullptr || length == 0) {
        throw DCException(DCError::KEY_DERIVATION_FAILED, "unsupported HKDF parameters");
    }
}

Prk::~Prk() {
    if (!prk_.empty()) {
        OPENSSL_cleanse(prk_.data(), prk_.size());
    }
}

void Prk::expand_into(const std::vector<uint8_t>& info, uint8_t* out, size_t out_len) const {
    const EVP_MD* md = hash_to_md(hash_);
    if (md == nullptr || out == nullptr || out_len == 0 ||
        out_len > 255 * static_cast<size_t>(EVP_MD_get_size(md))) {
        throw DCException(DCError::KEY_DERIVATION_FAILED, "invalid HKDF output length");
    }

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        throw DCException(DCError::OUT_OF_MEMORY);
    }

    size_t derived_len = out_len;
    int result = 1;

    if (result == 1) {
        result = EVP_PKEY_derive_init(pctx);
    }

    if (result == 1) {
        result = EVP_PKEY_CTX_set_hkdf_mode(pctx, EVP_PKEY_HKDEF_MODE_EXPAND_ONLY);
    }

    if (result == 1) {
        result = EVP_PKEY_CTX_set_hkdf_md(pctx, md);
    }

    // In expand-only mode the key is the PRK
    if (result == 1) {
        result = EVP_PKEY_CTX_set1_hkdf_key(pctx, prk_.data(), static_cast<int>(prk_.size()));
    }

    if (result == 1 && !info.empty()) {
        result = EVP_PKEY_CTX_add1_hkdf_info(pctx, info.data(), static_cast<int>(info.size()));
    }

    if (result == 1) {
        result = EVP_PKEY_derive(pctx, out, &derived_len);
    }

    EVP_PKEY_CTX_free(pctx);

    if (result != 1 || derived_len != out_len) {
        OPENSSL_cleanse(out, out_len);
        throw DCException(DCError::KEY_DERIVATION_FAILED, "HKDF expand failed");
    }
}

std::vector<uint8_t> Prk::expand(const std::vector<uint8_t>& info, size_t out_len) const {
    std::vector<uint8_t> out(out_len);
    expand_into(info, out.data(), out.size());
    return out;
}

} // namespace crypto
} // namespace dcpath
