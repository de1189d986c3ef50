#ifndef DCPATH_CRYPTO_HKDF_H
#define DCPATH_CRYPTO_HKDF_H

#include <dcpath/config.h>
#include <dcpath/types.h>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace dcpath {
namespace crypto {

/**
 * HKDF pseudo-random key.
 *
 * The exported TLS secret is already uniformly random, so it is used directly
 * as the PRK and only HKDF-Expand (RFC 5869 section 2.3) is ever applied.
 */
class DCPATH_API Prk {
public:
    Prk(HashAlgorithm hash, const uint8_t* secret, size_t length);
    ~Prk();

    Prk(const Prk& other) = default;
    Prk& operator=(const Prk& other) = default;
    Prk(Prk&& other) noexcept = default;
    Prk& operator=(Prk&& other) noexcept = default;

    /**
     * Expand into a caller buffer.
     *
     * @throws DCException(KEY_DERIVATION_FAILED) if the length is not
     *         derivable for the hash or OpenSSL fails; both indicate
     *         mismatched constants rather than a runtime condition.
     */
    void expand_into(const std::vector<uint8_t>& info, uint8_t* out, size_t out_len) const;

    std::vector<uint8_t> expand(const std::vector<uint8_t>& info, size_t out_len) const;

    HashAlgorithm hash() const noexcept { return hash_; }

private:
    HashAlgorithm hash_;
    std::vector<uint8_t> prk_;
};

} // namespace crypto
} // namespace dcpath

#endif // DCPATH_CRYPTO_HKDF_H
