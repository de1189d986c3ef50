#ifndef DCPATH_CRYPTO_STATELESS_RESET_H
#define DCPATH_CRYPTO_STATELESS_RESET_H

#include <dcpath/config.h>
#include <dcpath/credentials.h>
#include <array>
#include <cstdint>
#include <vector>

namespace dcpath {
namespace stateless_reset {

constexpr size_t TOKEN_LEN = 16;

struct Token {
    std::array<uint8_t, TOKEN_LEN> bytes{};

    // Constant time
    bool operator==(const Token& other) const noexcept;
    bool operator!=(const Token& other) const noexcept { return !(*this == other); }
};

/**
 * Produces the stateless reset token for a path secret id.
 *
 * Tokens are HMAC-SHA256(key, id) truncated to TOKEN_LEN bytes, so a node
 * that lost a path secret can still prove it once knew the id.
 */
class DCPATH_API Signer {
public:
    static constexpr size_t KEY_LEN = 32;

    explicit Signer(const std::vector<uint8_t>& key);
    ~Signer();

    Signer(const Signer&) = default;
    Signer& operator=(const Signer&) = default;

    /**
     * Signer with a key from the OpenSSL DRBG.
     * @throws DCException(RANDOM_GENERATION_FAILED)
     */
    static Signer random();

    Token sign(const Id& id) const;

private:
    std::vector<uint8_t> key_;
};

} // namespace stateless_reset
} // namespace dcpath

#endif // DCPATH_CRYPTO_STATELESS_RESET_H
