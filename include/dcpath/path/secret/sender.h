#ifndef DCPATH_PATH_SECRET_SENDER_H
#define DCPATH_PATH_SECRET_SENDER_H

#include <dcpath/config.h>
#include <dcpath/result.h>
#include <dcpath/credentials.h>
#include <dcpath/crypto/stateless_reset.h>
#include <atomic>

namespace dcpath {
namespace path {
namespace secret {
namespace sender {

/**
 * Send-side state of a path secret: the peer's stateless reset token and
 * the key id counter.
 */
class DCPATH_API State {
public:
    explicit State(const stateless_reset::Token& stateless_reset);

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    /**
     * Allocate the next key id.
     * @return KEY_ID_EXHAUSTED once the varint range is used up
     */
    Result<KeyId> next_key_id();

    /**
     * The peer rejected our key ids as stale. Skip ahead so the next id is
     * at least min_key_id. Never moves the counter backwards.
     */
    void update_for_stale_key(KeyId min_key_id);

    KeyId peek_next_key_id() const noexcept { return next_key_id_.load(std::memory_order_relaxed); }

    const stateless_reset::Token& stateless_reset() const noexcept { return stateless_reset_; }

private:
    stateless_reset::Token stateless_reset_;
    std::atomic<uint64_t> next_key_id_{0};
};

} // namespace sender
} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_SENDER_H
