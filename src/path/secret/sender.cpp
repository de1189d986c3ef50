#include <dcpath/path/secret/sender.h>
#include <algorithm>

namespace dcpath {
namespace path {
namespace secret {
namespace sender {

State::State(const stateless_reset::Token& stateless_reset)
    : stateless_reset_(stateless_reset) {}

Result<KeyId> State::next_key_id() {
    uint64_t current = next_key_id_.load(std::memory_order_relaxed);
    do {
        if (current > MAX_KEY_ID) {
            return make_error<KeyId>(DCError::KEY_ID_EXHAUSTED);
        }
    } while (!next_key_id_.compare_exchange_weak(current, current + 1,
                                                 std::memory_order_relaxed));
    return make_result(current);
}

void State::update_for_stale_key(KeyId min_key_id) {
    // fetch_max
    uint64_t target = std::min<uint64_t>(min_key_id, MAX_KEY_ID + 1);
    uint64_t current = next_key_id_.load(std::memory_order_relaxed);
    while (current < target &&
           !next_key_id_.compare_exchange_weak(current, target, std::memory_order_relaxed)) {
    }
}

} // namespace sender
} // namespace secret
} // namespace path
} // namespace dcpath
