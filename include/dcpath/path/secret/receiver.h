#ifndef DCPATH_PATH_SECRET_RECEIVER_H
#define DCPATH_PATH_SECRET_RECEIVER_H

#include <dcpath/config.h>
#include <dcpath/result.h>
#include <dcpath/credentials.h>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace dcpath {
namespace path {
namespace secret {
namespace receiver {

/**
 * Replay window state of one path secret. Not thread-safe on its own.
 *
 * bitset bit b tracks whether max_seen - (b + 1) was accepted. list holds,
 * in ascending order, the ids below max_seen - 32 that have not been
 * accepted yet. Ids below floor are no longer tracked at all.
 */
struct InnerState {
    static constexpr uint64_t NONE_SEEN = UINT64_MAX;
    static constexpr uint64_t WINDOW = 32;

    uint64_t max_seen{NONE_SEEN};
    uint32_t bitset{0};
    std::vector<uint64_t> list;
    uint64_t floor{0};

    uint64_t accepted_count{0};
    uint64_t already_seen_count{0};
    uint64_t unknown_count{0};
};

/**
 * Receive-side replay protection for a single path secret.
 *
 * post_authentication() returns success at most once for any key id. A
 * KEY_ID_ALREADY_SEEN error is a definite replay; KEY_ID_UNKNOWN means the id
 * fell below the tracked range and novelty cannot be proven.
 *
 * Thread-safety: all calls are linearized by an internal mutex.
 */
class DCPATH_API State {
public:
    struct Config {
        // Ids further than this below the high-water mark stop being tracked
        uint64_t max_backfill = 65536;
        // Hard cap on the unseen list; the smallest ids are dropped first
        size_t max_list_len = 65536;
    };

    struct Stats {
        std::optional<KeyId> max_seen;
        KeyId floor;
        size_t list_len;
        uint64_t accepted_count;
        uint64_t already_seen_count;
        uint64_t unknown_count;
    };

    State();
    explicit State(const Config& config);

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    /**
     * Cheap check before any decryption. Never mutates the window.
     * @return KEY_ID_UNKNOWN if the id is already below the tracked range
     */
    Result<void> pre_authentication(const Credentials& credentials) const;

    /**
     * Record a packet whose payload authenticated. Call at most once per packet.
     */
    Result<void> post_authentication(const Credentials& credentials);

    /**
     * Next key id the peer should use if nothing else is known.
     */
    KeyId minimum_unseen_key_id() const;

    Stats stats() const;

    const Config& config() const noexcept { return config_; }

private:
    Result<void> insert(KeyId key_id);
    void on_first_key(KeyId key_id);
    void advance(KeyId key_id);
    void raise_floor(uint64_t new_floor);
    void enforce_list_cap();

    Config config_;
    mutable std::mutex mutex_;
    InnerState inner_;
};

} // namespace receiver
} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_RECEIVER_H
