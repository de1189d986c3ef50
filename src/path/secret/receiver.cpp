#include <dcpath/path/secret/receiver.h>
#include <algorithm>

namespace dcpath {
namespace path {
namespace secret {
namespace receiver {

namespace {

constexpr uint64_t WINDOW = InnerState::WINDOW;

uint64_t saturating_sub(uint64_t a, uint64_t b) {
    return a > b ? a - b : 0;
}

} // anonymous namespace

State::State() : State(Config{}) {}

State::State(const Config& config) : config_(config) {}

Result<void> State::pre_authentication(const Credentials& credentials) const {
    if (credentials.key_id > MAX_KEY_ID) {
        return make_error<void>(DCError::KEY_ID_UNKNOWN);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (inner_.max_seen != InnerState::NONE_SEEN && credentials.key_id < inner_.floor) {
        return make_error<void>(DCError::KEY_ID_UNKNOWN);
    }
    return make_result();
}

Result<void> State::post_authentication(const Credentials& credentials) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = insert(credentials.key_id);
    if (result.is_success()) {
        inner_.accepted_count++;
    } else if (result.error() == DCError::KEY_ID_ALREADY_SEEN) {
        inner_.already_seen_count++;
    } else {
        inner_.unknown_count++;
    }
    return result;
}

KeyId State::minimum_unseen_key_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    // NONE_SEEN wraps to 0
    return inner_.max_seen + 1;
}

State::Stats State::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    if (inner_.max_seen != InnerState::NONE_SEEN) {
        stats.max_seen = inner_.max_seen;
    }
    stats.floor = inner_.floor;
    stats.list_len = inner_.list.size();
    stats.accepted_count = inner_.accepted_count;
    stats.already_seen_count = inner_.already_seen_count;
    stats.unknown_count = inner_.unknown_count;
    return stats;
}

// Private method implementations (mutex held)

Result<void> State::insert(KeyId key_id) {
    if (key_id > MAX_KEY_ID) {
        return make_error<void>(DCError::KEY_ID_UNKNOWN);
    }

    if (inner_.max_seen == InnerState::NONE_SEEN) {
        on_first_key(key_id);
        return make_result();
    }

    if (key_id > inner_.max_seen) {
        advance(key_id);
        return make_result();
    }

    if (key_id == inner_.max_seen) {
        return make_error<void>(DCError::KEY_ID_ALREADY_SEEN);
    }

    uint64_t delta = inner_.max_seen - key_id;
    if (delta <= WINDOW) {
        uint32_t mask = uint32_t{1} << (delta - 1);
        if (inner_.bitset & mask) {
            return make_error<void>(DCError::KEY_ID_ALREADY_SEEN);
        }
        inner_.bitset |= mask;
        return make_result();
    }

    if (key_id < inner_.floor) {
        return make_error<void>(DCError::KEY_ID_UNKNOWN);
    }

    auto it = std::lower_bound(inner_.list.begin(), inner_.list.end(), key_id);
    if (it != inner_.list.end() && *it == key_id) {
        inner_.list.erase(it);
        return make_result();
    }
    return make_error<void>(DCError::KEY_ID_ALREADY_SEEN);
}

void State::on_first_key(KeyId key_id) {
    inner_.max_seen = key_id;
    inner_.bitset = 0;
    inner_.list.clear();

    // One-time backfill of the ids below the bitset as provisionally unseen
    uint64_t upper = saturating_sub(key_id, WINDOW);
    uint64_t lower = saturating_sub(upper, config_.max_backfill);
    inner_.floor = lower;
    inner_.list.reserve(static_cast<size_t>(upper - lower));
    for (uint64_t id = lower; id < upper; ++id) {
        inner_.list.push_back(id);
    }

    enforce_list_cap();
}

void State::advance(KeyId key_id) {
    const uint64_t prev = inner_.max_seen;
    const uint64_t delta = key_id - prev;
    const uint64_t upper = saturating_sub(key_id, WINDOW);
    const uint64_t lower = saturating_sub(upper, config_.max_backfill);
    const uint64_t new_floor = std::max(inner_.floor, lower);

    // Bits shifted out of the window that were never set must not be
    // forgotten. Walking b downwards yields ascending ids.
    uint64_t first_evicted = delta >= WINDOW ? 0 : WINDOW - delta;
    for (uint64_t b = WINDOW; b-- > first_evicted;) {
        if (prev < b + 1) {
            continue;
        }
        uint64_t id = prev - 1 - b;
        if (id < new_floor) {
            continue;
        }
        if ((inner_.bitset & (uint32_t{1} << b)) == 0) {
            inner_.list.push_back(id);
        }
    }

    // Ids skipped over that are already below the new window
    for (uint64_t id = std::max(prev + 1, new_floor); id < upper; ++id) {
        inner_.list.push_back(id);
    }

    if (delta < WINDOW) {
        uint64_t shifted = (static_cast<uint64_t>(inner_.bitset) << delta) |
                           (uint64_t{1} << (delta - 1));
        inner_.bitset = static_cast<uint32_t>(shifted & 0xFFFFFFFFULL);
    } else if (delta == WINDOW) {
        inner_.bitset = uint32_t{1} << (WINDOW - 1);
    } else {
        inner_.bitset = 0;
    }

    inner_.max_seen = key_id;
    raise_floor(new_floor);
    enforce_list_cap();
}

void State::raise_floor(uint64_t new_floor) {
    if (new_floor <= inner_.floor) {
        return;
    }
    inner_.floor = new_floor;
    auto it = std::lower_bound(inner_.list.begin(), inner_.list.end(), new_floor);
    inner_.list.erase(inner_.list.begin(), it);
}

void State::enforce_list_cap() {
    if (inner_.list.size() <= config_.max_list_len) {
        return;
    }
    size_t excess = inner_.list.size() - config_.max_list_len;
    uint64_t last_dropped = inner_.list[excess - 1];
    inner_.list.erase(inner_.list.begin(), inner_.list.begin() + static_cast<std::ptrdiff_t>(excess));
    inner_.floor = std::max(inner_.floor, last_dropped + 1);
}

} // namespace receiver
} // namespace secret
} // namespace path
} // namespace dcpath
