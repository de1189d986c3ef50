#include <dcpath/path/secret/map_state.h>
#include <vector>

namespace dcpath {
namespace path {
namespace secret {

MapState::MapState(stateless_reset::Signer signer, const Config& config)
    : signer_(std::move(signer)), config_(config) {
    if (config_.capacity == 0) {
        throw DCException(DCError::INVALID_PARAMETER, "path secret map capacity must be non-zero");
    }
}

MapState::~MapState() = default;

size_t MapState::secrets_len() const {
    std::shared_lock<std::shared_mutex> lock(ids_mutex_);
    return ids_.size();
}

size_t MapState::peers_len() const {
    std::shared_lock<std::shared_mutex> lock(peers_mutex_);
    return peers_.size();
}

bool MapState::contains(const NetworkAddress& peer) const {
    std::shared_lock<std::shared_mutex> lock(peers_mutex_);
    return peers_.find(peer) != peers_.end();
}

std::shared_ptr<Entry> MapState::get_by_id(const Id& id) const {
    std::shared_lock<std::shared_mutex> lock(ids_mutex_);
    auto it = ids_.find(id);
    return it != ids_.end() ? it->second : nullptr;
}

std::shared_ptr<Entry> MapState::get_by_peer(const NetworkAddress& peer) const {
    std::shared_lock<std::shared_mutex> lock(peers_mutex_);
    auto it = peers_.find(peer);
    return it != peers_.end() ? it->second : nullptr;
}

void MapState::on_new_path_secrets(std::shared_ptr<Entry> entry) {
    if (!entry) {
        return;
    }

    std::shared_ptr<Entry> replaced;
    {
        std::unique_lock<std::shared_mutex> lock(ids_mutex_);
        auto& slot = ids_[entry->id()];
        if (slot != entry) {
            replaced = slot;
        }
        slot = entry;
    }

    if (replaced) {
        DCPATH_REPORT_WARNING(config_.reporter, DCError::SUCCESS,
                              "replaced path secret " + to_string(entry->id()));
    }

    std::vector<std::shared_ptr<Entry>> evicted;
    {
        std::lock_guard<std::mutex> lock(eviction_mutex_);
        eviction_queue_.push_back(entry);
        while (eviction_queue_.size() > config_.capacity) {
            auto oldest = eviction_queue_.front().lock();
            eviction_queue_.pop_front();
            if (oldest && oldest != entry) {
                evicted.push_back(std::move(oldest));
            }
        }
    }

    for (const auto& old : evicted) {
        evict(old);
    }
}

void MapState::on_handshake_complete(std::shared_ptr<Entry> entry) {
    if (!entry) {
        return;
    }

    std::shared_ptr<Entry> previous;
    bool published = false;
    {
        // Lock order is ids then peers. Holding ids across the insert keeps an
        // eviction of this entry from completing between the check and the insert.
        std::shared_lock<std::shared_mutex> ids_lock(ids_mutex_);
        auto it = ids_.find(entry->id());
        if (!entry->is_retired() && it != ids_.end() && it->second == entry) {
            std::unique_lock<std::shared_mutex> lock(peers_mutex_);
            auto& slot = peers_[entry->peer()];
            if (slot != entry) {
                previous = slot;
            }
            slot = entry;
            published = true;
        }
    }

    if (!published) {
        DCPATH_REPORT_WARNING(config_.reporter, DCError::PATH_SECRET_EVICTED,
                              "path secret " + to_string(entry->id()) +
                              " was evicted before its handshake completed");
        return;
    }

    if (previous) {
        previous->retire();
        DCPATH_REPORT_INFO(config_.reporter, DCError::SUCCESS,
                           "retired previous path secret for " +
                           (config_.reporter ? config_.reporter->format_address(entry->peer())
                                             : std::string()));
    }
}

Result<ApplicationData> MapState::application_data(const TlsSession& session) const {
    MakeApplicationData callback;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        callback = make_application_data_;
    }
    if (!callback) {
        return make_result(ApplicationData());
    }
    return callback(session);
}

void MapState::register_make_application_data(MakeApplicationData callback) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    make_application_data_ = std::move(callback);
}

void MapState::register_request_handshake(RequestHandshake callback) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    request_handshake_ = std::move(callback);
}

void MapState::request_handshake(const NetworkAddress& peer) {
    RequestHandshake callback;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        callback = request_handshake_;
    }

    if (config_.reporter) {
        DCPATH_REPORT_INFO(config_.reporter, DCError::SUCCESS,
                           "requesting handshake with " + config_.reporter->format_address(peer));
    }

    if (callback) {
        callback(peer);
    }
}

Result<void> MapState::handle_control_packet(const control::Packet& packet,
                                             const NetworkAddress& peer) {
    if (auto stale_key = std::get_if<control::StaleKey>(&packet)) {
        return handle_stale_key(*stale_key, peer);
    }
    if (auto replay = std::get_if<control::ReplayDetected>(&packet)) {
        return handle_replay_detected(*replay, peer);
    }
    return handle_unknown_path_secret(std::get<control::UnknownPathSecret>(packet), peer);
}

size_t MapState::request_due_handshakes(std::chrono::steady_clock::time_point now) {
    std::vector<NetworkAddress> due;
    {
        std::shared_lock<std::shared_mutex> lock(peers_mutex_);
        for (const auto& kv : peers_) {
            if (kv.second->rehandshake_due(now) && kv.second->mark_rehandshake_requested()) {
                due.push_back(kv.first);
            }
        }
    }

    for (const auto& peer : due) {
        request_handshake(peer);
    }
    return due.size();
}

// Private method implementations

Result<void> MapState::handle_stale_key(const control::StaleKey& packet,
                                        const NetworkAddress& peer) {
    auto entry = get_by_id(packet.credential_id);
    if (!entry) {
        return make_error<void>(DCError::UNKNOWN_PATH_SECRET);
    }

    auto auth = packet.authenticate(entry->control_opener());
    if (auth.is_error()) {
        DCPATH_REPORT_SECURITY(config_.reporter, auth.error(), "stale_key_forgery", 0.8);
        return auth;
    }

    note_peer_mismatch(entry, peer);
    entry->sender().update_for_stale_key(packet.min_key_id);
    DCPATH_REPORT_DEBUG(config_.reporter, DCError::SUCCESS,
                        "stale key, next key id at least " + std::to_string(packet.min_key_id));
    return make_result();
}

Result<void> MapState::handle_replay_detected(const control::ReplayDetected& packet,
                                              const NetworkAddress& peer) {
    auto entry = get_by_id(packet.credential_id);
    if (!entry) {
        return make_error<void>(DCError::UNKNOWN_PATH_SECRET);
    }

    auto auth = packet.authenticate(entry->control_opener());
    if (auth.is_error()) {
        DCPATH_REPORT_SECURITY(config_.reporter, auth.error(), "replay_detected_forgery", 0.8);
        return auth;
    }

    note_peer_mismatch(entry, peer);
    DCPATH_REPORT_WARNING(config_.reporter, DCError::KEY_ID_ALREADY_SEEN,
                          "peer detected replay of key id " +
                          std::to_string(packet.rejected_key_id));
    request_handshake(entry->peer());
    return make_result();
}

Result<void> MapState::handle_unknown_path_secret(const control::UnknownPathSecret& packet,
                                                  const NetworkAddress& peer) {
    auto entry = get_by_id(packet.credential_id);
    if (!entry) {
        return make_error<void>(DCError::UNKNOWN_PATH_SECRET);
    }

    if (!packet.authenticate(entry->sender().stateless_reset())) {
        DCPATH_REPORT_SECURITY(config_.reporter, DCError::AUTHENTICATION_FAILED,
                               "unknown_path_secret_forgery", 0.8);
        return make_error<void>(DCError::AUTHENTICATION_FAILED);
    }

    note_peer_mismatch(entry, peer);
    request_handshake(entry->peer());
    return make_result();
}

void MapState::note_peer_mismatch(const std::shared_ptr<Entry>& entry,
                                  const NetworkAddress& peer) const {
    // Peers may rebind; the entry address stays authoritative
    if (peer != entry->peer()) {
        DCPATH_REPORT_DEBUG(config_.reporter, DCError::SUCCESS,
                            "control packet from an address other than the path peer");
    }
}

void MapState::evict(const std::shared_ptr<Entry>& entry) {
    {
        std::unique_lock<std::shared_mutex> lock(ids_mutex_);
        auto it = ids_.find(entry->id());
        if (it != ids_.end() && it->second == entry) {
            ids_.erase(it);
        }
    }
    {
        std::unique_lock<std::shared_mutex> lock(peers_mutex_);
        auto it = peers_.find(entry->peer());
        if (it != peers_.end() && it->second == entry) {
            peers_.erase(it);
        }
    }
    entry->retire();
    DCPATH_REPORT_DEBUG(config_.reporter, DCError::PATH_SECRET_EVICTED,
                        "evicted path secret " + to_string(entry->id()));
}

} // namespace secret
} // namespace path
} // namespace dcpath
