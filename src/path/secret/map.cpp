#include <dcpath/path/secret/map.h>

namespace dcpath {
namespace path {
namespace secret {

Map::Map(stateless_reset::Signer signer, const Config& config)
    : store_(std::make_shared<MapState>(std::move(signer), config)) {}

Map::Map(std::shared_ptr<Store> store) : store_(std::move(store)) {
    if (!store_) {
        throw DCException(DCError::INVALID_PARAMETER, "map requires a store");
    }
}

bool Map::on_possible_secret_control_packet(const NetworkAddress& peer,
                                            const uint8_t* data, size_t length) {
    auto decoded = control::decode(data, length);
    if (decoded.is_error()) {
        return false;
    }

    if (decoded->consumed != length) {
        // A control packet never shares a datagram
        DCPATH_REPORT_WARNING(store_->reporter(), DCError::TRAILING_DATA,
                              std::to_string(length - decoded->consumed) +
                              " trailing bytes after secret control packet");
        return false;
    }

    // A dropped control packet is still consumed and must not be parsed as
    // anything else
    auto handled = store_->handle_control_packet(decoded->packet, peer);
    if (handled.is_error()) {
        DCPATH_REPORT_DEBUG(store_->reporter(), handled.error(),
                            "dropped secret control packet for " +
                            to_string(control::credential_id(decoded->packet)));
    }
    return true;
}

bool Map::on_possible_secret_control_packet(const NetworkAddress& peer,
                                            const std::vector<uint8_t>& datagram) {
    return on_possible_secret_control_packet(peer, datagram.data(), datagram.size());
}

Result<std::shared_ptr<Entry>> Map::pre_authentication(const Credentials& credentials,
                                                       std::vector<uint8_t>& control_out) const {
    control_out.clear();

    auto entry = store_->get_by_id(credentials.id);
    if (!entry) {
        control::UnknownPathSecret packet;
        packet.credential_id = credentials.id;
        packet.stateless_reset_tag = store_->signer().sign(credentials.id);
        control_out = packet.encode();
        return make_error<std::shared_ptr<Entry>>(DCError::UNKNOWN_PATH_SECRET);
    }

    auto result = entry->receiver().pre_authentication(credentials);
    if (result.is_error()) {
        auto packet = entry->replay_error_packet(credentials, result.error());
        if (packet.is_success()) {
            control_out = std::move(*packet);
        }
        return make_error<std::shared_ptr<Entry>>(result.error());
    }

    return make_result(std::move(entry));
}

Result<void> Map::post_authentication(Entry& entry,
                                      const Credentials& credentials,
                                      std::vector<uint8_t>& control_out) const {
    control_out.clear();

    auto result = entry.receiver().post_authentication(credentials);
    if (result.is_error()) {
        auto packet = entry.replay_error_packet(credentials, result.error());
        if (packet.is_success()) {
            control_out = std::move(*packet);
        }
        DCPATH_REPORT_DEBUG(store_->reporter(), result.error(),
                            "rejected key id " + std::to_string(credentials.key_id));
    }
    return result;
}

} // namespace secret
} // namespace path
} // namespace dcpath
