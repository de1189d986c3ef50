#include <gtest/gtest.h>
#include <dcpath/path/secret/handshaking_path.h>
#include <dcpath/varint.h>
#include "../test_infrastructure/test_utilities.h"
#include <atomic>
#include <thread>

using namespace dcpath;
using namespace dcpath::path::secret;

/**
 * Two endpoints that complete a handshake over a fake TLS session and then
 * exchange datagrams framed as [id][key id varint][ciphertext][tag].
 */
class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_addr_ = test::make_address(1);
        server_addr_ = test::make_address(2);

        Map::Config config;
        config.reporter = capture_.reporter();
        client_map_ = std::make_unique<Map>(stateless_reset::Signer::random(), config);
        server_map_ = std::make_unique<Map>(stateless_reset::Signer::random(), config);
        client_map_->register_request_handshake([this](const NetworkAddress& peer) {
            requested_.push_back(peer);
        });

        ConnectionInfo client_info;
        client_info.remote_address = server_addr_;
        client_info.endpoint_type = EndpointType::CLIENT;
        ConnectionInfo server_info;
        server_info.remote_address = client_addr_;
        server_info.endpoint_type = EndpointType::SERVER;

        test::FakeTlsSession session(0x9A);
        HandshakingPath client(client_info, *client_map_);
        HandshakingPath server(server_info, *server_map_);

        auto client_tokens = client.on_path_secrets_ready(session).value();
        auto server_tokens = server.on_path_secrets_ready(session).value();
        ASSERT_TRUE(client.on_peer_stateless_reset_tokens(server_tokens).is_success());
        ASSERT_TRUE(server.on_peer_stateless_reset_tokens(client_tokens).is_success());
        ASSERT_TRUE(client.on_dc_handshake_complete().is_success());
        ASSERT_TRUE(server.on_dc_handshake_complete().is_success());
    }

    static std::vector<uint8_t> header_for(const Credentials& credentials) {
        std::vector<uint8_t> header(credentials.id.bytes.begin(), credentials.id.bytes.end());
        encode_varint(header, credentials.key_id);
        return header;
    }

    std::vector<uint8_t> client_send(const std::vector<uint8_t>& payload) {
        auto entry = client_map_->get_by_peer(server_addr_);
        auto sealer = entry->uni_sealer().value();
        auto header = header_for(sealer.credentials());

        std::vector<uint8_t> body = payload;
        body.resize(payload.size() + TAG_LEN);
        EXPECT_TRUE(sealer.encrypt(sealer.credentials().key_id, header, {}, body).is_success());

        std::vector<uint8_t> datagram = header;
        datagram.insert(datagram.end(), body.begin(), body.end());
        return datagram;
    }

    // Mirrors a receive loop: credentials, lookup, open, replay check
    Result<std::vector<uint8_t>> server_receive(const std::vector<uint8_t>& datagram,
                                                std::vector<uint8_t>& control_out) {
        using Payload = std::vector<uint8_t>;
        if (datagram.size() < ID_LEN) {
            return make_error<Payload>(DCError::DECODE_ERROR);
        }
        Credentials credentials;
        std::copy(datagram.begin(), datagram.begin() + ID_LEN, credentials.id.bytes.begin());
        size_t offset = ID_LEN;
        auto key_id = decode_varint(datagram.data(), datagram.size(), offset);
        if (key_id.is_error()) {
            return make_error<Payload>(key_id.error());
        }
        credentials.key_id = *key_id;

        auto entry = server_map_->pre_authentication(credentials, control_out);
        if (entry.is_error()) {
            return make_error<Payload>(entry.error());
        }

        std::vector<uint8_t> header(datagram.begin(), datagram.begin() + offset);
        Payload body(datagram.begin() + offset, datagram.end());
        auto opened = (*entry)->uni_opener(credentials.key_id).decrypt_in_place(credentials.key_id, header, body);
        if (opened.is_error()) {
            return make_error<Payload>(opened.error());
        }

        auto replay = server_map_->post_authentication(**entry, credentials, control_out);
        if (replay.is_error()) {
            return make_error<Payload>(replay.error());
        }
        return make_result(std::move(body));
    }

    test::CapturingReporter capture_;
    NetworkAddress client_addr_;
    NetworkAddress server_addr_;
    std::unique_ptr<Map> client_map_;
    std::unique_ptr<Map> server_map_;
    std::vector<NetworkAddress> requested_;
};

TEST_F(EndToEndTest, BothSidesPublishTheSamePath) {
    auto client_entry = client_map_->get_by_peer(server_addr_);
    auto server_entry = server_map_->get_by_peer(client_addr_);
    ASSERT_NE(client_entry, nullptr);
    ASSERT_NE(server_entry, nullptr);
    EXPECT_EQ(client_entry->id(), server_entry->id());
}

TEST_F(EndToEndTest, BidirectionalStreamAtKeyIdFive) {
    auto client_entry = client_map_->get_by_peer(server_addr_);
    auto server_entry = server_map_->get_by_peer(client_addr_);
    client_entry->sender().update_for_stale_key(5);

    auto local = client_entry->bidi_local().value();
    ASSERT_EQ(local.credentials.key_id, 5u);
    auto remote = server_entry->bidi_remote(5);

    auto header = header_for(local.credentials);
    auto plain = test::make_payload(100);
    auto body = plain;
    body.resize(plain.size() + TAG_LEN);
    ASSERT_TRUE(local.sealer.encrypt(0, header, {}, body).is_success());
    ASSERT_TRUE(remote.opener.decrypt_in_place(0, header, body).is_success());
    EXPECT_EQ(body, plain);

    std::vector<uint8_t> control_out;
    EXPECT_TRUE(server_map_->post_authentication(*server_entry, local.credentials, control_out).is_success());
    EXPECT_EQ(server_map_->post_authentication(*server_entry, local.credentials, control_out).error(),
              DCError::KEY_ID_ALREADY_SEEN);
}

TEST_F(EndToEndTest, DatagramDeliveredOnce) {
    auto payload = test::make_payload(300, 4);
    auto datagram = client_send(payload);

    std::vector<uint8_t> control_out;
    auto received = server_receive(datagram, control_out);
    ASSERT_TRUE(received.is_success());
    EXPECT_EQ(*received, payload);
    EXPECT_TRUE(control_out.empty());

    // A replayed datagram is rejected and the peer is told
    EXPECT_EQ(server_receive(datagram, control_out).error(), DCError::KEY_ID_ALREADY_SEEN);
    ASSERT_FALSE(control_out.empty());
    EXPECT_TRUE(client_map_->on_possible_secret_control_packet(server_addr_, control_out));
    ASSERT_EQ(requested_.size(), 1u);
    EXPECT_EQ(requested_[0], server_addr_);
}

TEST_F(EndToEndTest, TamperedDatagramNeverReachesReplayWindow) {
    auto datagram = client_send(test::make_payload(50));
    datagram.back() ^= 0x01;

    std::vector<uint8_t> control_out;
    EXPECT_EQ(server_receive(datagram, control_out).error(), DCError::INVALID_TAG);

    auto server_entry = server_map_->get_by_peer(client_addr_);
    EXPECT_EQ(server_entry->receiver().stats().accepted_count, 0u);
}

TEST_F(EndToEndTest, ServerThatLostTheSecretTriggersRehandshake) {
    auto datagram = client_send(test::make_payload(20));

    Map amnesiac(server_map_->signer(), Map::Config{});
    Credentials credentials;
    std::copy(datagram.begin(), datagram.begin() + ID_LEN, credentials.id.bytes.begin());
    std::vector<uint8_t> control_out;
    EXPECT_EQ(amnesiac.pre_authentication(credentials, control_out).error(), DCError::UNKNOWN_PATH_SECRET);

    EXPECT_TRUE(client_map_->on_possible_secret_control_packet(server_addr_, control_out));
    ASSERT_EQ(requested_.size(), 1u);
}

TEST_F(EndToEndTest, ConcurrentSendersDeliverEachDatagramOnce) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;
    std::vector<std::vector<uint8_t>> datagrams(kThreads * kPerThread);

    std::vector<std::thread> senders;
    for (int t = 0; t < kThreads; ++t) {
        senders.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                datagrams[t * kPerThread + i] = client_send(test::make_payload(32, static_cast<uint8_t>(i)));
            }
        });
    }
    for (auto& thread : senders) {
        thread.join();
    }

    std::atomic<int> delivered{0};
    std::vector<std::thread> receivers;
    for (int t = 0; t < kThreads; ++t) {
        receivers.emplace_back([&]() {
            // Every receiver sees every datagram, as if each was duplicated in flight
            for (const auto& datagram : datagrams) {
                std::vector<uint8_t> control_out;
                if (server_receive(datagram, control_out).is_success()) {
                    delivered++;
                }
            }
        });
    }
    for (auto& thread : receivers) {
        thread.join();
    }

    EXPECT_EQ(delivered.load(), kThreads * kPerThread);
}
