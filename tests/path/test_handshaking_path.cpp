#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <dcpath/path/secret/handshaking_path.h>
#include "../test_infrastructure/test_utilities.h"
#include <algorithm>

using namespace dcpath;
using namespace dcpath::path::secret;
using ::testing::Invoke;
using ::testing::IsEmpty;
using ::testing::Return;
using ::testing::SizeIs;

class HandshakingPathTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_addr_ = test::make_address(1);
        server_addr_ = test::make_address(2);

        Map::Config config;
        config.reporter = capture_.reporter();
        config.rehandshake_period = std::chrono::seconds(3600);
        config.receiver.max_backfill = 100;
        client_map_ = std::make_unique<Map>(stateless_reset::Signer(std::vector<uint8_t>(32, 0xC1)), config);
        server_map_ = std::make_unique<Map>(stateless_reset::Signer(std::vector<uint8_t>(32, 0x5E)), config);
    }

    HandshakingPath client_path() const {
        ConnectionInfo info;
        info.remote_address = server_addr_;
        info.endpoint_type = EndpointType::CLIENT;
        return HandshakingPath(info, *client_map_);
    }

    HandshakingPath server_path() const {
        ConnectionInfo info;
        info.remote_address = client_addr_;
        info.endpoint_type = EndpointType::SERVER;
        return HandshakingPath(info, *server_map_);
    }

    test::CapturingReporter capture_;
    NetworkAddress client_addr_;
    NetworkAddress server_addr_;
    std::unique_ptr<Map> client_map_;
    std::unique_ptr<Map> server_map_;
    test::FakeTlsSession session_;
};

TEST_F(HandshakingPathTest, FullFlowPublishesEntry) {
    auto client = client_path();
    auto server = server_path();
    EXPECT_EQ(client.state(), HandshakingPath::State::AWAITING_SECRETS);

    auto client_tokens = client.on_path_secrets_ready(session_).value();
    auto server_tokens = server.on_path_secrets_ready(session_).value();
    EXPECT_EQ(session_.last_label(), TLS_EXPORTER_LABEL);
    EXPECT_TRUE(session_.last_context().empty());
    ASSERT_EQ(client_tokens.size(), 1u);
    ASSERT_EQ(server_tokens.size(), 1u);
    EXPECT_EQ(client.state(), HandshakingPath::State::SECRETS_READY);
    EXPECT_EQ(client.entry(), nullptr);

    ASSERT_TRUE(client.on_peer_stateless_reset_tokens(server_tokens).is_success());
    ASSERT_TRUE(server.on_peer_stateless_reset_tokens(client_tokens).is_success());
    EXPECT_EQ(client.state(), HandshakingPath::State::ENTRY_CREATED);

    auto entry = client.entry();
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->id(), server.entry()->id());
    EXPECT_EQ(client_tokens[0], client_map_->signer().sign(entry->id()));
    EXPECT_EQ(entry->sender().stateless_reset(), server_tokens[0]);
    EXPECT_EQ(client_map_->get_by_id(entry->id()), entry);
    EXPECT_FALSE(client_map_->contains(server_addr_));

    ASSERT_TRUE(client.on_dc_handshake_complete().is_success());
    EXPECT_EQ(client.state(), HandshakingPath::State::COMPLETE);
    EXPECT_EQ(client_map_->get_by_peer(server_addr_), entry);
    EXPECT_FALSE(client.take_error().has_value());
}

TEST_F(HandshakingPathTest, EntryTakesMapSettings) {
    auto client = client_path();
    auto tokens = client.on_path_secrets_ready(session_).value();
    ASSERT_TRUE(client.on_peer_stateless_reset_tokens(tokens).is_success());

    auto entry = client.entry();
    EXPECT_EQ(entry->rehandshake_period(), std::chrono::seconds(3600));
    EXPECT_EQ(entry->receiver().config().max_backfill, 100u);
    EXPECT_EQ(entry->peer(), server_addr_);
    EXPECT_EQ(entry->secret().endpoint(), EndpointType::CLIENT);
}

TEST_F(HandshakingPathTest, ApplicationDataIsAttached) {
    auto marker = std::make_shared<std::string>("tenant-7");
    client_map_->register_make_application_data([marker](const TlsSession&) {
        return Result<ApplicationData>(ApplicationData(marker));
    });

    auto client = client_path();
    auto tokens = client.on_path_secrets_ready(session_).value();
    ASSERT_TRUE(client.on_peer_stateless_reset_tokens(tokens).is_success());
    EXPECT_EQ(client.entry()->application_data(), marker);
}

TEST_F(HandshakingPathTest, ApplicationHookFailure) {
    client_map_->register_make_application_data([](const TlsSession&) {
        return Result<ApplicationData>(DCError::AUTHENTICATION_FAILED);
    });

    auto client = client_path();
    EXPECT_EQ(client.on_path_secrets_ready(session_).error(), DCError::APPLICATION_ERROR);
    EXPECT_EQ(client.state(), HandshakingPath::State::FAILED);
    EXPECT_EQ(capture_.count(ErrorReporter::LogLevel::ERROR), 1u);

    // The failure is sticky until taken
    EXPECT_EQ(client.on_dc_handshake_complete().error(), DCError::APPLICATION_ERROR);
    EXPECT_EQ(client.take_error(), DCError::APPLICATION_ERROR);
    EXPECT_FALSE(client.take_error().has_value());
    EXPECT_EQ(client.on_dc_handshake_complete().error(), DCError::INVALID_STATE);
    EXPECT_EQ(client_map_->secrets_len(), 0u);
}

TEST_F(HandshakingPathTest, ExporterFailure) {
    session_.set_fail_exporter(true);
    auto client = client_path();
    EXPECT_EQ(client.on_path_secrets_ready(session_).error(), DCError::INTERNAL_ERROR);
    EXPECT_EQ(client.state(), HandshakingPath::State::FAILED);
    EXPECT_EQ(client.take_error(), DCError::INTERNAL_ERROR);
}

TEST_F(HandshakingPathTest, UnsupportedCipherSuite) {
    test::FakeTlsSession chacha(0x42, CipherSuite::TLS_CHACHA20_POLY1305_SHA256);
    auto client = client_path();
    EXPECT_EQ(client.on_path_secrets_ready(chacha).error(), DCError::INTERNAL_ERROR);
    EXPECT_EQ(client.state(), HandshakingPath::State::FAILED);
}

TEST_F(HandshakingPathTest, TokensBeforeSecretsIsOrderingViolation) {
    auto client = client_path();
    std::vector<stateless_reset::Token> tokens(1);

    EXPECT_EQ(client.on_peer_stateless_reset_tokens(tokens).error(), DCError::INVALID_STATE);
    EXPECT_EQ(client.state(), HandshakingPath::State::FAILED);
    EXPECT_EQ(capture_.count(ErrorReporter::LogLevel::CRITICAL), 1u);

    // FAILED absorbs later transitions
    EXPECT_EQ(client.on_path_secrets_ready(session_).error(), DCError::INVALID_STATE);
    EXPECT_EQ(client.take_error(), DCError::INVALID_STATE);
}

TEST_F(HandshakingPathTest, CompleteBeforeEntryIsOrderingViolation) {
    auto client = client_path();
    ASSERT_TRUE(client.on_path_secrets_ready(session_).is_success());
    EXPECT_EQ(client.on_dc_handshake_complete().error(), DCError::INVALID_STATE);
    EXPECT_EQ(client.state(), HandshakingPath::State::FAILED);
    EXPECT_EQ(client_map_->secrets_len(), 0u);
}

TEST_F(HandshakingPathTest, SecretsReadyTwiceIsOrderingViolation) {
    auto client = client_path();
    ASSERT_TRUE(client.on_path_secrets_ready(session_).is_success());
    EXPECT_EQ(client.on_path_secrets_ready(session_).error(), DCError::INVALID_STATE);
    EXPECT_EQ(client.state(), HandshakingPath::State::FAILED);
}

TEST_F(HandshakingPathTest, EmptyTokenListRejected) {
    auto client = client_path();
    ASSERT_TRUE(client.on_path_secrets_ready(session_).is_success());
    EXPECT_EQ(client.on_peer_stateless_reset_tokens({}).error(), DCError::INVALID_PARAMETER);
    EXPECT_EQ(client.state(), HandshakingPath::State::FAILED);
    EXPECT_EQ(client.take_error(), DCError::INVALID_PARAMETER);
}

TEST_F(HandshakingPathTest, MtuUpdatesReachEntry) {
    auto client = client_path();
    client.on_mtu_updated(1200);

    auto tokens = client.on_path_secrets_ready(session_).value();
    ASSERT_TRUE(client.on_peer_stateless_reset_tokens(tokens).is_success());
    EXPECT_EQ(client.entry()->max_datagram_size(), DEFAULT_MAX_DATAGRAM_SIZE);

    client.on_mtu_updated(1200);
    EXPECT_EQ(client.entry()->max_datagram_size(), 1200);
}

TEST_F(HandshakingPathTest, CopiesShareState) {
    auto client = client_path();
    HandshakingPath copy = client;
    ASSERT_TRUE(copy.on_path_secrets_ready(session_).is_success());
    EXPECT_EQ(client.state(), HandshakingPath::State::SECRETS_READY);
}

TEST_F(HandshakingPathTest, ExporterContractWithMockSession) {
    test::MockTlsSession session;
    EXPECT_CALL(session, tls_exporter(std::string(TLS_EXPORTER_LABEL), IsEmpty(), SizeIs(EXPORT_SECRET_LEN)))
        .WillOnce(Invoke([](const std::string&, const std::vector<uint8_t>&, std::vector<uint8_t>& out) {
            std::fill(out.begin(), out.end(), 0x3C);
            return make_result();
        }));
    EXPECT_CALL(session, cipher_suite()).WillRepeatedly(Return(CipherSuite::TLS_AES_256_GCM_SHA384));

    auto client = client_path();
    auto tokens = client.on_path_secrets_ready(session).value();
    ASSERT_TRUE(client.on_peer_stateless_reset_tokens(tokens).is_success());
    EXPECT_EQ(client.entry()->secret().ciphersuite(), Ciphersuite::AES_GCM_256_SHA384);

    ExportSecret expected;
    expected.fill(0x3C);
    Secret reference(Ciphersuite::AES_GCM_256_SHA384, DC_VERSION_V1, EndpointType::CLIENT, expected);
    EXPECT_EQ(client.entry()->id(), reference.id());
}

TEST_F(HandshakingPathTest, ThrowingExporterFailsAttempt) {
    test::MockTlsSession session;
    EXPECT_CALL(session, tls_exporter(std::string(TLS_EXPORTER_LABEL), IsEmpty(), SizeIs(EXPORT_SECRET_LEN)))
        .WillOnce(Invoke([](const std::string&, const std::vector<uint8_t>&,
                            std::vector<uint8_t>& out) -> Result<void> {
            std::fill(out.begin(), out.end(), 0x77);
            throw DCException(DCError::KEY_DERIVATION_FAILED, "exporter backend failed");
        }));
    EXPECT_CALL(session, cipher_suite()).Times(0);

    auto client = client_path();
    EXPECT_EQ(client.on_path_secrets_ready(session).error(), DCError::INTERNAL_ERROR);
    EXPECT_EQ(client.state(), HandshakingPath::State::FAILED);
    EXPECT_EQ(client.entry(), nullptr);
    EXPECT_EQ(capture_.count(ErrorReporter::LogLevel::ERROR), 1u);

    EXPECT_EQ(client.on_peer_stateless_reset_tokens({stateless_reset::Token{}}).error(),
              DCError::INTERNAL_ERROR);
    EXPECT_EQ(client_map_->secrets_len(), 0u);
}

TEST_F(HandshakingPathTest, ExporterResizingOutputFailsAttempt) {
    test::MockTlsSession session;
    EXPECT_CALL(session, tls_exporter(std::string(TLS_EXPORTER_LABEL), IsEmpty(), SizeIs(EXPORT_SECRET_LEN)))
        .WillOnce(Invoke([](const std::string&, const std::vector<uint8_t>&, std::vector<uint8_t>& out) {
            out.assign(EXPORT_SECRET_LEN / 2, 0x55);
            return make_result();
        }));

    auto client = client_path();
    EXPECT_EQ(client.on_path_secrets_ready(session).error(), DCError::INTERNAL_ERROR);
    EXPECT_EQ(client.take_error(), DCError::INTERNAL_ERROR);
}

TEST_F(HandshakingPathTest, StateNames) {
    EXPECT_EQ(to_string(HandshakingPath::State::AWAITING_SECRETS), "AWAITING_SECRETS");
    EXPECT_EQ(to_string(HandshakingPath::State::FAILED), "FAILED");
}
