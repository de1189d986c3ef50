#include <gtest/gtest.h>
#include <dcpath/path/secret/schedule.h>
#include "../test_infrastructure/test_utilities.h"

using namespace dcpath;
using namespace dcpath::crypto;
using namespace dcpath::path::secret;

class ScheduleTest : public ::testing::TestWithParam<Ciphersuite> {
protected:
    void SetUp() override {
        export_secret_ = test::make_export_secret(0x21);
        client_ = std::make_unique<Secret>(GetParam(), DC_VERSION_V1, EndpointType::CLIENT, export_secret_);
        server_ = std::make_unique<Secret>(GetParam(), DC_VERSION_V1, EndpointType::SERVER, export_secret_);
    }

    static bool seal_and_open(const EncryptKey& sealer, const DecryptKey& opener, uint64_t pn) {
        std::vector<uint8_t> header = {0xAA, 0xBB};
        std::vector<uint8_t> plain = test::make_payload(100, 9);
        std::vector<uint8_t> buffer = plain;
        buffer.resize(plain.size() + TAG_LEN);
        if (!sealer.encrypt(pn, header, {}, buffer)) {
            return false;
        }
        if (!opener.decrypt_in_place(pn, header, buffer)) {
            return false;
        }
        return buffer == plain;
    }

    ExportSecret export_secret_;
    std::unique_ptr<Secret> client_;
    std::unique_ptr<Secret> server_;
};

TEST_P(ScheduleTest, BothEndsDeriveSameId) {
    EXPECT_EQ(client_->id(), server_->id());
    EXPECT_EQ(client_->endpoint(), EndpointType::CLIENT);
    EXPECT_EQ(server_->endpoint(), EndpointType::SERVER);
    EXPECT_EQ(client_->ciphersuite(), GetParam());
    EXPECT_EQ(client_->version(), DC_VERSION_V1);

    Secret again(GetParam(), DC_VERSION_V1, EndpointType::CLIENT, export_secret_);
    EXPECT_EQ(again.id(), client_->id());

    Secret other(GetParam(), DC_VERSION_V1, EndpointType::CLIENT, test::make_export_secret(0x22));
    EXPECT_NE(other.id(), client_->id());
}

TEST_P(ScheduleTest, BidirectionalKeysPairAcrossEndpoints) {
    const KeyId key_id = 5;

    // Stream opened by the client
    auto client_pair = client_->application_pair(key_id, Initiator::LOCAL);
    auto server_pair = server_->application_pair(key_id, Initiator::REMOTE);

    EXPECT_TRUE(same_key_material(client_pair.first, server_pair.second));
    EXPECT_TRUE(same_key_material(server_pair.first, client_pair.second));
    EXPECT_FALSE(same_key_material(client_pair.first, client_pair.second));

    EXPECT_TRUE(seal_and_open(client_pair.first, server_pair.second, 0));
    EXPECT_TRUE(seal_and_open(server_pair.first, client_pair.second, 0));

    EXPECT_EQ(client_pair.first.credentials().id, client_->id());
    EXPECT_EQ(client_pair.first.credentials().key_id, key_id);
    EXPECT_EQ(client_pair.first.cipher(), aead_of(GetParam()));
}

TEST_P(ScheduleTest, InitiatorSeparatesStreams) {
    auto client_opened = client_->application_pair(5, Initiator::LOCAL);
    auto server_opened = client_->application_pair(5, Initiator::REMOTE);

    EXPECT_FALSE(same_key_material(client_opened.first, server_opened.second));
    EXPECT_FALSE(seal_and_open(client_opened.first, server_opened.second, 0));
}

TEST_P(ScheduleTest, KeyIdsSeparateKeys) {
    auto five = client_->application_pair(5, Initiator::LOCAL);
    auto six = server_->application_pair(6, Initiator::REMOTE);

    EXPECT_FALSE(same_key_material(five.first, six.second));
    EXPECT_FALSE(seal_and_open(five.first, six.second, 1));
}

TEST_P(ScheduleTest, UnidirectionalKeys) {
    EXPECT_TRUE(same_key_material(client_->application_sealer(9), server_->application_opener(9)));
    EXPECT_TRUE(same_key_material(server_->application_sealer(9), client_->application_opener(9)));
    EXPECT_FALSE(same_key_material(client_->application_sealer(9), client_->application_opener(9)));
    EXPECT_FALSE(same_key_material(client_->application_sealer(9), server_->application_opener(10)));

    // Unidirectional and bidirectional derivations never collide
    auto bidi = server_->application_pair(9, Initiator::REMOTE);
    EXPECT_FALSE(same_key_material(client_->application_sealer(9), bidi.second));

    EXPECT_TRUE(seal_and_open(client_->application_sealer(9), server_->application_opener(9), 77));
}

TEST_P(ScheduleTest, ControlKeys) {
    auto sealer = client_->control_sealer();
    EXPECT_EQ(sealer.credentials().key_id, 0u);
    EXPECT_TRUE(same_key_material(sealer, server_->control_opener()));
    EXPECT_TRUE(same_key_material(server_->control_sealer(), client_->control_opener()));
    EXPECT_FALSE(same_key_material(sealer, server_->application_opener(0)));
}

INSTANTIATE_TEST_SUITE_P(Ciphersuites, ScheduleTest,
                         ::testing::Values(Ciphersuite::AES_GCM_128_SHA256,
                                           Ciphersuite::AES_GCM_256_SHA384));

class CiphersuiteTest : public ::testing::Test {};

TEST_F(CiphersuiteTest, MapsTlsSuites) {
    EXPECT_EQ(ciphersuite_from_tls(CipherSuite::TLS_AES_128_GCM_SHA256).value(),
              Ciphersuite::AES_GCM_128_SHA256);
    EXPECT_EQ(ciphersuite_from_tls(CipherSuite::TLS_AES_256_GCM_SHA384).value(),
              Ciphersuite::AES_GCM_256_SHA384);
    EXPECT_EQ(ciphersuite_from_tls(CipherSuite::TLS_CHACHA20_POLY1305_SHA256).error(),
              DCError::CIPHER_SUITE_NOT_SUPPORTED);
    EXPECT_EQ(ciphersuite_from_tls(CipherSuite::TLS_AES_128_CCM_SHA256).error(),
              DCError::CIPHER_SUITE_NOT_SUPPORTED);
}

TEST_F(CiphersuiteTest, SuiteParameters) {
    EXPECT_EQ(key_len_of(Ciphersuite::AES_GCM_128_SHA256), 16u);
    EXPECT_EQ(key_len_of(Ciphersuite::AES_GCM_256_SHA384), 32u);
    EXPECT_EQ(hash_of(Ciphersuite::AES_GCM_128_SHA256), HashAlgorithm::SHA256);
    EXPECT_EQ(hash_of(Ciphersuite::AES_GCM_256_SHA384), HashAlgorithm::SHA384);
    EXPECT_EQ(to_string(Ciphersuite::AES_GCM_256_SHA384), "AES_GCM_256_SHA384");
}
