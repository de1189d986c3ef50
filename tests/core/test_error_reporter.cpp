#include <gtest/gtest.h>
#include <dcpath/error_reporter.h>
#include <string>
#include <vector>

using namespace dcpath;

class ErrorReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.minimum_level = ErrorReporter::LogLevel::INFO;
        config_.write_to_stderr = false;
        config_.max_reports_per_second = 3;
        config_.max_reports_per_minute = 100;
        reporter_ = std::make_unique<ErrorReporter>(config_);
        reporter_->add_reporter_callback([this](const ErrorReporter::ErrorReport& report) {
            captured_.push_back(report);
        });
    }

    ErrorReporter::ReportingConfig config_;
    std::unique_ptr<ErrorReporter> reporter_;
    std::vector<ErrorReporter::ErrorReport> captured_;
};

TEST_F(ErrorReporterTest, FiltersBelowMinimumLevel) {
    EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::DEBUG,
                                        DCError::SUCCESS, "test", "ignored").is_success());
    EXPECT_TRUE(captured_.empty());

    EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::WARNING,
                                        DCError::TRAILING_DATA, "test", "kept").is_success());
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].error_code, DCError::TRAILING_DATA);
    EXPECT_EQ(captured_[0].category, "test");
    EXPECT_EQ(captured_[0].message, "kept");
}

TEST_F(ErrorReporterTest, RateLimitsOrdinaryReports) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::ERROR,
                                            DCError::INTERNAL_ERROR, "test", "burst").is_success());
    }
    auto limited = reporter_->report_error(ErrorReporter::LogLevel::ERROR,
                                           DCError::INTERNAL_ERROR, "test", "dropped");
    EXPECT_EQ(limited.error(), DCError::RATE_LIMITED);
    EXPECT_EQ(captured_.size(), 3u);
    EXPECT_EQ(reporter_->get_statistics().rate_limited_reports.load(), 1u);
}

TEST_F(ErrorReporterTest, SecurityIncidentsBypassRateLimit) {
    for (int i = 0; i < 3; ++i) {
        (void)reporter_->report_error(ErrorReporter::LogLevel::ERROR,
                                      DCError::INTERNAL_ERROR, "test", "burst");
    }
    EXPECT_TRUE(reporter_->report_security_incident(DCError::AUTHENTICATION_FAILED,
                                                    "control_packet_forgery", 0.9).is_success());

    ASSERT_EQ(captured_.size(), 4u);
    EXPECT_TRUE(captured_.back().is_security_incident);
    EXPECT_EQ(captured_.back().level, ErrorReporter::LogLevel::SECURITY);
    EXPECT_EQ(captured_.back().attack_vector, "control_packet_forgery");
    EXPECT_EQ(reporter_->get_statistics().security_incidents.load(), 1u);
}

TEST_F(ErrorReporterTest, StatisticsByLevelAndReset) {
    (void)reporter_->report_error(ErrorReporter::LogLevel::INFO, DCError::SUCCESS, "test", "a");
    (void)reporter_->report_error(ErrorReporter::LogLevel::CRITICAL, DCError::INVALID_STATE, "test", "b");

    const auto& stats = reporter_->get_statistics();
    EXPECT_EQ(stats.total_reports.load(), 2u);
    EXPECT_EQ(stats.reports_by_level[static_cast<size_t>(ErrorReporter::LogLevel::INFO)].load(), 1u);
    EXPECT_EQ(stats.reports_by_level[static_cast<size_t>(ErrorReporter::LogLevel::CRITICAL)].load(), 1u);

    reporter_->reset_statistics();
    EXPECT_EQ(stats.total_reports.load(), 0u);
}

TEST_F(ErrorReporterTest, ConfigurationValidation) {
    auto bad = config_;
    bad.max_reports_per_second = 0;
    EXPECT_EQ(reporter_->update_configuration(bad).error(), DCError::INVALID_PARAMETER);

    auto good = config_;
    good.format = ErrorReporter::OutputFormat::JSON;
    EXPECT_TRUE(reporter_->update_configuration(good).is_success());
    EXPECT_EQ(reporter_->get_configuration().format, ErrorReporter::OutputFormat::JSON);
}

TEST_F(ErrorReporterTest, AddressesAreHashedByDefault) {
    auto addr = NetworkAddress::from_ipv4(0x7F000001, 443);

    std::string hidden = reporter_->format_address(addr);
    EXPECT_EQ(hidden.rfind("peer#", 0), 0u);
    EXPECT_EQ(hidden.find("127.0.0.1"), std::string::npos);

    auto open = config_;
    open.log_network_addresses = true;
    ASSERT_TRUE(reporter_->update_configuration(open).is_success());
    EXPECT_EQ(reporter_->format_address(addr), "127.0.0.1:443");
}

TEST_F(ErrorReporterTest, MacrosTolerateNullReporter) {
    std::shared_ptr<ErrorReporter> none;
    DCPATH_REPORT_WARNING(none, DCError::INTERNAL_ERROR, "nobody listens");
    DCPATH_REPORT_SECURITY(none, DCError::AUTHENTICATION_FAILED, "forgery", 1.0);

    DCPATH_REPORT_INFO(reporter_, DCError::SUCCESS, "through macro");
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].category, "TestBody");
    EXPECT_EQ(ErrorReporter::log_level_to_string(ErrorReporter::LogLevel::SECURITY), "SECURITY");
}

TEST_F(ErrorReporterTest, JsonOutputEscapesStrings) {
    ErrorReporter::ErrorReport report(ErrorReporter::LogLevel::WARNING, DCError::TRAILING_DATA,
                                      "bad \"quote\"\nline\\two\x01");
    report.category = "map";

    std::string line = reporter_->format_report(report, ErrorReporter::OutputFormat::JSON);

    EXPECT_NE(line.find("\"message\":\"bad \\\"quote\\\"\\nline\\\\two\\u0001\""), std::string::npos)
        << line;
    EXPECT_NE(line.find("\"category\":\"map\""), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
}
