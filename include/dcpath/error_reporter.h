#ifndef DCPATH_ERROR_REPORTER_H
#define DCPATH_ERROR_REPORTER_H

#include <dcpath/config.h>
#include <dcpath/error.h>
#include <dcpath/result.h>
#include <dcpath/types.h>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <unordered_map>
#include <atomic>
#include <mutex>

namespace dcpath {

/**
 * ErrorReporter provides diagnostic logging for the path secret core:
 *
 * 1. Never logs key material, exported secrets or plaintext
 * 2. Hashes peer addresses unless explicitly allowed to log them
 * 3. Rate limits ordinary reports to keep hostile traffic from flooding logs
 * 4. Emits human readable or JSON lines, and forwards to registered callbacks
 */
class DCPATH_API ErrorReporter {
public:
    enum class LogLevel {
        DEBUG,      // Detailed diagnostic information
        INFO,       // General operational information
        WARNING,    // Warning conditions, non-fatal errors
        ERROR,      // Error conditions, recoverable
        CRITICAL,   // Caller ordering violations
        SECURITY    // Security-relevant events, always logged
    };

    enum class OutputFormat {
        HUMAN_READABLE,
        JSON
    };

    struct ReportingConfig {
        LogLevel minimum_level = LogLevel::WARNING;
        OutputFormat format = OutputFormat::HUMAN_READABLE;

        // Privacy setting: when false, peer addresses are replaced by a hash
        bool log_network_addresses = false;

        // Rate limiting
        uint32_t max_reports_per_second = 100;
        uint32_t max_reports_per_minute = 1000;

        // When false only callbacks receive reports
        bool write_to_stderr = true;
    };

    struct ErrorReport {
        LogLevel level;
        DCError error_code;
        std::string category;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::unordered_map<std::string, std::string> metadata;

        bool is_security_incident;
        double threat_confidence;
        std::string attack_vector;

        ErrorReport(LogLevel lvl, DCError error, const std::string& msg)
            : level(lvl)
            , error_code(error)
            , message(msg)
            , timestamp(std::chrono::system_clock::now())
            , is_security_incident(false)
            , threat_confidence(0.0) {}
    };

    using ReporterCallback = std::function<void(const ErrorReport&)>;

    ErrorReporter();
    explicit ErrorReporter(const ReportingConfig& config);
    ~ErrorReporter();

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    /**
     * Report an error.
     * @param level Log level for the report
     * @param error Error code
     * @param category Component or function reporting
     * @param message Descriptive message (no sensitive data)
     * @return RATE_LIMITED when dropped by the rate limiter
     */
    Result<void> report_error(LogLevel level,
                              DCError error,
                              const std::string& category,
                              const std::string& message);

    /**
     * Report a security incident. Never rate limited.
     * @param error Error code
     * @param incident_type Short incident identifier, e.g. "control_packet_forgery"
     * @param confidence Confidence level (0.0 to 1.0)
     */
    Result<void> report_security_incident(DCError error,
                                          const std::string& incident_type,
                                          double confidence);

    Result<void> update_configuration(const ReportingConfig& config);
    ReportingConfig get_configuration() const;

    void add_reporter_callback(ReporterCallback callback);
    void clear_reporter_callbacks();

    struct ReportingStatistics {
        std::atomic<uint64_t> total_reports{0};
        std::atomic<uint64_t> reports_by_level[6]{};
        std::atomic<uint64_t> security_incidents{0};
        std::atomic<uint64_t> rate_limited_reports{0};
        std::atomic<uint64_t> bytes_logged{0};
    };

    const ReportingStatistics& get_statistics() const { return stats_; }
    void reset_statistics();

    /**
     * Render a peer address according to the privacy setting.
     */
    std::string format_address(const NetworkAddress& addr) const;

    /**
     * Render one report as a single line. JSON output escapes every string
     * field, so the line is always a valid JSON object.
     */
    std::string format_report(const ErrorReport& report, OutputFormat format) const;

    static std::string log_level_to_string(LogLevel level);

private:
    ReportingConfig config_;
    mutable std::mutex config_mutex_;

    std::vector<ReporterCallback> custom_reporters_;
    mutable std::mutex reporters_mutex_;

    mutable std::mutex output_mutex_;
    mutable ReportingStatistics stats_;

    struct RateLimitState {
        uint32_t reports_this_second{0};
        uint32_t reports_this_minute{0};
        std::chrono::steady_clock::time_point second_start;
        std::chrono::steady_clock::time_point minute_start;
        std::mutex reset_mutex;
    };
    RateLimitState rate_limit_;

    bool is_rate_limited();
    Result<void> write_report(const ErrorReport& report);
    void update_statistics(const ErrorReport& report);
};

// Convenience macros for common reporting patterns
#define DCPATH_REPORT_ERROR(reporter, level, error, message) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_error((level), (error), __FUNCTION__, (message)); \
        } \
    } while(0)

#define DCPATH_REPORT_SECURITY(reporter, error, incident_type, confidence) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_security_incident((error), (incident_type), (confidence)); \
        } \
    } while(0)

#define DCPATH_REPORT_DEBUG(reporter, error, message) \
    DCPATH_REPORT_ERROR(reporter, dcpath::ErrorReporter::LogLevel::DEBUG, error, message)

#define DCPATH_REPORT_INFO(reporter, error, message) \
    DCPATH_REPORT_ERROR(reporter, dcpath::ErrorReporter::LogLevel::INFO, error, message)

#define DCPATH_REPORT_WARNING(reporter, error, message) \
    DCPATH_REPORT_ERROR(reporter, dcpath::ErrorReporter::LogLevel::WARNING, error, message)

} // namespace dcpath

#endif // DCPATH_ERROR_REPORTER_H
