#include <dcpath/error_reporter.h>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace dcpath {

namespace {

void write_json_string(std::ostream& out, const std::string& value) {
    out << '"';
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    out << c;
                }
        }
    }
    out << '"';
}

} // anonymous namespace

ErrorReporter::ErrorReporter() : ErrorReporter(ReportingConfig{}) {}

ErrorReporter::ErrorReporter(const ReportingConfig& config) : config_(config) {
    rate_limit_.second_start = std::chrono::steady_clock::now();
    rate_limit_.minute_start = rate_limit_.second_start;
}

ErrorReporter::~ErrorReporter() = default;

Result<void> ErrorReporter::report_error(LogLevel level,
                                         DCError error,
                                         const std::string& category,
                                         const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (level < config_.minimum_level) {
            return make_result();
        }
    }

    if (is_rate_limited()) {
        stats_.rate_limited_reports++;
        return make_error<void>(DCError::RATE_LIMITED);
    }

    ErrorReport report(level, error, message);
    report.category = category;

    update_statistics(report);
    return write_report(report);
}

Result<void> ErrorReporter::report_security_incident(DCError error,
                                                     const std::string& incident_type,
                                                     double confidence) {
    // Security incidents bypass the level filter and the rate limiter
    ErrorReport report(LogLevel::SECURITY, error, incident_type);
    report.category = "security";
    report.is_security_incident = true;
    report.threat_confidence = confidence;
    report.attack_vector = incident_type;

    update_statistics(report);
    stats_.security_incidents++;
    return write_report(report);
}

Result<void> ErrorReporter::update_configuration(const ReportingConfig& config) {
    if (config.max_reports_per_second == 0 || config.max_reports_per_minute == 0) {
        return make_error<void>(DCError::INVALID_PARAMETER);
    }
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
    return make_result();
}

ErrorReporter::ReportingConfig ErrorReporter::get_configuration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ErrorReporter::add_reporter_callback(ReporterCallback callback) {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.push_back(std::move(callback));
}

void ErrorReporter::clear_reporter_callbacks() {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.clear();
}

void ErrorReporter::reset_statistics() {
    stats_.total_reports = 0;
    for (auto& counter : stats_.reports_by_level) {
        counter = 0;
    }
    stats_.security_incidents = 0;
    stats_.rate_limited_reports = 0;
    stats_.bytes_logged = 0;
}

std::string ErrorReporter::format_address(const NetworkAddress& addr) const {
    bool log_addresses;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        log_addresses = config_.log_network_addresses;
    }
    if (log_addresses) {
        return to_string(addr);
    }
    std::ostringstream oss;
    oss << "peer#" << std::hex << NetworkAddressHash{}(addr);
    return oss.str();
}

std::string ErrorReporter::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::SECURITY: return "SECURITY";
        default: return "UNKNOWN";
    }
}

// Private method implementations

bool ErrorReporter::is_rate_limited() {
    uint32_t max_per_second, max_per_minute;
    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        max_per_second = config_.max_reports_per_second;
        max_per_minute = config_.max_reports_per_minute;
    }

    std::lock_guard<std::mutex> lock(rate_limit_.reset_mutex);
    auto now = std::chrono::steady_clock::now();

    if (now - rate_limit_.second_start >= std::chrono::seconds(1)) {
        rate_limit_.reports_this_second = 0;
        rate_limit_.second_start = now;
    }
    if (now - rate_limit_.minute_start >= std::chrono::minutes(1)) {
        rate_limit_.reports_this_minute = 0;
        rate_limit_.minute_start = now;
    }

    // Check limits BEFORE incrementing
    if (rate_limit_.reports_this_second >= max_per_second ||
        rate_limit_.reports_this_minute >= max_per_minute) {
        return true;
    }

    rate_limit_.reports_this_second++;
    rate_limit_.reports_this_minute++;
    return false;
}

Result<void> ErrorReporter::write_report(const ErrorReport& report) {
    ReportingConfig config = get_configuration();

    if (config.write_to_stderr) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::string formatted = format_report(report, config.format);
        std::cerr << formatted << std::endl;
        stats_.bytes_logged += formatted.length();
    }

    std::vector<ReporterCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(reporters_mutex_);
        callbacks = custom_reporters_;
    }
    for (const auto& callback : callbacks) {
        callback(report);
    }

    stats_.total_reports++;
    return make_result();
}

std::string ErrorReporter::format_report(const ErrorReport& report, OutputFormat format) const {
    std::ostringstream oss;

    if (format == OutputFormat::JSON) {
        oss << "{\"level\":\"" << log_level_to_string(report.level) << "\""
            << ",\"error\":" << static_cast<int>(report.error_code)
            << ",\"category\":";
        write_json_string(oss, report.category);
        oss << ",\"message\":";
        write_json_string(oss, report.message);

        if (report.is_security_incident) {
            oss << ",\"security_incident\":true"
                << ",\"threat_confidence\":" << report.threat_confidence
                << ",\"attack_vector\":";
            write_json_string(oss, report.attack_vector);
        }

        oss << "}";
    } else {
        oss << "[dcpath] " << log_level_to_string(report.level)
            << " [" << report.category << "] " << error_message(report.error_code)
            << ": " << report.message;

        if (report.is_security_incident) {
            oss << " (SECURITY: " << report.attack_vector
                << ", confidence: " << report.threat_confidence << ")";
        }
    }

    return oss.str();
}

void ErrorReporter::update_statistics(const ErrorReport& report) {
    size_t level_index = static_cast<size_t>(report.level);
    if (level_index < 6) {
        stats_.reports_by_level[level_index]++;
    }
}

} // namespace dcpath
