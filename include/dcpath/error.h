#ifndef DCPATH_ERROR_H
#define DCPATH_ERROR_H

#include <dcpath/config.h>
#include <system_error>
#include <string>
#include <cstdint>

namespace dcpath {

// dcpath error codes
enum class DCError : int {
    SUCCESS = 0,

    // General errors (1-19)
    INVALID_PARAMETER = 1,
    BUFFER_TOO_SMALL = 3,
    OUT_OF_MEMORY = 4,
    OPERATION_NOT_SUPPORTED = 10,
    INTERNAL_ERROR = 11,
    APPLICATION_ERROR = 12,

    // Protocol errors (20-49)
    DECODE_ERROR = 21,
    TRAILING_DATA = 22,
    UNKNOWN_PACKET_TAG = 23,
    INVALID_STATE = 30,

    // Replay protection errors (50-69)
    KEY_ID_ALREADY_SEEN = 50,
    KEY_ID_UNKNOWN = 51,
    KEY_ID_EXHAUSTED = 52,

    // Cryptographic errors (92-111)
    INVALID_TAG = 92,
    KEY_DERIVATION_FAILED = 94,
    CIPHER_SUITE_NOT_SUPPORTED = 96,
    CRYPTO_PROVIDER_ERROR = 97,
    RANDOM_GENERATION_FAILED = 98,
    INVALID_KEY_MATERIAL = 99,

    // Path secret errors (112-131)
    UNKNOWN_PATH_SECRET = 112,
    PATH_SECRET_EVICTED = 113,

    // Security errors (152-171)
    AUTHENTICATION_FAILED = 155,
    RATE_LIMITED = 196
};

// Error category for dcpath errors
class DCErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "dcpath";
    }

    std::string message(int ev) const override;

    bool equivalent(const std::error_code& code, int condition) const noexcept override;

    static const DCErrorCategory& instance() {
        static DCErrorCategory instance;
        return instance;
    }
};

inline std::error_code make_error_code(DCError e) {
    return std::error_code(static_cast<int>(e), DCErrorCategory::instance());
}

// Exception class for dcpath errors
class DCPATH_API DCException : public std::system_error {
public:
    explicit DCException(DCError error)
        : std::system_error(make_error_code(error)) {}

    DCException(DCError error, const std::string& what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    DCException(DCError error, const char* what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    DCError dc_error() const noexcept {
        return static_cast<DCError>(code().value());
    }
};

// Utility functions
DCPATH_API std::string error_message(DCError error);

/**
 * Replay errors are recovered locally by dropping the packet.
 */
DCPATH_API bool is_replay_error(DCError error);

/**
 * Errors that end a connection attempt rather than a single packet.
 */
DCPATH_API bool is_fatal_error(DCError error);

#define DCPATH_THROW_IF_ERROR(error) \
    do { \
        if ((error) != dcpath::DCError::SUCCESS) { \
            throw dcpath::DCException((error)); \
        } \
    } while (0)

} // namespace dcpath

namespace std {
template<>
struct is_error_code_enum<dcpath::DCError> : true_type {};
}

#endif // DCPATH_ERROR_H
