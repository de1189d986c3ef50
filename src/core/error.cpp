#include <dcpath/error.h>
#include <unordered_map>

namespace dcpath {

// Error message mapping
std::string DCErrorCategory::message(int ev) const {
    DCError error = static_cast<DCError>(ev);

    static const std::unordered_map<DCError, std::string> error_messages = {
        // General errors (1-19)
        {DCError::SUCCESS, "Success"},
        {DCError::INVALID_PARAMETER, "Invalid parameter provided"},
        {DCError::BUFFER_TOO_SMALL, "Buffer too small for operation"},
        {DCError::OUT_OF_MEMORY, "Memory allocation failed"},
        {DCError::OPERATION_NOT_SUPPORTED, "Operation not supported"},
        {DCError::INTERNAL_ERROR, "Internal implementation error"},
        {DCError::APPLICATION_ERROR, "Application rejected the path"},

        // Protocol errors (20-49)
        {DCError::DECODE_ERROR, "Packet decode error"},
        {DCError::TRAILING_DATA, "Unexpected bytes after packet"},
        {DCError::UNKNOWN_PACKET_TAG, "Unknown packet tag"},
        {DCError::INVALID_STATE, "Invalid state for operation"},

        // Replay protection errors (50-69)
        {DCError::KEY_ID_ALREADY_SEEN, "Key id was already seen"},
        {DCError::KEY_ID_UNKNOWN, "Key id novelty cannot be determined"},
        {DCError::KEY_ID_EXHAUSTED, "Key id space exhausted"},

        // Cryptographic errors (92-111)
        {DCError::INVALID_TAG, "Authentication tag verification failed"},
        {DCError::KEY_DERIVATION_FAILED, "Key derivation failed"},
        {DCError::CIPHER_SUITE_NOT_SUPPORTED, "Cipher suite not supported"},
        {DCError::CRYPTO_PROVIDER_ERROR, "Cryptographic provider error"},
        {DCError::RANDOM_GENERATION_FAILED, "Random number generation failed"},
        {DCError::INVALID_KEY_MATERIAL, "Invalid key material"},

        // Path secret errors (112-131)
        {DCError::UNKNOWN_PATH_SECRET, "Unknown path secret"},
        {DCError::PATH_SECRET_EVICTED, "Path secret was evicted"},

        // Security errors (152-171)
        {DCError::AUTHENTICATION_FAILED, "Authentication failed"},
        {DCError::RATE_LIMITED, "Rate limited"},
    };

    auto it = error_messages.find(error);
    if (it != error_messages.end()) {
        return it->second;
    }

    return "Unknown dcpath error (" + std::to_string(ev) + ")";
}

bool DCErrorCategory::equivalent(const std::error_code& code, int condition) const noexcept {
    return (code.category() == *this) && (code.value() == condition);
}

std::string error_message(DCError error) {
    return DCErrorCategory::instance().message(static_cast<int>(error));
}

bool is_replay_error(DCError error) {
    switch (error) {
        case DCError::KEY_ID_ALREADY_SEEN:
        case DCError::KEY_ID_UNKNOWN:
            return true;
        default:
            return false;
    }
}

bool is_fatal_error(DCError error) {
    switch (error) {
        // Per-packet failures: drop the packet and keep the path
        case DCError::SUCCESS:
        case DCError::DECODE_ERROR:
        case DCError::TRAILING_DATA:
        case DCError::UNKNOWN_PACKET_TAG:
        case DCError::KEY_ID_ALREADY_SEEN:
        case DCError::KEY_ID_UNKNOWN:
        case DCError::INVALID_TAG:
        case DCError::AUTHENTICATION_FAILED:
        case DCError::UNKNOWN_PATH_SECRET:
        case DCError::RATE_LIMITED:
            return false;

        case DCError::APPLICATION_ERROR:
        case DCError::INTERNAL_ERROR:
        case DCError::INVALID_STATE:
        case DCError::KEY_ID_EXHAUSTED:
        case DCError::KEY_DERIVATION_FAILED:
        case DCError::CIPHER_SUITE_NOT_SUPPORTED:
            return true;

        default:
            return true;
    }
}

} // namespace dcpath
