#include "ibangen/error.hpp"
#include <sstream>

namespace ibangen {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";

        case ErrorCode::UnsupportedCountry: return "Unsupported country";
        case ErrorCode::InvalidCharacter: return "Invalid character";
        case ErrorCode::InternalGenerationFault: return "Internal generation fault";
        case ErrorCode::RangeError: return "Range error";

        case ErrorCode::EntropySourceFailed: return "Entropy source failed";
        case ErrorCode::CryptoInitFailed: return "Crypto initialization failed";

        case ErrorCode::InvalidProfile: return "Invalid country profile";
        case ErrorCode::InvalidFormat: return "Invalid format";
        case ErrorCode::ConfigLoadFailed: return "Config load failed";

        default: return "Unknown error code";
    }
}

bool Error::is_internal() const {
    switch (code_) {
        case ErrorCode::InvalidCharacter:
        case ErrorCode::InternalGenerationFault:
        case ErrorCode::RangeError:
        case ErrorCode::EntropySourceFailed:
        case ErrorCode::CryptoInitFailed:
        case ErrorCode::Unknown:
            return true;
        default:
            return false;
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] ";
    if (country_code_) {
        oss << *country_code_ << ": ";
    }
    oss << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace ibangen
