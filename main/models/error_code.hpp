#ifndef ERROR_CODE_HPP
#define ERROR_CODE_HPP

#include <cstdint>

// Result of fallible domain operations. Drivers keep returning bool and log
// the underlying esp_err_t themselves.
enum class ErrorCode : uint8_t {
    OK = 0,
    INVALID_DATE,
    INVALID_CONFIG,
    FEATURE_LENGTH_MISMATCH,
    TRANSPORT_ERROR,
    PARSE_ERROR,
    INVALID_PUMP_RATE,
    INFERENCE_FAILED
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                      return "OK";
        case ErrorCode::INVALID_DATE:            return "InvalidDate";
        case ErrorCode::INVALID_CONFIG:          return "InvalidConfig";
        case ErrorCode::FEATURE_LENGTH_MISMATCH: return "FeatureLengthMismatch";
        case ErrorCode::TRANSPORT_ERROR:         return "TransportError";
        case ErrorCode::PARSE_ERROR:             return "ParseError";
        case ErrorCode::INVALID_PUMP_RATE:       return "InvalidPumpRate";
        case ErrorCode::INFERENCE_FAILED:        return "InferenceFailed";
    }
    return "Unknown";
}

#endif // ERROR_CODE_HPP
