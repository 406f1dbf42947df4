#include "cadenza/cadenza.hpp"

const char* cadenza::statusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::OK: return "OK";
        case StatusCode::UNKNOWN_PROCESSOR: return "UNKNOWN_PROCESSOR";
        case StatusCode::INVALID_PARAMETER: return "INVALID_PARAMETER";
        case StatusCode::INVALID_METADATA: return "INVALID_METADATA";
        case StatusCode::FAILED_TO_PROCESS: return "FAILED_TO_PROCESS";
        case StatusCode::UNSUPPORTED_VERSION: return "UNSUPPORTED_VERSION";
        case StatusCode::MALFORMED_DATA: return "MALFORMED_DATA";
        case StatusCode::INVALID_STATE: return "INVALID_STATE";
    }
    return "UNKNOWN";
}

const char* cadenza::errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigurationError: return "ConfigurationError";
        case ErrorKind::RenderFailure: return "RenderFailure";
        case ErrorKind::TimingViolation: return "TimingViolation";
        case ErrorKind::ResourceExhaustion: return "ResourceExhaustion";
    }
    return "Unknown";
}
