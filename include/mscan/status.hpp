#pragma once
#include <string>
#include <utility>

namespace mscan
{
    enum class ErrorKind
    {
        None = 0,
        InvalidRegion,
        RecognitionUnavailable,
        CoordinateParse,
        LowConfidence,
        SafetyViolation,
        Configuration,
        WindowNotFound,
        Capture,
        Input,
        Cancelled
    };

    inline const char *error_kind_name(ErrorKind k)
    {
        switch (k)
        {
        case ErrorKind::None:
            return "ok";
        case ErrorKind::InvalidRegion:
            return "invalid-region";
        case ErrorKind::RecognitionUnavailable:
            return "recognition-unavailable";
        case ErrorKind::CoordinateParse:
            return "coordinate-parse";
        case ErrorKind::LowConfidence:
            return "low-confidence";
        case ErrorKind::SafetyViolation:
            return "safety-violation";
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::WindowNotFound:
            return "window-not-found";
        case ErrorKind::Capture:
            return "capture";
        case ErrorKind::Input:
            return "input";
        case ErrorKind::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    // Result of an operation: either ok, or a failure kind with a message.
    // Operations that produce a value fill an out-parameter and return this.
    struct Status
    {
        ErrorKind kind{ErrorKind::None};
        std::string message;

        static Status ok() { return {}; }
        static Status fail(ErrorKind k, std::string msg) { return {k, std::move(msg)}; }

        bool is_ok() const { return kind == ErrorKind::None; }
        explicit operator bool() const { return is_ok(); }

        std::string to_string() const
        {
            if (is_ok())
                return "ok";
            return std::string(error_kind_name(kind)) + ": " + message;
        }
    };
}
