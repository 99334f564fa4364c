#pragma once

#include <stdexcept>
#include <string>

namespace fakehub {

enum class HubErrorCode : int {
    kNotFound = 1,
    kOutOfBounds = 2,
    kIo = 3,
};

inline const char* to_string(HubErrorCode code) {
    switch (code) {
        case HubErrorCode::kNotFound:
            return "NOT_FOUND";
        case HubErrorCode::kOutOfBounds:
            return "OUT_OF_BOUNDS";
        case HubErrorCode::kIo:
            return "IO_ERROR";
    }
    return "UNKNOWN";
}

class HubError : public std::runtime_error {
public:
    HubError(HubErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    HubErrorCode code() const { return code_; }

private:
    HubErrorCode code_;
};

// Missing repository, dataset or file. Maps to 404 at the HTTP boundary.
class NotFoundError : public HubError {
public:
    explicit NotFoundError(const std::string& message)
        : HubError(HubErrorCode::kNotFound, message) {}

protected:
    NotFoundError(HubErrorCode code, const std::string& message)
        : HubError(code, message) {}
};

// Path traversal attempt. Callers treat it exactly like NotFoundError.
class OutOfBoundsError : public NotFoundError {
public:
    explicit OutOfBoundsError(const std::string& message)
        : NotFoundError(HubErrorCode::kOutOfBounds, message) {}
};

// File vanished or became unreadable after resolution.
class IoError : public HubError {
public:
    explicit IoError(const std::string& message)
        : HubError(HubErrorCode::kIo, message) {}
};

}  // namespace fakehub
