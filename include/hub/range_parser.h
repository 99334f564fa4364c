#pragma once

#include <cstdint>
#include <string>

namespace fakehub {

// Inclusive byte interval, 0 <= start <= end < total size.
struct ByteRange {
    uint64_t start{0};
    uint64_t end{0};

    uint64_t length() const { return end - start + 1; }
};

enum class RangeParseStatus {
    Satisfiable,
    Unsatisfiable,  // answered with 416
    Malformed,      // ignored, answered like a request without Range
};

struct RangeParseResult {
    RangeParseStatus status{RangeParseStatus::Malformed};
    ByteRange range;

    bool satisfiable() const { return status == RangeParseStatus::Satisfiable; }
    bool unsatisfiable() const { return status == RangeParseStatus::Unsatisfiable; }
    bool malformed() const { return status == RangeParseStatus::Malformed; }

    static RangeParseResult ok(uint64_t start, uint64_t end) {
        return RangeParseResult{RangeParseStatus::Satisfiable, ByteRange{start, end}};
    }
    static RangeParseResult unsatisfiable_range() {
        return RangeParseResult{RangeParseStatus::Unsatisfiable, {}};
    }
    static RangeParseResult malformed_range() {
        return RangeParseResult{RangeParseStatus::Malformed, {}};
    }
};

const char* to_string(RangeParseStatus status);

/// Parse a Range header value against a resource of total_size bytes.
///
/// Accepted forms: "bytes=N-M", "bytes=N-", "bytes=-N". Only the first
/// comma-separated range is considered; the unit is matched case-insensitively.
/// An end past the resource is clamped to total_size - 1.
RangeParseResult parseRange(const std::string& header_value, uint64_t total_size);

/// "bytes {start}-{end}/{total}"
std::string contentRangeHeader(const ByteRange& range, uint64_t total_size);

/// "bytes */{total}"
std::string unsatisfiedContentRangeHeader(uint64_t total_size);

}  // namespace fakehub
