#include "hub/range_parser.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>

namespace fakehub {

namespace {

// Signed integer whose magnitude saturates at UINT64_MAX; larger values are
// only ever compared against the resource size, so saturation keeps the
// ordering intact.
struct RangeNumber {
    bool negative{false};
    uint64_t magnitude{0};
};

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::optional<RangeNumber> parseNumber(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty()) return std::nullopt;

    RangeNumber out;
    size_t i = 0;
    if (text[0] == '+' || text[0] == '-') {
        out.negative = text[0] == '-';
        i = 1;
    }
    if (i >= text.size()) return std::nullopt;

    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    for (; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return std::nullopt;
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (out.magnitude > (kMax - digit) / 10) {
            out.magnitude = kMax;
        } else {
            out.magnitude = out.magnitude * 10 + digit;
        }
    }
    if (out.magnitude == 0) out.negative = false;
    return out;
}

bool equalsIgnoreCase(const std::string& a, const char* b) {
    const std::string other(b);
    if (a.size() != other.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(other[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

const char* to_string(RangeParseStatus status) {
    switch (status) {
        case RangeParseStatus::Satisfiable:
            return "satisfiable";
        case RangeParseStatus::Unsatisfiable:
            return "unsatisfiable";
        case RangeParseStatus::Malformed:
            return "malformed";
    }
    return "unknown";
}

RangeParseResult parseRange(const std::string& header_value, uint64_t total_size) {
    const std::string header = trim(header_value);
    const auto eq = header.find('=');
    if (eq == std::string::npos) return RangeParseResult::malformed_range();

    if (!equalsIgnoreCase(header.substr(0, eq), "bytes")) {
        return RangeParseResult::malformed_range();
    }

    // Multi-range requests are reduced to their first range.
    std::string first = header.substr(eq + 1);
    const auto comma = first.find(',');
    if (comma != std::string::npos) first = first.substr(0, comma);
    first = trim(first);

    const auto dash = first.find('-');
    if (dash == std::string::npos) return RangeParseResult::malformed_range();
    const std::string start_text = first.substr(0, dash);
    const std::string end_text = first.substr(dash + 1);

    uint64_t start = 0;
    uint64_t end = 0;

    if (start_text.empty()) {
        // Suffix form: last N bytes.
        auto n = parseNumber(end_text);
        if (!n || n->negative || n->magnitude == 0) {
            return RangeParseResult::malformed_range();
        }
        start = total_size > n->magnitude ? total_size - n->magnitude : 0;
        end = total_size > 0 ? total_size - 1 : 0;
    } else {
        auto s = parseNumber(start_text);
        if (!s) return RangeParseResult::malformed_range();
        if (s->negative) return RangeParseResult::malformed_range();
        start = s->magnitude;

        if (trim(end_text).empty()) {
            if (start >= total_size) return RangeParseResult::unsatisfiable_range();
            end = total_size - 1;
        } else {
            auto e = parseNumber(end_text);
            if (!e) return RangeParseResult::malformed_range();
            if (start >= total_size) return RangeParseResult::unsatisfiable_range();
            if (e->negative) return RangeParseResult::unsatisfiable_range();
            end = e->magnitude;
        }
    }

    if (start >= total_size) return RangeParseResult::unsatisfiable_range();
    end = std::min(end, total_size - 1);
    if (end < start) return RangeParseResult::unsatisfiable_range();
    return RangeParseResult::ok(start, end);
}

std::string contentRangeHeader(const ByteRange& range, uint64_t total_size) {
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" +
           std::to_string(total_size);
}

std::string unsatisfiedContentRangeHeader(uint64_t total_size) {
    return "bytes */" + std::to_string(total_size);
}

}  // namespace fakehub
