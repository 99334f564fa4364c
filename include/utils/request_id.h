// request_id.h - request-id generator (hex)
#pragma once

#include <string>

namespace fakehub {

// Generate a random 16-hex-character request id.
std::string generate_request_id();

// Inbound X-Request-Id values are echoed only when they look like ids:
// 1-128 characters of [A-Za-z0-9._-].
bool is_acceptable_request_id(const std::string& value);

}  // namespace fakehub
