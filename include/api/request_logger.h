#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "utils/config.h"

namespace fakehub {

/// Access logging for the hub server.
///
/// onRequest() runs in the pre-routing stage (request line and headers);
/// onResponse() runs from the server logger once the response has been
/// written (body snippet, status, duration). Both run on the worker thread
/// that handles the connection, which is how the start time is carried over.
class RequestLogger {
public:
    explicit RequestLogger(RequestLogConfig config);

    bool enabled() const { return config_.enabled; }

    void onRequest(const httplib::Request& req, const std::string& request_id) const;
    void onResponse(const httplib::Request& req, const httplib::Response& res) const;

    std::string redact(const std::string& name, const std::string& value) const;
    nlohmann::json headerSnapshot(const httplib::Headers& headers) const;

    // Leading body bytes when bodies are logged for this request.
    std::optional<std::string> bodySnippet(const httplib::Request& req) const;

private:
    RequestLogConfig config_;
};

}  // namespace fakehub
