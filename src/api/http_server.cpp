#include "api/http_server.h"

#include "api/hub_endpoints.h"
#include <chrono>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include "runtime/state.h"
#include "utils/request_id.h"

namespace fakehub {

namespace {

// Range is evaluated by FileServer alone. httplib keeps its own parse in
// req.ranges and slices provider bodies by it when writing, so the list is
// emptied before any handler runs. The Request is a mutable local of
// httplib's connection loop; only the const view reaches handlers.
void dropTransportRanges(const httplib::Request& req) {
    const_cast<httplib::Request&>(req).ranges.clear();
}

// Details go to the log only; they may name files on disk.
void set_internal_error(const httplib::Request& req, httplib::Response& res, const std::string& what) {
    spdlog::error("Unhandled error on {} {}: {}", req.method, req.path, what);
    nlohmann::json body = {{"detail", "Internal Server Error"}};
    res.status = 500;
    res.set_content(body.dump(), "application/json");
}

}  // namespace

HttpServer::HttpServer(int port, HubEndpoints& hub, std::string bind_address, int worker_threads)
    : port_(port), bind_address_(std::move(bind_address)), worker_threads_(worker_threads), hub_(hub) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::addMiddleware(Middleware mw) {
    middlewares_.push_back(std::move(mw));
}

httplib::Server::HandlerResponse HttpServer::preRoute(const httplib::Request& req, httplib::Response& res) {
    count_request();
    dropTransportRanges(req);

    // Request ID: echo a well-formed inbound id, otherwise generate one
    std::string req_id = req.get_header_value("X-Request-Id");
    if (!is_acceptable_request_id(req_id)) req_id = generate_request_id();
    res.set_header("X-Request-Id", req_id);

    for (auto& mw : middlewares_) {
        if (!mw(req, res)) return httplib::Server::HandlerResponse::Handled;
    }
    return httplib::Server::HandlerResponse::Unhandled;
}

void HttpServer::recoverRejectedRange(const httplib::Request& req, httplib::Response& res) {
    if (preRoute(req, res) == httplib::Server::HandlerResponse::Handled) return;
    try {
        if (hub_.serveResolvePath(req, res)) return;
    } catch (const std::exception& e) {
        // Runs inside the error handler, which httplib's exception handler does not cover.
        set_internal_error(req, res, e.what());
        return;
    }

    spdlog::debug("Rejected Range header on {} {}: {}", req.method, req.path, req.get_header_value("Range"));
    nlohmann::json body = {{"detail", httplib::status_message(416)}};
    res.status = 416;
    res.set_content(body.dump(), "application/json");
}

void HttpServer::start() {
    if (running_) return;

    const size_t threads = worker_threads_ > 0 ? static_cast<size_t>(worker_threads_) : 1;
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    server_.set_pre_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res) { return preRoute(req, res); });

    // Access log
    if (logger_) {
        server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
            logger_(req, res);
        });
    }

    // Error handler (404/others)
    server_.set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (res.status == 416) {
            // FileServer's 416 always carries Content-Range; a bare one is
            // httplib rejecting the Range header before any route ran.
            if (!res.has_header("Content-Range")) recoverRejectedRange(req, res);
            return;
        }
        if (!res.body.empty()) {
            // respect existing body set by handlers
            if (!res.has_header("Content-Type")) {
                res.set_header("Content-Type", "text/plain");
            }
            return;
        }
        nlohmann::json body = {{"detail", res.status == 404 ? "Not Found" : httplib::status_message(res.status)}};
        res.set_content(body.dump(), "application/json");
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // non-standard exception type; reported below as unknown
        }
        set_internal_error(req, res, what);
    });

    hub_.registerRoutes(server_);

    if (!server_.bind_to_port(bind_address_.c_str(), port_)) {
        throw std::runtime_error("failed to bind " + bind_address_ + ":" + std::to_string(port_));
    }

    running_ = true;
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::info("Listening on {}:{} ({} worker threads)", bind_address_, port_, threads);
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace fakehub
