#pragma once

#include <httplib.h>
#include <thread>
#include <atomic>
#include <string>
#include <vector>
#include <functional>

namespace fakehub {

class HubEndpoints;

using Middleware = std::function<bool(const httplib::Request&, httplib::Response&)>;
using Logger = std::function<void(const httplib::Request&, const httplib::Response&)>;

class HttpServer {
public:
    HttpServer(int port, HubEndpoints& hub, std::string bind_address = "0.0.0.0", int worker_threads = 8);
    ~HttpServer();

    // Binds and starts listening on a background thread. Throws
    // std::runtime_error when the address cannot be bound.
    void start();
    void stop();

    void addMiddleware(Middleware mw);
    void setLogger(Logger logger) { logger_ = std::move(logger); }

    int port() const { return port_; }
    bool running() const { return running_; }

private:
    // Request id, request counter and middlewares; runs before every route.
    httplib::Server::HandlerResponse preRoute(const httplib::Request& req, httplib::Response& res);

    // httplib answers 416 by itself, before routing, when it cannot parse a
    // Range header. Such requests are routed here again so the hub decides.
    void recoverRejectedRange(const httplib::Request& req, httplib::Response& res);

    int port_;
    std::string bind_address_;
    int worker_threads_;
    HubEndpoints& hub_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::vector<Middleware> middlewares_;
    Logger logger_{};
};

}  // namespace fakehub
