#include "app/http_server.hpp"

#include <exception>
#include <optional>
#include <httplib.h>
#include "core/config/limits.hpp"
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/http_contract.hpp"

namespace runner::app {

namespace {

constexpr const char* kJsonContentType = "application/json";

std::optional<std::string> api_key_header(const httplib::Request& req) {
    const std::string header(core::config::kApiKeyHeader);
    if (!req.has_header(header)) {
        return std::nullopt;
    }
    return req.get_header_value(header);
}

void write_reply(const HttpReply& reply, httplib::Response& res) {
    res.status = reply.status;
    res.set_content(reply.body.dump(), kJsonContentType);
}

// Tags every log line written while handling this request.
class RequestScope {
public:
    explicit RequestScope(const httplib::Request& req) {
        core::logging::Logger::get().set_request_id(
            core::config::generate_request_id("req-"));
        LOG_DEBUG(req.method + " " + req.path);
    }
    ~RequestScope() { core::logging::Logger::get().clear_request_id(); }

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;
};

}  // namespace

HttpServer::HttpServer(const ApiService& service, const std::uint32_t worker_threads)
    : service_(service), server_(std::make_unique<httplib::Server>()) {
    server_->new_task_queue = [worker_threads] {
        return new httplib::ThreadPool(worker_threads);
    };
    install_routes();
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::install_routes() {
    server_->Get("/ping", [this](const httplib::Request& req, httplib::Response& res) {
        RequestScope scope(req);
        write_reply(service_.ping(), res);
    });

    server_->Post("/run", [this](const httplib::Request& req, httplib::Response& res) {
        RequestScope scope(req);
        write_reply(service_.run(api_key_header(req), req.body), res);
    });

    server_->Post("/test", [this](const httplib::Request& req, httplib::Response& res) {
        RequestScope scope(req);
        write_reply(service_.test(api_key_header(req), req.body), res);
    });

    // Unmatched routes and bodiless errors still answer with {"detail": ...}.
    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        const std::string detail = res.status == 404 ? "Not Found" : "Request failed";
        res.set_content(protocol::error_to_json(detail).dump(), kJsonContentType);
    });

    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown exception";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                // Non-standard exception type, logged below without a message.
            }
            LOG_ERROR("Unhandled exception on " + req.method + " " + req.path + ": " +
                      what);
            res.status = 500;
            res.set_content(protocol::error_to_json("Internal server error").dump(),
                            kJsonContentType);
        });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_INFO(req.method + " " + req.path + " -> " + std::to_string(res.status));
    });
}

bool HttpServer::bind(const std::string& host, const std::uint16_t port) {
    if (port == 0) {
        port_ = server_->bind_to_any_port(host);
        return port_ > 0;
    }
    if (!server_->bind_to_port(host, port)) {
        return false;
    }
    port_ = port;
    return true;
}

bool HttpServer::listen() {
    return server_->listen_after_bind();
}

void HttpServer::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

}  // namespace runner::app
