#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "app/api_service.hpp"

namespace httplib {
class Server;
}

namespace runner::app {

// Binds the endpoints of an ApiService to a cpp-httplib server. The service
// must outlive the server.
class HttpServer {
public:
    HttpServer(const ApiService& service, std::uint32_t worker_threads);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Port 0 picks a free port. Returns false when the address is unusable.
    bool bind(const std::string& host, std::uint16_t port);

    // Blocks serving requests until stop() is called.
    bool listen();

    void stop();

    int port() const { return port_; }

private:
    void install_routes();

    const ApiService& service_;
    std::unique_ptr<httplib::Server> server_;
    int port_ = -1;
};

}  // namespace runner::app
