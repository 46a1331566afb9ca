#pragma once

#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include "http_api.hpp"

namespace mergington {

/**
 * Boost.Beast HTTP listener serving an HttpApi.
 *
 * The socket is bound in the constructor, so port() is valid before
 * start(); binding port 0 picks a free port. Connections are served
 * asynchronously on thread_count io_context threads.
 *
 * The HttpApi must outlive the server.
 */
class HttpServer {
public:
    HttpServer(const HttpApi& api, const std::string& address, uint16_t port,
               int thread_count = 1);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bound port.
    uint16_t port() const { return port_; }

    void start();

    /// Stop accepting and drop open connections. Safe to call twice.
    void stop();

private:
    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    const HttpApi& api_;
    int thread_count_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::vector<std::thread> threads_;
};

} // namespace mergington
