#include "mergington/http_server.hpp"
#include "mergington/logging.hpp"
#include <chrono>
#include <memory>
#include <utility>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

namespace mergington {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr const char* COMPONENT = "http";
constexpr auto IDLE_TIMEOUT = std::chrono::seconds(30);

/// One client connection; reads requests until the peer closes or asks to.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, const HttpApi& api)
        : stream_(std::move(socket)), api_(api) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    void do_read() {
        request_ = {};
        stream_.expires_after(IDLE_TIMEOUT);
        beast_http::async_read(stream_, buffer_, request_,
                               beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == beast_http::error::end_of_stream) {
            return do_close();
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
                log_warn(COMPONENT, "read_failed", {{"error", ec.message()}});
            }
            return;
        }

        response_ = api_.handle(request_);
        log_info(COMPONENT, "request", {
            {"method", std::string(request_.method_string())},
            {"target", std::string(request_.target())},
            {"status", response_.result_int()}
        });

        beast_http::async_write(stream_, response_,
                                beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            log_warn(COMPONENT, "write_failed", {{"error", ec.message()}});
            return;
        }
        if (response_.need_eof()) {
            return do_close();
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpRequest request_;
    HttpResponse response_;
    const HttpApi& api_;
};

} // anonymous namespace

HttpServer::HttpServer(const HttpApi& api, const std::string& address, uint16_t port,
                       int thread_count)
    : api_(api),
      thread_count_(thread_count > 0 ? thread_count : 1),
      ioc_(thread_count_),
      acceptor_(net::make_strand(ioc_)) {
    tcp::endpoint endpoint{net::ip::make_address(address), port};

    // Throws boost::system::system_error on failure.
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    port_ = acceptor_.local_endpoint().port();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    do_accept();
    threads_.reserve(thread_count_);
    for (int i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this] { ioc_.run(); });
    }
    log_info(COMPONENT, "http_server_started", {{"port", port_}, {"threads", thread_count_}});
}

void HttpServer::stop() {
    if (ioc_.stopped() && threads_.empty()) {
        return;
    }
    ioc_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    beast::error_code ec;
    acceptor_.close(ec);
}

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&HttpServer::on_accept, this));
}

void HttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        log_warn(COMPONENT, "accept_failed", {{"error", ec.message()}});
    } else {
        std::make_shared<Session>(std::move(socket), api_)->run();
    }
    do_accept();
}

} // namespace mergington
