#include "activities/http_server.hpp"
#include "activities/logging.hpp"
#include <chrono>
#include <memory>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/flat_buffer.hpp>

namespace activities {

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

/// One client connection; reads, routes and writes until the peer is done.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, HttpRouter& router)
        : socket_(std::move(socket)), router_(router) {}

    void start() { do_read(); }

private:
    void do_read() {
        request_ = HttpRequest{};
        http::async_read(socket_, buffer_, request_,
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                self->on_read(ec);
            });
    }

    void on_read(const boost::system::error_code& ec) {
        if (ec == http::error::end_of_stream) {
            close();
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted) {
                log_warn(LOG_DOMAIN, "http_read_failed", {{"error", ec.message()}});
            }
            return;
        }

        response_ = router_.handle(request_);
        http::async_write(socket_, response_,
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                self->on_write(ec);
            });
    }

    void on_write(const boost::system::error_code& ec) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                log_warn(LOG_DOMAIN, "http_write_failed", {{"error", ec.message()}});
            }
            return;
        }
        if (!response_.keep_alive()) {
            close();
            return;
        }
        do_read();
    }

    void close() {
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_send, ignored);
    }

    tcp::socket socket_;
    HttpRouter& router_;
    boost::beast::flat_buffer buffer_;
    HttpRequest request_;
    HttpResponse response_;
};

} // anonymous namespace

bool is_transient_accept_error(const boost::system::error_code& ec) {
    using boost::system::errc::errc_t;
    static const errc_t transient[] = {
        boost::system::errc::too_many_files_open,
        boost::system::errc::too_many_files_open_in_system,
        boost::system::errc::connection_aborted,
        boost::system::errc::not_enough_memory,
        boost::system::errc::no_buffer_space,
        boost::system::errc::interrupted,
        boost::system::errc::resource_unavailable_try_again,
    };
    for (auto code : transient) {
        if (ec == boost::system::errc::make_error_condition(code)) {
            return true;
        }
    }
    return false;
}

HttpServer::HttpServer(const std::string& host, uint16_t port, HttpRouter& router)
    : acceptor_(ioc_, tcp::endpoint(net::ip::make_address(host), port)),
      retry_timer_(ioc_),
      router_(router) {}

bool HttpServer::run() {
    log_info(LOG_DOMAIN, "http_server_started", {{"port", port()}});

    do_accept();
    ioc_.run();

    log_info(LOG_DOMAIN, "http_server_stopped", {{"failed", failed_}});
    return !failed_;
}

void HttpServer::stop() {
    ioc_.stop();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        });
}

void HttpServer::on_accept(const boost::system::error_code& ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (ec && is_transient_accept_error(ec)) {
        log_warn(LOG_DOMAIN, "http_accept_retry", {{"error", ec.message()}});
        retry_timer_.expires_after(ACCEPT_RETRY_DELAY);
        retry_timer_.async_wait([this](boost::system::error_code wait_ec) {
            if (!wait_ec) {
                do_accept();
            }
        });
        return;
    }
    if (ec) {
        log_error(LOG_DOMAIN, "http_accept_failed", {{"error", ec.message()}});
        failed_ = true;
        ioc_.stop();
        return;
    }

    std::make_shared<HttpSession>(std::move(socket), router_)->start();
    do_accept();
}

} // namespace activities
