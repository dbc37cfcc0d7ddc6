#pragma once

#include <cstdint>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include "http_router.hpp"

namespace activities {

/// True for accept errors that leave the listening socket usable (descriptor
/// exhaustion, a peer resetting before accept completes, interrupted calls).
bool is_transient_accept_error(const boost::system::error_code& ec);

/// Asynchronous HTTP/1.1 listener. Connections are sessions owned by their
/// pending operations on the server's io_context, so none outlive the server.
/// The router must outlive the server.
class HttpServer {
public:
    /// @throws boost::system::system_error if the address cannot be bound.
    HttpServer(const std::string& host, uint16_t port, HttpRouter& router);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Serve until stop() is called or the acceptor fails for good.
    /// @return false if the acceptor failed; true after stop().
    bool run();

    /// Safe to call from any thread.
    void stop();

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    void do_accept();
    void on_accept(const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket);

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer retry_timer_;
    HttpRouter& router_;
    bool failed_ = false;
};

} // namespace activities
