#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <string>

#include "api_handler.hpp"

using boost::asio::ip::tcp;
namespace http = boost::beast::http;

/**
 * @brief One HTTP/1.1 connection. Keeps reading requests until the peer
 * closes, the request asks for close, or the idle timeout fires.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, ApiHandler& handler);

    void start();

private:
    void readRequest();
    void handleRequest();
    void sendError(http::status status, const std::string& detail);
    void sendResponse(http::response<http::string_body> response);
    void close();

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::unique_ptr<http::request_parser<http::string_body>> parser_;
    ApiHandler& handler_;
};

/**
 * @brief Accepts connections and spawns an HttpSession for each.
 *
 * The io_context may be run from several threads; sessions are independent
 * and only meet in the JobStore.
 */
class HttpServer {
public:
    HttpServer(boost::asio::io_context& io_context, const std::string& bindAddress, uint16_t port, ApiHandler& handler);

    void startAccept();
    void stop();

    uint16_t port() const;

private:
    tcp::acceptor acceptor_;
    ApiHandler& handler_;
};
