#include "http_server.hpp"
#include "logger.hpp"

#include <chrono>

namespace beast = boost::beast;

namespace {
constexpr std::chrono::seconds kIdleTimeout{30};
constexpr std::uint64_t kBodyLimit = 1024 * 1024;
}

HttpServer::HttpServer(boost::asio::io_context& io_context, const std::string& bindAddress, uint16_t port, ApiHandler& handler)
    : acceptor_(io_context, tcp::endpoint(boost::asio::ip::make_address(bindAddress), port)),
      handler_(handler) {}

void HttpServer::startAccept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), handler_)->start();
        } else {
            Logger::formattedWarn("Accept failed: {}", ec.message());
        }
        startAccept();
    });
}

void HttpServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

uint16_t HttpServer::port() const {
    return acceptor_.local_endpoint().port();
}

// ---------------- Session ----------------

HttpSession::HttpSession(tcp::socket socket, ApiHandler& handler)
    : stream_(std::move(socket)),
      handler_(handler) {}

void HttpSession::start() {
    readRequest();
}

void HttpSession::readRequest() {
    parser_ = std::make_unique<http::request_parser<http::string_body>>();
    parser_->body_limit(kBodyLimit);
    stream_.expires_after(kIdleTimeout);

    auto self = shared_from_this();
    http::async_read(stream_, buffer_, *parser_,
        [this, self](beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream || ec == http::error::partial_message) {
                close();
                return;
            }
            if (ec == http::error::body_limit) {
                sendError(http::status::payload_too_large, "Request body too large");
                return;
            }
            if (ec.category() == http::make_error_code(http::error::bad_method).category()) {
                Logger::formattedDebug("Malformed HTTP request: {}", ec.message());
                sendError(http::status::bad_request, "Malformed HTTP request");
                return;
            }
            if (ec) {
                if (ec != beast::error::timeout) {
                    Logger::formattedDebug("HTTP read failed: {}", ec.message());
                }
                return;
            }
            handleRequest();
        });
}

void HttpSession::handleRequest() {
    const auto& request = parser_->get();

    ApiRequest apiRequest;
    apiRequest.method = std::string(request.method_string());
    apiRequest.target = std::string(request.target());
    apiRequest.contentType = std::string(request[http::field::content_type]);
    apiRequest.body = request.body();

    ApiResponse apiResponse = handler_.handle(apiRequest);

    http::response<http::string_body> response{static_cast<http::status>(apiResponse.status), request.version()};
    response.set(http::field::server, "render-dispatch");
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = apiResponse.body.dump(-1, ' ', false, Json::error_handler_t::replace);
    response.prepare_payload();

    sendResponse(std::move(response));
}

// Replies and closes; the stream position is unknown after a parse error.
void HttpSession::sendError(http::status status, const std::string& detail) {
    http::response<http::string_body> response{status, 11};
    response.set(http::field::server, "render-dispatch");
    response.set(http::field::content_type, "application/json");
    response.keep_alive(false);
    response.body() = Json{{"detail", detail}}.dump();
    response.prepare_payload();

    sendResponse(std::move(response));
}

void HttpSession::sendResponse(http::response<http::string_body> response) {
    auto self = shared_from_this();
    auto message = std::make_shared<http::response<http::string_body>>(std::move(response));

    http::async_write(stream_, *message,
        [this, self, message](beast::error_code ec, std::size_t) {
            if (ec) {
                Logger::formattedDebug("HTTP write failed: {}", ec.message());
                return;
            }
            if (message->need_eof()) {
                close();
                return;
            }
            readRequest();
        });
}

void HttpSession::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}
