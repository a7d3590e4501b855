#undef NDEBUG
#include "http_server.hpp"
#include "test_helpers.hpp"

#include <assert.h>
#include <thread>

namespace {

struct Exchange {
    unsigned status;
    bool keepAlive;
    Json body;
};

// Writes `raw` on a fresh loopback connection and reads one response.
Exchange exchange(uint16_t port, const std::string& raw) {
    boost::asio::io_context io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    boost::asio::write(socket, boost::asio::buffer(raw));

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);
    return {response.result_int(), response.keep_alive(), Json::parse(response.body())};
}

}

int main() {
    Config config = Config::fromValues(baseConfigValues());
    JobStore store;
    RecordingSink sink;
    NotificationDispatcher notifier(sink, 1);
    IngressRouter router(config, store, nullptr, notifier);
    WorkerQueue queue(store, notifier);
    ApiHandler api(config, router, queue, store);

    boost::asio::io_context io;
    HttpServer server(io, "127.0.0.1", 0, api);
    server.startAccept();
    uint16_t port = server.port();
    std::thread runner([&io]() { io.run(); });

    /* Well-formed request.  */
    {
        auto reply = exchange(port, "GET / HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
        assert(reply.status == 200);
        assert(reply.body["status"] == "ok");
    }

    /* Declared body over the limit.  */
    {
        auto reply = exchange(port,
            "POST /api/update-task HTTP/1.1\r\nHost: localhost\r\n"
            "Content-Type: application/json\r\nContent-Length: 2000000\r\n\r\n");
        assert(reply.status == 413);
        assert(!reply.keepAlive);
        assert(reply.body["detail"] == "Request body too large");
    }

    /* Unparsable request.  */
    {
        auto reply = exchange(port,
            "POST /api/update-task HTTP/1.1\r\nHost: localhost\r\nContent-Length: abc\r\n\r\n");
        assert(reply.status == 400);
        assert(!reply.keepAlive);
        assert(reply.body["detail"] == "Malformed HTTP request");
    }

    /* Still serving afterwards.  */
    assert(exchange(port, "GET /api/get-task HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n").status == 200);
    assert(store.size() == 0);

    io.stop();
    runner.join();
    server.stop();
    return 0;
}
