#include <boost/asio.hpp>
#include <curl/curl.h>

#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "dispatch_center.hpp"
#include "errors.hpp"
#include "logger.hpp"

int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";

    Config config;
    try {
        config = Config::load(configPath);
    } catch (const ConfigError& e) {
        Logger::error(std::string("Configuration error: ") + e.what());
        return 1;
    }
    Logger::setLevel(config.logLevel);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        Logger::error("curl_global_init failed");
        return 1;
    }

    int exitCode = 0;
    try {
        boost::asio::io_context io;
        DispatchCenter center(io, config);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const boost::system::error_code& ec, int signal) {
            if (!ec) {
                Logger::formattedInfo("Signal {} received, shutting down", signal);
                io.stop();
            }
        });

        center.run();

        std::vector<std::thread> threads;
        for (int i = 1; i < config.httpThreads; ++i) {
            threads.emplace_back([&io]() { io.run(); });
        }
        io.run();
        for (auto& t : threads) {
            t.join();
        }

        center.stop();
        Logger::info("Dispatch center stopped");
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
        exitCode = 1;
    }

    curl_global_cleanup();
    return exitCode;
}
