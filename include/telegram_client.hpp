#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "message_sink.hpp"

using Json = nlohmann::json;

/**
 * @class TelegramClient
 * @brief Bot API client over libcurl.
 *
 * Each call is a blocking HTTPS POST with a JSON body. Safe to use from
 * several threads at once, every call owns its own CURL handle.
 */
class TelegramClient : public MessageSink {
public:
    TelegramClient(const std::string& apiUrl, const std::string& botToken);
    ~TelegramClient() override = default;

    void sendText(const std::string& originator, const std::string& text) override;
    void sendPhoto(const std::string& originator, const std::string& photoUrl, const std::string& caption) override;

    /**
     * @brief Points the bot's webhook at `url`.
     * @throws TransientDeliveryError when the API call fails.
     */
    void setWebhook(const std::string& url);

    // The bot's own username, without '@'. Throws TransientDeliveryError.
    std::string getMe();

private:
    // Calls `method` and returns the "result" member. Throws TransientDeliveryError.
    Json call(const std::string& method, const Json& payload);

    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::string endpoint_;   // <apiUrl>/bot<token>/
};
