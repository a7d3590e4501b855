#include "telegram_client.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <curl/curl.h>

TelegramClient::TelegramClient(const std::string& apiUrl, const std::string& botToken)
    : endpoint_(apiUrl + "/bot" + botToken + "/") {}

size_t TelegramClient::WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

Json TelegramClient::call(const std::string& method, const Json& payload) {
    std::string readBuffer;
    long httpCode = 0;

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransientDeliveryError("Failed to init CURL");
    }

    std::string url = endpoint_ + method;
    std::string body = payload.dump(-1, ' ', false, Json::error_handler_t::replace);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw TransientDeliveryError(method + ": " + curl_easy_strerror(res));
    }

    Json response;
    try {
        response = Json::parse(readBuffer);
    } catch (const Json::exception&) {
        throw TransientDeliveryError(method + ": HTTP " + std::to_string(httpCode) + ", unreadable body");
    }
    if (!response.is_object()) {
        throw TransientDeliveryError(method + ": HTTP " + std::to_string(httpCode) + ", unexpected body");
    }

    if (httpCode != 200 || !response.value("ok", false)) {
        throw TransientDeliveryError(method + ": HTTP " + std::to_string(httpCode) + " "
                                     + response.value("description", std::string("no description")));
    }
    return response.value("result", Json());
}

void TelegramClient::sendText(const std::string& originator, const std::string& text) {
    Json payload = {
        {"chat_id", originator},
        {"text", text},
        {"parse_mode", "Markdown"}
    };
    call("sendMessage", payload);
    Logger::formattedDebug("Message delivered to chat {}", originator);
}

void TelegramClient::sendPhoto(const std::string& originator, const std::string& photoUrl, const std::string& caption) {
    Json payload = {
        {"chat_id", originator},
        {"photo", photoUrl},
        {"caption", caption},
        {"parse_mode", "Markdown"}
    };
    call("sendPhoto", payload);
    Logger::formattedDebug("Photo delivered to chat {}", originator);
}

std::string TelegramClient::getMe() {
    Json me = call("getMe", Json::object());
    if (!me.is_object() || !me.contains("username") || !me["username"].is_string()) {
        throw TransientDeliveryError("getMe: no username in reply");
    }
    return me["username"].get<std::string>();
}

void TelegramClient::setWebhook(const std::string& url) {
    call("setWebhook", Json{{"url", url}});
}
