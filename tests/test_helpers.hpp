#pragma once

#include "errors.hpp"
#include "message_sink.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct SentMessage {
    std::string originator;
    std::string text;
    std::string photoUrl;
};

// Records deliveries instead of calling the chat platform.
class RecordingSink : public MessageSink {
public:
    void sendText(const std::string& originator, const std::string& text) override {
        if (failing_) throw TransientDeliveryError("chat platform unreachable");
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back({originator, text, ""});
    }

    void sendPhoto(const std::string& originator, const std::string& photoUrl, const std::string& caption) override {
        if (failing_) throw TransientDeliveryError("chat platform unreachable");
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back({originator, caption, photoUrl});
    }

    std::vector<SentMessage> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

    void setFailing(bool failing) { failing_ = failing; }

private:
    mutable std::mutex mutex_;
    std::vector<SentMessage> sent_;
    std::atomic<bool> failing_{false};
};

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

inline std::map<std::string, std::string> baseConfigValues() {
    return {
        {"BOT_TOKEN", "123456:test-token"},
        {"PUBLIC_SERVER_URL", "https://dispatch.example.com"},
    };
}

inline std::map<std::string, std::string> paymentConfigValues() {
    auto values = baseConfigValues();
    values["PAYMENT_ENABLED"] = "true";
    values["PAY_PARTNER_ID"] = "1001";
    values["PAY_SECRET"] = "s3cr3t";
    values["PRICE_AMOUNT"] = "9.90";
    values["PRICE_CURRENCY"] = "CNY";
    values["QR_SOURCE"] = "static";
    values["QR_STATIC_URL"] = "https://dispatch.example.com/qr.png";
    return values;
}
