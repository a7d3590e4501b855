#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>

namespace {

const std::vector<std::string> kKnownKeys = {
    "BOT_TOKEN", "BOT_USERNAME", "PUBLIC_SERVER_URL", "WEBHOOK_SECRET", "TELEGRAM_API_URL", "JOB_COMMAND",
    "BIND_ADDRESS", "PORT", "HTTP_THREADS", "NOTIFY_THREADS", "SERVICE_NAME",
    "RUNNING_TIMEOUT_SECONDS", "LOG_LEVEL",
    "PAYMENT_ENABLED", "PAY_PARTNER_ID", "PAY_SECRET", "PRICE_AMOUNT", "PRICE_CURRENCY",
    "PAY_SIGN_SCHEME", "PAY_SIGNED_FIELDS", "PAY_UNSIGNED_FIELDS", "PAY_SIGNATURE_FIELD",
    "PAY_JOB_FIELD", "PAY_JOB_FIELD_MODE", "PAY_AMOUNT_FIELD", "PAY_CURRENCY_FIELD",
    "PAY_PARTNER_FIELD", "PAY_STATUS_FIELD", "PAY_STATUS_SUCCESS",
    "QR_SOURCE", "QR_STATIC_URL", "PAY_GATEWAY_URL",
};

class ValueReader {
public:
    explicit ValueReader(const std::map<std::string, std::string>& values) : values_(values) {}

    std::optional<std::string> find(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end() || Utils::trim(it->second).empty()) return std::nullopt;
        return Utils::trim(it->second);
    }

    std::string required(const std::string& key) const {
        auto value = find(key);
        if (!value) throw ConfigError("Missing required configuration key " + key);
        return *value;
    }

    std::string get(const std::string& key, const std::string& fallback) const {
        return find(key).value_or(fallback);
    }

    long number(const std::string& key, long fallback, long min, long max) const {
        auto value = find(key);
        if (!value) return fallback;
        long parsed = 0;
        try {
            size_t used = 0;
            parsed = std::stol(*value, &used);
            if (used != value->size()) throw std::invalid_argument(*value);
        } catch (const std::exception&) {
            throw ConfigError(key + " is not a number: " + *value);
        }
        if (parsed < min || parsed > max) {
            throw ConfigError(key + " out of range: " + *value);
        }
        return parsed;
    }

    bool flag(const std::string& key, bool fallback) const {
        auto value = find(key);
        if (!value) return fallback;
        std::string v = Utils::toLower(*value);
        if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
        if (v == "0" || v == "false" || v == "no" || v == "off") return false;
        throw ConfigError(key + " is not a boolean: " + *value);
    }

    std::vector<std::string> list(const std::string& key, const std::string& fallback) const {
        std::vector<std::string> items;
        for (const auto& item : Utils::split(get(key, fallback), ',')) {
            std::string trimmed = Utils::trim(item);
            if (!trimmed.empty()) items.push_back(trimmed);
        }
        return items;
    }

private:
    const std::map<std::string, std::string>& values_;
};

PaymentSettings loadPayment(const ValueReader& r) {
    PaymentSettings p;
    p.partnerId = r.required("PAY_PARTNER_ID");
    p.secret = r.required("PAY_SECRET");
    p.expectedAmount = r.required("PRICE_AMOUNT");
    if (!Utils::parseMinorUnits(p.expectedAmount)) {
        throw ConfigError("PRICE_AMOUNT is not a valid amount: " + p.expectedAmount);
    }
    p.currency = r.get("PRICE_CURRENCY", "CNY");

    p.signScheme = r.get("PAY_SIGN_SCHEME", "md5-sorted");
    if (p.signScheme != "md5-sorted" && p.signScheme != "sha256-sorted" && p.signScheme != "sha256-fixed") {
        throw ConfigError("Unknown PAY_SIGN_SCHEME: " + p.signScheme);
    }
    p.signedFields = r.list("PAY_SIGNED_FIELDS", "");
    if (p.signScheme == "sha256-fixed" && p.signedFields.empty()) {
        throw ConfigError("PAY_SIGNED_FIELDS is required for sha256-fixed");
    }
    for (const auto& field : r.list("PAY_UNSIGNED_FIELDS", "sign_type")) {
        p.unsignedFields.insert(field);
    }
    p.signatureField = r.get("PAY_SIGNATURE_FIELD", "sign");

    p.jobField = r.get("PAY_JOB_FIELD", "out_trade_no");
    std::string mode = r.get("PAY_JOB_FIELD_MODE", "order-id");
    if (mode == "order-id") {
        p.jobFieldMode = JobReferenceMode::OrderId;
    } else if (mode == "description") {
        p.jobFieldMode = JobReferenceMode::Description;
    } else {
        throw ConfigError("Unknown PAY_JOB_FIELD_MODE: " + mode);
    }
    p.amountField = r.get("PAY_AMOUNT_FIELD", "money");
    p.currencyField = r.get("PAY_CURRENCY_FIELD", "");
    p.partnerField = r.get("PAY_PARTNER_FIELD", "pid");
    p.statusField = r.get("PAY_STATUS_FIELD", "trade_status");
    p.statusSuccessValue = r.get("PAY_STATUS_SUCCESS", "TRADE_SUCCESS");

    std::string qr = r.get("QR_SOURCE", "static");
    if (qr == "static") {
        p.qrSource = QrSource::Static;
        p.qrStaticUrl = r.required("QR_STATIC_URL");
    } else if (qr == "dynamic") {
        p.qrSource = QrSource::Dynamic;
        p.gatewayUrl = r.required("PAY_GATEWAY_URL");
    } else {
        throw ConfigError("Unknown QR_SOURCE: " + qr);
    }
    return p;
}

}

Config Config::fromValues(const std::map<std::string, std::string>& values) {
    ValueReader r(values);
    Config cfg;

    cfg.botToken = r.required("BOT_TOKEN");
    cfg.publicServerUrl = r.get("PUBLIC_SERVER_URL", "");
    while (!cfg.publicServerUrl.empty() && cfg.publicServerUrl.back() == '/') {
        cfg.publicServerUrl.pop_back();
    }
    cfg.webhookSecret = r.get("WEBHOOK_SECRET", cfg.botToken);
    cfg.telegramApiUrl = r.get("TELEGRAM_API_URL", "https://api.telegram.org");
    // Chat verbs are matched lower-case and without the slash
    cfg.jobCommand = Utils::toLower(r.get("JOB_COMMAND", "vtuber"));
    if (!cfg.jobCommand.empty() && cfg.jobCommand.front() == '/') cfg.jobCommand.erase(0, 1);
    if (cfg.jobCommand.empty() || cfg.jobCommand.find_first_of(" \t@") != std::string::npos) {
        throw ConfigError("JOB_COMMAND is not a valid command name: " + r.get("JOB_COMMAND", ""));
    }
    cfg.botUsername = Utils::toLower(r.get("BOT_USERNAME", ""));
    if (!cfg.botUsername.empty() && cfg.botUsername.front() == '@') cfg.botUsername.erase(0, 1);

    cfg.bindAddress = r.get("BIND_ADDRESS", "0.0.0.0");
    cfg.port = static_cast<uint16_t>(r.number("PORT", 8000, 1, 65535));
    cfg.httpThreads = static_cast<int>(r.number("HTTP_THREADS", 4, 1, 256));
    cfg.notifyThreads = static_cast<int>(r.number("NOTIFY_THREADS", 2, 1, 64));
    cfg.serviceName = r.get("SERVICE_NAME", "Telebot Dispatch Center");

    cfg.runningTimeoutSeconds = static_cast<int>(r.number("RUNNING_TIMEOUT_SECONDS", 0, 0, 30L * 24 * 3600));

    std::string level = r.get("LOG_LEVEL", "info");
    if (!Logger::parseLevel(Utils::toLower(level), cfg.logLevel)) {
        throw ConfigError("Unknown LOG_LEVEL: " + level);
    }

    cfg.paymentEnabled = r.flag("PAYMENT_ENABLED", false);
    if (cfg.paymentEnabled) {
        cfg.payment = loadPayment(r);
        // The gateway calls back on an absolute URL signed into the link
        if (cfg.payment.qrSource == QrSource::Dynamic && cfg.publicServerUrl.empty()) {
            throw ConfigError("PUBLIC_SERVER_URL is required for QR_SOURCE=dynamic");
        }
    }
    return cfg;
}

Config Config::load(const std::string& filename) {
    std::map<std::string, std::string> values;

    std::ifstream file(filename);
    if (file.is_open()) {
        Json j;
        try {
            file >> j;
        } catch (const Json::exception& e) {
            throw ConfigError("Could not parse " + filename + ": " + e.what());
        }
        for (const auto& key : kKnownKeys) {
            std::string jsonKey = Utils::toLower(key);
            if (!j.contains(jsonKey)) continue;
            const auto& v = j[jsonKey];
            values[key] = v.is_string() ? v.get<std::string>() : v.dump();
        }
        Logger::info("Configuration file loaded: " + filename);
    }

    for (const auto& key : kKnownKeys) {
        if (const char* env = std::getenv(key.c_str())) {
            values[key] = env;
        }
    }
    return fromValues(values);
}
