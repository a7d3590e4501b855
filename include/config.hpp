#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "logger.hpp"

using Json = nlohmann::json;

enum class JobReferenceMode {
    OrderId,       // the field holds the job id verbatim
    Description    // free text typed by the payer; the job id is searched inside it
};

enum class QrSource {
    Static,        // fixed image URL
    Dynamic        // per-job signed gateway link
};

struct PaymentSettings {
    std::string partnerId;
    std::string secret;
    std::string expectedAmount;   // decimal string, e.g. "9.90"
    std::string currency;

    std::string signScheme;
    std::vector<std::string> signedFields;
    std::set<std::string> unsignedFields;
    std::string signatureField;

    std::string jobField;
    JobReferenceMode jobFieldMode = JobReferenceMode::OrderId;
    std::string amountField;
    std::string currencyField;    // empty: currency is not checked
    std::string partnerField;
    std::string statusField;
    std::string statusSuccessValue;

    QrSource qrSource = QrSource::Static;
    std::string qrStaticUrl;
    std::string gatewayUrl;
};

struct Config {
    // Chat platform
    std::string botToken;
    std::string publicServerUrl;
    std::string webhookSecret;
    std::string telegramApiUrl;
    std::string jobCommand;       // lower-case, without '/'
    std::string botUsername;      // lower-case, without '@'; empty until known

    // Network Settings
    std::string bindAddress;
    uint16_t port;
    int httpThreads;
    int notifyThreads;
    std::string serviceName;

    // 0 disables reclamation of stuck RUNNING jobs
    int runningTimeoutSeconds;
    LogLevel logLevel;

    bool paymentEnabled;
    PaymentSettings payment;

    /**
     * @brief Loads the configuration for the running process.
     *
     * Values come from the optional JSON file (lower-case keys, e.g.
     * "bot_token"), then environment variables (upper-case keys, e.g.
     * BOT_TOKEN) override them.
     *
     * @throws ConfigError when a required key is missing or a value is invalid.
     */
    static Config load(const std::string& filename = "config.json");

    // Builds from upper-case keys only; throws ConfigError like load().
    static Config fromValues(const std::map<std::string, std::string>& values);
};
