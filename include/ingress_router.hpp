#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "chat_update.hpp"
#include "config.hpp"
#include "job_store.hpp"
#include "notification_dispatcher.hpp"
#include "payment_verifier.hpp"

using Json = nlohmann::json;

enum class PaymentNotifyResult {
    Acknowledged,
    AuthenticationFailed
};

/**
 * @class IngressRouter
 * @brief Entry points for the chat webhook and the payment gateway webhook.
 *
 * The two handlers share nothing but the JobStore and the PaymentVerifier.
 * `payments` may be null when payment gating is disabled.
 */
class IngressRouter {
public:
    IngressRouter(const Config& config,
                  JobStore& store,
                  const PaymentVerifier* payments,
                  NotificationDispatcher& notifier);

    // Bad input is answered in the chat or logged, never thrown.
    void handleChatUpdate(const Json& update);

    // Commands suffixed "@other" are ignored once the name is known. Set before serving.
    void setBotUsername(const std::string& username);

    /**
     * @brief Admits a payment notification.
     * @throws ValidationError when required fields are missing.
     */
    PaymentNotifyResult handlePaymentNotify(const NotificationFields& fields);

    /**
     * @brief Creates a job for `command` and sends the acknowledgment.
     * @throws ValidationError for an empty prompt; nothing is created then.
     */
    std::string submitJob(const ChatCommand& command);

private:
    void reportStatus(const ChatCommand& command);
    void requestPayment(const Job& job);

    const Config& config_;
    JobStore& store_;
    const PaymentVerifier* payments_;
    NotificationDispatcher& notifier_;
    std::string botUsername_;
};
