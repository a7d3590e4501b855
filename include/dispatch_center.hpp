#pragma once

#include <string>
#include <memory>
#include <boost/asio.hpp>

#include "api_handler.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "ingress_router.hpp"
#include "job_store.hpp"
#include "notification_dispatcher.hpp"
#include "payment_verifier.hpp"
#include "telegram_client.hpp"
#include "worker_queue.hpp"

class DispatchCenter {
public:
    DispatchCenter(boost::asio::io_context& io, const Config& cfg);

    // Registers the webhook, starts accepting and arms the reclaim timer.
    void run();

    // Call once the io_context threads have returned.
    void stop();

private:
    void resolveBotUsername();
    void registerWebhook();
    void startReclaimTimer();

    static std::unique_ptr<PaymentVerifier> makePaymentVerifier(const Config& cfg, const JobStore& store);

    boost::asio::io_context& io_context_;
    const Config& config_;
    TelegramClient telegram_;
    JobStore store_;
    NotificationDispatcher notifier_;
    std::unique_ptr<PaymentVerifier> payments_;
    IngressRouter router_;
    WorkerQueue queue_;
    ApiHandler api_;
    HttpServer http_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
};
