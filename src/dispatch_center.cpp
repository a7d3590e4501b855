#include "dispatch_center.hpp"
#include "logger.hpp"

#include <algorithm>

DispatchCenter::DispatchCenter(boost::asio::io_context& io, const Config& cfg)
    : io_context_(io),
      config_(cfg),
      telegram_(cfg.telegramApiUrl, cfg.botToken),
      notifier_(telegram_, static_cast<size_t>(cfg.notifyThreads)),
      payments_(makePaymentVerifier(cfg, store_)),
      router_(cfg, store_, payments_.get(), notifier_),
      queue_(store_, notifier_),
      api_(cfg, router_, queue_, store_),
      http_(io, cfg.bindAddress, cfg.port, api_) {}

std::unique_ptr<PaymentVerifier> DispatchCenter::makePaymentVerifier(const Config& cfg, const JobStore& store) {
    if (!cfg.paymentEnabled) return nullptr;

    const PaymentSettings& p = cfg.payment;
    auto scheme = makeSignatureScheme(p.signScheme, p.secret, p.signatureField, p.unsignedFields, p.signedFields);
    Logger::formattedInfo("Payment gating enabled: {} {} via {}", p.expectedAmount, p.currency, scheme->name());
    return std::make_unique<PaymentVerifier>(std::move(scheme), p, store);
}

void DispatchCenter::run() {
    resolveBotUsername();
    registerWebhook();
    http_.startAccept();
    Logger::formattedInfo("{} listening on {}:{}", config_.serviceName, config_.bindAddress, http_.port());

    if (config_.runningTimeoutSeconds > 0) {
        Logger::formattedInfo("RUNNING jobs older than {}s will be failed", config_.runningTimeoutSeconds);
        startReclaimTimer();
    } else {
        Logger::warn("RUNNING_TIMEOUT_SECONDS not set: jobs of crashed workers stay RUNNING forever");
    }
}

void DispatchCenter::stop() {
    http_.stop();
    if (timer_) timer_->cancel();
    notifier_.drain();
}

void DispatchCenter::resolveBotUsername() {
    if (!config_.botUsername.empty()) return;
    try {
        std::string username = telegram_.getMe();
        router_.setBotUsername(username);
        Logger::info("Serving commands for @" + username);
    } catch (const std::exception& e) {
        Logger::formattedWarn("Bot username unknown ({}), commands for other bots are not filtered", e.what());
    }
}

void DispatchCenter::registerWebhook() {
    if (config_.publicServerUrl.empty()) {
        Logger::warn("PUBLIC_SERVER_URL is not set, the webhook is not registered");
        return;
    }

    std::string url = config_.publicServerUrl + "/" + config_.webhookSecret;
    Logger::info("Registering chat webhook at " + config_.publicServerUrl + "/<secret>");
    try {
        telegram_.setWebhook(url);
        Logger::info("Webhook registered");
    } catch (const std::exception& e) {
        // Keep serving so the worker API can still be used
        Logger::formattedError("Webhook registration failed: {}", e.what());
    }
}

void DispatchCenter::startReclaimTimer() {
    // Checks at a tenth of the timeout, at least every second
    auto period = std::max(std::chrono::seconds(1), std::chrono::seconds(config_.runningTimeoutSeconds / 10));
    timer_ = std::make_unique<boost::asio::steady_timer>(io_context_, period);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            size_t reclaimed = queue_.reclaimStale(std::chrono::seconds(config_.runningTimeoutSeconds));
            if (reclaimed > 0) {
                Logger::formattedWarn("Failed {} stuck job(s)", reclaimed);
            }
            startReclaimTimer();
        }
    });
}
