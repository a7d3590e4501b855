#include "ingress_router.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

IngressRouter::IngressRouter(const Config& config,
                             JobStore& store,
                             const PaymentVerifier* payments,
                             NotificationDispatcher& notifier)
    : config_(config),
      store_(store),
      payments_(payments),
      notifier_(notifier),
      botUsername_(config.botUsername) {}

void IngressRouter::setBotUsername(const std::string& username) {
    botUsername_ = Utils::toLower(username);
}

void IngressRouter::handleChatUpdate(const Json& update) {
    auto command = parseChatCommand(update);
    if (!command) {
        Logger::debug("Chat update without a command ignored");
        return;
    }
    if (command->addressee && !botUsername_.empty() && *command->addressee != botUsername_) {
        Logger::formattedDebug("Command /{}@{} is for another bot", command->verb, *command->addressee);
        return;
    }

    MessageArgs args = {{"command", config_.jobCommand}};

    if (command->verb == "start") {
        notifier_.notify(command->originator, command->locale, MessageId::Welcome, args);
    } else if (command->verb == "help") {
        notifier_.notify(command->originator, command->locale, MessageId::Help, args);
    } else if (command->verb == config_.jobCommand) {
        try {
            submitJob(*command);
        } catch (const ValidationError& e) {
            Logger::formattedInfo("Rejected job request from chat {}: {}", command->originator, e.what());
            notifier_.notify(command->originator, command->locale, MessageId::EmptyPrompt, args);
        }
    } else if (command->verb == "status") {
        reportStatus(*command);
    } else {
        Logger::formattedDebug("Unknown command /{} from chat {}", command->verb, command->originator);
    }
}

std::string IngressRouter::submitJob(const ChatCommand& command) {
    if (command.argument.empty()) {
        throw ValidationError("Empty prompt");
    }

    JobStatus initial = payments_ ? JobStatus::AwaitingPayment : JobStatus::Pending;
    std::string id = store_.create(command.argument, command.originator, command.locale, initial);

    if (payments_) {
        auto job = store_.get(id);
        if (job) requestPayment(*job);
    } else {
        notifier_.notify(command.originator, command.locale, MessageId::JobQueued, {{"job_id", id}});
    }
    return id;
}

void IngressRouter::requestPayment(const Job& job) {
    const PaymentSettings& settings = payments_->settings();
    MessageArgs args = {
        {"job_id", job.id},
        {"amount", settings.expectedAmount},
        {"currency", settings.currency}
    };

    if (settings.qrSource == QrSource::Static) {
        notifier_.notifyWithPhoto(job.originator, job.locale, settings.qrStaticUrl, MessageId::PaymentRequired, args);
    } else {
        std::string notifyUrl = config_.publicServerUrl + "/api/payment-notify";
        args["payment_url"] = payments_->buildPaymentUrl(job, notifyUrl);
        notifier_.notify(job.originator, job.locale, MessageId::PaymentLink, args);
    }
}

void IngressRouter::reportStatus(const ChatCommand& command) {
    MessageArgs args = {{"job_id", command.argument}};

    auto job = store_.get(command.argument);
    // Other chats' jobs are reported as missing
    if (!job || job->originator != command.originator) {
        notifier_.notify(command.originator, command.locale, MessageId::JobNotFound, args);
        return;
    }
    args["status"] = toString(job->status);
    notifier_.notify(command.originator, command.locale, MessageId::JobStatusReport, args);
}

PaymentNotifyResult IngressRouter::handlePaymentNotify(const NotificationFields& fields) {
    if (!payments_) {
        Logger::warn("Payment notification received while payment gating is disabled, ignored");
        return PaymentNotifyResult::Acknowledged;
    }

    PaymentVerdict verdict = payments_->verify(fields);
    Logger::formattedInfo("Payment notification {}: {} {}",
                          toString(verdict.outcome), verdict.jobId, verdict.reason);

    switch (verdict.outcome) {
        case PaymentVerdict::Outcome::Rejected:
            return PaymentNotifyResult::AuthenticationFailed;

        case PaymentVerdict::Outcome::Ignored:
            return PaymentNotifyResult::Acknowledged;

        case PaymentVerdict::Outcome::Verified:
            break;
    }

    TransitionResult result = store_.transition(verdict.jobId, JobStatus::Pending);
    if (!result.applied()) {
        // A concurrent duplicate got there first
        Logger::formattedInfo("Payment for job {} already applied: {}", verdict.jobId, result.errorReason);
        return PaymentNotifyResult::Acknowledged;
    }

    const Job& job = *result.job;
    notifier_.notify(job.originator, job.locale, MessageId::PaymentConfirmed, {{"job_id", job.id}});
    return PaymentNotifyResult::Acknowledged;
}
