#include "payment_verifier.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <regex>
#include <stdexcept>

PaymentVerdict PaymentVerdict::verified(const std::string& jobId) {
    return {Outcome::Verified, jobId, ""};
}

PaymentVerdict PaymentVerdict::rejected(const std::string& reason) {
    return {Outcome::Rejected, "", reason};
}

PaymentVerdict PaymentVerdict::ignored(const std::string& reason, const std::string& jobId) {
    return {Outcome::Ignored, jobId, reason};
}

std::string toString(PaymentVerdict::Outcome outcome) {
    switch (outcome) {
        case PaymentVerdict::Outcome::Verified: return "verified";
        case PaymentVerdict::Outcome::Rejected: return "rejected";
        case PaymentVerdict::Outcome::Ignored:  return "ignored";
    }
    return "unknown";
}

PaymentVerifier::PaymentVerifier(std::unique_ptr<SignatureScheme> scheme, PaymentSettings settings, const JobStore& store)
    : scheme_(std::move(scheme)),
      settings_(std::move(settings)),
      store_(store) {
    auto expected = Utils::parseMinorUnits(settings_.expectedAmount);
    if (!expected) {
        throw std::invalid_argument("Invalid expected amount: " + settings_.expectedAmount);
    }
    expectedMinorUnits_ = *expected;
}

PaymentVerdict PaymentVerifier::verify(const NotificationFields& fields) const {
    auto signature = fields.find(settings_.signatureField);
    if (signature == fields.end() || Utils::trim(signature->second).empty()) {
        throw ValidationError("Notification has no " + settings_.signatureField + " field");
    }
    if (!fields.contains(settings_.amountField)) {
        throw ValidationError("Notification has no " + settings_.amountField + " field");
    }
    if (!fields.contains(settings_.jobField)) {
        throw ValidationError("Notification has no " + settings_.jobField + " field");
    }

    if (!scheme_->verify(fields, signature->second)) {
        Logger::formattedError("Payment signature mismatch ({}): computed {} received {}",
                               scheme_->name(), scheme_->sign(fields), signature->second);
        return PaymentVerdict::rejected("Signature mismatch");
    }

    auto partner = fields.find(settings_.partnerField);
    if (partner != fields.end() && partner->second != settings_.partnerId) {
        Logger::formattedError("Payment notification for foreign partner {}", partner->second);
        return PaymentVerdict::rejected("Partner mismatch");
    }

    auto jobId = extractJobReference(fields);

    auto status = fields.find(settings_.statusField);
    if (status != fields.end() && status->second != settings_.statusSuccessValue) {
        return PaymentVerdict::ignored("Trade status " + status->second, jobId.value_or(""));
    }

    auto paid = Utils::parseMinorUnits(fields.at(settings_.amountField));
    if (!paid || *paid != expectedMinorUnits_) {
        Logger::formattedWarn("Payment amount {} does not match expected {}",
                              fields.at(settings_.amountField), settings_.expectedAmount);
        return PaymentVerdict::ignored("Amount mismatch", jobId.value_or(""));
    }

    if (!settings_.currencyField.empty()) {
        auto currency = fields.find(settings_.currencyField);
        if (currency != fields.end() && Utils::toLower(currency->second) != Utils::toLower(settings_.currency)) {
            return PaymentVerdict::ignored("Currency " + currency->second, jobId.value_or(""));
        }
    }

    if (!jobId) {
        Logger::formattedWarn("Payment notification without a job reference in {}", settings_.jobField);
        return PaymentVerdict::ignored("No job reference");
    }

    auto job = store_.get(*jobId);
    if (!job) {
        Logger::formattedWarn("Payment notification for unknown job {}", *jobId);
        return PaymentVerdict::ignored("Unknown job", *jobId);
    }
    if (job->status != JobStatus::AwaitingPayment) {
        Logger::formattedInfo("Duplicate or late payment notification for job {} ({})", *jobId, toString(job->status));
        return PaymentVerdict::ignored("Job already " + toString(job->status), *jobId);
    }

    return PaymentVerdict::verified(*jobId);
}

std::optional<std::string> PaymentVerifier::extractJobReference(const NotificationFields& fields) const {
    auto it = fields.find(settings_.jobField);
    if (it == fields.end()) return std::nullopt;

    if (settings_.jobFieldMode == JobReferenceMode::OrderId) {
        std::string id = Utils::trim(it->second);
        if (id.empty()) return std::nullopt;
        return id;
    }

    // Payers type anything around the id, only the first UUID counts
    static const std::regex uuidPattern(
        "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}");
    std::smatch match;
    if (std::regex_search(it->second, match, uuidPattern)) {
        return Utils::toLower(match.str());
    }
    return std::nullopt;
}

std::string PaymentVerifier::buildPaymentUrl(const Job& job, const std::string& notifyUrl) const {
    NotificationFields params;
    params[settings_.partnerField] = settings_.partnerId;
    params[settings_.amountField] = settings_.expectedAmount;
    params["notify_url"] = notifyUrl;
    params["name"] = "Job " + job.id;
    if (!settings_.currencyField.empty()) {
        params[settings_.currencyField] = settings_.currency;
    }
    params[settings_.jobField] = settings_.jobFieldMode == JobReferenceMode::OrderId ? job.id : "Job " + job.id;
    params[settings_.signatureField] = scheme_->sign(params);
    if (settings_.unsignedFields.contains("sign_type")) {
        params["sign_type"] = scheme_->name().starts_with("md5") ? "MD5" : "SHA256";
    }

    std::string separator = settings_.gatewayUrl.find('?') == std::string::npos ? "?" : "&";
    return settings_.gatewayUrl + separator + Utils::buildQueryString(params);
}
