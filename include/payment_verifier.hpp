#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config.hpp"
#include "job.hpp"
#include "job_store.hpp"
#include "signature_scheme.hpp"

struct PaymentVerdict {
    enum class Outcome {
        Verified,   // authentic, right amount, job is awaiting payment
        Rejected,   // not authentic; the gateway gets an error
        Ignored     // authentic but no state change; acknowledged to stop retries
    };

    Outcome outcome;
    std::string jobId;    // set when the reference could be extracted
    std::string reason;

    static PaymentVerdict verified(const std::string& jobId);
    static PaymentVerdict rejected(const std::string& reason);
    static PaymentVerdict ignored(const std::string& reason, const std::string& jobId = "");
};

std::string toString(PaymentVerdict::Outcome outcome);

/**
 * @class PaymentVerifier
 * @brief Admits payment gateway notifications.
 *
 * Checks, in order: required fields present (ValidationError otherwise),
 * signature, partner code, trade status, amount and currency, job reference,
 * and finally that the referenced job is still awaiting payment. The verifier
 * reads the store but never mutates it.
 */
class PaymentVerifier {
public:
    PaymentVerifier(std::unique_ptr<SignatureScheme> scheme, PaymentSettings settings, const JobStore& store);

    PaymentVerdict verify(const NotificationFields& fields) const;

    // Signed gateway link used as the dynamic QR payload for `job`.
    std::string buildPaymentUrl(const Job& job, const std::string& notifyUrl) const;

    const PaymentSettings& settings() const { return settings_; }

private:
    std::optional<std::string> extractJobReference(const NotificationFields& fields) const;

    std::unique_ptr<SignatureScheme> scheme_;
    PaymentSettings settings_;
    int64_t expectedMinorUnits_;
    const JobStore& store_;
};
