#pragma once

#include <map>
#include <optional>
#include <string>

enum class MessageId {
    Welcome,
    Help,
    EmptyPrompt,
    JobQueued,
    PaymentRequired,
    PaymentLink,
    PaymentConfirmed,
    JobCompleted,
    JobCompletedNoArtifact,
    JobFailed,
    JobTimedOut,
    JobStatusReport,
    JobNotFound
};

using MessageArgs = std::map<std::string, std::string>;

// Localized chat texts with {placeholder} substitution.
class MessageCatalog {
public:
    MessageCatalog();

    std::string render(MessageId id, const std::optional<std::string>& locale, const MessageArgs& args = {}) const;

    // "zh-hans" -> "zh", "en-US" -> "en"; unknown or missing -> "en"
    std::string resolveLocale(const std::optional<std::string>& tag) const;

private:
    std::map<std::string, std::map<MessageId, std::string>> templates_;
};
