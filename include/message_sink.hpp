#pragma once

#include <string>

/**
 * @brief Outbound side of the chat platform.
 *
 * Implementations throw TransientDeliveryError when a message could not be
 * delivered; NotificationDispatcher logs and drops it.
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;

    virtual void sendText(const std::string& originator, const std::string& text) = 0;
    virtual void sendPhoto(const std::string& originator, const std::string& photoUrl, const std::string& caption) = 0;
};
