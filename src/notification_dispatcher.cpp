#include "notification_dispatcher.hpp"
#include "logger.hpp"

#include <boost/asio/post.hpp>

NotificationDispatcher::NotificationDispatcher(MessageSink& sink, size_t threads)
    : sink_(sink),
      pool_(threads),
      inFlight_(0) {}

NotificationDispatcher::~NotificationDispatcher() {
    drain();
    pool_.join();
}

void NotificationDispatcher::notify(const std::string& originator,
                                    const std::optional<std::string>& locale,
                                    MessageId message,
                                    const MessageArgs& args) {
    std::string text = catalog_.render(message, locale, args);
    post(originator, [this, originator, text]() {
        sink_.sendText(originator, text);
    });
}

void NotificationDispatcher::notifyWithPhoto(const std::string& originator,
                                             const std::optional<std::string>& locale,
                                             const std::string& photoUrl,
                                             MessageId message,
                                             const MessageArgs& args) {
    std::string caption = catalog_.render(message, locale, args);
    post(originator, [this, originator, photoUrl, caption]() {
        sink_.sendPhoto(originator, photoUrl, caption);
    });
}

void NotificationDispatcher::post(const std::string& originator, std::function<void()> delivery) {
    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        ++inFlight_;
    }

    boost::asio::post(pool_, [this, originator, delivery = std::move(delivery)]() {
        try {
            delivery();
        } catch (const std::exception& e) {
            Logger::formattedError("Notification to chat {} failed: {}", originator, e.what());
        }

        std::lock_guard<std::mutex> lock(inFlightMutex_);
        if (--inFlight_ == 0) {
            idle_.notify_all();
        }
    });
}

void NotificationDispatcher::drain() {
    std::unique_lock<std::mutex> lock(inFlightMutex_);
    idle_.wait(lock, [this]() { return inFlight_ == 0; });
}
