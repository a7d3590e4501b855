#pragma once

#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "message_catalog.hpp"
#include "message_sink.hpp"

/**
 * @class NotificationDispatcher
 * @brief Best-effort, fire-and-forget delivery of chat messages.
 *
 * Messages are rendered in the caller's thread and delivered on a small
 * thread pool, so no caller ever waits on the network (and never while
 * holding the JobStore lock). Delivery failures are logged and dropped;
 * nothing is retried and no job state is rolled back.
 */
class NotificationDispatcher {
public:
    NotificationDispatcher(MessageSink& sink, size_t threads);
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void notify(const std::string& originator,
                const std::optional<std::string>& locale,
                MessageId message,
                const MessageArgs& args = {});

    // Same as notify() but the text becomes the caption of `photoUrl`.
    void notifyWithPhoto(const std::string& originator,
                         const std::optional<std::string>& locale,
                         const std::string& photoUrl,
                         MessageId message,
                         const MessageArgs& args = {});

    // Blocks until every delivery queued so far has finished or failed.
    void drain();

    const MessageCatalog& catalog() const { return catalog_; }

private:
    void post(const std::string& originator, std::function<void()> delivery);

    MessageSink& sink_;
    MessageCatalog catalog_;
    boost::asio::thread_pool pool_;

    std::mutex inFlightMutex_;
    std::condition_variable idle_;
    size_t inFlight_;
};
