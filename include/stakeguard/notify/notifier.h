// STAKEGUARD - Notifications
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Operator notifications. Callers hand a message and the current state to
// an INotifier and continue; delivery happens on notification workers and
// a failed delivery is logged, never reported back to the caller.

#ifndef STAKEGUARD_NOTIFY_NOTIFIER_H
#define STAKEGUARD_NOTIFY_NOTIFIER_H

#include "stakeguard/net/http_client.h"
#include "stakeguard/node/state.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stakeguard {

namespace util {
class ThreadPool;
}

namespace notify {

// ============================================================================
// Interfaces
// ============================================================================

class INotifier {
public:
    virtual ~INotifier() = default;

    /// Fire-and-forget delivery of `message`
    virtual void Notify(const std::string& message, const node::SharedState& state) = 0;
};

/// One delivery target (webhook, chat service, ...)
class INotificationChannel {
public:
    virtual ~INotificationChannel() = default;

    virtual std::string Name() const = 0;

    /// Deliver synchronously; false on failure
    virtual bool Send(const std::string& message, const node::SharedState& state) = 0;
};

// ============================================================================
// Webhook Channel
// ============================================================================

/**
 * POSTs {"content": "<message>"} to a URL. The payload shape is accepted
 * by Discord webhooks as well as generic JSON receivers.
 */
class WebhookChannel : public INotificationChannel {
public:
    WebhookChannel(net::IHttpClient& http, std::string name, std::string url);

    std::string Name() const override { return name_; }
    bool Send(const std::string& message, const node::SharedState& state) override;

    static std::string BuildPayload(const std::string& message);

private:
    net::IHttpClient& http_;
    std::string name_;
    std::string url_;
};

// ============================================================================
// Notification Service
// ============================================================================

class NotificationService : public INotifier {
public:
    /**
     * @param pool Workers that perform delivery; must outlive the service
     */
    explicit NotificationService(util::ThreadPool& pool);

    void AddChannel(std::unique_ptr<INotificationChannel> channel);

    /// Names of configured channels in registration order
    std::vector<std::string> ChannelNames() const;

    bool HasChannels() const;

    /**
     * Redact registered secrets, then queue delivery to every channel.
     * Returns immediately.
     */
    void Notify(const std::string& message, const node::SharedState& state) override;

    /// Block until queued deliveries have finished
    void Flush();

private:
    util::ThreadPool& pool_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<INotificationChannel>> channels_;
};

} // namespace notify
} // namespace stakeguard

#endif // STAKEGUARD_NOTIFY_NOTIFIER_H
