// STAKEGUARD - Notifications Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/notify/notifier.h"
#include "stakeguard/core/json.h"
#include "stakeguard/util/logging.h"
#include "stakeguard/util/threadpool.h"

namespace stakeguard {
namespace notify {

// ============================================================================
// WebhookChannel Implementation
// ============================================================================

WebhookChannel::WebhookChannel(net::IHttpClient& http, std::string name, std::string url)
    : http_(http), name_(std::move(name)), url_(std::move(url)) {}

std::string WebhookChannel::BuildPayload(const std::string& message) {
    core::JSONValue payload;
    payload["content"] = message;
    return payload.ToJSON();
}

bool WebhookChannel::Send(const std::string& message, const node::SharedState& /*state*/) {
    net::HttpResponse response = http_.Post(url_, BuildPayload(message));
    if (!response.ok) {
        LOG_ERROR(util::LogCategory::NOTIFY) << name_ << " notification failed: "
                                             << response.error;
        return false;
    }
    if (!response.IsSuccess()) {
        LOG_ERROR(util::LogCategory::NOTIFY) << name_ << " notification rejected with HTTP "
                                             << response.statusCode;
        return false;
    }
    return true;
}

// ============================================================================
// NotificationService Implementation
// ============================================================================

NotificationService::NotificationService(util::ThreadPool& pool) : pool_(pool) {}

void NotificationService::AddChannel(std::unique_ptr<INotificationChannel> channel) {
    if (!channel) return;
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.push_back(std::shared_ptr<INotificationChannel>(std::move(channel)));
}

std::vector<std::string> NotificationService::ChannelNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(channels_.size());
    for (const auto& channel : channels_) {
        names.push_back(channel->Name());
    }
    return names;
}

bool NotificationService::HasChannels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !channels_.empty();
}

void NotificationService::Notify(const std::string& message, const node::SharedState& state) {
    std::string redacted = util::Logger::Instance().Redact(message);

    std::vector<std::shared_ptr<INotificationChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels = channels_;
    }

    for (const auto& channel : channels) {
        try {
            pool_.Execute([channel, redacted, state]() {
                if (channel->Send(redacted, state)) {
                    LOG_DEBUG(util::LogCategory::NOTIFY) << "Delivered notification via "
                                                         << channel->Name();
                }
            });
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::NOTIFY) << "Dropped " << channel->Name()
                                                << " notification: " << e.what();
        }
    }
}

void NotificationService::Flush() {
    pool_.Wait();
}

} // namespace notify
} // namespace stakeguard
