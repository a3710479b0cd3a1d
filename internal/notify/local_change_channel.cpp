#include "internal/notify/local_change_channel.hpp"

#include <vector>

#include "internal/observability/logging.hpp"

namespace stagesync::notify {

void LocalChangeChannel::Publish(const std::string& topic, const std::string& payload) {
  std::vector<Handler> handlers;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [_, sub] : subscriptions_) {
      if (sub.topic == topic) handlers.push_back(sub.handler);
    }
  }

  for (const auto& handler : handlers) {
    try {
      handler(topic, payload);
    } catch (const std::exception& e) {
      STAGESYNC_LOG_WARN("Change handler failed", {observability::StringField("topic", topic), observability::StringField("error", e.what())});
    }
  }
}

ChangeChannel::SubscriptionId LocalChangeChannel::Subscribe(const std::string& topic, Handler handler) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  subscriptions_.emplace(id, Subscription{topic, std::move(handler)});
  return id;
}

void LocalChangeChannel::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscriptions_.erase(id);
}

std::size_t LocalChangeChannel::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscriptions_.size();
}

} // namespace stagesync::notify
