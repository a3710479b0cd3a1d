#pragma once

#include <map>
#include <mutex>

#include "internal/notify/change_channel.hpp"

namespace stagesync::notify {

/*
  In-process fan-out. Handlers run synchronously on the publisher's thread,
  outside the channel lock, so a handler may publish or unsubscribe.
*/
class LocalChangeChannel final : public ChangeChannel {
 public:
  void           Publish(const std::string& topic, const std::string& payload) override;
  SubscriptionId Subscribe(const std::string& topic, Handler handler) override;
  void           Unsubscribe(SubscriptionId id) override;

  std::size_t SubscriberCount() const;

 private:
  struct Subscription {
    std::string topic;
    Handler     handler;
  };

  mutable std::mutex                     mutex_;
  std::map<SubscriptionId, Subscription> subscriptions_;
  SubscriptionId                         next_id_ = 1;
};

} // namespace stagesync::notify
