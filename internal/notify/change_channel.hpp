#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace stagesync::notify {

/*
  Publish/subscribe transport for status change notifications.

  Delivery is at-least-once and unordered; subscribers must tolerate
  duplicates and stale messages.
*/
class ChangeChannel {
 public:
  using Handler        = std::function<void(const std::string& topic, const std::string& payload)>;
  using SubscriptionId = std::uint64_t;

  virtual ~ChangeChannel() = default;

  virtual void           Publish(const std::string& topic, const std::string& payload) = 0;
  virtual SubscriptionId Subscribe(const std::string& topic, Handler handler)          = 0;
  virtual void           Unsubscribe(SubscriptionId id)                                = 0;
};

inline std::string StatusTopic(const std::string& event_id) {
  return "status." + event_id;
}

} // namespace stagesync::notify
