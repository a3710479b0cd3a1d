#include "internal/notify/local_change_channel.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using stagesync::notify::LocalChangeChannel;

void TestDeliversOnlyToMatchingTopic() {
  LocalChangeChannel       channel;
  std::vector<std::string> fest, other;

  channel.Subscribe(stagesync::notify::StatusTopic("fest"), [&](const std::string&, const std::string& payload) { fest.push_back(payload); });
  channel.Subscribe(stagesync::notify::StatusTopic("other"), [&](const std::string&, const std::string& payload) { other.push_back(payload); });

  channel.Publish("status.fest", "one");
  channel.Publish("status.fest", "two");

  assert((fest == std::vector<std::string>{"one", "two"}));
  assert(other.empty());
}

void TestUnsubscribeStopsDelivery() {
  LocalChangeChannel channel;
  int                calls = 0;

  const auto id = channel.Subscribe("t", [&](const std::string&, const std::string&) { ++calls; });
  channel.Publish("t", "x");
  channel.Unsubscribe(id);
  channel.Publish("t", "x");

  assert(calls == 1);
  assert(channel.SubscriberCount() == 0);
}

void TestFailingHandlerDoesNotBlockOthers() {
  LocalChangeChannel channel;
  int                calls = 0;

  channel.Subscribe("t", [](const std::string&, const std::string&) { throw std::runtime_error("handler bug"); });
  channel.Subscribe("t", [&](const std::string&, const std::string&) { ++calls; });
  channel.Publish("t", "x");

  assert(calls == 1);
}

void TestHandlerMayUnsubscribeItself() {
  LocalChangeChannel                               channel;
  stagesync::notify::ChangeChannel::SubscriptionId id    = 0;
  int                                              calls = 0;

  id = channel.Subscribe("t", [&](const std::string&, const std::string&) {
    ++calls;
    channel.Unsubscribe(id);
  });
  channel.Publish("t", "x");
  channel.Publish("t", "x");

  assert(calls == 1);
}

} // namespace

int main() {
  TestDeliversOnlyToMatchingTopic();
  TestUnsubscribeStopsDelivery();
  TestFailingHandlerDoesNotBlockOthers();
  TestHandlerMayUnsubscribeItself();

  std::cout << "stagesync_unit_local_change_channel: pass\n";
  return 0;
}
