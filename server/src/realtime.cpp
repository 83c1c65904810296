/*
 * 설명: 스트림 구독 레지스트리와 방송 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_dispatcher_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#include "teamlink/realtime.hpp"

#include <algorithm>

namespace teamlink {

void StreamHub::Subscribe(const std::string& stream_key, const std::shared_ptr<StreamSubscriber>& subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entries = streams_[stream_key];
  auto found = std::find_if(entries.begin(), entries.end(),
                            [&](const Entry& entry) { return entry.raw == subscriber.get(); });
  if (found != entries.end()) {
    return;
  }
  entries.push_back(Entry{subscriber, subscriber.get()});
  ++subscription_count_;
  PublishCountLocked();
}

void StreamHub::Unsubscribe(const std::string& stream_key, const StreamSubscriber* subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream_key);
  if (it == streams_.end()) {
    return;
  }
  auto& entries = it->second;
  auto removed = std::remove_if(entries.begin(), entries.end(),
                                [&](const Entry& entry) { return entry.raw == subscriber; });
  subscription_count_ -= static_cast<std::size_t>(std::distance(removed, entries.end()));
  entries.erase(removed, entries.end());
  if (entries.empty()) {
    streams_.erase(it);
  }
  PublishCountLocked();
}

void StreamHub::UnsubscribeAll(const StreamSubscriber* subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = streams_.begin(); it != streams_.end();) {
    auto& entries = it->second;
    auto removed = std::remove_if(entries.begin(), entries.end(),
                                  [&](const Entry& entry) { return entry.raw == subscriber; });
    subscription_count_ -= static_cast<std::size_t>(std::distance(removed, entries.end()));
    entries.erase(removed, entries.end());
    if (entries.empty()) {
      it = streams_.erase(it);
    } else {
      ++it;
    }
  }
  PublishCountLocked();
}

std::size_t StreamHub::Broadcast(const std::string& stream_key, const nlohmann::json& payload) {
  std::vector<std::shared_ptr<StreamSubscriber>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream_key);
    if (it == streams_.end()) {
      return 0;
    }
    for (const auto& entry : it->second) {
      if (auto subscriber = entry.subscriber.lock()) {
        targets.push_back(std::move(subscriber));
      }
    }
  }
  for (const auto& subscriber : targets) {
    subscriber->Deliver(stream_key, payload);
  }
  return targets.size();
}

std::size_t StreamHub::SubscriberCount(const std::string& stream_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream_key);
  return it == streams_.end() ? 0 : it->second.size();
}

std::size_t StreamHub::ActiveSubscriptions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscription_count_;
}

void StreamHub::PublishCountLocked() {
  if (observability_) {
    observability_->SetSubscriptionsActive(subscription_count_);
  }
}

}  // namespace teamlink
