/*
 * 설명: 스트림 키별 구독자(케이블 연결)를 관리하고 방송 메시지를 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_dispatcher_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "teamlink/observability.hpp"

namespace teamlink {

class StreamSubscriber {
 public:
  virtual ~StreamSubscriber() = default;
  // 허브 잠금 밖에서 호출된다. 구현체는 자기 실행기로 넘겨 처리해야 한다.
  virtual void Deliver(const std::string& stream_key, const nlohmann::json& payload) = 0;
};

class StreamHub {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  void Subscribe(const std::string& stream_key, const std::shared_ptr<StreamSubscriber>& subscriber);
  void Unsubscribe(const std::string& stream_key, const StreamSubscriber* subscriber);
  void UnsubscribeAll(const StreamSubscriber* subscriber);
  // 전달된 구독자 수를 돌려준다.
  std::size_t Broadcast(const std::string& stream_key, const nlohmann::json& payload);

  std::size_t SubscriberCount(const std::string& stream_key) const;
  std::size_t ActiveSubscriptions() const;

 private:
  struct Entry {
    std::weak_ptr<StreamSubscriber> subscriber;
    const StreamSubscriber* raw{nullptr};
  };

  void PublishCountLocked();

  std::unordered_map<std::string, std::vector<Entry>> streams_;
  std::size_t subscription_count_{0};
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace teamlink
