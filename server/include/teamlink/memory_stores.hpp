/*
 * 설명: 프로세스 로컬 사용자/조직/메시지 저장소. 기본 백엔드와 테스트에 쓰인다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_authorizer_test.cpp, server/tests/unit/message_dispatcher_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "teamlink/auth_types.hpp"
#include "teamlink/stores.hpp"

namespace teamlink {

class InMemoryUserStore : public UserStore {
 public:
  // 비밀번호가 비어 있으면 로그인 자격 증명을 만들지 않는다.
  void AddUser(const User& user, const std::string& password = "");
  void UpsertUser(const User& user);
  void RemoveUser(const std::string& id);

  std::optional<User> FindById(const std::string& id) override;
  std::optional<UserCredential> FindCredentialByEmail(const std::string& email) override;

 private:
  std::unordered_map<std::string, User> users_;
  std::unordered_map<std::string, UserCredential> credentials_by_email_;
  std::mutex mutex_;
};

class InMemoryOrganizationStore : public OrganizationStore {
 public:
  void AddOrganization(const Organization& organization);
  std::optional<Organization> FindById(const std::string& id) override;

 private:
  std::unordered_map<std::string, Organization> organizations_;
  std::mutex mutex_;
};

class InMemoryMessageStore : public MessageStore {
 public:
  explicit InMemoryMessageStore(EpochClock clock = SystemEpochSeconds);

  StoredMessage Create(const TenantScope& scope, const std::string& content, const std::string& sender_id,
                       const std::optional<std::string>& recipient_id, const std::string& organization_id) override;

  // 테스트에서 저장 실패를 흉내 낸다. true를 돌려주면 StoreError.
  void SetFailureInjector(const std::function<bool(const std::string& content)>& injector);
  std::vector<StoredMessage> Messages();

 private:
  EpochClock clock_;
  std::vector<StoredMessage> messages_;
  std::function<bool(const std::string&)> failure_injector_;
  std::uint64_t next_id_{1};
  std::mutex mutex_;
};

}  // namespace teamlink
