/*
 * 설명: 인메모리 사용자/조직/메시지 저장소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_authorizer_test.cpp, server/tests/unit/message_dispatcher_test.cpp
 */
#include "teamlink/memory_stores.hpp"

#include <utility>

#include "teamlink/credentials.hpp"

namespace teamlink {

void InMemoryUserStore::AddUser(const User& user, const std::string& password) {
  UserCredential credential;
  if (!password.empty()) {
    credential.user_id = user.id;
    credential.salt_hex = PasswordHasher::GenerateSalt();
    credential.hash_hex = PasswordHasher::Hash(password, credential.salt_hex);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  users_[user.id] = user;
  if (!password.empty()) {
    credentials_by_email_[NormalizeEmail(user.email)] = std::move(credential);
  }
}

void InMemoryUserStore::UpsertUser(const User& user) {
  std::lock_guard<std::mutex> lock(mutex_);
  users_[user.id] = user;
}

void InMemoryUserStore::RemoveUser(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = users_.find(id);
  if (it == users_.end()) {
    return;
  }
  credentials_by_email_.erase(NormalizeEmail(it->second.email));
  users_.erase(it);
}

std::optional<User> InMemoryUserStore::FindById(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = users_.find(id);
  if (it == users_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<UserCredential> InMemoryUserStore::FindCredentialByEmail(const std::string& email) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = credentials_by_email_.find(NormalizeEmail(email));
  if (it == credentials_by_email_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryOrganizationStore::AddOrganization(const Organization& organization) {
  std::lock_guard<std::mutex> lock(mutex_);
  organizations_[organization.id] = organization;
}

std::optional<Organization> InMemoryOrganizationStore::FindById(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = organizations_.find(id);
  if (it == organizations_.end()) {
    return std::nullopt;
  }
  return it->second;
}

InMemoryMessageStore::InMemoryMessageStore(EpochClock clock) : clock_(std::move(clock)) {}

StoredMessage InMemoryMessageStore::Create(const TenantScope& scope, const std::string& content,
                                           const std::string& sender_id,
                                           const std::optional<std::string>& recipient_id,
                                           const std::string& organization_id) {
  if (!scope.Allows(organization_id)) {
    throw StoreError("테넌트 범위 밖의 조직에는 메시지를 쓸 수 없습니다");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (failure_injector_ && failure_injector_(content)) {
    throw StoreError("주입된 저장 실패");
  }
  StoredMessage message;
  message.id = std::to_string(next_id_++);
  message.content = content;
  message.sender_id = sender_id;
  message.recipient_id = recipient_id;
  message.organization_id = organization_id;
  message.created_at = clock_();
  messages_.push_back(message);
  return message;
}

void InMemoryMessageStore::SetFailureInjector(const std::function<bool(const std::string& content)>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_injector_ = injector;
}

std::vector<StoredMessage> InMemoryMessageStore::Messages() {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_;
}

}  // namespace teamlink
