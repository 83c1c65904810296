/*
 * 설명: 인증 코어가 호출하는 외부 저장소(사용자/조직/메시지) 인터페이스와 레코드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_authorizer_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "teamlink/tenant_context.hpp"

namespace teamlink {

struct User {
  std::string id;
  // 조직에서 빠진 사용자는 빈 문자열이다.
  std::string organization_id;
  std::string role;
  std::string email;
};

struct Organization {
  std::string id;
  std::string name;
};

struct UserCredential {
  std::string user_id;
  std::string salt_hex;
  std::string hash_hex;
};

struct StoredMessage {
  std::string id;
  std::string content;
  std::string sender_id;
  std::optional<std::string> recipient_id;
  std::string organization_id;
  std::int64_t created_at{0};
};

// 저장 계층의 제약 위반/검증 실패. 클라이언트에는 content_rejected로 보고된다.
class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class UserStore {
 public:
  virtual ~UserStore() = default;
  virtual std::optional<User> FindById(const std::string& id) = 0;
  virtual std::optional<UserCredential> FindCredentialByEmail(const std::string& email) = 0;
};

class OrganizationStore {
 public:
  virtual ~OrganizationStore() = default;
  virtual std::optional<Organization> FindById(const std::string& id) = 0;
};

class MessageStore {
 public:
  virtual ~MessageStore() = default;
  // scope가 organization_id와 다른 테넌트에 묶여 있으면 StoreError.
  virtual StoredMessage Create(const TenantScope& scope, const std::string& content, const std::string& sender_id,
                               const std::optional<std::string>& recipient_id,
                               const std::string& organization_id) = 0;
};

}  // namespace teamlink
