/*
 * 설명: 비밀번호 해시 검증, 로그인 레이트리밋, 이메일/비밀번호 로그인을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credentials_test.cpp, server/tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "teamlink/auth_types.hpp"
#include "teamlink/session_service.hpp"
#include "teamlink/stores.hpp"

namespace teamlink {

struct LoginConfig {
  std::chrono::seconds login_window{std::chrono::seconds(60)};
  std::size_t login_max_attempts{5};
};

class RateLimiter {
 public:
  RateLimiter(std::size_t max_attempts, std::chrono::seconds window);
  bool Allow(const std::string& key, std::chrono::system_clock::time_point now);
  // 현재 창이 살아 있는 키의 수. 만료된 창은 다음 정리 때 사라진다.
  std::size_t TrackedKeys();

 private:
  struct Bucket {
    std::size_t count{0};
    std::chrono::system_clock::time_point window_start{};
  };
  void PruneExpired(std::chrono::system_clock::time_point now);

  std::unordered_map<std::string, Bucket> buckets_;
  std::chrono::system_clock::time_point last_prune_{};
  std::size_t max_attempts_;
  std::chrono::seconds window_;
  std::mutex mutex_;
};

class PasswordHasher {
 public:
  static std::string GenerateSalt();
  static std::string Hash(const std::string& password, const std::string& salt_hex);
  static bool Verify(const std::string& password, const UserCredential& credential);
};

struct LoginResult {
  User user;
  std::optional<Organization> organization;
  TokenPair tokens;
};

class LoginService {
 public:
  LoginService(std::shared_ptr<UserStore> users, std::shared_ptr<OrganizationStore> organizations,
               std::shared_ptr<SessionService> sessions, const LoginConfig& config);

  std::optional<LoginResult> Login(const std::string& email, const std::string& password, const std::string& ip,
                                   std::string& error_code, std::string& error_message);

 private:
  std::shared_ptr<UserStore> users_;
  std::shared_ptr<OrganizationStore> organizations_;
  std::shared_ptr<SessionService> sessions_;
  RateLimiter rate_limiter_;
};

std::string NormalizeEmail(const std::string& email);

}  // namespace teamlink
