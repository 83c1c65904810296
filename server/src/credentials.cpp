/*
 * 설명: PBKDF2 비밀번호 검증, IP 단위 로그인 레이트리밋, 로그인 후 토큰 발급을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credentials_test.cpp, server/tests/e2e/auth_flow_test.cpp
 */
#include "teamlink/credentials.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>

#include "teamlink/crypto_util.hpp"

namespace teamlink {

namespace {
constexpr int kPbkdf2Iterations = 100000;
constexpr std::size_t kHashBytes = 32;
}  // namespace

RateLimiter::RateLimiter(std::size_t max_attempts, std::chrono::seconds window)
    : max_attempts_(max_attempts), window_(window) {}

bool RateLimiter::Allow(const std::string& key, std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (now - last_prune_ > window_) {
    PruneExpired(now);
  }
  auto [it, inserted] = buckets_.try_emplace(key);
  auto& bucket = it->second;
  if (inserted || now - bucket.window_start > window_) {
    bucket.window_start = now;
    bucket.count = 0;
  }
  if (bucket.count >= max_attempts_) {
    return false;
  }
  ++bucket.count;
  return true;
}

std::size_t RateLimiter::TrackedKeys() {
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_.size();
}

void RateLimiter::PruneExpired(std::chrono::system_clock::time_point now) {
  for (auto it = buckets_.begin(); it != buckets_.end();) {
    if (now - it->second.window_start > window_) {
      it = buckets_.erase(it);
    } else {
      ++it;
    }
  }
  last_prune_ = now;
}

std::string PasswordHasher::GenerateSalt() { return RandomHex(16); }

std::string PasswordHasher::Hash(const std::string& password, const std::string& salt_hex) {
  std::vector<unsigned char> salt;
  if (!HexToBytes(salt_hex, salt)) {
    throw std::invalid_argument("salt는 HEX 문자열이어야 합니다");
  }
  std::vector<unsigned char> output(kHashBytes);
  if (PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                        static_cast<int>(salt.size()), kPbkdf2Iterations, EVP_sha256(),
                        static_cast<int>(output.size()), output.data()) != 1) {
    throw std::runtime_error("PBKDF2 계산 실패");
  }
  return BytesToHex(output.data(), output.size());
}

bool PasswordHasher::Verify(const std::string& password, const UserCredential& credential) {
  std::vector<unsigned char> ignored;
  if (!HexToBytes(credential.salt_hex, ignored)) {
    return false;
  }
  return ConstantTimeEquals(Hash(password, credential.salt_hex), credential.hash_hex);
}

std::string NormalizeEmail(const std::string& email) {
  auto begin = email.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = email.find_last_not_of(" \t\r\n");
  std::string normalized = email.substr(begin, end - begin + 1);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}

LoginService::LoginService(std::shared_ptr<UserStore> users, std::shared_ptr<OrganizationStore> organizations,
                           std::shared_ptr<SessionService> sessions, const LoginConfig& config)
    : users_(std::move(users)), organizations_(std::move(organizations)), sessions_(std::move(sessions)),
      rate_limiter_(config.login_max_attempts, config.login_window) {}

std::optional<LoginResult> LoginService::Login(const std::string& email, const std::string& password,
                                               const std::string& ip, std::string& error_code,
                                               std::string& error_message) {
  if (!rate_limiter_.Allow(ip, std::chrono::system_clock::now())) {
    error_code = "rate_limited";
    error_message = "로그인 시도 제한을 초과했습니다";
    return std::nullopt;
  }
  auto normalized = NormalizeEmail(email);
  if (normalized.empty() || password.empty()) {
    error_code = "bad_request";
    error_message = "email과 password가 필요합니다";
    return std::nullopt;
  }

  auto credential = users_->FindCredentialByEmail(normalized);
  if (!credential || !PasswordHasher::Verify(password, *credential)) {
    error_code = "INVALID_CREDENTIALS";
    error_message = "Invalid email or password";
    return std::nullopt;
  }
  auto user = users_->FindById(credential->user_id);
  if (!user) {
    error_code = "INVALID_CREDENTIALS";
    error_message = "Invalid email or password";
    return std::nullopt;
  }

  LoginResult result;
  result.user = *user;
  if (!user->organization_id.empty()) {
    result.organization = organizations_->FindById(user->organization_id);
  }
  result.tokens = sessions_->IssueTokenPair(*user);
  return result;
}

}  // namespace teamlink
