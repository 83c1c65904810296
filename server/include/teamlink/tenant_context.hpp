/*
 * 설명: 요청/연결 단위 작업 동안 테넌트(조직) 컨텍스트를 보관하는 스코프 객체를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/tenant_context_test.cpp
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "teamlink/auth_types.hpp"

namespace teamlink {

struct TenantContext {
  std::string organization_id;
  std::string user_id;
  std::string role;
};

class TenantScopeError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// 전역/스레드 로컬 상태를 쓰지 않는다. 작업 단위가 직접 소유하고 저장소 호출에 넘긴다.
// 소멸 시점(성공, 예외, 연결 종료)에 무조건 비워진다.
class TenantScope {
 public:
  TenantScope() = default;
  ~TenantScope();

  TenantScope(const TenantScope&) = delete;
  TenantScope& operator=(const TenantScope&) = delete;

  // 인증 직후 한 번만 묶는다. 다른 Identity로 다시 묶으려 하면 TenantScopeError.
  void Bind(const Identity& identity);
  void Clear() noexcept;

  bool IsBound() const { return context_.has_value(); }
  const std::optional<TenantContext>& Current() const { return context_; }
  const TenantContext& Require() const;
  bool Allows(const std::string& organization_id) const;

 private:
  std::optional<TenantContext> context_;
};

}  // namespace teamlink
