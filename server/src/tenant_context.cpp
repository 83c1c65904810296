/*
 * 설명: 테넌트 스코프의 바인딩/해제/검사를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/tenant_context_test.cpp
 */
#include "teamlink/tenant_context.hpp"

namespace teamlink {

TenantScope::~TenantScope() { Clear(); }

void TenantScope::Bind(const Identity& identity) {
  if (identity.organization_id.empty()) {
    throw TenantScopeError("조직이 없는 Identity는 테넌트 스코프에 묶을 수 없습니다");
  }
  if (context_) {
    if (context_->organization_id == identity.organization_id && context_->user_id == identity.user_id) {
      return;
    }
    throw TenantScopeError("테넌트 스코프가 이미 다른 Identity에 묶여 있습니다");
  }
  context_ = TenantContext{identity.organization_id, identity.user_id, identity.role};
}

void TenantScope::Clear() noexcept { context_.reset(); }

const TenantContext& TenantScope::Require() const {
  if (!context_) {
    throw TenantScopeError("테넌트 스코프가 설정되지 않았습니다");
  }
  return *context_;
}

bool TenantScope::Allows(const std::string& organization_id) const {
  return context_ && !organization_id.empty() && context_->organization_id == organization_id;
}

}  // namespace teamlink
