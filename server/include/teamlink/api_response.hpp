/*
 * 설명: REST 응답 엔벨로프와 케이블 프레임 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "teamlink/auth_types.hpp"
#include "teamlink/stores.hpp"

namespace teamlink {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const std::optional<std::string>& detail = std::nullopt);

std::string ToIsoString(std::int64_t epoch_seconds);

nlohmann::json TokenPairToJson(const TokenPair& pair);
nlohmann::json IdentityToJson(const Identity& identity);
nlohmann::json UserToJson(const User& user);
nlohmann::json OrganizationToJson(const Organization& organization);

nlohmann::json MakeWelcomeFrame(const Identity& identity);
nlohmann::json MakeConfirmSubscriptionFrame(const nlohmann::json& identifier, const std::string& stream_key);
nlohmann::json MakeRejectSubscriptionFrame(const nlohmann::json& identifier, AuthErrorCode code);
// 스트림으로 방송되는 본문. 연결별 identifier는 MakeChannelFrame에서 붙는다.
nlohmann::json MakeNewMessagePayload(const StoredMessage& message, const Identity& sender);
nlohmann::json MakeChannelFrame(const nlohmann::json& identifier, const nlohmann::json& message);
nlohmann::json MakeChannelErrorFrame(const nlohmann::json& identifier, const AuthError& error);
nlohmann::json MakeProtocolErrorFrame(std::string_view message);

}  // namespace teamlink
