/*
 * 설명: JSON 응답 엔벨로프와 케이블 프레임을 생성하고 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "teamlink/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace teamlink {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  return ToIsoString(static_cast<std::int64_t>(clock::to_time_t(clock::now())));
}
}  // namespace

std::string ToIsoString(std::int64_t epoch_seconds) {
  auto itt = static_cast<std::time_t>(epoch_seconds);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const std::optional<std::string>& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  if (detail) {
    envelope["error"]["detail"] = *detail;
  }
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json TokenPairToJson(const TokenPair& pair) {
  return {{"access_token", pair.access_token},
          {"refresh_token", pair.refresh_token},
          {"token_type", pair.token_type},
          {"expires_in", pair.expires_in}};
}

nlohmann::json IdentityToJson(const Identity& identity) {
  return {{"user_id", identity.user_id},
          {"organization_id", identity.organization_id},
          {"role", identity.role}};
}

nlohmann::json UserToJson(const User& user) {
  nlohmann::json j{{"id", user.id}, {"email", user.email}, {"role", user.role}};
  j["organization_id"] = user.organization_id.empty() ? nlohmann::json(nullptr) : nlohmann::json(user.organization_id);
  return j;
}

nlohmann::json OrganizationToJson(const Organization& organization) {
  return {{"id", organization.id}, {"name", organization.name}};
}

nlohmann::json MakeWelcomeFrame(const Identity& identity) {
  return {{"type", "welcome"}, {"identity", IdentityToJson(identity)}};
}

nlohmann::json MakeConfirmSubscriptionFrame(const nlohmann::json& identifier, const std::string& stream_key) {
  return {{"type", "confirm_subscription"}, {"identifier", identifier}, {"stream", stream_key}};
}

nlohmann::json MakeRejectSubscriptionFrame(const nlohmann::json& identifier, AuthErrorCode code) {
  return {{"type", "reject_subscription"}, {"identifier", identifier}, {"code", ToWireCode(code)}};
}

nlohmann::json MakeNewMessagePayload(const StoredMessage& message, const Identity& sender) {
  nlohmann::json body{{"id", message.id},
                      {"content", message.content},
                      {"created_at", ToIsoString(message.created_at)},
                      {"user", {{"id", sender.user_id}, {"role", sender.role}}}};
  body["recipient_id"] = message.recipient_id ? nlohmann::json(*message.recipient_id) : nlohmann::json(nullptr);
  return {{"type", "new_message"}, {"message", body}};
}

nlohmann::json MakeChannelFrame(const nlohmann::json& identifier, const nlohmann::json& message) {
  return {{"identifier", identifier}, {"message", message}};
}

nlohmann::json MakeChannelErrorFrame(const nlohmann::json& identifier, const AuthError& error) {
  return MakeChannelFrame(identifier, {{"error", error.message}, {"code", ToWireCode(error.code)}});
}

nlohmann::json MakeProtocolErrorFrame(std::string_view message) { return {{"type", "error"}, {"error", message}}; }

}  // namespace teamlink
