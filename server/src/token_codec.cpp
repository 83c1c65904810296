/*
 * 설명: JWT(HS256) 헤더/페이로드 직렬화, 서명, 만료 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#include "teamlink/token_codec.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "teamlink/crypto_util.hpp"

namespace teamlink {

namespace {
constexpr std::size_t kTokenIdBytes = 16;

std::string EncodedHeader() {
  static const std::string header = Base64UrlEncode(nlohmann::json{{"alg", "HS256"}, {"typ", "JWT"}}.dump());
  return header;
}

nlohmann::json ClaimsToJson(const TokenClaims& claims) {
  nlohmann::json payload;
  payload["user_id"] = claims.user_id;
  if (claims.organization_id.empty()) {
    payload["organization_id"] = nullptr;
  } else {
    payload["organization_id"] = claims.organization_id;
  }
  if (!claims.role.empty()) {
    payload["role"] = claims.role;
  }
  if (claims.type == TokenType::kAccess && !claims.email.empty()) {
    payload["email"] = claims.email;
  }
  payload["type"] = ToString(claims.type);
  payload["iat"] = claims.issued_at;
  payload["exp"] = claims.expires_at;
  payload["jti"] = claims.token_id;
  return payload;
}

std::optional<std::string> OptionalString(const nlohmann::json& payload, const char* key, bool& malformed) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    malformed = true;
    return std::nullopt;
  }
  return it->get<std::string>();
}
}  // namespace

TokenCodec::TokenCodec(TokenCodecConfig config, EpochClock clock) : config_(std::move(config)), clock_(std::move(clock)) {
  if (config_.secret.empty()) {
    throw std::invalid_argument("JWT 서명 키가 비어 있습니다");
  }
  if (!clock_) {
    clock_ = SystemEpochSeconds;
  }
}

std::string TokenCodec::Encode(TokenClaims claims, std::optional<std::int64_t> expires_at) const {
  if (claims.token_id.empty()) {
    claims.token_id = RandomHex(kTokenIdBytes);
  }
  claims.issued_at = clock_();
  claims.expires_at = expires_at ? *expires_at : claims.issued_at + config_.default_ttl.count();

  std::string signing_input = EncodedHeader() + "." + Base64UrlEncode(ClaimsToJson(claims).dump());
  return signing_input + "." + Base64UrlEncode(Sign(signing_input));
}

std::optional<TokenClaims> TokenCodec::Decode(const std::string& token, AuthError& error) const {
  auto first_dot = token.find('.');
  auto second_dot = first_dot == std::string::npos ? std::string::npos : token.find('.', first_dot + 1);
  if (first_dot == std::string::npos || second_dot == std::string::npos ||
      token.find('.', second_dot + 1) != std::string::npos) {
    error.Set(AuthErrorCode::kTokenInvalid, "Invalid token: segment count");
    return std::nullopt;
  }

  std::string signing_input = token.substr(0, second_dot);
  auto signature = Base64UrlDecode(std::string_view(token).substr(second_dot + 1));
  if (!signature || !ConstantTimeEquals(*signature, Sign(signing_input))) {
    error.Set(AuthErrorCode::kTokenInvalid, "Invalid token: signature verification failed");
    return std::nullopt;
  }

  auto header_text = Base64UrlDecode(std::string_view(token).substr(0, first_dot));
  auto payload_text = Base64UrlDecode(std::string_view(token).substr(first_dot + 1, second_dot - first_dot - 1));
  if (!header_text || !payload_text) {
    error.Set(AuthErrorCode::kTokenInvalid, "Invalid token: encoding");
    return std::nullopt;
  }
  auto header = nlohmann::json::parse(*header_text, nullptr, false);
  auto payload = nlohmann::json::parse(*payload_text, nullptr, false);
  if (header.is_discarded() || payload.is_discarded() || !header.is_object() || !payload.is_object()) {
    error.Set(AuthErrorCode::kTokenInvalid, "Invalid token: malformed JSON");
    return std::nullopt;
  }
  auto alg_it = header.find("alg");
  if (alg_it == header.end() || !alg_it->is_string() || alg_it->get<std::string>() != "HS256") {
    error.Set(AuthErrorCode::kTokenInvalid, "Invalid token: expected HS256");
    return std::nullopt;
  }

  auto exp_it = payload.find("exp");
  if (exp_it == payload.end() || !exp_it->is_number_integer()) {
    error.Set(AuthErrorCode::kTokenInvalid, "Invalid token: exp claim");
    return std::nullopt;
  }

  bool malformed = false;
  TokenClaims claims;
  claims.user_id = OptionalString(payload, "user_id", malformed).value_or("");
  claims.organization_id = OptionalString(payload, "organization_id", malformed).value_or("");
  claims.role = OptionalString(payload, "role", malformed).value_or("");
  claims.email = OptionalString(payload, "email", malformed).value_or("");
  claims.token_id = OptionalString(payload, "jti", malformed).value_or("");
  auto type_text = OptionalString(payload, "type", malformed);
  auto type = type_text ? ParseTokenType(*type_text) : std::nullopt;
  if (malformed || claims.user_id.empty() || claims.token_id.empty() || !type) {
    error.Set(AuthErrorCode::kTokenInvalid, "Invalid token: required claims missing");
    return std::nullopt;
  }
  claims.type = *type;
  claims.expires_at = exp_it->get<std::int64_t>();
  auto iat_it = payload.find("iat");
  if (iat_it != payload.end() && iat_it->is_number_integer()) {
    claims.issued_at = iat_it->get<std::int64_t>();
  }

  if (clock_() >= claims.expires_at) {
    error.Set(AuthErrorCode::kTokenExpired, "Token has expired");
    return std::nullopt;
  }
  return claims;
}

std::string TokenCodec::Sign(const std::string& signing_input) const {
  return HmacSha256(config_.secret, signing_input);
}

}  // namespace teamlink
