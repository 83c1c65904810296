/*
 * 설명: OpenSSL 기반 난수, HEX/Base64URL 인코딩, HMAC-SHA256 유틸리티를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp, server/tests/unit/credentials_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace teamlink {

std::string BytesToHex(const unsigned char* data, std::size_t len);
bool HexToBytes(const std::string& hex, std::vector<unsigned char>& out);

// RAND_bytes 실패 시 std::runtime_error를 던진다.
std::string RandomHex(std::size_t bytes);

std::string Base64UrlEncode(std::string_view input);
std::optional<std::string> Base64UrlDecode(std::string_view input);

std::string HmacSha256(std::string_view key, std::string_view data);

bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs);

}  // namespace teamlink
