/*
 * 설명: 토큰 서명과 자격 증명 해시에 쓰는 OpenSSL 유틸리티를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/crypto_util_test.cpp, server/tests/unit/token_codec_test.cpp,
 *         server/tests/unit/credentials_test.cpp
 */
#include "teamlink/crypto_util.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace teamlink {

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool HexToBytes(const std::string& hex, std::vector<unsigned char>& out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  out.clear();
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    unsigned int byte;
    std::istringstream iss(hex.substr(i, 2));
    iss >> std::hex >> byte;
    if (iss.fail()) {
      return false;
    }
    out.push_back(static_cast<unsigned char>(byte));
  }
  return true;
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

std::string Base64UrlEncode(std::string_view input) {
  if (input.empty()) {
    return {};
  }
  std::vector<unsigned char> raw(input.begin(), input.end());
  std::vector<unsigned char> block(4 * ((raw.size() + 2) / 3) + 1);
  int written = EVP_EncodeBlock(block.data(), raw.data(), static_cast<int>(raw.size()));
  std::string encoded(block.begin(), block.begin() + written);
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  for (auto& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return encoded;
}

std::optional<std::string> Base64UrlDecode(std::string_view input) {
  if (input.empty()) {
    return std::string{};
  }
  if (input.size() % 4 == 1) {
    return std::nullopt;
  }
  std::string standard;
  standard.reserve(input.size() + 3);
  for (char c : input) {
    if (c == '-') {
      standard.push_back('+');
    } else if (c == '_') {
      standard.push_back('/');
    } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
      standard.push_back(c);
    } else {
      return std::nullopt;
    }
  }
  std::size_t padding = 0;
  while (standard.size() % 4 != 0) {
    standard.push_back('=');
    ++padding;
  }
  std::vector<unsigned char> encoded(standard.begin(), standard.end());
  std::vector<unsigned char> block(encoded.size() / 4 * 3);
  int written = EVP_DecodeBlock(block.data(), encoded.data(), static_cast<int>(encoded.size()));
  if (written < 0 || static_cast<std::size_t>(written) < padding) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 바이트까지 0으로 채워 길이에 포함한다.
  return std::string(block.begin(), block.begin() + (written - static_cast<int>(padding)));
}

std::string HmacSha256(std::string_view key, std::string_view data) {
  std::vector<unsigned char> message(data.begin(), data.end());
  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message.data(), message.size(), digest.data(),
           &digest_len) == nullptr) {
    throw std::runtime_error("HMAC-SHA256 계산 실패");
  }
  return std::string(digest.begin(), digest.begin() + digest_len);
}

bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace teamlink
