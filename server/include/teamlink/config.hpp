/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace teamlink {

struct AppConfig {
  unsigned short port{8080};
  std::string db_host{"mariadb"};
  unsigned short db_port{3306};
  std::string db_user{"app"};
  std::string db_password{"app_pass"};
  std::string db_name{"app_db"};
  // memory | mariadb
  std::string store_backend{"memory"};
  std::string log_level{"info"};
  std::string jwt_secret_key;
  std::size_t jwt_expiration_hours{24};
  std::size_t jwt_refresh_expiration_days{7};
  std::size_t login_rate_window_seconds{60};
  std::size_t login_rate_limit_max{5};
  std::size_t ws_queue_limit_messages{32};
  std::size_t ws_queue_limit_bytes{262144};
  std::size_t revocation_sweep_seconds{300};
  std::string ops_token;
};

// JWT_SECRET_KEY가 비어 있거나 값 형식이 잘못되면 std::invalid_argument.
AppConfig LoadConfigFromEnv();

}  // namespace teamlink
