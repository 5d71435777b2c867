/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "arbiter/observability.hpp"

namespace arbiter {

enum class StorageBackend { kMemory, kMariaDb };

struct AppConfig {
  unsigned short port{8080};
  StorageBackend storage_backend{StorageBackend::kMemory};
  std::string db_host{"mariadb"};
  unsigned short db_port{3306};
  std::string db_user{"app"};
  std::string db_password{"app_pass"};
  std::string db_name{"app_db"};
  LogLevel log_level{LogLevel::kInfo};
  std::size_t max_active_matches{5};
};

// 잘못된 값은 std::invalid_argument.
AppConfig LoadConfigFromEnv();

}  // namespace arbiter
