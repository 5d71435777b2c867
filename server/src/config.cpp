/*
 * 설명: 환경변수에서 서버 설정을 읽고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "arbiter/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace arbiter {
namespace {
unsigned long ParseUnsigned(const std::string& key, const std::string& value, unsigned long max) {
  std::size_t pos = 0;
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value, &pos);
  } catch (const std::exception&) {
    throw std::invalid_argument(key + " 값이 숫자가 아닙니다: " + value);
  }
  if (pos != value.size() || value.front() == '-' || parsed > max) {
    throw std::invalid_argument(key + " 값이 범위를 벗어났습니다: " + value);
  }
  return parsed;
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(ParseUnsigned("SERVER_PORT", get_env("SERVER_PORT", "8080"), 65535));

  const std::string backend = get_env("STORAGE_BACKEND", "memory");
  if (backend == "memory") {
    cfg.storage_backend = StorageBackend::kMemory;
  } else if (backend == "mariadb") {
    cfg.storage_backend = StorageBackend::kMariaDb;
  } else {
    throw std::invalid_argument("STORAGE_BACKEND는 memory 또는 mariadb여야 합니다: " + backend);
  }

  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(ParseUnsigned("DB_PORT", get_env("DB_PORT", "3306"), 65535));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");

  const std::string level = get_env("LOG_LEVEL", "info");
  auto parsed_level = ParseLogLevel(level);
  if (!parsed_level) {
    throw std::invalid_argument("LOG_LEVEL 값이 올바르지 않습니다: " + level);
  }
  cfg.log_level = *parsed_level;

  cfg.max_active_matches =
      static_cast<std::size_t>(ParseUnsigned("MAX_ACTIVE_MATCHES", get_env("MAX_ACTIVE_MATCHES", "5"), 10000));
  if (cfg.max_active_matches == 0) {
    throw std::invalid_argument("MAX_ACTIVE_MATCHES는 1 이상이어야 합니다");
  }
  return cfg;
}

}  // namespace arbiter
