#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "arbiter/config.hpp"

namespace {

const char* const kConfigKeys[] = {"SERVER_PORT", "STORAGE_BACKEND", "DB_HOST",   "DB_PORT",
                                   "DB_USER",     "DB_PASSWORD",     "DB_NAME",   "LOG_LEVEL",
                                   "MAX_ACTIVE_MATCHES"};

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* key : kConfigKeys) {
      unsetenv(key);
    }
  }
};

}  // namespace

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
  auto cfg = arbiter::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.storage_backend, arbiter::StorageBackend::kMemory);
  EXPECT_EQ(cfg.db_port, 3306);
  EXPECT_EQ(cfg.db_name, "app_db");
  EXPECT_EQ(cfg.log_level, arbiter::LogLevel::kInfo);
  EXPECT_EQ(cfg.max_active_matches, 5u);
}

TEST_F(ConfigTest, ReadsOverrides) {
  setenv("SERVER_PORT", "9090", 1);
  setenv("STORAGE_BACKEND", "mariadb", 1);
  setenv("DB_HOST", "127.0.0.1", 1);
  setenv("DB_PORT", "3307", 1);
  setenv("LOG_LEVEL", "warn", 1);
  setenv("MAX_ACTIVE_MATCHES", "12", 1);

  auto cfg = arbiter::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9090);
  EXPECT_EQ(cfg.storage_backend, arbiter::StorageBackend::kMariaDb);
  EXPECT_EQ(cfg.db_host, "127.0.0.1");
  EXPECT_EQ(cfg.db_port, 3307);
  EXPECT_EQ(cfg.log_level, arbiter::LogLevel::kWarn);
  EXPECT_EQ(cfg.max_active_matches, 12u);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
  setenv("STORAGE_BACKEND", "redis", 1);
  EXPECT_THROW(arbiter::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("STORAGE_BACKEND");

  setenv("LOG_LEVEL", "verbose", 1);
  EXPECT_THROW(arbiter::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("LOG_LEVEL");

  setenv("MAX_ACTIVE_MATCHES", "0", 1);
  EXPECT_THROW(arbiter::LoadConfigFromEnv(), std::invalid_argument);
  setenv("MAX_ACTIVE_MATCHES", "ten", 1);
  EXPECT_THROW(arbiter::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("MAX_ACTIVE_MATCHES");

  setenv("SERVER_PORT", "70000", 1);
  EXPECT_THROW(arbiter::LoadConfigFromEnv(), std::invalid_argument);
  setenv("SERVER_PORT", "-1", 1);
  EXPECT_THROW(arbiter::LoadConfigFromEnv(), std::invalid_argument);
}
