#include <unity.h>
#include "fleet_core/config.hpp"
#include "fleet_core/file_util.hpp"
#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>

using namespace fleet;

static const char* CONFIG_PATH = "test_fleet_config.json";

static fleet_err_t apply(AppConfig& cfg, const char* json) {
  return config_apply_json(cfg, json, std::strlen(json));
}

void setUp() {
  std::remove(CONFIG_PATH);
}

void tearDown() {
  std::remove(CONFIG_PATH);
}

void test_defaults() {
  AppConfig cfg;
  cfg.scan.concurrency = 7;
  config_reset_defaults(cfg);
  TEST_ASSERT_EQUAL_STRING("device_map.json", cfg.map_file.c_str());
  TEST_ASSERT_EQUAL_UINT32(80, cfg.device_port);
  TEST_ASSERT_EQUAL_UINT32(2000, cfg.scan.timeout_ms);
  TEST_ASSERT_EQUAL_UINT32(50, cfg.scan.concurrency);
  TEST_ASSERT_EQUAL_UINT32(5000, cfg.batch.timeout_ms);
  TEST_ASSERT_EQUAL_UINT32(10, cfg.batch.concurrency);
  TEST_ASSERT_FALSE(cfg.batch.include_offline);
  TEST_ASSERT_EQUAL_STRING("LOUD", cfg.identity.prefix.c_str());
  TEST_ASSERT_EQUAL_INT(1, cfg.identity.start_num);
  TEST_ASSERT_EQUAL_UINT32(30, cfg.identity.identify_duration_s);
  TEST_ASSERT_EQUAL_UINT32(60000, cfg.upload.timeout_ms);
}

void test_partial_document_keeps_other_fields() {
  AppConfig cfg;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, apply(cfg, R"({"batch":{"concurrency":25,"include_offline":true},"identity":{"prefix":"SPK"}})"));
  TEST_ASSERT_EQUAL_UINT32(25, cfg.batch.concurrency);
  TEST_ASSERT_TRUE(cfg.batch.include_offline);
  TEST_ASSERT_EQUAL_UINT32(5000, cfg.batch.timeout_ms);
  TEST_ASSERT_EQUAL_STRING("SPK", cfg.identity.prefix.c_str());
  TEST_ASSERT_EQUAL_UINT32(50, cfg.scan.concurrency);

  // Wrong types are ignored.
  TEST_ASSERT_EQUAL_INT(FLEET_OK, apply(cfg, R"({"scan":{"concurrency":"many"},"map_file":""})"));
  TEST_ASSERT_EQUAL_UINT32(50, cfg.scan.concurrency);
  TEST_ASSERT_EQUAL_STRING("device_map.json", cfg.map_file.c_str());
}

void test_values_are_clamped() {
  AppConfig cfg;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, apply(cfg, R"({"device_port":70000,"scan":{"concurrency":0,"timeout_ms":5},
                                              "identity":{"start_num":-4,"identify_duration_s":99999},
                                              "upload":{"timeout_ms":10}})"));
  TEST_ASSERT_EQUAL_UINT32(65535, cfg.device_port);
  TEST_ASSERT_EQUAL_UINT32(1, cfg.scan.concurrency);
  TEST_ASSERT_EQUAL_UINT32(100, cfg.scan.timeout_ms);
  TEST_ASSERT_EQUAL_INT(0, cfg.identity.start_num);
  TEST_ASSERT_EQUAL_UINT32(3600, cfg.identity.identify_duration_s);
  TEST_ASSERT_EQUAL_UINT32(1000, cfg.upload.timeout_ms);
}

void test_timeout_override_is_clamped() {
  TEST_ASSERT_EQUAL_INT(2500, static_cast<int>(timeout_from_seconds(2.5, 5000).count()));
  TEST_ASSERT_EQUAL_INT(3600000, static_cast<int>(timeout_from_seconds(1e300, 5000).count()));
  TEST_ASSERT_EQUAL_INT(3600000, static_cast<int>(timeout_from_seconds(HUGE_VAL, 5000).count()));
  TEST_ASSERT_EQUAL_INT(100, static_cast<int>(timeout_from_seconds(0.001, 5000).count()));
  TEST_ASSERT_EQUAL_INT(5000, static_cast<int>(timeout_from_seconds(0.0, 5000).count()));
  TEST_ASSERT_EQUAL_INT(5000, static_cast<int>(timeout_from_seconds(-3.0, 5000).count()));
  TEST_ASSERT_EQUAL_INT(5000, static_cast<int>(timeout_from_seconds(std::nan(""), 5000).count()));
}

void test_malformed_input_is_rejected() {
  AppConfig cfg;
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, config_apply_json(cfg, nullptr, 0));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_FORMAT, apply(cfg, "{\"scan\": {"));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_FORMAT, apply(cfg, "[1,2,3]"));

  TEST_ASSERT_EQUAL_INT(FLEET_OK, file_write_atomic(CONFIG_PATH, "scan = 5\n"));
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_FORMAT, config_load(CONFIG_PATH, cfg));
  TEST_ASSERT_EQUAL_UINT32(50, cfg.scan.concurrency);
}

void test_missing_file_keeps_defaults() {
  AppConfig cfg;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, config_load(CONFIG_PATH, cfg));
  TEST_ASSERT_EQUAL_UINT32(10, cfg.batch.concurrency);
}

void test_save_then_load() {
  AppConfig cfg;
  cfg.map_file = "site/hall_b.json";
  cfg.device_port = 8080;
  cfg.batch.include_offline = true;
  cfg.identity.prefix = "HALL";
  cfg.identity.start_num = 100;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, config_save(CONFIG_PATH, cfg));

  AppConfig loaded;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, config_load(CONFIG_PATH, loaded));
  TEST_ASSERT_EQUAL_STRING("site/hall_b.json", loaded.map_file.c_str());
  TEST_ASSERT_EQUAL_UINT32(8080, loaded.device_port);
  TEST_ASSERT_TRUE(loaded.batch.include_offline);
  TEST_ASSERT_EQUAL_STRING("HALL", loaded.identity.prefix.c_str());
  TEST_ASSERT_EQUAL_INT(100, loaded.identity.start_num);
  TEST_ASSERT_EQUAL_STRING(config_to_json(cfg).c_str(), config_to_json(loaded).c_str());
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_defaults);
  RUN_TEST(test_partial_document_keeps_other_fields);
  RUN_TEST(test_values_are_clamped);
  RUN_TEST(test_timeout_override_is_clamped);
  RUN_TEST(test_malformed_input_is_rejected);
  RUN_TEST(test_missing_file_keeps_defaults);
  RUN_TEST(test_save_then_load);
  return UNITY_END();
}
