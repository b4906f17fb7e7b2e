#include <unity.h>
#include "fleet_core/device_filter.hpp"
#include <string>
#include <vector>

using namespace fleet;

static std::vector<DeviceRecord> fleet_sample() {
  auto make = [](const char* mac, const char* id, bool online) {
    DeviceRecord d;
    d.mac_address = mac;
    d.id = id;
    d.ip_address = "10.0.0.1";
    d.online = online;
    return d;
  };
  return {make("02:00:00:00:00:01", "LOUD-001", true), make("02:00:00:00:00:02", "LOUD-002", false),
          make("02:00:00:00:00:03", "STAGE-1", true), make("02:00:00:00:00:04", "LOUD-010", true)};
}

static std::vector<std::string> ids_of(const std::vector<DeviceRecord>& devices) {
  std::vector<std::string> ids;
  for (const auto& d : devices) {
    ids.push_back(d.id);
  }
  return ids;
}

void setUp() {}
void tearDown() {}

void test_empty_filter_selects_online() {
  std::vector<DeviceRecord> out;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, apply_filter(fleet_sample(), DeviceFilter{}, out));
  TEST_ASSERT_EQUAL_UINT32(3, out.size());

  DeviceFilter all;
  all.include_offline = true;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, apply_filter(fleet_sample(), all, out));
  TEST_ASSERT_EQUAL_UINT32(4, out.size());
}

void test_pattern_is_searched() {
  DeviceFilter filter;
  filter.id_pattern = "LOUD-0[01]";
  std::vector<DeviceRecord> out;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, apply_filter(fleet_sample(), filter, out));
  const auto ids = ids_of(out);
  TEST_ASSERT_EQUAL_UINT32(2, ids.size());
  TEST_ASSERT_EQUAL_STRING("LOUD-001", ids[0].c_str());
  TEST_ASSERT_EQUAL_STRING("LOUD-010", ids[1].c_str());

  filter.id_pattern = "GE-";
  TEST_ASSERT_EQUAL_INT(FLEET_OK, apply_filter(fleet_sample(), filter, out));
  TEST_ASSERT_EQUAL_UINT32(1, out.size());
}

void test_criteria_combine() {
  DeviceFilter filter;
  filter.include_offline = true;
  filter.id_pattern = "^LOUD";
  filter.macs = {"02-00-00-00-00-02", "020000000003"};
  std::vector<DeviceRecord> out;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, apply_filter(fleet_sample(), filter, out));
  TEST_ASSERT_EQUAL_UINT32(1, out.size());
  TEST_ASSERT_EQUAL_STRING("LOUD-002", out[0].id.c_str());

  DeviceFilter by_id;
  by_id.ids = {"STAGE-1", "LOUD-999"};
  TEST_ASSERT_EQUAL_INT(FLEET_OK, apply_filter(fleet_sample(), by_id, out));
  TEST_ASSERT_EQUAL_UINT32(1, out.size());
  TEST_ASSERT_EQUAL_STRING("02:00:00:00:00:03", out[0].mac_address.c_str());
}

void test_bad_criteria_rejected() {
  std::vector<DeviceRecord> out = fleet_sample();
  DeviceFilter filter;
  filter.id_pattern = "LOUD-(";
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, apply_filter(fleet_sample(), filter, out));
  TEST_ASSERT_EQUAL_UINT32(4, out.size());

  DeviceFilter bad_mac;
  bad_mac.macs = {"02:00:00"};
  TEST_ASSERT_EQUAL_INT(FLEET_ERR_INVALID_ARG, apply_filter(fleet_sample(), bad_mac, out));
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_empty_filter_selects_online);
  RUN_TEST(test_pattern_is_searched);
  RUN_TEST(test_criteria_combine);
  RUN_TEST(test_bad_criteria_rejected);
  return UNITY_END();
}
