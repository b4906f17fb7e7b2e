#include <unity.h>
#include "fleet_core/address_range.hpp"
#include <vector>

using namespace fleet;

void setUp() {}
void tearDown() {}

void test_slash24_lists_254_hosts() {
  AddressRange range;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, AddressRange::parse("192.168.1.0/24", range));
  TEST_ASSERT_EQUAL_UINT32(254, range.size());
  TEST_ASSERT_EQUAL_STRING("192.168.1.1", range.at(0).c_str());
  TEST_ASSERT_EQUAL_STRING("192.168.1.254", range.at(253).c_str());
  TEST_ASSERT_EQUAL_STRING("192.168.1.0/24", range.to_string().c_str());
}

// 2^(32-p) - 2 hosts for every prefix up to /30
void test_host_count_by_prefix() {
  for (int prefix = 8; prefix <= 30; ++prefix) {
    AddressRange range;
    const std::string cidr = "10.0.0.0/" + std::to_string(prefix);
    TEST_ASSERT_EQUAL_INT(FLEET_OK, AddressRange::parse(cidr, range));
    const size_t expected = (static_cast<size_t>(1) << (32 - prefix)) - 2;
    TEST_ASSERT_EQUAL_UINT32(expected, range.size());
    if (prefix >= 20) {
      size_t walked = 0;
      for (auto it = range.begin(); it != range.end(); ++it) {
        ++walked;
      }
      TEST_ASSERT_EQUAL_UINT32(expected, walked);
    }
  }
}

void test_point_to_point_and_single_host() {
  AddressRange range;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, AddressRange::parse("10.1.1.4/31", range));
  TEST_ASSERT_EQUAL_UINT32(2, range.size());
  TEST_ASSERT_EQUAL_STRING("10.1.1.4", range.at(0).c_str());
  TEST_ASSERT_EQUAL_STRING("10.1.1.5", range.at(1).c_str());

  TEST_ASSERT_EQUAL_INT(FLEET_OK, AddressRange::parse("10.1.1.9/32", range));
  TEST_ASSERT_EQUAL_UINT32(1, range.size());
  TEST_ASSERT_EQUAL_STRING("10.1.1.9", range.at(0).c_str());

  TEST_ASSERT_EQUAL_INT(FLEET_OK, AddressRange::parse("10.1.1.9", range));
  TEST_ASSERT_EQUAL_UINT32(1, range.size());
  TEST_ASSERT_EQUAL_UINT8(32, range.prefix());
}

void test_host_bits_are_masked() {
  AddressRange range;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, AddressRange::parse("172.16.5.77/24", range));
  TEST_ASSERT_EQUAL_STRING("172.16.5.1", range.at(0).c_str());
  TEST_ASSERT_EQUAL_STRING("172.16.5.0/24", range.to_string().c_str());
}

void test_malformed_ranges_rejected() {
  const char* bad[] = {"", "300.1.1.1/24", "1.2.3.4/33", "1.2.3/24", "1.2.3.4/", "1.2.3.4/x", "1.2.3.4/-1",
                       "host.local/24", "1.2.3.4/24/8"};
  for (const char* cidr : bad) {
    AddressRange range;
    TEST_ASSERT_EQUAL_INT_MESSAGE(FLEET_ERR_INVALID_RANGE, AddressRange::parse(cidr, range), cidr);
  }
}

void test_sequence_is_restartable() {
  AddressRange range;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, AddressRange::parse("192.168.10.0/29", range));
  std::vector<std::string> first(range.begin(), range.end());
  std::vector<std::string> second(range.begin(), range.end());
  TEST_ASSERT_EQUAL_UINT32(6, first.size());
  TEST_ASSERT_TRUE(first == second);
  TEST_ASSERT_TRUE(range.at(6).empty());
}

void test_large_range_is_lazy() {
  AddressRange range;
  TEST_ASSERT_EQUAL_INT(FLEET_OK, AddressRange::parse("10.0.0.0/8", range));
  TEST_ASSERT_EQUAL_UINT32(16777214, range.size());
  TEST_ASSERT_EQUAL_STRING("10.255.255.254", range.at(range.size() - 1).c_str());
}

void test_ipv4_helpers() {
  uint32_t addr = 0;
  TEST_ASSERT_TRUE(ipv4_parse("10.0.0.10", addr));
  TEST_ASSERT_EQUAL_HEX32(0x0A00000A, addr);
  TEST_ASSERT_FALSE(ipv4_parse("10.0.0", addr));
  TEST_ASSERT_EQUAL_STRING("10.0.0.10", ipv4_to_string(0x0A00000A).c_str());
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_slash24_lists_254_hosts);
  RUN_TEST(test_host_count_by_prefix);
  RUN_TEST(test_point_to_point_and_single_host);
  RUN_TEST(test_host_bits_are_masked);
  RUN_TEST(test_malformed_ranges_rejected);
  RUN_TEST(test_sequence_is_restartable);
  RUN_TEST(test_large_range_is_lazy);
  RUN_TEST(test_ipv4_helpers);
  return UNITY_END();
}
