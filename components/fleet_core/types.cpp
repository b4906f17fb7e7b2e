#include "fleet_core/types.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace fleet {

const char* merge_mode_name(MergeMode mode) {
  switch (mode) {
    case MergeMode::Create:
      return "create";
    case MergeMode::Add:
      return "add";
    case MergeMode::Update:
      return "update";
  }
  return "create";
}

const char* operation_status_name(OperationStatus status) {
  switch (status) {
    case OperationStatus::Success:
      return "success";
    case OperationStatus::Partial:
      return "partial";
    case OperationStatus::Error:
      return "error";
  }
  return "error";
}

bool mac_canonicalize(const std::string& text, std::string& out) {
  std::string hex;
  hex.reserve(12);
  char separator = 0;
  size_t group_len = 0;
  for (char ch : text) {
    if (ch == ':' || ch == '-') {
      if (group_len != 2 || (separator && separator != ch)) {
        return false;
      }
      separator = ch;
      group_len = 0;
      continue;
    }
    if (!std::isxdigit(static_cast<unsigned char>(ch))) {
      return false;
    }
    hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    ++group_len;
  }
  if (hex.size() != 12) {
    return false;
  }
  if (separator && group_len != 2) {
    return false;
  }
  std::string result;
  result.reserve(17);
  for (size_t i = 0; i < hex.size(); i += 2) {
    if (i) {
      result.push_back(':');
    }
    result.append(hex, i, 2);
  }
  out = result;
  return true;
}

std::string timestamp_now_iso() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
  std::tm local{};
  localtime_r(&secs, &local);
  char buf[40];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%06lld", buf, static_cast<long long>(micros));
  return out;
}

uint64_t json_number_to_u64(double value) {
  constexpr double max_exact = 9007199254740992.0;
  if (!(value > 0.0)) {
    return 0;
  }
  return static_cast<uint64_t>(std::min(value, max_exact));
}

}  // namespace fleet
