#pragma once
#include <cstdint>

namespace fleet {

using fleet_err_t = int32_t;

constexpr fleet_err_t FLEET_OK = 0;
constexpr fleet_err_t FLEET_FAIL = -1;

constexpr fleet_err_t FLEET_ERR_BASE = 0x4000;
constexpr fleet_err_t FLEET_ERR_INVALID_ARG = FLEET_ERR_BASE + 1;
constexpr fleet_err_t FLEET_ERR_INVALID_RANGE = FLEET_ERR_BASE + 2;
constexpr fleet_err_t FLEET_ERR_INVALID_MODE = FLEET_ERR_BASE + 3;
constexpr fleet_err_t FLEET_ERR_INVALID_FORMAT = FLEET_ERR_BASE + 4;
constexpr fleet_err_t FLEET_ERR_NOT_FOUND = FLEET_ERR_BASE + 5;
constexpr fleet_err_t FLEET_ERR_TIMEOUT = FLEET_ERR_BASE + 6;
constexpr fleet_err_t FLEET_ERR_CONNECT = FLEET_ERR_BASE + 7;
constexpr fleet_err_t FLEET_ERR_HTTP_STATUS = FLEET_ERR_BASE + 8;
constexpr fleet_err_t FLEET_ERR_IO = FLEET_ERR_BASE + 9;
constexpr fleet_err_t FLEET_ERR_CANCELLED = FLEET_ERR_BASE + 10;
constexpr fleet_err_t FLEET_ERR_DUPLICATE = FLEET_ERR_BASE + 11;

const char* fleet_err_to_name(fleet_err_t code);

}  // namespace fleet
