#include "fleet_core/err.hpp"

namespace fleet {

const char* fleet_err_to_name(fleet_err_t code) {
  switch (code) {
    case FLEET_OK:
      return "FLEET_OK";
    case FLEET_FAIL:
      return "FLEET_FAIL";
    case FLEET_ERR_INVALID_ARG:
      return "FLEET_ERR_INVALID_ARG";
    case FLEET_ERR_INVALID_RANGE:
      return "FLEET_ERR_INVALID_RANGE";
    case FLEET_ERR_INVALID_MODE:
      return "FLEET_ERR_INVALID_MODE";
    case FLEET_ERR_INVALID_FORMAT:
      return "FLEET_ERR_INVALID_FORMAT";
    case FLEET_ERR_NOT_FOUND:
      return "FLEET_ERR_NOT_FOUND";
    case FLEET_ERR_TIMEOUT:
      return "FLEET_ERR_TIMEOUT";
    case FLEET_ERR_CONNECT:
      return "FLEET_ERR_CONNECT";
    case FLEET_ERR_HTTP_STATUS:
      return "FLEET_ERR_HTTP_STATUS";
    case FLEET_ERR_IO:
      return "FLEET_ERR_IO";
    case FLEET_ERR_CANCELLED:
      return "FLEET_ERR_CANCELLED";
    case FLEET_ERR_DUPLICATE:
      return "FLEET_ERR_DUPLICATE";
  }
  return "FLEET_ERR_UNKNOWN";
}

}  // namespace fleet
