#include "fleet_core/address_range.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <cctype>

namespace asio = boost::asio;

namespace fleet {

bool ipv4_parse(const std::string& text, uint32_t& out) {
  boost::system::error_code ec;
  const auto addr = asio::ip::make_address_v4(text, ec);
  if (ec) {
    return false;
  }
  out = addr.to_uint();
  return true;
}

std::string ipv4_to_string(uint32_t addr) {
  return asio::ip::address_v4(addr).to_string();
}

fleet_err_t AddressRange::parse(const std::string& cidr, AddressRange& out) {
  if (cidr.empty()) {
    return FLEET_ERR_INVALID_RANGE;
  }
  std::string addr_part = cidr;
  int prefix = 32;
  const auto slash = cidr.find('/');
  if (slash != std::string::npos) {
    addr_part = cidr.substr(0, slash);
    const std::string prefix_part = cidr.substr(slash + 1);
    if (prefix_part.empty() || prefix_part.size() > 2) {
      return FLEET_ERR_INVALID_RANGE;
    }
    for (char ch : prefix_part) {
      if (!std::isdigit(static_cast<unsigned char>(ch))) {
        return FLEET_ERR_INVALID_RANGE;
      }
    }
    prefix = std::stoi(prefix_part);
    if (prefix > 32) {
      return FLEET_ERR_INVALID_RANGE;
    }
  }
  uint32_t addr = 0;
  if (!ipv4_parse(addr_part, addr)) {
    return FLEET_ERR_INVALID_RANGE;
  }

  const uint32_t mask = prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
  AddressRange range;
  range.prefix_ = static_cast<uint8_t>(prefix);
  range.network_ = addr & mask;
  const uint64_t block = 1ULL << (32 - prefix);
  if (prefix >= 31) {
    range.first_host_ = range.network_;
    range.host_count_ = static_cast<size_t>(block);
  } else {
    range.first_host_ = range.network_ + 1;
    range.host_count_ = static_cast<size_t>(block - 2);
  }
  out = range;
  return FLEET_OK;
}

std::string AddressRange::at(size_t index) const {
  if (index >= host_count_) {
    return {};
  }
  return ipv4_to_string(first_host_ + static_cast<uint32_t>(index));
}

std::string AddressRange::to_string() const {
  return ipv4_to_string(network_) + "/" + std::to_string(prefix_);
}

}  // namespace fleet
