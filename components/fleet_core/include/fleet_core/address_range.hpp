#pragma once
#include "fleet_core/err.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>

namespace fleet {

bool ipv4_parse(const std::string& text, uint32_t& out);
std::string ipv4_to_string(uint32_t addr);

// Host addresses of an IPv4 CIDR block. Network and broadcast addresses are
// excluded for prefixes up to /30; /31 and /32 list every address they hold.
// Addresses are produced on demand, so a /8 costs no memory.
class AddressRange {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = std::string;

    iterator() = default;
    iterator(const AddressRange* range, size_t index) : range_(range), index_(index) {}

    std::string operator*() const { return range_->at(index_); }
    iterator& operator++() {
      ++index_;
      return *this;
    }
    iterator operator++(int) {
      iterator copy = *this;
      ++index_;
      return copy;
    }
    bool operator==(const iterator& other) const { return index_ == other.index_ && range_ == other.range_; }
    bool operator!=(const iterator& other) const { return !(*this == other); }

  private:
    const AddressRange* range_{nullptr};
    size_t index_{0};
  };

  // Accepts "a.b.c.d/p" or a bare address (treated as /32). Host bits set in
  // the address are masked off.
  static fleet_err_t parse(const std::string& cidr, AddressRange& out);

  size_t size() const { return host_count_; }
  bool empty() const { return host_count_ == 0; }
  std::string at(size_t index) const;
  std::string to_string() const;
  uint8_t prefix() const { return prefix_; }

  iterator begin() const { return iterator(this, 0); }
  iterator end() const { return iterator(this, host_count_); }

private:
  uint32_t network_{0};
  uint8_t prefix_{32};
  uint32_t first_host_{0};
  size_t host_count_{0};
};

}  // namespace fleet
