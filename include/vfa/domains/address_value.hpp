#pragma once

/**
 * Finite powerset of memory addresses.
 *
 * Join is set union and meet is set intersection. The universe of
 * addresses is fixed when the analysis starts so no widening is
 * needed. The empty set means that no address is possible.
 *
 * Memory objects are referred to by virtual addresses: the object
 * identifier lives in the low 24 bits and the high byte carries a
 * fixed tag. Object 0 is the null object.
 **/

#include <vfa/support/debug.hpp>
#include <vfa/support/os.hpp>

#include <boost/container/flat_set.hpp>

#include <cstdint>
#include <initializer_list>

namespace vfa {
namespace domains {

using vaddr_t = uint32_t;
using obj_id_t = uint32_t;

class address_value {
public:
  using addr_set_t = boost::container::flat_set<vaddr_t>;
  using iterator = addr_set_t::const_iterator;

  static const vaddr_t ADDR_HIGH_BYTE = 0x7F000000;
  static const vaddr_t ADDR_MASK = 0xFF000000;
  static const obj_id_t MAX_OBJ_ID = ~ADDR_MASK;
  static const obj_id_t NULL_OBJ_ID = 0;

private:
  addr_set_t m_addrs;

public:
  static vaddr_t get_virtual_mem_address(obj_id_t id);
  static bool is_virtual_mem_address(vaddr_t val);
  // Return the object identifier if val is a virtual address,
  // otherwise val itself.
  static obj_id_t get_internal_id(vaddr_t val);

  address_value() {}
  address_value(vaddr_t addr) { m_addrs.insert(addr); }
  address_value(std::initializer_list<vaddr_t> addrs)
      : m_addrs(addrs.begin(), addrs.end()) {}
  address_value(addr_set_t addrs) : m_addrs(std::move(addrs)) {}

  template <typename Iterator>
  address_value(Iterator it, Iterator et) : m_addrs(it, et) {}

  address_value(const address_value &o) = default;
  address_value(address_value &&o) = default;
  address_value &operator=(const address_value &o) = default;
  address_value &operator=(address_value &&o) = default;

  const addr_set_t &get_addrs() const { return m_addrs; }

  bool contains(vaddr_t addr) const { return m_addrs.count(addr) > 0; }

  bool insert(vaddr_t addr) { return m_addrs.insert(addr).second; }

  std::size_t size() const { return m_addrs.size(); }

  bool empty() const { return m_addrs.empty(); }

  iterator begin() const { return m_addrs.begin(); }

  iterator end() const { return m_addrs.end(); }

  // subset
  bool operator<=(const address_value &o) const;

  bool operator==(const address_value &o) const { return m_addrs == o.m_addrs; }

  bool operator!=(const address_value &o) const { return !operator==(o); }

  // union
  address_value operator|(const address_value &o) const;

  // intersection
  address_value operator&(const address_value &o) const;

  void operator|=(const address_value &o);

  void operator&=(const address_value &o);

  bool contain(const address_value &o) const { return o.operator<=(*this); }
  bool equals(const address_value &o) const { return operator==(o); }
  address_value join(const address_value &o) const { return operator|(o); }
  address_value meet(const address_value &o) const { return operator&(o); }

  void write(vfa_os &o) const;

  friend vfa_os &operator<<(vfa_os &o, const address_value &a) {
    a.write(o);
    return o;
  }
};

} // end namespace domains
} // end namespace vfa
