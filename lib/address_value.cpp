#include <vfa/domains/address_value.hpp>
#include <vfa/support/debug.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace vfa {
namespace domains {

const vaddr_t address_value::ADDR_HIGH_BYTE;
const vaddr_t address_value::ADDR_MASK;
const obj_id_t address_value::MAX_OBJ_ID;
const obj_id_t address_value::NULL_OBJ_ID;

vaddr_t address_value::get_virtual_mem_address(obj_id_t id) {
  if (id > MAX_OBJ_ID) {
    VFA_ERROR("object id ", id, " does not fit in the virtual address space");
  }
  return ADDR_HIGH_BYTE | id;
}

bool address_value::is_virtual_mem_address(vaddr_t val) {
  return (val & ADDR_MASK) == ADDR_HIGH_BYTE;
}

obj_id_t address_value::get_internal_id(vaddr_t val) {
  if (is_virtual_mem_address(val)) {
    return val & ~ADDR_MASK;
  }
  return val;
}

bool address_value::operator<=(const address_value &o) const {
  if (size() > o.size()) {
    return false;
  }
  return std::includes(o.m_addrs.begin(), o.m_addrs.end(), m_addrs.begin(),
                       m_addrs.end());
}

address_value address_value::operator|(const address_value &o) const {
  addr_set_t res;
  res.reserve(size() + o.size());
  std::set_union(m_addrs.begin(), m_addrs.end(), o.m_addrs.begin(),
                 o.m_addrs.end(), std::inserter(res, res.end()));
  return address_value(std::move(res));
}

address_value address_value::operator&(const address_value &o) const {
  addr_set_t res;
  std::set_intersection(m_addrs.begin(), m_addrs.end(), o.m_addrs.begin(),
                        o.m_addrs.end(), std::inserter(res, res.end()));
  return address_value(std::move(res));
}

void address_value::operator|=(const address_value &o) {
  m_addrs.insert(o.m_addrs.begin(), o.m_addrs.end());
}

void address_value::operator&=(const address_value &o) {
  *this = operator&(o);
}

void address_value::write(vfa_os &o) const {
  if (empty()) {
    o << "∅";
    return;
  }
  std::ostringstream s;
  s << "{";
  for (auto it = m_addrs.begin(), et = m_addrs.end(); it != et;) {
    s << "0x" << std::hex << *it;
    ++it;
    if (it != et) {
      s << ", ";
    }
  }
  s << "}";
  o << s.str();
}

} // end namespace domains
} // end namespace vfa
