#pragma once

/*******************************************************************************
 * Abstract state of the value-flow analysis.
 *
 * The state keeps two independent stores: one from variables to
 * abstract values and one from memory objects to abstract values.
 * Memory objects are reached through virtual addresses (see
 * address_value).
 *
 * A missing key does not mean the same thing for every operation:
 *  - get and load return a top interval,
 *  - join, widening and narrowing copy the binding of the side that
 *    has it,
 *  - meet and containment treat it as bottom.
 ******************************************************************************/

#include <vfa/domains/abstract_value.hpp>
#include <vfa/domains/address_value.hpp>
#include <vfa/domains/interval.hpp>
#include <vfa/domains/separate_store.hpp>
#include <vfa/support/debug.hpp>
#include <vfa/support/os.hpp>

#include <boost/container/flat_set.hpp>

#include <cstdint>

namespace vfa {
namespace domains {

using var_id_t = uint32_t;

class abstract_state {
public:
  using abstract_state_t = abstract_state;
  using var_store_t = separate_store<var_id_t, abstract_value>;
  using obj_store_t = separate_store<obj_id_t, abstract_value>;
  using var_id_set_t = boost::container::flat_set<var_id_t>;

private:
  var_store_t m_var_to_val;
  obj_store_t m_obj_to_val;

  abstract_state(var_store_t &&vars, obj_store_t &&objs)
      : m_var_to_val(std::move(vars)), m_obj_to_val(std::move(objs)) {}

  static obj_id_t check_virtual_address(vaddr_t addr, const char *op);

  // Every binding of *this is bound in o to a value above it.
  bool below(const abstract_state_t &o) const;
  // Every key bound in both *this and o is bound here to a value below o's.
  bool below_on_shared(const abstract_state_t &o) const;
  bool has_uninformative() const;
  // With sanity checks on, raise vfa_exception if holds is false.
  static void sanity_check(const char *op, bool holds);

public:
  abstract_state() {}
  abstract_state(const abstract_state_t &o) = default;
  abstract_state(abstract_state_t &&o) = default;
  abstract_state_t &operator=(const abstract_state_t &o) = default;
  abstract_state_t &operator=(abstract_state_t &&o) = default;

  /* Variable store */

  // Value of var, or a top interval if var is not bound.
  abstract_value get(var_id_t var) const;

  abstract_value operator[](var_id_t var) const { return get(var); }

  abstract_value load_value(var_id_t var) const { return get(var); }

  void assign(var_id_t var, abstract_value v);

  /* Memory */

  // Raise invalid_address_error if addr is not a virtual
  // address. Stores through the null object are dropped.
  void store(vaddr_t addr, abstract_value v);

  // Raise invalid_address_error if addr is not a virtual address.
  abstract_value load(vaddr_t addr) const;

  // Join of the values stored at every address ptr may point to.
  abstract_value load_through(var_id_t ptr) const;

  // Store v at every address ptr may point to.
  void store_through(var_id_t ptr, const abstract_value &v);

  // Addresses reached by adding offset to the addresses of pointer.
  address_value get_gep_obj_addrs(var_id_t pointer,
                                  const z_interval &offset) const;

  /* Table queries */

  bool in_var_to_val_table(var_id_t id) const;
  bool in_var_to_addrs_table(var_id_t id) const;
  bool in_addr_to_val_table(obj_id_t id) const;
  bool in_addr_to_addrs_table(obj_id_t id) const;

  const var_store_t &get_var_to_val() const { return m_var_to_val; }
  const obj_store_t &get_loc_to_val() const { return m_obj_to_val; }

  /* Lattice operations */

  void join_with(const abstract_state_t &o);

  void meet_with(const abstract_state_t &o);

  abstract_state_t operator|(const abstract_state_t &o) const;

  abstract_state_t operator&(const abstract_state_t &o) const;

  abstract_state_t widening(const abstract_state_t &o) const;

  abstract_state_t narrowing(const abstract_state_t &o) const;

  abstract_state_t operator||(const abstract_state_t &o) const {
    return widening(o);
  }

  abstract_state_t operator&&(const abstract_state_t &o) const {
    return narrowing(o);
  }

  // *this includes o
  bool contain(const abstract_state_t &o) const;

  bool operator>=(const abstract_state_t &o) const { return contain(o); }

  bool operator<(const abstract_state_t &o) const { return !contain(o); }

  bool equals(const abstract_state_t &o) const;

  bool operator==(const abstract_state_t &o) const { return equals(o); }

  bool operator!=(const abstract_state_t &o) const { return !equals(o); }

  // Copy where every interval bound to a variable is bottom.
  abstract_state_t bottom() const;

  // Copy where every interval bound to a variable is top.
  abstract_state_t top() const;

  // Copy of the variable bindings whose key is in vars.
  abstract_state_t slice_state(const var_id_set_t &vars) const;

  void clear();

  std::size_t hash() const;

  void write(vfa_os &o) const;

  friend vfa_os &operator<<(vfa_os &o, const abstract_state_t &s) {
    s.write(o);
    return o;
  }
};

inline std::size_t hash_value(const abstract_state &s) { return s.hash(); }

} // end namespace domains
} // end namespace vfa
