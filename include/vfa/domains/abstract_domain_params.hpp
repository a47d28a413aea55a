#pragma once

#include <vfa/support/debug.hpp>
#include <vfa/support/os.hpp>

#include <string>

namespace vfa {
namespace domains {

class vfa_domain_params;

class abstract_state_params {
  // warn when a store through the null object is dropped
  bool m_warn_null_store;
  // print the virtual address next to each object id
  bool m_print_virtual_addresses;

  friend class vfa_domain_params;

public:
  abstract_state_params()
      : m_warn_null_store(false), m_print_virtual_addresses(true) {}
  abstract_state_params(bool warn_null_store, bool print_virtual_addresses)
      : m_warn_null_store(warn_null_store),
        m_print_virtual_addresses(print_virtual_addresses) {}

  bool state_warn_null_store() const { return m_warn_null_store; }
  bool state_print_virtual_addresses() const {
    return m_print_virtual_addresses;
  }
  void update_params(const abstract_state_params &p);
  void write(vfa_os &o) const;
};

class vfa_domain_params : public abstract_state_params {
public:
  vfa_domain_params() : abstract_state_params() {}

  /* Set a parameter from its textual form:
     - state.warn_null_store: bool
     - state.print_virtual_addresses: bool
     - state.sanity_checks: bool
   */
  void set_param(const std::string &param, const std::string &val);
  void update_params(const vfa_domain_params &p);
  void write(vfa_os &o) const;
};

class vfa_domain_params_man {
public:
  static vfa_domain_params &get() {
    static vfa_domain_params m_params;
    return m_params;
  }
};

} // end namespace domains
} // end namespace vfa
