#include <vfa/domains/abstract_domain_params.hpp>

#include <string>

namespace vfa {
namespace domains {

void abstract_state_params::update_params(const abstract_state_params &p) {
  m_warn_null_store = p.state_warn_null_store();
  m_print_virtual_addresses = p.state_print_virtual_addresses();
}

void abstract_state_params::write(vfa_os &o) const {
  o << "Abstract state parameters:\n";
  o << "\twarn_null_store=" << m_warn_null_store << "\n";
  o << "\tprint_virtual_addresses=" << m_print_virtual_addresses << "\n";
  o << "\tsanity_checks=" << VfaSanityCheckFlag << "\n";
}

void vfa_domain_params::update_params(const vfa_domain_params &p) {
  abstract_state_params s_p(p.state_warn_null_store(),
                            p.state_print_virtual_addresses());
  abstract_state_params::update_params(s_p);
}

static bool to_bool(const std::string &val) {
  if (val == "true") {
    return true;
  } else if (val == "false") {
    return false;
  } else {
    VFA_ERROR("parameter value ", val,
              " cannot be converted to \"true\" or \"false\"");
  }
}

void vfa_domain_params::set_param(const std::string &param,
                                  const std::string &val) {
  if (param == "state.warn_null_store") {
    abstract_state_params::m_warn_null_store = to_bool(val);
  } else if (param == "state.print_virtual_addresses") {
    abstract_state_params::m_print_virtual_addresses = to_bool(val);
  } else if (param == "state.sanity_checks") {
    VfaEnableSanityChecks(to_bool(val));
  } else {
    VFA_WARN("Ignored unsupported parameter ", param);
  }
}

void vfa_domain_params::write(vfa_os &o) const {
  abstract_state_params::write(o);
}

} // end namespace domains
} // end namespace vfa
