#ifndef __TESTS_COMMON__
#define __TESTS_COMMON__

/* To be included by all the tests */

#include <vfa/config.h>
#include <vfa/domains/abstract_state.hpp>
#include <vfa/domains/abstract_value.hpp>
#include <vfa/domains/address_value.hpp>
#include <vfa/domains/interval.hpp>
#include <vfa/numbers/bignums.hpp>
#include <vfa/support/debug.hpp>
#include <vfa/support/os.hpp>
#include <vfa/support/stats.hpp>

#include <cstdint>
#include <sstream>
#include <string>

namespace vfa_tests {

using namespace vfa;
using namespace vfa::domains;

inline unsigned &num_failures() {
  static unsigned n = 0;
  return n;
}

inline void check(bool cond, const char *what, const char *file, int line) {
  if (!cond) {
    ++num_failures();
    vfa::errs() << file << ":" << line << ": check failed: " << what << "\n";
  }
}

// Return true if f raises an exception of type Exc.
template <typename Exc, typename Fn> bool raises(Fn f) {
  try {
    f();
  } catch (const Exc &e) {
    VFA_VERBOSE_IF(1, vfa::outs() << "Caught: " << e.what() << "\n";);
    return true;
  }
  return false;
}

// Print v into a string.
template <typename T> std::string str(const T &v) {
  std::ostringstream s;
  vfa_os o(s);
  o << v;
  return s.str();
}

inline z_interval itv(int64_t lb, int64_t ub) {
  return z_interval(z_bound(lb), z_bound(ub));
}

inline z_interval itv_from(int64_t lb) {
  return z_interval(z_bound(lb), z_bound::plus_infinity());
}

inline z_interval itv_upto(int64_t ub) {
  return z_interval(z_bound::minus_infinity(), z_bound(ub));
}

inline abstract_value ival(int64_t lb, int64_t ub) {
  return abstract_value::create_interval(z_bound(lb), z_bound(ub));
}

inline vaddr_t vaddr(obj_id_t id) {
  return address_value::get_virtual_mem_address(id);
}

inline int report(bool stats_enabled) {
  if (stats_enabled) {
    vfa::VfaStats::Print(vfa::outs());
    vfa::VfaStats::reset();
  }
  if (num_failures() > 0) {
    vfa::errs() << num_failures() << " check(s) failed\n";
    return 1;
  }
  return 0;
}

} // namespace vfa_tests

#define VFA_CHECK(COND) ::vfa_tests::check((COND), #COND, __FILE__, __LINE__)

#endif
