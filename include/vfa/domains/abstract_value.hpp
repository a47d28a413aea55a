#pragma once

/**
 * An abstract value is either an interval or a set of addresses.
 *
 * The active alternative is part of the value's identity: join, meet
 * and containment between values of different kinds raise
 * type_mismatch_error, and equality across kinds is false.
 **/

#include <vfa/domains/address_value.hpp>
#include <vfa/domains/interval.hpp>
#include <vfa/numbers/bignums.hpp>
#include <vfa/support/debug.hpp>
#include <vfa/support/os.hpp>

#include <boost/variant.hpp>

namespace vfa {
namespace domains {

class abstract_value {
public:
  using value_t = boost::variant<z_interval, address_value>;

private:
  value_t m_value;

  void check_same_kind(const abstract_value &o, const char *op) const;

public:
  static abstract_value create_interval(z_bound lb, z_bound ub);

  static abstract_value create_interval();

  static abstract_value create_address(address_value addrs);

  // top interval
  abstract_value();

  abstract_value(z_interval i);

  abstract_value(address_value a);

  abstract_value(const abstract_value &o) = default;
  abstract_value(abstract_value &&o) = default;
  abstract_value &operator=(const abstract_value &o) = default;
  abstract_value &operator=(abstract_value &&o) = default;

  bool is_interval() const { return m_value.which() == 0; }

  bool is_addr() const { return m_value.which() == 1; }

  const z_interval &get_interval() const;

  z_interval &get_interval();

  const address_value &get_address() const;

  address_value &get_address();

  // bottom interval or empty set of addresses
  bool is_uninformative() const;

  abstract_value join(const abstract_value &o) const;

  abstract_value meet(const abstract_value &o) const;

  void join_with(const abstract_value &o);

  void meet_with(const abstract_value &o);

  // *this includes o
  bool contain(const abstract_value &o) const;

  bool equals(const abstract_value &o) const;

  bool operator==(const abstract_value &o) const { return equals(o); }

  bool operator!=(const abstract_value &o) const { return !equals(o); }

  void write(vfa_os &o) const;

  friend vfa_os &operator<<(vfa_os &o, const abstract_value &v) {
    v.write(o);
    return o;
  }
};

} // end namespace domains
} // end namespace vfa
