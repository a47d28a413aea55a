#include <vfa/domains/abstract_value.hpp>
#include <vfa/support/debug.hpp>

namespace vfa {
namespace domains {

namespace abstract_value_impl {
const char *kind_name(const abstract_value &v) {
  return v.is_interval() ? "interval" : "address";
}

class write_visitor : public boost::static_visitor<> {
  vfa_os &m_o;

public:
  write_visitor(vfa_os &o) : m_o(o) {}

  void operator()(const z_interval &i) const { m_o << i; }

  void operator()(const address_value &a) const { m_o << a; }
};
} // namespace abstract_value_impl

abstract_value abstract_value::create_interval(z_bound lb, z_bound ub) {
  return abstract_value(z_interval(lb, ub));
}

abstract_value abstract_value::create_interval() {
  return abstract_value(z_interval::top());
}

abstract_value abstract_value::create_address(address_value addrs) {
  return abstract_value(std::move(addrs));
}

abstract_value::abstract_value() : m_value(z_interval::top()) {}

abstract_value::abstract_value(z_interval i) : m_value(std::move(i)) {}

abstract_value::abstract_value(address_value a) : m_value(std::move(a)) {}

void abstract_value::check_same_kind(const abstract_value &o,
                                     const char *op) const {
  if (m_value.which() != o.m_value.which()) {
    VFA_LOG("abs-value", vfa::outs() << op << " between " << *this << " and "
                                     << o << "\n";);
    VFA_THROW(type_mismatch_error, op, " between ",
              abstract_value_impl::kind_name(*this), " and ",
              abstract_value_impl::kind_name(o), " values");
  }
}

const z_interval &abstract_value::get_interval() const {
  if (const z_interval *i = boost::get<z_interval>(&m_value)) {
    return *i;
  }
  VFA_THROW(type_mismatch_error, "abstract value is not an interval");
}

z_interval &abstract_value::get_interval() {
  if (z_interval *i = boost::get<z_interval>(&m_value)) {
    return *i;
  }
  VFA_THROW(type_mismatch_error, "abstract value is not an interval");
}

const address_value &abstract_value::get_address() const {
  if (const address_value *a = boost::get<address_value>(&m_value)) {
    return *a;
  }
  VFA_THROW(type_mismatch_error, "abstract value is not an address");
}

address_value &abstract_value::get_address() {
  if (address_value *a = boost::get<address_value>(&m_value)) {
    return *a;
  }
  VFA_THROW(type_mismatch_error, "abstract value is not an address");
}

bool abstract_value::is_uninformative() const {
  if (is_interval()) {
    return get_interval().is_bottom();
  } else {
    return get_address().empty();
  }
}

abstract_value abstract_value::join(const abstract_value &o) const {
  check_same_kind(o, "join");
  if (is_interval()) {
    return abstract_value(get_interval() | o.get_interval());
  } else {
    return abstract_value(get_address() | o.get_address());
  }
}

abstract_value abstract_value::meet(const abstract_value &o) const {
  check_same_kind(o, "meet");
  if (is_interval()) {
    return abstract_value(get_interval() & o.get_interval());
  } else {
    return abstract_value(get_address() & o.get_address());
  }
}

void abstract_value::join_with(const abstract_value &o) {
  check_same_kind(o, "join");
  if (is_interval()) {
    get_interval() = get_interval() | o.get_interval();
  } else {
    get_address() |= o.get_address();
  }
}

void abstract_value::meet_with(const abstract_value &o) {
  check_same_kind(o, "meet");
  if (is_interval()) {
    get_interval() = get_interval() & o.get_interval();
  } else {
    get_address() &= o.get_address();
  }
}

bool abstract_value::contain(const abstract_value &o) const {
  check_same_kind(o, "containment");
  if (is_interval()) {
    return get_interval().contain(o.get_interval());
  } else {
    return get_address().contain(o.get_address());
  }
}

bool abstract_value::equals(const abstract_value &o) const {
  if (m_value.which() != o.m_value.which()) {
    return false;
  }
  if (is_interval()) {
    return get_interval() == o.get_interval();
  } else {
    return get_address() == o.get_address();
  }
}

void abstract_value::write(vfa_os &o) const {
  boost::apply_visitor(abstract_value_impl::write_visitor(o), m_value);
}

} // end namespace domains
} // end namespace vfa
