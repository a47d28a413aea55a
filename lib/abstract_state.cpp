#include <vfa/domains/abstract_domain_params.hpp>
#include <vfa/domains/abstract_state.hpp>
#include <vfa/support/debug.hpp>
#include <vfa/support/stats.hpp>

#include <boost/functional/hash.hpp>

#include <cstdint>
#include <sstream>

namespace vfa {
namespace domains {

namespace abstract_state_impl {

using value_op_t = separate_store<uint32_t, abstract_value>::binary_op;
using value_po_t = separate_store<uint32_t, abstract_value>::partial_order;

class join_op : public value_op_t {
  boost::optional<abstract_value> apply(const uint32_t & /*key*/,
                                        const abstract_value &x,
                                        const abstract_value &y) override {
    return x.join(y);
  }

  bool keep_unmatched() override { return true; }
}; // class join_op

class meet_op : public value_op_t {
  boost::optional<abstract_value> apply(const uint32_t & /*key*/,
                                        const abstract_value &x,
                                        const abstract_value &y) override {
    abstract_value z = x.meet(y);
    if (z.is_uninformative()) {
      return boost::none;
    }
    return z;
  }

  bool keep_unmatched() override { return false; }
}; // class meet_op

// Sets of addresses have no widening: the join is used instead.
class widening_op : public value_op_t {
  boost::optional<abstract_value> apply(const uint32_t & /*key*/,
                                        const abstract_value &x,
                                        const abstract_value &y) override {
    if (x.is_interval() && y.is_interval()) {
      return abstract_value(x.get_interval() || y.get_interval());
    } else if (x.is_addr() && y.is_addr()) {
      return abstract_value(x.get_address() | y.get_address());
    }
    VFA_THROW(type_mismatch_error, "widening between an interval and an address");
  }

  bool keep_unmatched() override { return true; }
}; // class widening_op

// Sets of addresses have no narrowing: the meet is used instead.
class narrowing_op : public value_op_t {
  boost::optional<abstract_value> apply(const uint32_t & /*key*/,
                                        const abstract_value &x,
                                        const abstract_value &y) override {
    if (x.is_interval() && y.is_interval()) {
      return abstract_value(x.get_interval() && y.get_interval());
    } else if (x.is_addr() && y.is_addr()) {
      return abstract_value(x.get_address() & y.get_address());
    }
    VFA_THROW(type_mismatch_error,
              "narrowing between an interval and an address");
  }

  bool keep_unmatched() override { return true; }
}; // class narrowing_op

// Values of different kinds are never ordered.
class value_po : public value_po_t {
  bool leq(const abstract_value &x, const abstract_value &y) override {
    if (x.is_interval() && y.is_interval()) {
      return x.get_interval() <= y.get_interval();
    } else if (x.is_addr() && y.is_addr()) {
      return x.get_address() <= y.get_address();
    }
    return false;
  }
}; // class value_po

template <typename Store> bool has_uninformative(const Store &s) {
  for (auto const &kv : s) {
    if (kv.second.is_uninformative()) {
      return true;
    }
  }
  return false;
}

template <typename Store> bool below_on_shared(const Store &x, const Store &y) {
  value_po po;
  value_po_t &order = po;
  for (auto const &kv : x) {
    const abstract_value *v = y.find(kv.first);
    if (v && !order.leq(kv.second, *v)) {
      return false;
    }
  }
  return true;
}

template <typename Store> void hash_keys(std::size_t &res, const Store &s) {
  for (auto const &kv : s) {
    boost::hash_combine(res, kv.first);
  }
}
} // namespace abstract_state_impl

obj_id_t abstract_state::check_virtual_address(vaddr_t addr, const char *op) {
  if (!address_value::is_virtual_mem_address(addr)) {
    VFA_THROW(invalid_address_error, op, ": ", addr,
              " is not a virtual memory address");
  }
  return address_value::get_internal_id(addr);
}

bool abstract_state::below(const abstract_state &o) const {
  abstract_state_impl::value_po po;
  return m_var_to_val.leq(o.m_var_to_val, po) &&
         m_obj_to_val.leq(o.m_obj_to_val, po);
}

bool abstract_state::below_on_shared(const abstract_state &o) const {
  return abstract_state_impl::below_on_shared(m_var_to_val, o.m_var_to_val) &&
         abstract_state_impl::below_on_shared(m_obj_to_val, o.m_obj_to_val);
}

bool abstract_state::has_uninformative() const {
  return abstract_state_impl::has_uninformative(m_var_to_val) ||
         abstract_state_impl::has_uninformative(m_obj_to_val);
}

void abstract_state::sanity_check(const char *op, bool holds) {
  if (!holds) {
    VFA_ERROR("abstract state: result of ", op, " fails its sanity check");
  }
}

abstract_value abstract_state::get(var_id_t var) const {
  if (const abstract_value *v = m_var_to_val.find(var)) {
    return *v;
  }
  return abstract_value::create_interval();
}

void abstract_state::assign(var_id_t var, abstract_value v) {
  m_var_to_val.set(var, std::move(v));
}

void abstract_state::store(vaddr_t addr, abstract_value v) {
  obj_id_t obj = check_virtual_address(addr, "store");
  if (obj == address_value::NULL_OBJ_ID) {
    if (vfa_domain_params_man::get().state_warn_null_store()) {
      VFA_WARN("store through the null object is ignored");
    }
    return;
  }
  m_obj_to_val.set(obj, std::move(v));
}

abstract_value abstract_state::load(vaddr_t addr) const {
  obj_id_t obj = check_virtual_address(addr, "load");
  if (const abstract_value *v = m_obj_to_val.find(obj)) {
    return *v;
  }
  return abstract_value::create_interval();
}

abstract_value abstract_state::load_through(var_id_t ptr) const {
  if (!in_var_to_addrs_table(ptr)) {
    return abstract_value::create_interval();
  }
  const address_value &addrs = m_var_to_val.find(ptr)->get_address();
  if (addrs.empty()) {
    return abstract_value::create_interval();
  }
  auto it = addrs.begin();
  abstract_value res = load(*it);
  for (++it; it != addrs.end(); ++it) {
    res.join_with(load(*it));
  }
  return res;
}

void abstract_state::store_through(var_id_t ptr, const abstract_value &v) {
  if (!in_var_to_addrs_table(ptr)) {
    return;
  }
  // copy: ptr may be rebound if a store hits its own object
  address_value addrs = m_var_to_val.find(ptr)->get_address();
  for (vaddr_t a : addrs) {
    store(a, v);
  }
}

address_value abstract_state::get_gep_obj_addrs(var_id_t pointer,
                                                const z_interval &offset) const {
  if (!in_var_to_addrs_table(pointer)) {
    return address_value();
  }
  const address_value &base = m_var_to_val.find(pointer)->get_address();
  boost::optional<z_number> c = offset.singleton();
  if (!c) {
    // non-constant offset: keep the base addresses
    return base;
  }
  const z_number max_addr(static_cast<int64_t>(UINT32_MAX));
  address_value res;
  for (vaddr_t a : base) {
    z_number n = z_number(static_cast<int64_t>(a)) + *c;
    if (n < 0 || n > max_addr) {
      VFA_ERROR("gep: address ", a, " plus offset ", c->get_str(),
                " is out of the address space");
    }
    res.insert(static_cast<vaddr_t>(static_cast<int64_t>(n)));
  }
  return res;
}

bool abstract_state::in_var_to_val_table(var_id_t id) const {
  const abstract_value *v = m_var_to_val.find(id);
  return v && v->is_interval();
}

bool abstract_state::in_var_to_addrs_table(var_id_t id) const {
  const abstract_value *v = m_var_to_val.find(id);
  return v && v->is_addr();
}

bool abstract_state::in_addr_to_val_table(obj_id_t id) const {
  const abstract_value *v = m_obj_to_val.find(id);
  return v && v->is_interval();
}

bool abstract_state::in_addr_to_addrs_table(obj_id_t id) const {
  const abstract_value *v = m_obj_to_val.find(id);
  return v && v->is_addr();
}

void abstract_state::join_with(const abstract_state &o) {
  VFA_SCOPED_STATS("abs_state.join", 1);
  VFA_LOG("abs-state",
          vfa::outs() << "Join " << *this << " and\n" << o << "\n";);
  abstract_state_impl::join_op op;
  abstract_state res(m_var_to_val.apply_operation(op, o.m_var_to_val),
                     m_obj_to_val.apply_operation(op, o.m_obj_to_val));
  if (VfaSanityCheckFlag) {
    // upper bound of both operands
    sanity_check("join", below(res) && o.below(res));
  }
  *this = std::move(res);
  VFA_LOG("abs-state", vfa::outs() << "Result=" << *this << "\n";);
}

void abstract_state::meet_with(const abstract_state &o) {
  VFA_SCOPED_STATS("abs_state.meet", 1);
  VFA_LOG("abs-state",
          vfa::outs() << "Meet " << *this << " and\n" << o << "\n";);
  abstract_state_impl::meet_op op;
  abstract_state res(m_var_to_val.apply_operation(op, o.m_var_to_val),
                     m_obj_to_val.apply_operation(op, o.m_obj_to_val));
  if (VfaSanityCheckFlag) {
    // lower bound of both operands, with no bottom or empty binding
    sanity_check("meet", res.below(*this) && res.below(o) &&
                             !res.has_uninformative());
  }
  *this = std::move(res);
  VFA_LOG("abs-state", vfa::outs() << "Result=" << *this << "\n";);
}

abstract_state abstract_state::operator|(const abstract_state &o) const {
  abstract_state res(*this);
  res.join_with(o);
  return res;
}

abstract_state abstract_state::operator&(const abstract_state &o) const {
  abstract_state res(*this);
  res.meet_with(o);
  return res;
}

abstract_state abstract_state::widening(const abstract_state &o) const {
  VFA_SCOPED_STATS("abs_state.widening", 1);
  VFA_LOG("abs-state",
          vfa::outs() << "Widening " << *this << " and\n" << o << "\n";);
  abstract_state_impl::widening_op op;
  abstract_state res(m_var_to_val.apply_operation(op, o.m_var_to_val),
                     m_obj_to_val.apply_operation(op, o.m_obj_to_val));
  if (VfaSanityCheckFlag) {
    sanity_check("widening", below(res) && o.below(res));
  }
  VFA_LOG("abs-state", vfa::outs() << "Result=" << res << "\n";);
  return res;
}

abstract_state abstract_state::narrowing(const abstract_state &o) const {
  VFA_SCOPED_STATS("abs_state.narrowing", 1);
  VFA_LOG("abs-state",
          vfa::outs() << "Narrowing " << *this << " and\n" << o << "\n";);
  abstract_state_impl::narrowing_op op;
  abstract_state res(m_var_to_val.apply_operation(op, o.m_var_to_val),
                     m_obj_to_val.apply_operation(op, o.m_obj_to_val));
  if (VfaSanityCheckFlag) {
    // never above the receiver where both are bound
    sanity_check("narrowing", res.below_on_shared(*this));
  }
  VFA_LOG("abs-state", vfa::outs() << "Result=" << res << "\n";);
  return res;
}

bool abstract_state::contain(const abstract_state &o) const {
  VFA_SCOPED_STATS("abs_state.leq", 1);
  abstract_state_impl::value_po po;
  return o.m_var_to_val.leq(m_var_to_val, po) &&
         o.m_obj_to_val.leq(m_obj_to_val, po);
}

bool abstract_state::equals(const abstract_state &o) const {
  return m_var_to_val == o.m_var_to_val && m_obj_to_val == o.m_obj_to_val;
}

abstract_state abstract_state::bottom() const {
  abstract_state res(*this);
  res.m_var_to_val.transform([](abstract_value &v) {
    if (v.is_interval()) {
      v.get_interval().set_to_bottom();
    }
  });
  return res;
}

abstract_state abstract_state::top() const {
  abstract_state res(*this);
  res.m_var_to_val.transform([](abstract_value &v) {
    if (v.is_interval()) {
      v.get_interval().set_to_top();
    }
  });
  return res;
}

abstract_state abstract_state::slice_state(const var_id_set_t &vars) const {
  return abstract_state(m_var_to_val.project(vars.begin(), vars.end()),
                        obj_store_t());
}

void abstract_state::clear() {
  m_var_to_val.clear();
  m_obj_to_val.clear();
}

std::size_t abstract_state::hash() const {
  std::size_t res = 0;
  abstract_state_impl::hash_keys(res, m_var_to_val);
  boost::hash_combine(res, m_var_to_val.size());
  abstract_state_impl::hash_keys(res, m_obj_to_val);
  return res;
}

void abstract_state::write(vfa_os &o) const {
  const bool print_addrs =
      vfa_domain_params_man::get().state_print_virtual_addresses();
  o << "Variable to Abstract Value Map:\n";
  for (auto const &kv : m_var_to_val) {
    o << "  " << kv.first << ": " << kv.second << "\n";
  }
  o << "Address to Abstract Value Map:\n";
  for (auto const &kv : m_obj_to_val) {
    o << "  " << kv.first;
    if (print_addrs) {
      std::ostringstream s;
      s << std::hex << address_value::get_virtual_mem_address(kv.first);
      o << " (0x" << s.str() << ")";
    }
    o << ": " << kv.second << "\n";
  }
}

} // end namespace domains
} // end namespace vfa
