#include "../common.hpp"
#include "../program_options.hpp"

#include <vfa/domains/object_model.hpp>

#include <map>

using namespace vfa_tests;

// Layout of a toy program: each gep statement accesses a fixed element.
class toy_object_model : public object_model {
  std::map<gep_id_t, z_interval> m_indexes;

public:
  void add_gep(gep_id_t gep, z_interval index) {
    m_indexes.insert({gep, index});
  }

  z_interval element_index(gep_id_t gep) const override {
    auto it = m_indexes.find(gep);
    if (it == m_indexes.end()) {
      return z_interval::top();
    }
    return it->second;
  }

  z_interval byte_offset(gep_id_t gep) const override {
    z_interval idx = element_index(gep);
    return z_interval(idx.lb() + idx.lb() + idx.lb() + idx.lb(),
                      idx.ub() + idx.ub() + idx.ub() + idx.ub());
  }

  uint64_t alloca_byte_size(obj_id_t /*obj*/) const override { return 8; }

  boost::optional<obj_id_t> pointee_element(obj_id_t /*obj*/) const override {
    return boost::none;
  }
};

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }

  abstract_state s;
  s.assign(1, abstract_value::create_address(address_value{10, 20}));
  s.assign(2, ival(0, 0));
  s.assign(3, abstract_value::create_address(address_value{0xFFFFFFFFu}));
  s.assign(4, abstract_value::create_address(address_value{vaddr(5)}));

  { // constant offsets move every address
    address_value r = s.get_gep_obj_addrs(1, itv(5, 5));
    VFA_CHECK(r == (address_value{15, 25}));
    VFA_CHECK(s.get_gep_obj_addrs(1, itv(0, 0)) == (address_value{10, 20}));
    VFA_CHECK(s.get_gep_obj_addrs(1, itv(-10, -10)) == (address_value{0, 10}));
    VFA_CHECK(s.get_gep_obj_addrs(4, itv(2, 2)) == address_value{vaddr(7)});
    vfa::outs() << s.get(1) << " + 5 = " << r << "\n";
  }

  { // other offsets keep the base addresses
    VFA_CHECK(s.get_gep_obj_addrs(1, itv(0, 10)) == (address_value{10, 20}));
    VFA_CHECK(s.get_gep_obj_addrs(1, z_interval::top()) ==
              (address_value{10, 20}));
    VFA_CHECK(s.get_gep_obj_addrs(1, itv_from(3)) == (address_value{10, 20}));
    VFA_CHECK(s.get_gep_obj_addrs(1, z_interval::bottom()) ==
              (address_value{10, 20}));
  }

  { // pointers without addresses
    VFA_CHECK(s.get_gep_obj_addrs(2, itv(5, 5)).empty());
    VFA_CHECK(s.get_gep_obj_addrs(99, itv(5, 5)).empty());
  }

  { // results outside the address space
    VFA_CHECK(raises<vfa_exception>(
        [&]() { (void)s.get_gep_obj_addrs(3, itv(1, 1)); }));
    VFA_CHECK(raises<vfa_exception>(
        [&]() { (void)s.get_gep_obj_addrs(1, itv(-11, -11)); }));
  }

  { // offsets supplied by the object model
    toy_object_model model;
    model.add_gep(100, itv(5, 5));
    model.add_gep(101, itv(0, 3));
    VFA_CHECK(gep_obj_addrs(s, model, 1, 100) == (address_value{15, 25}));
    VFA_CHECK(gep_obj_addrs(s, model, 1, 101) == (address_value{10, 20}));
    VFA_CHECK(gep_obj_addrs(s, model, 1, 102) == (address_value{10, 20}));
    VFA_CHECK(model.byte_offset(100) == itv(20, 20));
    VFA_CHECK(model.alloca_byte_size(1) == 8);
    VFA_CHECK(!model.pointee_element(1));
  }

  return report(stats_enabled);
}
