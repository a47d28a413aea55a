#include "../common.hpp"
#include "../program_options.hpp"

using namespace vfa_tests;

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }

  { // virtual address encoding
    obj_id_t ids[] = {0, 1, 10, 123, 0xABCD, 0xFFFFFF};
    for (obj_id_t id : ids) {
      vaddr_t a = address_value::get_virtual_mem_address(id);
      VFA_CHECK(address_value::is_virtual_mem_address(a));
      VFA_CHECK(address_value::get_internal_id(a) == id);
      VFA_CHECK((a & address_value::ADDR_MASK) == address_value::ADDR_HIGH_BYTE);
    }
    VFA_CHECK(address_value::get_virtual_mem_address(0) == 0x7F000000u);
    VFA_CHECK(address_value::get_virtual_mem_address(123) == 0x7F00007Bu);
    // plain integers are not addresses and decode to themselves
    VFA_CHECK(!address_value::is_virtual_mem_address(42));
    VFA_CHECK(!address_value::is_virtual_mem_address(0x80000001u));
    VFA_CHECK(address_value::get_internal_id(42) == 42);
    // the id must fit in the 24 bits below the tag
    VFA_CHECK(raises<vfa_exception>([]() {
      (void)address_value::get_virtual_mem_address(0x1000000);
    }));
  }

  { // lattice operations
    address_value a{vaddr(1), vaddr(2), vaddr(3)};
    address_value b{vaddr(2), vaddr(3), vaddr(4)};
    address_value empty;

    VFA_CHECK(empty.empty());
    VFA_CHECK(a.size() == 3);
    VFA_CHECK(a.contains(vaddr(1)));
    VFA_CHECK(!a.contains(vaddr(4)));

    address_value j = a.join(b);
    VFA_CHECK(j.size() == 4);
    VFA_CHECK(j == (address_value{vaddr(1), vaddr(2), vaddr(3), vaddr(4)}));

    address_value m = a.meet(b);
    VFA_CHECK(m == (address_value{vaddr(2), vaddr(3)}));
    VFA_CHECK(a.meet(address_value{vaddr(9)}).empty());

    VFA_CHECK(j.contain(a));
    VFA_CHECK(!a.contain(b));
    VFA_CHECK(a.contain(empty));
    VFA_CHECK(empty <= empty);
    VFA_CHECK(m <= a && m <= b);
    VFA_CHECK(a.join(empty) == a);
    VFA_CHECK(a.meet(empty).empty());

    address_value c(a);
    VFA_CHECK(c.insert(vaddr(7)));
    VFA_CHECK(!c.insert(vaddr(7)));
    c |= b;
    VFA_CHECK(c.size() == 5);
    c &= a;
    VFA_CHECK(c == a);
    // copies do not share storage
    VFA_CHECK(a.size() == 3);

    vfa::outs() << a << " | " << b << " = " << j << "\n";
    vfa::outs() << a << " & " << b << " = " << m << "\n";
  }

  { // ordered iteration
    address_value a{vaddr(30), vaddr(10), vaddr(20)};
    vaddr_t prev = 0;
    unsigned n = 0;
    for (vaddr_t x : a) {
      VFA_CHECK(prev < x);
      prev = x;
      ++n;
    }
    VFA_CHECK(n == 3);
  }

  { // printing
    VFA_CHECK(str(address_value()) == "∅");
    VFA_CHECK(str(address_value{vaddr(20), vaddr(10)}) ==
              "{0x7f00000a, 0x7f000014}");
  }

  return report(stats_enabled);
}
