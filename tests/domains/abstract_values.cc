#include "../common.hpp"
#include "../program_options.hpp"

using namespace vfa_tests;

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }

  { // construction and kinds
    abstract_value d;
    VFA_CHECK(d.is_interval());
    VFA_CHECK(d.get_interval().is_top());
    VFA_CHECK(abstract_value::create_interval().get_interval().is_top());

    abstract_value i = ival(1, 5);
    VFA_CHECK(i.is_interval() && !i.is_addr());
    VFA_CHECK(i.get_interval() == itv(1, 5));

    abstract_value a =
        abstract_value::create_address(address_value{vaddr(1), vaddr(2)});
    VFA_CHECK(a.is_addr() && !a.is_interval());
    VFA_CHECK(a.get_address().size() == 2);

    VFA_CHECK(raises<type_mismatch_error>([&]() { (void)i.get_address(); }));
    VFA_CHECK(raises<type_mismatch_error>([&]() { (void)a.get_interval(); }));
  }

  { // join and meet on intervals
    abstract_value x = ival(1, 5);
    abstract_value y = ival(3, 10);
    VFA_CHECK(x.join(y) == ival(1, 10));
    VFA_CHECK(x.meet(y) == ival(3, 5));
    abstract_value z(x);
    z.join_with(y);
    VFA_CHECK(z == ival(1, 10));
    z.meet_with(ival(20, 30));
    VFA_CHECK(z.is_uninformative());
    // x is left untouched by the copy
    VFA_CHECK(x == ival(1, 5));
  }

  { // join and meet on addresses
    abstract_value x =
        abstract_value::create_address(address_value{vaddr(1), vaddr(2)});
    abstract_value y =
        abstract_value::create_address(address_value{vaddr(2), vaddr(3)});
    VFA_CHECK(x.join(y).get_address().size() == 3);
    VFA_CHECK(x.meet(y).get_address() == address_value{vaddr(2)});
    VFA_CHECK(x.contain(x.meet(y)));
    VFA_CHECK(!x.contain(y));
    abstract_value z(x);
    z.meet_with(abstract_value::create_address(address_value{vaddr(9)}));
    VFA_CHECK(z.is_uninformative());
    VFA_CHECK(!x.is_uninformative());
  }

  { // values of different kinds
    abstract_value i = ival(0, 0);
    abstract_value a = abstract_value::create_address(address_value{vaddr(0)});
    VFA_CHECK(raises<type_mismatch_error>([&]() { (void)i.join(a); }));
    VFA_CHECK(raises<type_mismatch_error>([&]() { (void)a.meet(i); }));
    VFA_CHECK(raises<type_mismatch_error>([&]() { i.join_with(a); }));
    VFA_CHECK(raises<type_mismatch_error>([&]() { (void)i.contain(a); }));
    VFA_CHECK(!i.equals(a));
    VFA_CHECK(i != a);
    // the failed operations did not modify i
    VFA_CHECK(i == ival(0, 0));
    // an empty set of addresses and a bottom interval are different values
    abstract_value no_addr = abstract_value::create_address(address_value());
    abstract_value bot = abstract_value(z_interval::bottom());
    VFA_CHECK(no_addr.is_uninformative() && bot.is_uninformative());
    VFA_CHECK(!no_addr.equals(bot));
  }

  { // printing
    VFA_CHECK(str(ival(1, 5)) == "[1, 5]");
    VFA_CHECK(str(abstract_value()) == "[-∞, +∞]");
    VFA_CHECK(str(abstract_value::create_address(address_value{vaddr(10)})) ==
              "{0x7f00000a}");
    vfa::outs() << ival(1, 5) << " "
                << abstract_value::create_address(address_value{vaddr(10)})
                << "\n";
  }

  return report(stats_enabled);
}
