#include "../common.hpp"
#include "../program_options.hpp"

using namespace vfa_tests;

/*
  Fixpoint of the loop head of:

    i := 0;
    p := &a;
    while (i <= 99) {
      *p := i;
      i := i + 1;
      if (*) p := &b;
    }

  with widening followed by narrowing. Variables: i=1, p=2.
  Objects: a=1, b=2.
 */

static const var_id_t VAR_I = 1;
static const var_id_t VAR_P = 2;

static abstract_state entry() {
  abstract_state s;
  s.assign(VAR_I, ival(0, 0));
  s.assign(VAR_P, abstract_value::create_address(address_value{vaddr(1)}));
  return s;
}

static abstract_state loop_body(abstract_state s) {
  abstract_state guard;
  guard.assign(VAR_I, abstract_value(itv_upto(99)));
  guard.assign(VAR_P, s.get(VAR_P));
  s.meet_with(guard);
  if (!s.in_var_to_val_table(VAR_I)) {
    // the guard cannot hold
    return abstract_state();
  }
  s.store_through(VAR_P, s.get(VAR_I));
  s.assign(VAR_I, abstract_value(s.get(VAR_I).get_interval() + itv(1, 1)));
  abstract_state other(s);
  other.assign(VAR_P, abstract_value::create_address(address_value{vaddr(2)}));
  s.join_with(other);
  return s;
}

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }

  abstract_state head = entry();
  unsigned widenings = 0;
  while (true) {
    abstract_state next = entry() | loop_body(head);
    if (head >= next) {
      break;
    }
    head = head.widening(next);
    ++widenings;
    vfa::outs() << "After widening " << widenings << ":\n" << head;
    VFA_CHECK(widenings <= 3);
    if (widenings > 3) {
      break;
    }
  }
  VFA_CHECK(head.get(VAR_I).get_interval() == itv_from(0));

  unsigned narrowings = 0;
  while (true) {
    abstract_state next = entry() | loop_body(head);
    abstract_state narrowed = head.narrowing(next);
    if (narrowed == head) {
      break;
    }
    head = narrowed;
    ++narrowings;
    vfa::outs() << "After narrowing " << narrowings << ":\n" << head;
    VFA_CHECK(narrowings <= 3);
    if (narrowings > 3) {
      break;
    }
  }
  vfa::outs() << "Loop head:\n" << head;

  VFA_CHECK(head.get(VAR_I) == ival(0, 100));
  VFA_CHECK(head.get(VAR_P) ==
            abstract_value::create_address(address_value{vaddr(1), vaddr(2)}));
  VFA_CHECK(head.load(vaddr(1)) == ival(0, 99));
  VFA_CHECK(head.load(vaddr(2)) == ival(0, 99));

  // exit: i >= 100
  abstract_state exit_guard;
  exit_guard.assign(VAR_I, abstract_value(itv_from(100)));
  exit_guard.assign(VAR_P, head.get(VAR_P));
  abstract_state exit_state = head & exit_guard;
  VFA_CHECK(exit_state.get(VAR_I) == ival(100, 100));
  // objects are not constrained by the guard and are dropped by the meet
  VFA_CHECK(exit_state.get_loc_to_val().empty());

  return report(stats_enabled);
}
