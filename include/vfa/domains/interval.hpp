#pragma once

/*******************************************************************************
 * Intervals over integers extended with -oo and +oo.
 *
 * Any interval whose lower bound is greater than its upper bound is
 * bottom. The constructors normalize such pairs to the canonical
 * bottom [0, -1].
 ******************************************************************************/

#include <vfa/numbers/bignums.hpp>
#include <vfa/support/debug.hpp>
#include <vfa/support/os.hpp>

#include <boost/optional.hpp>

namespace vfa {

template <typename Number> class bound {
public:
  using bound_t = bound<Number>;

private:
  bool _is_infinite;
  Number _n;

  bound(bool is_infinite, Number n);

public:
  static bound_t min(const bound_t &x, const bound_t &y);

  static bound_t max(const bound_t &x, const bound_t &y);

  static bound_t plus_infinity();

  static bound_t minus_infinity();

  bound(int64_t n);

  bound(Number n);

  bound(const bound_t &o) = default;

  bound_t &operator=(const bound_t &o) = default;

  bound(bound_t &&o) = default;

  bound_t &operator=(bound_t &&o) = default;

  bool is_infinite() const;

  bool is_finite() const;

  bool is_plus_infinity() const;

  bool is_minus_infinity() const;

  // Raise vfa_exception on -oo + +oo.
  bound_t operator+(const bound_t &x) const;

  // Negative, zero or positive as *this is below, equal to or above x.
  int compare(const bound_t &x) const;

  bool operator<(const bound_t &x) const;

  bool operator>(const bound_t &x) const;

  bool operator==(const bound_t &x) const;

  bool operator<=(const bound_t &x) const;

  bool operator>=(const bound_t &x) const;

  boost::optional<Number> number() const;

  void write(vfa_os &o) const;

  friend vfa_os &operator<<(vfa_os &o, const bound<Number> &b) {
    b.write(o);
    return o;
  }
}; // class bound

template <typename Number> class interval {
public:
  using bound_t = bound<Number>;
  using interval_t = interval<Number>;

private:
  bound_t _lb;
  bound_t _ub;

  interval();

public:
  static interval_t top();

  static interval_t bottom();

  interval(bound_t lb, bound_t ub);

  interval(const interval_t &i) = default;

  interval_t &operator=(const interval_t &i) = default;

  interval(interval_t &&i) = default;

  interval_t &operator=(interval_t &&i) = default;

  bound_t lb() const;

  bound_t ub() const;

  bool is_bottom() const;

  bool is_top() const;

  void set_to_top();

  void set_to_bottom();

  bool operator==(const interval_t &x) const;

  bool operator!=(const interval_t &x) const { return !operator==(x); }

  // partial order: *this is included in x
  bool operator<=(const interval_t &x) const;

  // join
  interval_t operator|(const interval_t &x) const;

  // meet
  interval_t operator&(const interval_t &x) const;

  // widening: a bound that grows jumps straight to infinity
  interval_t operator||(const interval_t &x) const;

  // narrowing: only infinite bounds are refined
  interval_t operator&&(const interval_t &x) const;

  /* Named forms of the lattice operations */
  bool contain(const interval_t &x) const { return x.operator<=(*this); }
  bool equals(const interval_t &x) const { return operator==(x); }
  interval_t join(const interval_t &x) const { return operator|(x); }
  interval_t meet(const interval_t &x) const { return operator&(x); }
  interval_t widening(const interval_t &x) const { return operator||(x); }
  interval_t narrowing(const interval_t &x) const { return operator&&(x); }

  // Pointwise sum of the bounds.
  interval_t operator+(const interval_t &x) const;

  boost::optional<Number> singleton() const;

  bool operator[](Number n) const;

  void write(vfa_os &o) const;
  friend vfa_os &operator<<(vfa_os &o, const interval_t &i) {
    i.write(o);
    return o;
  }
}; //  class interval

using z_bound = bound<z_number>;
using z_interval = interval<z_number>;

} // namespace vfa
