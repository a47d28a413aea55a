#pragma once

#include <vfa/support/os.hpp>

#include <cstdint>
#include <gmp.h>
#include <string>

namespace vfa {

// Arbitrary precision integer backed by GMP. Only the operations that
// interval bounds and address offsets need are provided.
class z_number {
  mpz_t _n;

public:
  z_number();
  z_number(int64_t n);
  z_number(const z_number &o);
  z_number(z_number &&o);
  z_number &operator=(const z_number &o);
  z_number &operator=(z_number &&o);
  ~z_number();

  // Raise vfa_exception if the value is outside the int64_t range.
  explicit operator int64_t() const;

  bool fits_int64() const;

  std::string get_str() const;

  z_number operator+(const z_number &x) const;

  // Sign of the number: -1, 0 or 1.
  int sign() const { return mpz_sgn(_n); }

  int compare(const z_number &x) const { return mpz_cmp(_n, x._n); }

  bool operator==(const z_number &x) const { return compare(x) == 0; }
  bool operator!=(const z_number &x) const { return compare(x) != 0; }
  bool operator<(const z_number &x) const { return compare(x) < 0; }
  bool operator<=(const z_number &x) const { return compare(x) <= 0; }
  bool operator>(const z_number &x) const { return compare(x) > 0; }
  bool operator>=(const z_number &x) const { return compare(x) >= 0; }

  void write(vfa_os &o) const;
}; // class z_number

inline vfa_os &operator<<(vfa_os &o, const z_number &z) {
  z.write(o);
  return o;
}

} // namespace vfa
