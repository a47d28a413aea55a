#include <vfa/numbers/bignums.hpp>
#include <vfa/support/debug.hpp>

#include <limits>
#include <string>

namespace vfa {

namespace {
// mpz_import/mpz_export on the magnitude of an int64_t, one 64-bit word.
void set_int64(mpz_t r, int64_t n) {
  uint64_t mag = (n < 0) ? (uint64_t)0 - (uint64_t)n : (uint64_t)n;
  mpz_import(r, 1, 1, sizeof(uint64_t), 0, 0, &mag);
  if (n < 0) {
    mpz_neg(r, r);
  }
}
} // namespace

z_number::z_number() { mpz_init(_n); }

z_number::z_number(int64_t n) {
  if (n >= std::numeric_limits<long>::min() &&
      n <= std::numeric_limits<long>::max()) {
    mpz_init_set_si(_n, static_cast<long>(n));
  } else {
    mpz_init(_n);
    set_int64(_n, n);
  }
}

z_number::z_number(const z_number &o) { mpz_init_set(_n, o._n); }

z_number::z_number(z_number &&o) {
  mpz_init(_n);
  mpz_swap(_n, o._n);
}

z_number &z_number::operator=(const z_number &o) {
  if (this != &o) {
    mpz_set(_n, o._n);
  }
  return *this;
}

z_number &z_number::operator=(z_number &&o) {
  mpz_swap(_n, o._n);
  return *this;
}

z_number::~z_number() { mpz_clear(_n); }

bool z_number::fits_int64() const {
  static const z_number lo(std::numeric_limits<int64_t>::min());
  static const z_number hi(std::numeric_limits<int64_t>::max());
  return lo <= *this && *this <= hi;
}

z_number::operator int64_t() const {
  if (mpz_fits_slong_p(_n)) {
    return static_cast<int64_t>(mpz_get_si(_n));
  }
  if (!fits_int64()) {
    VFA_ERROR("z_number ", get_str(), " does not fit into int64_t");
  }
  if (*this == z_number(std::numeric_limits<int64_t>::min())) {
    return std::numeric_limits<int64_t>::min();
  }
  uint64_t mag = 0;
  mpz_export(&mag, nullptr, 1, sizeof(uint64_t), 0, 0, _n);
  int64_t res = static_cast<int64_t>(mag);
  return sign() < 0 ? -res : res;
}

std::string z_number::get_str() const {
  // mpz_sizeinbase may overestimate by one, plus sign and terminator
  std::string buf(mpz_sizeinbase(_n, 10) + 2, '\0');
  mpz_get_str(&buf[0], 10, _n);
  buf.resize(std::char_traits<char>::length(buf.c_str()));
  return buf;
}

z_number z_number::operator+(const z_number &x) const {
  z_number res;
  mpz_add(res._n, _n, x._n);
  return res;
}

void z_number::write(vfa_os &o) const { o << get_str(); }

} // namespace vfa
