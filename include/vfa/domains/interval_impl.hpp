#pragma once

#include <vfa/domains/interval.hpp>
#include <vfa/support/debug.hpp>

namespace vfa {

/* bound: an infinite bound keeps only its sign in _n */

template <typename Number>
bound<Number>::bound(bool is_infinite, Number n)
    : _is_infinite(is_infinite), _n(is_infinite ? Number(n.sign()) : n) {}

template <typename Number>
bound<Number>::bound(int64_t n) : _is_infinite(false), _n(n) {}

template <typename Number>
bound<Number>::bound(Number n) : _is_infinite(false), _n(n) {}

template <typename Number> bound<Number> bound<Number>::plus_infinity() {
  return bound<Number>(true, Number(1));
}

template <typename Number> bound<Number> bound<Number>::minus_infinity() {
  return bound<Number>(true, Number(-1));
}

template <typename Number>
bound<Number> bound<Number>::min(const bound<Number> &x,
                                 const bound<Number> &y) {
  return x.compare(y) <= 0 ? x : y;
}

template <typename Number>
bound<Number> bound<Number>::max(const bound<Number> &x,
                                 const bound<Number> &y) {
  return x.compare(y) <= 0 ? y : x;
}

template <typename Number> bool bound<Number>::is_infinite() const {
  return _is_infinite;
}

template <typename Number> bool bound<Number>::is_finite() const {
  return !_is_infinite;
}

template <typename Number> bool bound<Number>::is_plus_infinity() const {
  return _is_infinite && _n.sign() > 0;
}

template <typename Number> bool bound<Number>::is_minus_infinity() const {
  return _is_infinite && _n.sign() < 0;
}

template <typename Number>
bound<Number> bound<Number>::operator+(const bound<Number> &x) const {
  if (is_finite()) {
    return x.is_finite() ? bound<Number>(_n + x._n) : x;
  }
  if (x.is_finite() || _n == x._n) {
    return *this;
  }
  VFA_ERROR("bound: undefined operation -∞ + +∞");
}

template <typename Number>
int bound<Number>::compare(const bound<Number> &x) const {
  if (_is_infinite && x._is_infinite) {
    return _n.compare(x._n);
  } else if (_is_infinite) {
    return _n.sign();
  } else if (x._is_infinite) {
    return -x._n.sign();
  }
  return _n.compare(x._n);
}

template <typename Number>
bool bound<Number>::operator<(const bound<Number> &x) const {
  return compare(x) < 0;
}

template <typename Number>
bool bound<Number>::operator>(const bound<Number> &x) const {
  return compare(x) > 0;
}

template <typename Number>
bool bound<Number>::operator==(const bound<Number> &x) const {
  return compare(x) == 0;
}

template <typename Number>
bool bound<Number>::operator<=(const bound<Number> &x) const {
  return compare(x) <= 0;
}

template <typename Number>
bool bound<Number>::operator>=(const bound<Number> &x) const {
  return compare(x) >= 0;
}

template <typename Number>
boost::optional<Number> bound<Number>::number() const {
  if (_is_infinite) {
    return boost::none;
  }
  return _n;
}

template <typename Number> void bound<Number>::write(vfa_os &o) const {
  if (!_is_infinite) {
    o << _n;
  } else {
    o << (_n.sign() > 0 ? "+∞" : "-∞");
  }
}

/* interval */

template <typename Number> interval<Number>::interval() : _lb(0), _ub(-1) {}

template <typename Number>
interval<Number>::interval(bound<Number> lb, bound<Number> ub)
    : _lb(lb), _ub(ub) {
  if (_lb > _ub) {
    set_to_bottom();
  }
}

template <typename Number> interval<Number> interval<Number>::top() {
  return interval<Number>(bound<Number>::minus_infinity(),
                          bound<Number>::plus_infinity());
}

template <typename Number> interval<Number> interval<Number>::bottom() {
  return interval<Number>();
}

template <typename Number> bound<Number> interval<Number>::lb() const {
  return _lb;
}

template <typename Number> bound<Number> interval<Number>::ub() const {
  return _ub;
}

template <typename Number> bool interval<Number>::is_bottom() const {
  return _lb > _ub;
}

template <typename Number> bool interval<Number>::is_top() const {
  return _lb.is_minus_infinity() && _ub.is_plus_infinity();
}

template <typename Number> void interval<Number>::set_to_top() {
  *this = top();
}

template <typename Number> void interval<Number>::set_to_bottom() {
  _lb = bound<Number>(0);
  _ub = bound<Number>(-1);
}

template <typename Number>
bool interval<Number>::operator==(const interval<Number> &x) const {
  if (is_bottom() || x.is_bottom()) {
    return is_bottom() && x.is_bottom();
  }
  return _lb == x._lb && _ub == x._ub;
}

template <typename Number>
bool interval<Number>::operator<=(const interval<Number> &x) const {
  if (is_bottom()) {
    return true;
  }
  return !x.is_bottom() && x._lb <= _lb && _ub <= x._ub;
}

template <typename Number>
interval<Number> interval<Number>::operator|(const interval<Number> &x) const {
  if (is_bottom()) {
    return x;
  } else if (x.is_bottom()) {
    return *this;
  }
  return interval<Number>(bound<Number>::min(_lb, x._lb),
                          bound<Number>::max(_ub, x._ub));
}

template <typename Number>
interval<Number> interval<Number>::operator&(const interval<Number> &x) const {
  if (is_bottom() || x.is_bottom()) {
    return bottom();
  }
  // the constructor turns an empty overlap into bottom
  return interval<Number>(bound<Number>::max(_lb, x._lb),
                          bound<Number>::min(_ub, x._ub));
}

template <typename Number>
interval<Number> interval<Number>::operator||(const interval<Number> &x) const {
  if (is_bottom()) {
    return x;
  } else if (x.is_bottom()) {
    return *this;
  }
  bound<Number> lb = (x._lb < _lb) ? bound<Number>::minus_infinity() : _lb;
  bound<Number> ub = (x._ub > _ub) ? bound<Number>::plus_infinity() : _ub;
  return interval<Number>(lb, ub);
}

template <typename Number>
interval<Number> interval<Number>::operator&&(const interval<Number> &x) const {
  if (is_bottom() || x.is_bottom()) {
    return bottom();
  }
  bound<Number> lb = (_lb.is_infinite() && x._lb.is_finite()) ? x._lb : _lb;
  bound<Number> ub = (_ub.is_infinite() && x._ub.is_finite()) ? x._ub : _ub;
  return interval<Number>(lb, ub);
}

template <typename Number>
interval<Number> interval<Number>::operator+(const interval<Number> &x) const {
  if (is_bottom() || x.is_bottom()) {
    return bottom();
  }
  return interval<Number>(_lb + x._lb, _ub + x._ub);
}

template <typename Number>
boost::optional<Number> interval<Number>::singleton() const {
  if (is_bottom() || !(_lb == _ub)) {
    return boost::none;
  }
  return _lb.number();
}

template <typename Number>
bool interval<Number>::operator[](Number n) const {
  bound<Number> b(n);
  return !is_bottom() && _lb <= b && b <= _ub;
}

template <typename Number> void interval<Number>::write(vfa_os &o) const {
  if (is_bottom()) {
    o << "⊥";
    return;
  }
  o << "[" << _lb << ", " << _ub << "]";
}

} // namespace vfa
