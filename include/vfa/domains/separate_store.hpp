#pragma once

/*******************************************************************************
 * Finite map from keys to abstract values with pointwise lattice
 * operations.
 *
 * Unlike a classical non-relational environment there is no implicit
 * value for a missing key: each binary operation decides, through
 * binary_op::keep_unmatched, whether a key bound on one side only is
 * copied into the result or dropped. Results are always built as a
 * fresh map by merging both sorted key sequences.
 ******************************************************************************/

#include <vfa/support/debug.hpp>

#include <boost/container/flat_map.hpp>
#include <boost/optional.hpp>

#include <algorithm>

namespace vfa {
namespace domains {

template <typename Key, typename Value> class separate_store {
public:
  using separate_store_t = separate_store<Key, Value>;
  using map_t = boost::container::flat_map<Key, Value>;
  using iterator = typename map_t::const_iterator;
  using key_type = Key;
  using value_type = Value;

  class binary_op {
  public:
    virtual ~binary_op() {}
    // Combine the values bound to key on both sides. An empty result
    // removes the key.
    virtual boost::optional<Value> apply(const Key &key, const Value &x,
                                         const Value &y) = 0;
    // Whether a key bound on only one side is copied unchanged.
    virtual bool keep_unmatched() = 0;
  };

  class partial_order {
  public:
    virtual ~partial_order() {}
    virtual bool leq(const Value &x, const Value &y) = 0;
  };

private:
  map_t m_map;

  separate_store(map_t &&m) : m_map(std::move(m)) {}

  static map_t merge(const map_t &m1, const map_t &m2, binary_op &op) {
    map_t res;
    const bool keep = op.keep_unmatched();
    res.reserve(keep ? m1.size() + m2.size() : std::min(m1.size(), m2.size()));
    auto it1 = m1.begin(), et1 = m1.end();
    auto it2 = m2.begin(), et2 = m2.end();
    while (it1 != et1 || it2 != et2) {
      if (it2 == et2 || (it1 != et1 && it1->first < it2->first)) {
        if (keep) {
          res.emplace_hint(res.end(), it1->first, it1->second);
        }
        ++it1;
      } else if (it1 == et1 || it2->first < it1->first) {
        if (keep) {
          res.emplace_hint(res.end(), it2->first, it2->second);
        }
        ++it2;
      } else {
        boost::optional<Value> v = op.apply(it1->first, it1->second, it2->second);
        if (v) {
          res.emplace_hint(res.end(), it1->first, std::move(*v));
        }
        ++it1;
        ++it2;
      }
    }
    return res;
  }

public:
  separate_store() {}
  separate_store(const separate_store_t &o) = default;
  separate_store(separate_store_t &&o) = default;
  separate_store_t &operator=(const separate_store_t &o) = default;
  separate_store_t &operator=(separate_store_t &&o) = default;

  iterator begin() const { return m_map.begin(); }

  iterator end() const { return m_map.end(); }

  std::size_t size() const { return m_map.size(); }

  bool empty() const { return m_map.empty(); }

  bool contains(const Key &k) const { return m_map.find(k) != m_map.end(); }

  // Return null if k is not bound.
  const Value *find(const Key &k) const {
    auto it = m_map.find(k);
    return (it == m_map.end() ? nullptr : &it->second);
  }

  void set(const Key &k, Value v) { m_map[k] = std::move(v); }

  void clear() { m_map.clear(); }

  // Apply f to every bound value in place.
  template <typename Fn> void transform(Fn f) {
    for (auto &kv : m_map) {
      f(kv.second);
    }
  }

  separate_store_t apply_operation(binary_op &op,
                                   const separate_store_t &o) const {
    return separate_store_t(merge(m_map, o.m_map, op));
  }

  // Keep only the bindings whose key is in [it, et).
  template <typename Iterator>
  separate_store_t project(Iterator it, Iterator et) const {
    map_t res;
    for (; it != et; ++it) {
      auto m_it = m_map.find(*it);
      if (m_it != m_map.end()) {
        res.emplace(m_it->first, m_it->second);
      }
    }
    return separate_store_t(std::move(res));
  }

  // Every key bound in *this is bound in o to a value above it.
  bool leq(const separate_store_t &o, partial_order &po) const {
    if (size() > o.size()) {
      return false;
    }
    for (auto const &kv : m_map) {
      auto it = o.m_map.find(kv.first);
      if (it == o.m_map.end() || !po.leq(kv.second, it->second)) {
        return false;
      }
    }
    return true;
  }

  bool operator==(const separate_store_t &o) const {
    if (size() != o.size()) {
      return false;
    }
    for (auto it1 = m_map.begin(), it2 = o.m_map.begin(), et1 = m_map.end();
         it1 != et1; ++it1, ++it2) {
      if (it1->first != it2->first || !(it1->second == it2->second)) {
        return false;
      }
    }
    return true;
  }

  bool operator!=(const separate_store_t &o) const { return !operator==(o); }
}; // class separate_store

} // end namespace domains
} // end namespace vfa
