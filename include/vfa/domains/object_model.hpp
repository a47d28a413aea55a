#pragma once

/*
 * Queries about the program's memory layout.
 *
 * The abstract state never interprets types or field layouts: a
 * client that knows the program representation implements
 * object_model and the state only consumes the intervals it returns.
 */

#include <vfa/domains/abstract_state.hpp>
#include <vfa/domains/address_value.hpp>
#include <vfa/domains/interval.hpp>

#include <boost/optional.hpp>

#include <cstdint>

namespace vfa {
namespace domains {

// Identifier of a pointer arithmetic statement.
using gep_id_t = uint32_t;

class object_model {
public:
  virtual ~object_model() {}

  // Element index accessed by gep.
  virtual z_interval element_index(gep_id_t gep) const = 0;

  // Byte offset accessed by gep.
  virtual z_interval byte_offset(gep_id_t gep) const = 0;

  // Size in bytes of the stack or heap allocation obj.
  virtual uint64_t alloca_byte_size(obj_id_t obj) const = 0;

  // Object of the first element reached from obj, if any.
  virtual boost::optional<obj_id_t> pointee_element(obj_id_t obj) const = 0;
};

// Addresses reached by gep from the addresses of pointer.
inline address_value gep_obj_addrs(const abstract_state &s,
                                   const object_model &model,
                                   var_id_t pointer, gep_id_t gep) {
  return s.get_gep_obj_addrs(pointer, model.element_index(gep));
}

} // end namespace domains
} // end namespace vfa
