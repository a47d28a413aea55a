#include <vfa/domains/interval_impl.hpp>
#include <vfa/numbers/bignums.hpp>

namespace vfa {

// Default instantiations
template class bound<z_number>;
template class interval<z_number>;

} // end namespace vfa
