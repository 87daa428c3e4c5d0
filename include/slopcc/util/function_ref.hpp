#ifndef SLOPCC_FUNCTION_REF_HPP
#define SLOPCC_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace slopcc {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace slopcc

#endif
