#ifndef PARLEY_FUNCTION_REF_HPP
#define PARLEY_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace parley {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace parley

#endif
