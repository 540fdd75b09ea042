#ifndef TPP_FUNCTION_REF_HPP
#define TPP_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace tpp {

/// @brief A non-owning, nullable reference to something invocable.
/// Used for error consumers and callbacks which do not outlive the call they are passed to.
template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace tpp

#endif
