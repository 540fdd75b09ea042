#ifndef TPP_ASSERT_HPP
#define TPP_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace tpp {

using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define TPP_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define TPP_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define TPP_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)
#define TPP_DEBUG_ASSERT_UNREACHABLE(...) ULIGHT_DEBUG_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace tpp

#endif
