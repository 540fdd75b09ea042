#ifndef TPP_ASCII_ALGORITHM_HPP
#define TPP_ASCII_ALGORITHM_HPP

#include "ulight/impl/ascii_algorithm.hpp"

namespace tpp::ascii {

using ulight::ascii::equals_ignore_case;
using ulight::ascii::length_if;
using ulight::ascii::length_if_not;
using ulight::ascii::starts_with_ignore_case;

} // namespace tpp::ascii

#endif
