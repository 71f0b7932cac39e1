#ifndef CHAINRELAY_OUTCOME_HPP
#define CHAINRELAY_OUTCOME_HPP

#include <libp2p/outcome/outcome.hpp>

/**
 * Every fallible operation returns outcome::result<T>; error enums are
 * registered with OUTCOME_HPP_DECLARE_ERROR_2 / OUTCOME_CPP_DEFINE_CATEGORY_3
 */
namespace outcome = libp2p::outcome;

#endif  // CHAINRELAY_OUTCOME_HPP
