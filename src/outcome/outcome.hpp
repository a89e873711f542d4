/**
 * @file       outcome.hpp
 * @brief      Result type used across the prover, backed by libp2p's Boost.Outcome configuration
 * @date       2026-10-17
 */

#ifndef _NIZK_OUTCOME_HPP_
#define _NIZK_OUTCOME_HPP_

#include <libp2p/outcome/outcome.hpp>

namespace outcome
{
    using libp2p::outcome::result;
    using libp2p::outcome::success;
    using libp2p::outcome::failure;
}

#endif
