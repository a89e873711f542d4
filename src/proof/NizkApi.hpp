/**
 * @file       NizkApi.hpp
 * @brief      Proof generation and verification entry points with the default backend and settings
 * @date       2026-10-17
 */

#ifndef _NIZK_API_HPP_
#define _NIZK_API_HPP_

#include <cstdint>
#include <vector>

#include <gsl/span>

#include "outcome/outcome.hpp"

namespace nizk
{
    /**
     * @brief       Proves a wtns witness against a Placeholder circuit, with the "nizk_example" label
     * @param[in]   circuit circuit file bytes
     * @param[in]   witness wtns witness file bytes
     * @param[in]   public_inputs concatenated 32 byte little-endian public inputs
     * @return      The serialized proof
     */
    outcome::result<std::vector<uint8_t>> Prove( gsl::span<const uint8_t> circuit,
                                                 gsl::span<const uint8_t> witness,
                                                 gsl::span<const uint8_t> public_inputs );

    /**
     * @brief       Verifies a proof made by @ref Prove
     * @return      Whether the proof holds for @p public_inputs
     */
    outcome::result<bool> Verify( gsl::span<const uint8_t> circuit,
                                  gsl::span<const uint8_t> proof,
                                  gsl::span<const uint8_t> public_inputs );
}

#endif
