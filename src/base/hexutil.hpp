/**
 * @file       hexutil.hpp
 * @brief      Hex encoding helpers for field elements, proofs and configuration values
 * @date       2026-10-17
 */

#ifndef _NIZK_HEXUTIL_HPP_
#define _NIZK_HEXUTIL_HPP_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>
#include "outcome/outcome.hpp"

namespace nizk::base
{
    /**
     * @brief error codes for exceptions that may occur during unhexing
     */
    enum class UnhexError
    {
        NOT_ENOUGH_INPUT = 1,
        NON_HEX_INPUT,
        VALUE_OUT_OF_RANGE,
        MISSING_0X_PREFIX,
        UNKNOWN
    };

    /**
     * @brief      Converts bytes to lowercase hex representation
     * @param[in]  bytes bytes
     * @return     hexstring
     */
    std::string hex_lower( gsl::span<const uint8_t> bytes ) noexcept;

    /**
     * @brief      Converts hex representation to bytes
     * @param[in]  hex individual chars, even length
     * @return     result containing array of bytes if input string is hex encoded and has even length
     *
     * @note reads both uppercase and lowercase hexstrings
     */
    outcome::result<std::vector<uint8_t>> unhex( std::string_view hex );

    /**
     * @brief      Unhex hex-string with 0x in the begining
     * @param[in]  hex hex string with 0x in the beginning
     * @return     unhexed buffer
     */
    outcome::result<std::vector<uint8_t>> unhexWith0x( std::string_view hex );
}

OUTCOME_HPP_DECLARE_ERROR_2( nizk::base, UnhexError );

#endif
