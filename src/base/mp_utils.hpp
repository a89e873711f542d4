/**
 * @file       mp_utils.hpp
 * @brief      Conversions between little-endian byte blobs and boost multiprecision integers
 * @date       2026-10-17
 */

#ifndef _NIZK_MP_UTILS_HPP_
#define _NIZK_MP_UTILS_HPP_

#include <array>
#include <cstdint>

#include <boost/multiprecision/cpp_int.hpp>
#include <gsl/span>

namespace nizk::base
{
    std::array<uint8_t, 8> uint64_t_to_bytes( uint64_t number );

    /**
     * @brief       Little-endian 32 byte encoding, least significant byte first
     */
    std::array<uint8_t, 32> uint256_t_to_bytes( const boost::multiprecision::uint256_t &i );

    boost::multiprecision::uint256_t bytes_to_uint256_t( gsl::span<const uint8_t, 32> bytes );
}

#endif
