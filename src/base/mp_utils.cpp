/**
 * @file       mp_utils.cpp
 * @brief      Conversions between little-endian byte blobs and boost multiprecision integers
 * @date       2026-10-17
 */

#include "base/mp_utils.hpp"

#include <boost/endian/conversion.hpp>

namespace nizk::base
{
    namespace detail
    {
        template <size_t size, typename uint>
        std::array<uint8_t, size> uint_to_bytes( const uint &i )
        {
            std::array<uint8_t, size> res{};
            res.fill( 0 );
            boost::multiprecision::export_bits( i, res.begin(), 8, false );
            return res;
        }

        template <size_t size, typename uint>
        uint bytes_to_uint( gsl::span<const uint8_t, size> bytes )
        {
            uint result;
            boost::multiprecision::import_bits( result, bytes.begin(), bytes.end(), 8, false );
            return result;
        }
    } // namespace detail

    std::array<uint8_t, 8> uint64_t_to_bytes( uint64_t number )
    {
        std::array<uint8_t, 8> result{};
        boost::endian::store_little_u64( result.data(), number );
        return result;
    }

    std::array<uint8_t, 32> uint256_t_to_bytes( const boost::multiprecision::uint256_t &i )
    {
        return detail::uint_to_bytes<32>( i );
    }

    boost::multiprecision::uint256_t bytes_to_uint256_t( gsl::span<const uint8_t, 32> bytes )
    {
        return detail::bytes_to_uint<32, boost::multiprecision::uint256_t>( bytes );
    }
}
