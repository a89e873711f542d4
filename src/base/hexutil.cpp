/**
 * @file       hexutil.cpp
 * @brief      Hex encoding helpers for field elements, proofs and configuration values
 * @date       2026-10-17
 */

#include "base/hexutil.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY_3( nizk::base, UnhexError, e )
{
    using nizk::base::UnhexError;
    switch ( e )
    {
        case UnhexError::NON_HEX_INPUT:
            return "Input contains non-hex characters";
        case UnhexError::NOT_ENOUGH_INPUT:
            return "Input contains odd number of characters";
        case UnhexError::VALUE_OUT_OF_RANGE:
            return "Decoded value is out of range of requested type";
        case UnhexError::MISSING_0X_PREFIX:
            return "Missing expected 0x prefix";
        case UnhexError::UNKNOWN:
            return "Unknown error";
    }
    return "Unknown error (error id not listed)";
}

namespace nizk::base
{
    std::string hex_lower( gsl::span<const uint8_t> bytes ) noexcept
    {
        std::string res( bytes.size() * 2, '\x00' );
        boost::algorithm::hex_lower( bytes.begin(), bytes.end(), res.begin() );
        return res;
    }

    outcome::result<std::vector<uint8_t>> unhex( std::string_view hex )
    {
        std::vector<uint8_t> blob;
        blob.reserve( ( hex.size() + 1 ) / 2 );

        try
        {
            boost::algorithm::unhex( hex.begin(), hex.end(), std::back_inserter( blob ) );
            return blob;
        }
        catch ( const boost::algorithm::not_enough_input & )
        {
            return outcome::failure( UnhexError::NOT_ENOUGH_INPUT );
        }
        catch ( const boost::algorithm::non_hex_input & )
        {
            return outcome::failure( UnhexError::NON_HEX_INPUT );
        }
        catch ( const std::exception & )
        {
            return outcome::failure( UnhexError::UNKNOWN );
        }
    }

    outcome::result<std::vector<uint8_t>> unhexWith0x( std::string_view hex_with_prefix )
    {
        static const std::size_t prefix_len = sizeof( "0x" ) - 1;

        if ( hex_with_prefix.substr( 0, prefix_len ) != "0x" && hex_with_prefix.substr( 0, prefix_len ) != "0X" )
        {
            return outcome::failure( UnhexError::MISSING_0X_PREFIX );
        }
        return unhex( hex_with_prefix.substr( prefix_len ) );
    }
}
