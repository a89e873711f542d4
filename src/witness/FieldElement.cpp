/**
 * @file       FieldElement.cpp
 * @brief      Fixed-width little-endian field element encoding shared by the witness and proof modules
 * @date       2026-10-17
 */

#include "witness/FieldElement.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>

#include <boost/multiprecision/cpp_int.hpp>

#include "base/hexutil.hpp"
#include "base/mp_utils.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( nizk, FieldElement::Error, e )
{
    using FieldElementError = nizk::FieldElement::Error;
    switch ( e )
    {
        case FieldElementError::INVALID_LENGTH:
            return "The field element encoding doesn't have the expected width";
        case FieldElementError::INVALID_NUMBER:
            return "The text is not a valid decimal or 0x prefixed hex number";
        case FieldElementError::VALUE_TOO_LARGE:
            return "The number doesn't fit in a 32 byte field element";
    }
    return "Unknown error";
}

namespace nizk
{
    namespace
    {
        using boost::multiprecision::cpp_int;
        using boost::multiprecision::uint256_t;

        uint256_t ToInteger( const FieldElement::Bytes &repr )
        {
            return base::bytes_to_uint256_t( gsl::span<const uint8_t, FieldElement::BYTE_SIZE>( repr ) );
        }
    }

    FieldElement::FieldElement()
    {
        repr_.fill( 0 );
    }

    FieldElement::FieldElement( const Bytes &repr ) : repr_( repr )
    {
    }

    FieldElement FieldElement::Zero()
    {
        return FieldElement();
    }

    FieldElement FieldElement::One()
    {
        return FromUint64( 1 );
    }

    FieldElement FieldElement::FromUint64( uint64_t value )
    {
        Bytes repr{};
        repr.fill( 0 );
        auto le_value = base::uint64_t_to_bytes( value );
        std::copy( le_value.begin(), le_value.end(), repr.begin() );
        return FieldElement( repr );
    }

    outcome::result<FieldElement> FieldElement::FromBytes( gsl::span<const uint8_t> bytes )
    {
        if ( static_cast<std::size_t>( bytes.size() ) != BYTE_SIZE )
        {
            return outcome::failure( Error::INVALID_LENGTH );
        }
        Bytes repr{};
        std::copy( bytes.begin(), bytes.end(), repr.begin() );
        return FieldElement( repr );
    }

    outcome::result<FieldElement> FieldElement::FromNarrowBytes( gsl::span<const uint8_t> bytes )
    {
        if ( static_cast<std::size_t>( bytes.size() ) > BYTE_SIZE )
        {
            return outcome::failure( Error::INVALID_LENGTH );
        }
        Bytes repr{};
        repr.fill( 0 );
        std::copy( bytes.begin(), bytes.end(), repr.begin() );
        return FieldElement( repr );
    }

    outcome::result<FieldElement> FieldElement::FromHex( std::string_view hex )
    {
        if ( hex.size() < 3 || hex[0] != '0' || ( hex[1] != 'x' && hex[1] != 'X' ) )
        {
            return outcome::failure( Error::INVALID_NUMBER );
        }
        std::string prefixed( hex );
        if ( prefixed.size() % 2 != 0 )
        {
            prefixed.insert( 2, 1, '0' );
        }
        auto unhexed = base::unhexWith0x( prefixed );
        if ( !unhexed )
        {
            return outcome::failure( Error::INVALID_NUMBER );
        }
        auto &big_endian = unhexed.value();

        auto first_significant = std::find_if( big_endian.begin(),
                                               big_endian.end(),
                                               []( uint8_t byte ) { return byte != 0; } );
        if ( std::distance( first_significant, big_endian.end() ) > static_cast<std::ptrdiff_t>( BYTE_SIZE ) )
        {
            return outcome::failure( Error::VALUE_TOO_LARGE );
        }

        Bytes repr{};
        repr.fill( 0 );
        std::copy( big_endian.rbegin(), std::make_reverse_iterator( first_significant ), repr.begin() );
        return FieldElement( repr );
    }

    outcome::result<FieldElement> FieldElement::FromDecimal( std::string_view decimal )
    {
        if ( decimal.empty() ||
             !std::all_of( decimal.begin(),
                           decimal.end(),
                           []( char c ) { return std::isdigit( static_cast<unsigned char>( c ) ) != 0; } ) )
        {
            return outcome::failure( Error::INVALID_NUMBER );
        }
        cpp_int value( std::string{ decimal } );
        if ( value > cpp_int( std::numeric_limits<uint256_t>::max() ) )
        {
            return outcome::failure( Error::VALUE_TOO_LARGE );
        }
        return FieldElement( base::uint256_t_to_bytes( static_cast<uint256_t>( value ) ) );
    }

    outcome::result<FieldElement> FieldElement::FromString( std::string_view text )
    {
        if ( text.size() >= 2 && text[0] == '0' && ( text[1] == 'x' || text[1] == 'X' ) )
        {
            return FromHex( text );
        }
        return FromDecimal( text );
    }

    std::string FieldElement::ToHex() const
    {
        Bytes big_endian{};
        std::reverse_copy( repr_.begin(), repr_.end(), big_endian.begin() );
        return "0x" + base::hex_lower( big_endian );
    }

    std::string FieldElement::ToDecimal() const
    {
        return ToInteger( repr_ ).str();
    }

    bool FieldElement::IsLessThan( const FieldElement &bound ) const
    {
        return ToInteger( repr_ ) < ToInteger( bound.repr_ );
    }

    bool FieldElement::IsZero() const
    {
        return std::all_of( repr_.begin(), repr_.end(), []( uint8_t byte ) { return byte == 0; } );
    }
}
