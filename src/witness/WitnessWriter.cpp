/**
 * @file       WitnessWriter.cpp
 * @brief      Encoder of field elements into the binary wtns witness layout
 * @date       2026-10-17
 */

#include "witness/WitnessWriter.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include <boost/endian/conversion.hpp>

OUTCOME_CPP_DEFINE_CATEGORY_3( nizk, WitnessWriter::Error, e )
{
    using WriterError = nizk::WitnessWriter::Error;
    switch ( e )
    {
        case WriterError::ELEMENT_TOO_WIDE:
            return "A field element doesn't fit in the configured element width";
        case WriterError::TOO_MANY_ELEMENTS:
            return "The witness length doesn't fit in the 32 bit length field";
        case WriterError::UNSUPPORTED_FIELD_SIZE:
            return "The configured element width is zero or wider than a field element";
    }
    return "Unknown error";
}

namespace nizk
{
    namespace
    {
        void AppendU32( std::vector<uint8_t> &out, uint32_t value )
        {
            uint8_t buffer[sizeof( uint32_t )];
            boost::endian::store_little_u32( buffer, value );
            out.insert( out.end(), std::begin( buffer ), std::end( buffer ) );
        }

        void AppendU64( std::vector<uint8_t> &out, uint64_t value )
        {
            uint8_t buffer[sizeof( uint64_t )];
            boost::endian::store_little_u64( buffer, value );
            out.insert( out.end(), std::begin( buffer ), std::end( buffer ) );
        }
    }

    WitnessWriter::WitnessWriter( WitnessFormat format ) : format_( std::move( format ) )
    {
    }

    outcome::result<void> WitnessWriter::AppendElement( std::vector<uint8_t> &out, const FieldElement &element ) const
    {
        const auto &repr  = element.ToBytes();
        const auto  width = static_cast<std::size_t>( format_.field_byte_size );
        if ( std::any_of( repr.begin() + width, repr.end(), []( uint8_t byte ) { return byte != 0; } ) )
        {
            return outcome::failure( Error::ELEMENT_TOO_WIDE );
        }
        out.insert( out.end(), repr.begin(), repr.begin() + width );
        return outcome::success();
    }

    outcome::result<std::vector<uint8_t>> WitnessWriter::Encode( const std::vector<FieldElement> &witness,
                                                                 const FieldElement              &modulus,
                                                                 uint32_t                         version ) const
    {
        if ( format_.field_byte_size == 0 || format_.field_byte_size > FieldElement::BYTE_SIZE )
        {
            return outcome::failure( Error::UNSUPPORTED_FIELD_SIZE );
        }
        if ( witness.size() > std::numeric_limits<uint32_t>::max() )
        {
            return outcome::failure( Error::TOO_MANY_ELEMENTS );
        }
        const auto     witness_len = static_cast<uint32_t>( witness.size() );
        const uint64_t data_size   = static_cast<uint64_t>( witness_len ) * format_.field_byte_size;

        std::vector<uint8_t> out;
        out.reserve( format_.magic.size() + 3 * sizeof( uint32_t ) + sizeof( uint64_t ) +
                     format_.HeaderSectionSize() + sizeof( uint32_t ) + sizeof( uint64_t ) + data_size );

        out.insert( out.end(), format_.magic.begin(), format_.magic.end() );
        AppendU32( out, version );
        AppendU32( out, format_.section_count );

        AppendU32( out, format_.header_section_type );
        AppendU64( out, format_.HeaderSectionSize() );
        AppendU32( out, format_.field_byte_size );
        OUTCOME_TRY( AppendElement( out, modulus ) );
        AppendU32( out, witness_len );

        AppendU32( out, format_.data_section_type );
        AppendU64( out, data_size );
        for ( const auto &element : witness )
        {
            OUTCOME_TRY( AppendElement( out, element ) );
        }
        return out;
    }
}
