/**
 * @file       WitnessReader.cpp
 * @brief      Parser of binary wtns witness files into field elements
 * @date       2026-10-17
 */

#include "witness/WitnessReader.hpp"

#include <algorithm>
#include <utility>

#include <boost/endian/conversion.hpp>

OUTCOME_CPP_DEFINE_CATEGORY_3( nizk, WitnessReader::Error, e )
{
    using ReaderError = nizk::WitnessReader::Error;
    switch ( e )
    {
        case ReaderError::MALFORMED_HEADER:
            return "The witness doesn't start with the expected magic bytes";
        case ReaderError::UNSUPPORTED_VERSION:
            return "The witness file version is newer than the supported one";
        case ReaderError::INVALID_SECTION_COUNT:
            return "The witness file doesn't have the expected number of sections";
        case ReaderError::INVALID_SECTION_TYPE:
            return "A witness section has an unexpected type tag";
        case ReaderError::INVALID_SECTION_SIZE:
            return "A witness section size doesn't match its contents";
        case ReaderError::INVALID_FIELD_SIZE:
            return "The witness field element width is not supported";
        case ReaderError::TRUNCATED_WITNESS:
            return "The witness file ended before the declared data";
        case ReaderError::MODULUS_MISMATCH:
            return "The witness field modulus is not the expected one";
        case ReaderError::NON_CANONICAL_ELEMENT:
            return "A witness element is not below the field modulus";
    }
    return "Unknown error";
}

namespace nizk
{
    namespace
    {
        /**
         * @brief       Forward only view over the input, every read checks the remaining length first
         */
        class ByteCursor
        {
        public:
            explicit ByteCursor( gsl::span<const uint8_t> bytes ) : bytes_( bytes )
            {
            }

            outcome::result<gsl::span<const uint8_t>> Take( uint64_t count )
            {
                if ( Remaining() < count )
                {
                    return outcome::failure( WitnessReader::Error::TRUNCATED_WITNESS );
                }
                auto chunk = bytes_.subspan( offset_, static_cast<std::size_t>( count ) );
                offset_ += static_cast<std::size_t>( count );
                return chunk;
            }

            outcome::result<uint32_t> ReadU32()
            {
                OUTCOME_TRY( ( auto &&, chunk ), Take( sizeof( uint32_t ) ) );
                return boost::endian::load_little_u32( chunk.data() );
            }

            outcome::result<uint64_t> ReadU64()
            {
                OUTCOME_TRY( ( auto &&, chunk ), Take( sizeof( uint64_t ) ) );
                return boost::endian::load_little_u64( chunk.data() );
            }

            uint64_t Remaining() const
            {
                return static_cast<uint64_t>( bytes_.size() ) - offset_;
            }

        private:
            gsl::span<const uint8_t> bytes_;
            std::size_t              offset_ = 0;
        };
    }

    WitnessReader::WitnessReader( WitnessFormat format ) : format_( std::move( format ) )
    {
    }

    outcome::result<std::vector<FieldElement>> WitnessReader::Parse( gsl::span<const uint8_t> bytes ) const
    {
        ByteCursor cursor( bytes );

        OUTCOME_TRY( ( auto &&, magic ), cursor.Take( format_.magic.size() ) );
        if ( !std::equal( magic.begin(), magic.end(), format_.magic.begin() ) )
        {
            logger_->warn( "Rejecting witness with unknown magic" );
            return outcome::failure( Error::MALFORMED_HEADER );
        }

        OUTCOME_TRY( ( auto &&, version ), cursor.ReadU32() );
        if ( version > format_.max_version )
        {
            logger_->warn( "Rejecting witness version {}, newest supported is {}", version, format_.max_version );
            return outcome::failure( Error::UNSUPPORTED_VERSION );
        }

        OUTCOME_TRY( ( auto &&, section_count ), cursor.ReadU32() );
        if ( section_count != format_.section_count )
        {
            logger_->warn( "Rejecting witness with {} sections", section_count );
            return outcome::failure( Error::INVALID_SECTION_COUNT );
        }

        OUTCOME_TRY( ( auto &&, header_type ), cursor.ReadU32() );
        if ( header_type != format_.header_section_type )
        {
            return outcome::failure( Error::INVALID_SECTION_TYPE );
        }
        OUTCOME_TRY( ( auto &&, header_size ), cursor.ReadU64() );
        if ( header_size != format_.HeaderSectionSize() )
        {
            logger_->warn( "Header section size {} doesn't match the expected {}",
                           header_size,
                           format_.HeaderSectionSize() );
            return outcome::failure( Error::INVALID_SECTION_SIZE );
        }

        OUTCOME_TRY( ( auto &&, field_size ), cursor.ReadU32() );
        if ( field_size == 0 || field_size != format_.field_byte_size )
        {
            logger_->warn( "Field element width {} is not the supported {}", field_size, format_.field_byte_size );
            return outcome::failure( Error::INVALID_FIELD_SIZE );
        }

        OUTCOME_TRY( ( auto &&, modulus_bytes ), cursor.Take( field_size ) );
        if ( format_.expected_modulus )
        {
            auto modulus = FieldElement::FromNarrowBytes( modulus_bytes );
            if ( !modulus || modulus.value() != format_.expected_modulus.value() )
            {
                logger_->warn( "Witness modulus doesn't match the configured one" );
                return outcome::failure( Error::MODULUS_MISMATCH );
            }
        }

        OUTCOME_TRY( ( auto &&, witness_len ), cursor.ReadU32() );

        OUTCOME_TRY( ( auto &&, data_type ), cursor.ReadU32() );
        if ( data_type != format_.data_section_type )
        {
            return outcome::failure( Error::INVALID_SECTION_TYPE );
        }
        OUTCOME_TRY( ( auto &&, data_size ), cursor.ReadU64() );
        const uint64_t expected_data_size = static_cast<uint64_t>( witness_len ) * field_size;
        if ( data_size != expected_data_size )
        {
            logger_->warn( "Data section size {} doesn't match {} elements of {} bytes",
                           data_size,
                           witness_len,
                           field_size );
            return outcome::failure( Error::INVALID_SECTION_SIZE );
        }
        if ( cursor.Remaining() < expected_data_size )
        {
            logger_->warn( "Witness declares {} data bytes but only {} remain", expected_data_size, cursor.Remaining() );
            return outcome::failure( Error::TRUNCATED_WITNESS );
        }

        std::vector<FieldElement> witness;
        witness.reserve( witness_len );
        for ( uint32_t i = 0; i < witness_len; ++i )
        {
            OUTCOME_TRY( ( auto &&, element_bytes ), cursor.Take( field_size ) );
            auto element = FieldElement::FromNarrowBytes( element_bytes );
            if ( !element )
            {
                return outcome::failure( Error::INVALID_FIELD_SIZE );
            }
            if ( ( format_.expected_modulus && !element.value().IsLessThan( format_.expected_modulus.value() ) ) ||
                 ( format_.element_bound && !element.value().IsLessThan( format_.element_bound.value() ) ) )
            {
                logger_->warn( "Witness element {} is not reduced", i );
                return outcome::failure( Error::NON_CANONICAL_ELEMENT );
            }
            witness.push_back( element.value() );
        }

        logger_->debug( "Parsed witness version {} with {} elements", version, witness.size() );
        return witness;
    }

    outcome::result<std::vector<FieldElement>> ParseWitness( gsl::span<const uint8_t> bytes )
    {
        return WitnessReader().Parse( bytes );
    }
}
