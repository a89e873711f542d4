/**
 * @file       FieldElement.hpp
 * @brief      Fixed-width little-endian field element encoding shared by the witness and proof modules
 * @date       2026-10-17
 */

#ifndef _NIZK_FIELD_ELEMENT_HPP_
#define _NIZK_FIELD_ELEMENT_HPP_

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <gsl/span>
#include "outcome/outcome.hpp"

namespace nizk
{
    /**
     * @brief       Canonical 32 byte little-endian representation of a prime field element.
     *              No reduction is performed, the value is carried exactly as encoded.
     */
    class FieldElement
    {
    public:
        static constexpr std::size_t BYTE_SIZE = 32;

        using Bytes = std::array<uint8_t, BYTE_SIZE>;

        enum class Error
        {
            INVALID_LENGTH = 1,
            INVALID_NUMBER,
            VALUE_TOO_LARGE,
        };

        FieldElement();

        explicit FieldElement( const Bytes &repr );

        static FieldElement Zero();
        static FieldElement One();
        static FieldElement FromUint64( uint64_t value );

        /**
         * @brief       Builds an element from its little-endian encoding
         * @param[in]   bytes exactly @ref BYTE_SIZE bytes
         */
        static outcome::result<FieldElement> FromBytes( gsl::span<const uint8_t> bytes );

        /**
         * @brief       Builds an element from a narrower little-endian encoding, zero extended
         * @param[in]   bytes little-endian bytes, at most @ref BYTE_SIZE of them
         */
        static outcome::result<FieldElement> FromNarrowBytes( gsl::span<const uint8_t> bytes );

        /**
         * @brief       Parses a "0x" prefixed big-endian hex number, as humans write them
         */
        static outcome::result<FieldElement> FromHex( std::string_view hex );

        static outcome::result<FieldElement> FromDecimal( std::string_view decimal );

        /**
         * @brief       Dispatches to @ref FromHex when the text is "0x" prefixed, @ref FromDecimal otherwise
         */
        static outcome::result<FieldElement> FromString( std::string_view text );

        const Bytes &ToBytes() const
        {
            return repr_;
        }

        /**
         * @brief       Big-endian "0x" prefixed hex text
         */
        std::string ToHex() const;

        std::string ToDecimal() const;

        /**
         * @brief       Numeric comparison of the encoded values
         */
        bool IsLessThan( const FieldElement &bound ) const;

        bool IsZero() const;

        bool operator==( const FieldElement &other ) const
        {
            return repr_ == other.repr_;
        }

        bool operator!=( const FieldElement &other ) const
        {
            return !( *this == other );
        }

    private:
        Bytes repr_;
    };
}

OUTCOME_HPP_DECLARE_ERROR_2( nizk, FieldElement::Error );

#endif
