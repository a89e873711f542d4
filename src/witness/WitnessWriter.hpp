/**
 * @file       WitnessWriter.hpp
 * @brief      Encoder of field elements into the binary wtns witness layout
 * @date       2026-10-17
 */

#ifndef _NIZK_WITNESS_WRITER_HPP_
#define _NIZK_WITNESS_WRITER_HPP_

#include <cstdint>
#include <vector>

#include "outcome/outcome.hpp"
#include "witness/FieldElement.hpp"
#include "witness/WitnessFormat.hpp"

namespace nizk
{
    class WitnessWriter
    {
    public:
        enum class Error
        {
            ELEMENT_TOO_WIDE = 1,
            TOO_MANY_ELEMENTS,
            UNSUPPORTED_FIELD_SIZE,
        };

        explicit WitnessWriter( WitnessFormat format = WitnessFormat{} );

        /**
         * @brief       Writes a witness that @ref WitnessReader parses back into @p witness
         * @param[in]   witness elements in order
         * @param[in]   modulus value stored in the header section
         * @param[in]   version version number stored in the file header
         * @return      The encoded file, or an error if an element doesn't fit the configured width
         *              or the width is one the reader can't decode
         */
        outcome::result<std::vector<uint8_t>> Encode( const std::vector<FieldElement> &witness,
                                                      const FieldElement              &modulus,
                                                      uint32_t                         version ) const;

        outcome::result<std::vector<uint8_t>> Encode( const std::vector<FieldElement> &witness,
                                                      const FieldElement              &modulus ) const
        {
            return Encode( witness, modulus, format_.max_version );
        }

    private:
        const WitnessFormat format_;

        outcome::result<void> AppendElement( std::vector<uint8_t> &out, const FieldElement &element ) const;
    };
}

OUTCOME_HPP_DECLARE_ERROR_2( nizk, WitnessWriter::Error );

#endif
