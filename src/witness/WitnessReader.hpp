/**
 * @file       WitnessReader.hpp
 * @brief      Parser of binary wtns witness files into field elements
 * @date       2026-10-17
 */

#ifndef _NIZK_WITNESS_READER_HPP_
#define _NIZK_WITNESS_READER_HPP_

#include <cstdint>
#include <vector>

#include <gsl/span>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "witness/FieldElement.hpp"
#include "witness/WitnessFormat.hpp"

namespace nizk
{
    /**
     * @brief       Reads the two section wtns layout: a header section describing the field and the
     *              number of elements, followed by the data section with the elements themselves.
     *              All integers are little-endian. The reader keeps no state between calls.
     */
    class WitnessReader
    {
    public:
        enum class Error
        {
            MALFORMED_HEADER = 1,
            UNSUPPORTED_VERSION,
            INVALID_SECTION_COUNT,
            INVALID_SECTION_TYPE,
            INVALID_SECTION_SIZE,
            INVALID_FIELD_SIZE,
            TRUNCATED_WITNESS,
            MODULUS_MISMATCH,
            NON_CANONICAL_ELEMENT,
        };

        explicit WitnessReader( WitnessFormat format = WitnessFormat{} );

        /**
         * @brief       Parses a whole witness file
         * @param[in]   bytes the file contents
         * @return      The witness elements in file order, or the first layout violation found
         */
        outcome::result<std::vector<FieldElement>> Parse( gsl::span<const uint8_t> bytes ) const;

        const WitnessFormat &GetFormat() const
        {
            return format_;
        }

    private:
        const WitnessFormat format_;
        base::Logger        logger_ = base::createLogger( "WitnessReader" );
    };

    /**
     * @brief       Parses @p bytes with the default wtns layout
     */
    outcome::result<std::vector<FieldElement>> ParseWitness( gsl::span<const uint8_t> bytes );
}

OUTCOME_HPP_DECLARE_ERROR_2( nizk, WitnessReader::Error );

#endif
