/**
 * @file       WitnessFormat.hpp
 * @brief      Layout constants of the binary wtns witness file
 * @date       2026-10-17
 */

#ifndef _NIZK_WITNESS_FORMAT_HPP_
#define _NIZK_WITNESS_FORMAT_HPP_

#include <array>
#include <cstdint>
#include <optional>

#include "witness/FieldElement.hpp"

namespace nizk
{
    /**
     * @brief       Values the reader validates a wtns header against.
     *              The defaults describe the files emitted by circom style witness generators.
     */
    struct WitnessFormat
    {
        std::array<uint8_t, 4> magic               = { 'w', 't', 'n', 's' };
        uint32_t               max_version         = 2;
        uint32_t               section_count       = 2;
        uint32_t               header_section_type = 1;
        uint32_t               data_section_type   = 2;
        uint32_t               field_byte_size     = static_cast<uint32_t>( FieldElement::BYTE_SIZE );

        /// When set, the header modulus must equal it and every element must be below it
        std::optional<FieldElement> expected_modulus;

        /// When set, every element must be below it whatever modulus the header declares
        std::optional<FieldElement> element_bound;

        /**
         * @brief       Byte size of the header section payload: field size, modulus and witness length
         */
        uint64_t HeaderSectionSize() const
        {
            return sizeof( uint32_t ) + static_cast<uint64_t>( field_byte_size ) + sizeof( uint32_t );
        }
    };
}

#endif
