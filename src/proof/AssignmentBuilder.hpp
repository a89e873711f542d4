/**
 * @file       AssignmentBuilder.hpp
 * @brief      Shapes witness, public inputs and circuit bytes into what the proof backend consumes
 * @date       2026-10-17
 */

#ifndef _NIZK_ASSIGNMENT_BUILDER_HPP_
#define _NIZK_ASSIGNMENT_BUILDER_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <gsl/span>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "proof/Assignment.hpp"
#include "proof/IProofBackend.hpp"
#include "witness/FieldElement.hpp"

namespace nizk
{
    class AssignmentBuilder
    {
    public:
        enum class Error
        {
            TRUNCATED_PUBLIC_INPUT = 1,
            NON_CANONICAL_INPUT,
        };

        explicit AssignmentBuilder( std::shared_ptr<IProofBackend> backend );

        /**
         * @brief       Re-encodes every witness element, in order, to its 32 byte form
         */
        static Assignment BuildPrivate( const std::vector<FieldElement> &witness );

        /**
         * @brief       Splits @p raw_bytes into @p num_inputs consecutive 32 byte chunks
         * @param[in]   raw_bytes concatenated little-endian encodings, extra trailing bytes are ignored
         * @param[in]   num_inputs number of public inputs of the circuit
         * @param[in]   bound when set, every input must be below it
         * @return      The chunks, TRUNCATED_PUBLIC_INPUT if fewer than num_inputs * 32 bytes were given,
         *              or NON_CANONICAL_INPUT for an input not below @p bound
         */
        static outcome::result<Assignment> BuildPublic( gsl::span<const uint8_t>           raw_bytes,
                                                        uint64_t                           num_inputs,
                                                        const std::optional<FieldElement> &bound = std::nullopt );

        /**
         * @brief       Loads a circuit through the backend encoding
         * @return      The instance, or CIRCUIT_DESERIALIZATION whatever the backend reported
         */
        outcome::result<std::shared_ptr<CircuitInstance>> DeserializeCircuit( gsl::span<const uint8_t> bytes ) const;

    private:
        std::shared_ptr<IProofBackend> backend_;
        base::Logger                   logger_ = base::createLogger( "AssignmentBuilder" );
    };
}

OUTCOME_HPP_DECLARE_ERROR_2( nizk, AssignmentBuilder::Error );

#endif
