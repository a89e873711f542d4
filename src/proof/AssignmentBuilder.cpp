/**
 * @file       AssignmentBuilder.cpp
 * @brief      Shapes witness, public inputs and circuit bytes into what the proof backend consumes
 * @date       2026-10-17
 */

#include "proof/AssignmentBuilder.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

OUTCOME_CPP_DEFINE_CATEGORY_3( nizk, AssignmentBuilder::Error, e )
{
    using BuilderError = nizk::AssignmentBuilder::Error;
    switch ( e )
    {
        case BuilderError::TRUNCATED_PUBLIC_INPUT:
            return "Fewer public input bytes than the circuit declares inputs";
        case BuilderError::NON_CANONICAL_INPUT:
            return "A public input is not below the field modulus";
    }
    return "Unknown error";
}

namespace nizk
{
    AssignmentBuilder::AssignmentBuilder( std::shared_ptr<IProofBackend> backend ) : backend_( std::move( backend ) )
    {
    }

    Assignment AssignmentBuilder::BuildPrivate( const std::vector<FieldElement> &witness )
    {
        Assignment assignment;
        assignment.reserve( witness.size() );
        std::transform( witness.begin(),
                        witness.end(),
                        std::back_inserter( assignment ),
                        []( const FieldElement &element ) { return element.ToBytes(); } );
        return assignment;
    }

    outcome::result<Assignment> AssignmentBuilder::BuildPublic( gsl::span<const uint8_t>           raw_bytes,
                                                                uint64_t                           num_inputs,
                                                                const std::optional<FieldElement> &bound )
    {
        const uint64_t available = static_cast<uint64_t>( raw_bytes.size() ) / FieldElement::BYTE_SIZE;
        if ( available < num_inputs )
        {
            return outcome::failure( Error::TRUNCATED_PUBLIC_INPUT );
        }

        Assignment assignment( static_cast<std::size_t>( num_inputs ) );
        for ( std::size_t i = 0; i < assignment.size(); ++i )
        {
            auto chunk = raw_bytes.subspan( i * FieldElement::BYTE_SIZE, FieldElement::BYTE_SIZE );
            std::copy( chunk.begin(), chunk.end(), assignment[i].begin() );
            if ( bound && !FieldElement( assignment[i] ).IsLessThan( bound.value() ) )
            {
                return outcome::failure( Error::NON_CANONICAL_INPUT );
            }
        }
        return assignment;
    }

    outcome::result<std::shared_ptr<CircuitInstance>> AssignmentBuilder::DeserializeCircuit(
        gsl::span<const uint8_t> bytes ) const
    {
        auto instance = backend_->DeserializeCircuit( bytes );
        if ( !instance )
        {
            logger_->warn( "Circuit rejected by the backend: {}", instance.error().message() );
            return outcome::failure( ProofError::CIRCUIT_DESERIALIZATION );
        }
        auto dimensions = instance.value()->GetDimensions();
        logger_->debug( "Circuit loaded: {} constraints, {} variables, {} inputs",
                        dimensions.num_constraints,
                        dimensions.num_vars,
                        dimensions.num_inputs );
        return instance.value();
    }
}
