/**
 * @file       ProofOrchestrator.cpp
 * @brief      End to end proof generation and verification over a proof backend
 * @date       2026-10-17
 */

#include "proof/ProofOrchestrator.hpp"

#include <utility>

namespace nizk
{
    ProofOrchestrator::ProofOrchestrator( std::shared_ptr<IProofBackend> backend, ProofConfig config ) :
        backend_( std::move( backend ) ),                                       //
        config_( std::move( config ) ),                                         //
        field_modulus_( backend_->GetFieldModulus() ),                          //
        reader_( BoundedFormat( config_.witness_format, field_modulus_ ) ),     //
        builder_( backend_ )                                                    //
    {
    }

    WitnessFormat ProofOrchestrator::BoundedFormat( WitnessFormat                      format,
                                                    const std::optional<FieldElement> &field_modulus )
    {
        if ( !format.element_bound )
        {
            format.element_bound = field_modulus;
        }
        return format;
    }

    outcome::result<std::shared_ptr<GeneratorParams>> ProofOrchestrator::MakeGenerators(
        const CircuitDimensions &dimensions ) const
    {
        auto generators = backend_->MakeGenerators( dimensions );
        if ( !generators )
        {
            logger_->error( "Can't derive generators: {}", generators.error().message() );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }
        return generators.value();
    }

    outcome::result<std::vector<uint8_t>> ProofOrchestrator::Prove( gsl::span<const uint8_t> circuit_bytes,
                                                                    gsl::span<const uint8_t> witness_bytes,
                                                                    gsl::span<const uint8_t> public_input_bytes ) const
    {
        OUTCOME_TRY( ( auto &&, witness ), reader_.Parse( witness_bytes ) );
        auto vars = AssignmentBuilder::BuildPrivate( witness );

        OUTCOME_TRY( ( auto &&, instance ), builder_.DeserializeCircuit( circuit_bytes ) );
        auto dimensions = instance->GetDimensions();

        OUTCOME_TRY( ( auto &&, generators ), MakeGenerators( dimensions ) );
        OUTCOME_TRY( ( auto &&, inputs ),
                     AssignmentBuilder::BuildPublic( public_input_bytes, dimensions.num_inputs, field_modulus_ ) );

        auto transcript = backend_->MakeTranscript( config_.transcript_label );

        logger_->debug( "Proving with {} witness values and {} public inputs", vars.size(), inputs.size() );
        auto proof = backend_->Prove( *instance, vars, inputs, *generators, *transcript );
        if ( !proof )
        {
            logger_->error( "Proof generation failed: {}", proof.error().message() );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }

        auto proof_bytes = backend_->SerializeProof( *proof.value() );
        if ( !proof_bytes )
        {
            logger_->error( "Proof serialization failed: {}", proof_bytes.error().message() );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }
        logger_->debug( "Proof of {} bytes generated", proof_bytes.value().size() );
        return std::move( proof_bytes.value() );
    }

    outcome::result<bool> ProofOrchestrator::Verify( gsl::span<const uint8_t> circuit_bytes,
                                                     gsl::span<const uint8_t> proof_bytes,
                                                     gsl::span<const uint8_t> public_input_bytes ) const
    {
        OUTCOME_TRY( ( auto &&, instance ), builder_.DeserializeCircuit( circuit_bytes ) );

        auto proof = backend_->DeserializeProof( proof_bytes );
        if ( !proof )
        {
            logger_->warn( "Proof rejected by the backend: {}", proof.error().message() );
            return outcome::failure( ProofError::PROOF_DESERIALIZATION );
        }

        auto dimensions = instance->GetDimensions();
        OUTCOME_TRY( ( auto &&, generators ), MakeGenerators( dimensions ) );
        OUTCOME_TRY( ( auto &&, inputs ),
                     AssignmentBuilder::BuildPublic( public_input_bytes, dimensions.num_inputs, field_modulus_ ) );

        auto transcript = backend_->MakeTranscript( config_.transcript_label );

        auto verified = backend_->Verify( *proof.value(), *instance, inputs, *transcript, *generators );
        if ( !verified )
        {
            logger_->error( "Proof verification failed to run: {}", verified.error().message() );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }
        logger_->debug( "Proof verification result: {}", verified.value() );
        return verified.value();
    }

    outcome::result<CircuitDimensions> ProofOrchestrator::Inspect( gsl::span<const uint8_t> circuit_bytes ) const
    {
        OUTCOME_TRY( ( auto &&, instance ), builder_.DeserializeCircuit( circuit_bytes ) );
        return instance->GetDimensions();
    }
}
