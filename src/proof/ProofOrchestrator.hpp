/**
 * @file       ProofOrchestrator.hpp
 * @brief      End to end proof generation and verification over a proof backend
 * @date       2026-10-17
 */

#ifndef _NIZK_PROOF_ORCHESTRATOR_HPP_
#define _NIZK_PROOF_ORCHESTRATOR_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gsl/span>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "proof/AssignmentBuilder.hpp"
#include "proof/IProofBackend.hpp"
#include "witness/WitnessFormat.hpp"
#include "witness/WitnessReader.hpp"

namespace nizk
{
    struct ProofConfig
    {
        /// Domain separation label both sides seed their transcript with
        std::string   transcript_label = "nizk_example";
        WitnessFormat witness_format;
    };

    /**
     * @brief       Drives a backend through a whole prove or verify. Holds only configuration,
     *              so one instance may serve concurrent calls when the backend allows it.
     */
    class ProofOrchestrator
    {
    public:
        /**
         * @brief       When the backend has a fixed field, witness elements and public inputs not below its
         *              modulus are rejected, on top of whatever @p config.witness_format checks
         */
        explicit ProofOrchestrator( std::shared_ptr<IProofBackend> backend, ProofConfig config = ProofConfig{} );

        /**
         * @brief       Proves that @p witness_bytes satisfies the circuit for the given public inputs
         * @param[in]   circuit_bytes circuit in the backend encoding
         * @param[in]   witness_bytes wtns witness file
         * @param[in]   public_input_bytes concatenated 32 byte little-endian public inputs
         * @return      The serialized proof
         */
        outcome::result<std::vector<uint8_t>> Prove( gsl::span<const uint8_t> circuit_bytes,
                                                     gsl::span<const uint8_t> witness_bytes,
                                                     gsl::span<const uint8_t> public_input_bytes ) const;

        /**
         * @brief       Checks a serialized proof against the circuit and public inputs
         * @return      true if the proof holds, false if it doesn't, an error for malformed inputs
         */
        outcome::result<bool> Verify( gsl::span<const uint8_t> circuit_bytes,
                                      gsl::span<const uint8_t> proof_bytes,
                                      gsl::span<const uint8_t> public_input_bytes ) const;

        /**
         * @brief       Loads a circuit only to report its dimensions
         */
        outcome::result<CircuitDimensions> Inspect( gsl::span<const uint8_t> circuit_bytes ) const;

        const ProofConfig &GetConfig() const
        {
            return config_;
        }

    private:
        std::shared_ptr<IProofBackend>    backend_;
        const ProofConfig                 config_;
        const std::optional<FieldElement> field_modulus_;
        const WitnessReader               reader_;
        const AssignmentBuilder        builder_;
        base::Logger                   logger_ = base::createLogger( "ProofOrchestrator" );

        outcome::result<std::shared_ptr<GeneratorParams>> MakeGenerators( const CircuitDimensions &dimensions ) const;

        static WitnessFormat BoundedFormat( WitnessFormat format, const std::optional<FieldElement> &field_modulus );
    };
}

#endif
