/**
 * @file       IProofBackend.hpp
 * @brief      Contract between the proof orchestration and a zero knowledge proof system
 * @date       2026-10-17
 */

#ifndef _NIZK_IPROOF_BACKEND_HPP_
#define _NIZK_IPROOF_BACKEND_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gsl/span>

#include "outcome/outcome.hpp"
#include "proof/Assignment.hpp"
#include "witness/FieldElement.hpp"

namespace nizk
{
    enum class ProofError
    {
        CIRCUIT_DESERIALIZATION = 1,
        PROOF_DESERIALIZATION,
        BACKEND_INVOCATION,
    };

    /**
     * @brief       Sizes that fully determine the public parameters of a circuit
     */
    struct CircuitDimensions
    {
        uint64_t num_constraints = 0;
        uint64_t num_vars        = 0;
        uint64_t num_inputs      = 0;

        bool operator==( const CircuitDimensions &other ) const
        {
            return num_constraints == other.num_constraints && num_vars == other.num_vars &&
                   num_inputs == other.num_inputs;
        }

        bool operator!=( const CircuitDimensions &other ) const
        {
            return !( *this == other );
        }
    };

    /**
     * @brief       Constraint system loaded by a backend. Immutable once loaded.
     */
    class CircuitInstance
    {
    public:
        virtual ~CircuitInstance() = default;

        virtual CircuitDimensions GetDimensions() const = 0;
    };

    /**
     * @brief       Public parameters derived from the circuit dimensions only
     */
    class GeneratorParams
    {
    public:
        virtual ~GeneratorParams() = default;
    };

    class Proof
    {
    public:
        virtual ~Proof() = default;
    };

    /**
     * @brief       Fiat-Shamir transcript, seeded with a domain separation label
     */
    class Transcript
    {
    public:
        virtual ~Transcript() = default;

        virtual void Append( gsl::span<const uint8_t> bytes ) = 0;

        virtual std::vector<uint8_t> Challenge() = 0;
    };

    /**
     * @brief       Proof system reached by the orchestrator. Implementations must be reentrant:
     *              every call works only on its arguments.
     */
    class IProofBackend
    {
    public:
        virtual ~IProofBackend() = default;

        virtual outcome::result<std::shared_ptr<CircuitInstance>> DeserializeCircuit(
            gsl::span<const uint8_t> bytes ) const = 0;

        /**
         * @brief       Deterministic: equal dimensions always give equal generators
         */
        virtual outcome::result<std::shared_ptr<GeneratorParams>> MakeGenerators(
            const CircuitDimensions &dimensions ) const = 0;

        virtual std::shared_ptr<Transcript> MakeTranscript( const std::string &label ) const = 0;

        /**
         * @brief       Modulus of the field the backend proves over, if it has a fixed one.
         *              Witness values and public inputs must be below it.
         */
        virtual std::optional<FieldElement> GetFieldModulus() const = 0;

        virtual outcome::result<std::shared_ptr<Proof>> Prove( const CircuitInstance &instance,
                                                               const Assignment      &vars,
                                                               const Assignment      &inputs,
                                                               const GeneratorParams &generators,
                                                               Transcript            &transcript ) const = 0;

        /**
         * @return      false when the proof doesn't hold for @p inputs, an error only if the backend failed
         */
        virtual outcome::result<bool> Verify( const Proof           &proof,
                                              const CircuitInstance &instance,
                                              const Assignment      &inputs,
                                              Transcript            &transcript,
                                              const GeneratorParams &generators ) const = 0;

        virtual outcome::result<std::vector<uint8_t>> SerializeProof( const Proof &proof ) const = 0;

        virtual outcome::result<std::shared_ptr<Proof>> DeserializeProof( gsl::span<const uint8_t> bytes ) const = 0;
    };
}

OUTCOME_HPP_DECLARE_ERROR_2( nizk, ProofError );

#endif
