/**
 * @file       PlaceholderBackend.hpp
 * @brief      Proof backend on top of the crypto3 Placeholder (PLONK with LPC/FRI commitments) proof system
 * @date       2026-10-17
 */

#ifndef _NIZK_PLACEHOLDER_BACKEND_HPP_
#define _NIZK_PLACEHOLDER_BACKEND_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gsl/span>

#include <nil/marshalling/status_type.hpp>
#include <nil/marshalling/field_type.hpp>
#include <nil/marshalling/endianness.hpp>
#include <nil/crypto3/zk/snark/arithmetization/plonk/params.hpp>
#include <nil/crypto3/zk/snark/arithmetization/plonk/constraint_system.hpp>
#include <nil/crypto3/marshalling/zk/types/plonk/constraint_system.hpp>
#include <nil/crypto3/marshalling/zk/types/plonk/assignment_table.hpp>
#include <nil/crypto3/algebra/curves/pallas.hpp>
#include <nil/crypto3/algebra/fields/arithmetic_params/pallas.hpp>

#include <nil/crypto3/marshalling/zk/types/placeholder/common_data.hpp>
#include <nil/crypto3/marshalling/zk/types/placeholder/proof.hpp>
#include <nil/crypto3/math/algorithms/calculate_domain_set.hpp>
#include <nil/crypto3/multiprecision/cpp_int.hpp>
#include <nil/crypto3/zk/snark/systems/plonk/placeholder/detail/placeholder_policy.hpp>
#include <nil/crypto3/zk/snark/systems/plonk/placeholder/params.hpp>
#include <nil/crypto3/zk/snark/systems/plonk/placeholder/preprocessor.hpp>
#include <nil/crypto3/zk/snark/systems/plonk/placeholder/proof.hpp>
#include <nil/crypto3/zk/snark/systems/plonk/placeholder/prover.hpp>
#include <nil/crypto3/zk/snark/systems/plonk/placeholder/verifier.hpp>
#include <nil/crypto3/zk/transcript/fiat_shamir.hpp>

#include <nil/crypto3/marshalling/zk/types/commitments/lpc.hpp>

#include <nil/crypto3/hash/keccak.hpp>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "proof/IProofBackend.hpp"
#include "witness/FieldElement.hpp"

using namespace nil;

namespace nizk
{
    /**
     * @brief       Placeholder proofs over the pallas base field with keccak commitments.
     *              Circuits are a PLONK constraint system plus a table template carrying the
     *              fixed columns. The witness fills the witness columns column by column and the
     *              public inputs fill the first public input column. The proving table carries one
     *              constant and one selector column past the template: the constant column repeats
     *              the public inputs, and a gate enabled by the selector equates it with the public
     *              input column, so the verifier's fixed column commitment pins the inputs.
     */
    class PlaceholderBackend : public IProofBackend
    {
    public:
        using BlueprintFieldType   = typename crypto3::algebra::curves::pallas::base_field_type;
        using FieldValueType       = typename BlueprintFieldType::value_type;
        using HashType             = crypto3::hashes::keccak_1600<256>;
        using ProverEndianess      = nil::marshalling::option::big_endian;
        using TTypeBase            = nil::marshalling::field_type<ProverEndianess>;
        using ConstraintSystemType = crypto3::zk::snark::plonk_constraint_system<BlueprintFieldType>;
        using TableDescriptionType = crypto3::zk::snark::plonk_table_description<BlueprintFieldType>;
        using PlonkColumn          = crypto3::zk::snark::plonk_column<BlueprintFieldType>;
        using AssignmentTableType  = crypto3::zk::snark::plonk_table<BlueprintFieldType, PlonkColumn>;
        using PlonkConstraintSystemType =
            crypto3::marshalling::types::plonk_constraint_system<TTypeBase, ConstraintSystemType>;
        using PlonkAssignTableType = crypto3::marshalling::types::plonk_assignment_table<TTypeBase, AssignmentTableType>;
        using LpcParams         = crypto3::zk::commitments::list_polynomial_commitment_params<HashType, HashType, 9, 2>;
        using Lpc               = crypto3::zk::commitments::list_polynomial_commitment<BlueprintFieldType, LpcParams>;
        using LpcScheme         = typename crypto3::zk::commitments::lpc_commitment_scheme<Lpc>;
        using FriParams         = typename Lpc::fri_type::params_type;
        using CircuitParams     = crypto3::zk::snark::placeholder_circuit_params<BlueprintFieldType>;
        using PlaceholderParams = crypto3::zk::snark::placeholder_params<CircuitParams, LpcScheme>;
        using PublicPreprocessor =
            crypto3::zk::snark::placeholder_public_preprocessor<BlueprintFieldType, PlaceholderParams>;
        using PublicPreprocessedData = PublicPreprocessor::preprocessed_data_type;
        using PrivatePreprocessor =
            crypto3::zk::snark::placeholder_private_preprocessor<BlueprintFieldType, PlaceholderParams>;
        using PrivatePreprocessedData = PrivatePreprocessor::preprocessed_data_type;
        using ProofSnarkType          = crypto3::zk::snark::placeholder_proof<BlueprintFieldType, PlaceholderParams>;
        using ProofType    = crypto3::marshalling::types::placeholder_proof<TTypeBase, ProofSnarkType>;
        using ProverType   = crypto3::zk::snark::placeholder_prover<BlueprintFieldType, PlaceholderParams>;
        using VerifierType = crypto3::zk::snark::placeholder_verifier<BlueprintFieldType, PlaceholderParams>;
        using TranscriptType = crypto3::zk::transcript::fiat_shamir_heuristic_sequential<HashType>;
        using PlonkTablePair = std::pair<TableDescriptionType, AssignmentTableType>;

        /**
         * @brief       Table shape every circuit of this backend has. The defaults are the zkLLVM
         *              assigner columns.
         */
        struct Config
        {
            std::size_t witness_columns            = 15;
            std::size_t public_input_columns       = 1;
            std::size_t constant_columns           = 35;
            std::size_t selector_columns           = 56;
            std::size_t component_constant_columns = 5; ///< constant columns taking part in copy constraints
            std::size_t expand_factor              = 2;
            std::size_t max_fri_step               = 1;
        };

        /**
         * @brief       Column major table contents, each column @ref padded_rows long
         */
        struct TableVectors
        {
            std::vector<FieldValueType> witness_values;
            std::vector<FieldValueType> public_input_values;
            std::vector<FieldValueType> constant_values;
            std::vector<FieldValueType> selector_values;
        };

        explicit PlaceholderBackend( Config config = Config{} );

        outcome::result<std::shared_ptr<CircuitInstance>> DeserializeCircuit(
            gsl::span<const uint8_t> bytes ) const override;

        outcome::result<std::shared_ptr<GeneratorParams>> MakeGenerators(
            const CircuitDimensions &dimensions ) const override;

        std::shared_ptr<Transcript> MakeTranscript( const std::string &label ) const override;

        std::optional<FieldElement> GetFieldModulus() const override;

        outcome::result<std::shared_ptr<Proof>> Prove( const CircuitInstance &instance,
                                                       const Assignment      &vars,
                                                       const Assignment      &inputs,
                                                       const GeneratorParams &generators,
                                                       Transcript            &transcript ) const override;

        outcome::result<bool> Verify( const Proof           &proof,
                                      const CircuitInstance &instance,
                                      const Assignment      &inputs,
                                      Transcript            &transcript,
                                      const GeneratorParams &generators ) const override;

        outcome::result<std::vector<uint8_t>> SerializeProof( const Proof &proof ) const override;

        outcome::result<std::shared_ptr<Proof>> DeserializeProof( gsl::span<const uint8_t> bytes ) const override;

        /**
         * @brief       Writes a circuit file @ref DeserializeCircuit loads
         * @param[in]   constraints marshalled constraint system
         * @param[in]   table_template marshalled table with the fixed columns, witness values are ignored
         * @param[in]   num_inputs number of public inputs
         */
        static outcome::result<std::vector<uint8_t>> EncodeCircuit( const PlonkConstraintSystemType &constraints,
                                                                    const PlonkAssignTableType      &table_template,
                                                                    uint64_t                         num_inputs );

        /**
         * @brief       Marshals a table, each kind of column counted from the size of its vector
         * @param[in]   usable_rows_amount rows the circuit uses, the table is padded from it
         * @param[in]   table_vectors column major values, already padded
         */
        static PlonkAssignTableType BuildPlonkAssignmentTable( std::size_t         usable_rows_amount,
                                                               const TableVectors &table_vectors );

        /**
         * @brief       Padded size of a table with @p usable_rows_amount rows: the next power of two,
         *              doubled when already one, and never below 8
         */
        static std::size_t GetPaddedRowsAmount( std::size_t usable_rows_amount );

        /**
         * @brief       Field value of a canonical little-endian encoding. Callers reject values not
         *              below @ref GetModulus first, anything else would come back reduced.
         */
        static FieldValueType ToFieldValue( const FieldElement::Bytes &bytes );

        static FieldElement::Bytes FromFieldValue( const FieldValueType &value );

        /**
         * @brief       Modulus of the proof field, to validate witness files against
         */
        static FieldElement GetModulus();

        const Config &GetConfig() const
        {
            return config_;
        }

    private:
        const Config config_;
        base::Logger logger_ = base::createLogger( "PlaceholderBackend" );

        FriParams MakeFRIParams( std::size_t rows_amount, std::size_t max_step, std::size_t expand_factor ) const;

        std::vector<std::size_t> GenerateStepList( std::size_t r, std::size_t max_step ) const;

        ProofType FillPlaceholderProof( const ProofSnarkType &proof, const FriParams &commitment_params ) const;

        std::size_t GetPermutationSize() const;

        std::vector<uint8_t> BindTranscript( Transcript              &transcript,
                                             const CircuitDimensions &dimensions,
                                             const Assignment        &inputs,
                                             const std::string       &snark ) const;
    };
}

#endif
