/**
 * @file       PlaceholderBackend.cpp
 * @brief      Proof backend on top of the crypto3 Placeholder (PLONK with LPC/FRI commitments) proof system
 * @date       2026-10-17
 */

#include "proof/PlaceholderBackend.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include <boost/endian/conversion.hpp>

#include <nil/crypto3/zk/snark/arithmetization/plonk/constraint.hpp>
#include <nil/crypto3/zk/snark/arithmetization/plonk/gate.hpp>
#include <nil/crypto3/zk/snark/arithmetization/plonk/variable.hpp>

#include "base/mp_utils.hpp"
#include "proof/NilFileHelper.hpp"
#include "proof/proto/NizkProof.pb.h"

namespace nizk
{
    namespace
    {
        using Backend      = PlaceholderBackend;
        using ModulusType  = nil::crypto3::multiprecision::number<nil::crypto3::multiprecision::backends::cpp_int_backend<>>;
        using VariableType = typename Backend::ConstraintSystemType::variable_type;
        using GateType     = typename Backend::ConstraintSystemType::gates_container_type::value_type;
        using ConstraintType = crypto3::zk::snark::plonk_constraint<Backend::BlueprintFieldType>;

        /// dimensions, then the transcript binding, then the snark
        constexpr std::size_t PROOF_HEADER_SIZE = 3 * sizeof( uint64_t ) + FieldElement::BYTE_SIZE;

        class PlaceholderCircuit : public CircuitInstance
        {
        public:
            PlaceholderCircuit( Backend::ConstraintSystemType constraint_system,
                                Backend::TableDescriptionType table_description,
                                Backend::AssignmentTableType  table_template,
                                CircuitDimensions             dimensions ) :
                constraint_system_( std::move( constraint_system ) ), //
                table_description_( std::move( table_description ) ), //
                table_template_( std::move( table_template ) ),       //
                dimensions_( dimensions )                             //
            {
            }

            CircuitDimensions GetDimensions() const override
            {
                return dimensions_;
            }

            const Backend::ConstraintSystemType &GetConstraintSystem() const
            {
                return constraint_system_;
            }

            const Backend::TableDescriptionType &GetTableDescription() const
            {
                return table_description_;
            }

            const Backend::AssignmentTableType &GetTableTemplate() const
            {
                return table_template_;
            }

        private:
            const Backend::ConstraintSystemType constraint_system_;
            const Backend::TableDescriptionType table_description_;
            const Backend::AssignmentTableType  table_template_;
            const CircuitDimensions             dimensions_;
        };

        class PlaceholderGenerators : public GeneratorParams
        {
        public:
            PlaceholderGenerators( Backend::FriParams fri_params, std::size_t rows_amount ) :
                fri_params_( std::move( fri_params ) ), rows_amount_( rows_amount )
            {
            }

            const Backend::FriParams &GetFriParams() const
            {
                return fri_params_;
            }

            std::size_t GetRowsAmount() const
            {
                return rows_amount_;
            }

        private:
            const Backend::FriParams fri_params_;
            const std::size_t        rows_amount_;
        };

        struct PlaceholderProof : public Proof
        {
            CircuitDimensions    dimensions;
            std::vector<uint8_t> transcript_binding;
            std::string          snark;
        };

        class PlaceholderTranscript : public Transcript
        {
        public:
            explicit PlaceholderTranscript( const std::string &label ) :
                transcript_( std::vector<std::uint8_t>( label.begin(), label.end() ) )
            {
            }

            void Append( gsl::span<const uint8_t> bytes ) override
            {
                transcript_( std::vector<std::uint8_t>( bytes.begin(), bytes.end() ) );
            }

            std::vector<uint8_t> Challenge() override
            {
                auto challenge = transcript_.template challenge<Backend::BlueprintFieldType>();
                auto repr      = Backend::FromFieldValue( challenge );
                return std::vector<uint8_t>( repr.begin(), repr.end() );
            }

        private:
            Backend::TranscriptType transcript_;
        };

        uint64_t CountConstraints( const Backend::ConstraintSystemType &constraint_system )
        {
            uint64_t num_constraints = 0;
            for ( const auto &gate : constraint_system.gates() )
            {
                num_constraints += gate.constraints.size();
            }
            for ( const auto &lookup_gate : constraint_system.lookup_gates() )
            {
                num_constraints += lookup_gate.constraints.size();
            }
            return num_constraints;
        }

        void CopyColumn( const Backend::PlonkColumn                    &table_col,
                         std::vector<Backend::FieldValueType>::iterator start,
                         std::size_t                                    padded_rows_amount )
        {
            auto count = std::min<std::size_t>( table_col.size(), padded_rows_amount );
            std::copy( table_col.begin(), table_col.begin() + count, start );
        }

        /**
         * @brief       Lays out a full table: the values fill the witness columns one column after
         *              the other, the inputs the first public input column, and the fixed columns
         *              come from the circuit template. Past the template sit one more constant column,
         *              repeating the inputs with @p domain_tag in its last row, and the selector of
         *              the gate tying it to the public input column. Everything else is zero.
         */
        Backend::TableVectors MakeTableVectors( const PlaceholderCircuit      &circuit,
                                                const Assignment              &vars,
                                                const Assignment              &inputs,
                                                const Backend::FieldValueType &domain_tag )
        {
            const auto &desc = circuit.GetTableDescription();
            const auto  rows = desc.rows_amount;

            Backend::TableVectors table_vectors;
            table_vectors.witness_values.resize( rows * desc.witness_columns, 0 );
            for ( std::size_t i = 0; i < vars.size(); ++i )
            {
                auto column = i / desc.usable_rows_amount;
                auto row    = i % desc.usable_rows_amount;
                table_vectors.witness_values[column * rows + row] = Backend::ToFieldValue( vars[i] );
            }
            table_vectors.public_input_values.resize( rows * desc.public_input_columns, 0 );
            for ( std::size_t i = 0; i < inputs.size(); ++i )
            {
                table_vectors.public_input_values[i] = Backend::ToFieldValue( inputs[i] );
            }

            table_vectors.constant_values.resize( rows * ( desc.constant_columns + 1 ), 0 );
            auto it = table_vectors.constant_values.begin();
            for ( std::uint32_t i = 0; i < desc.constant_columns; i++ )
            {
                CopyColumn( circuit.GetTableTemplate().constant( i ), it, rows );
                it += rows;
            }
            for ( std::size_t i = 0; i < inputs.size(); ++i )
            {
                it[i] = table_vectors.public_input_values[i];
            }
            it[rows - 1] = domain_tag;

            table_vectors.selector_values.resize( rows * ( desc.selector_columns + 1 ), 0 );
            it = table_vectors.selector_values.begin();
            for ( std::uint32_t i = 0; i < desc.selector_columns; i++ )
            {
                CopyColumn( circuit.GetTableTemplate().selector( i ), it, rows );
                it += rows;
            }
            std::fill_n( it, inputs.size(), Backend::FieldValueType::one() );
            return table_vectors;
        }

        /**
         * @brief       Adds the gate forcing the first public input column to equal the input
         *              constant column on the rows its selector enables
         */
        Backend::ConstraintSystemType AddInputGate( const Backend::ConstraintSystemType &constraint_sys,
                                                    std::size_t                          constant_index,
                                                    std::size_t                          selector_index )
        {
            ConstraintType input_equality = VariableType( 0, 0, true, VariableType::column_type::public_input ) -
                                            VariableType( constant_index, 0, true, VariableType::column_type::constant );

            auto gates = constraint_sys.gates();
            gates.push_back( GateType( selector_index, std::vector<ConstraintType>{ input_equality } ) );
            return Backend::ConstraintSystemType( gates,
                                                  constraint_sys.copy_constraints(),
                                                  constraint_sys.lookup_gates(),
                                                  constraint_sys.lookup_tables() );
        }

        /**
         * @brief       Field value a label seeded transcript yields before anything is appended
         */
        outcome::result<Backend::FieldValueType> DomainTag( Transcript &transcript )
        {
            OUTCOME_TRY( ( auto &&, tag ), FieldElement::FromBytes( transcript.Challenge() ) );
            return Backend::ToFieldValue( tag.ToBytes() );
        }

        bool IsCanonical( const Assignment &assignment )
        {
            static const FieldElement modulus = Backend::GetModulus();
            return std::all_of( assignment.begin(),
                                assignment.end(),
                                []( const FieldElement::Bytes &value ) { return FieldElement( value ).IsLessThan( modulus ); } );
        }
    }

    PlaceholderBackend::PlaceholderBackend( Config config ) : config_( std::move( config ) )
    {
    }

    outcome::result<std::shared_ptr<CircuitInstance>> PlaceholderBackend::DeserializeCircuit(
        gsl::span<const uint8_t> bytes ) const
    {
        proto::CircuitInstance circuit;
        if ( !circuit.ParseFromArray( bytes.data(), static_cast<int>( bytes.size() ) ) )
        {
            logger_->warn( "Circuit file is not a valid circuit message" );
            return outcome::failure( ProofError::CIRCUIT_DESERIALIZATION );
        }

        const auto &cs_string = circuit.constraint_system();
        OUTCOME_TRY( ( auto &&, plonk_constrains ),
                     NilFileHelper::DecodeMarshalledData<PlonkConstraintSystemType>(
                         gsl::span<const uint8_t>( reinterpret_cast<const uint8_t *>( cs_string.data() ),
                                                   cs_string.size() ),
                         ProofError::CIRCUIT_DESERIALIZATION ) );
        const auto &table_string = circuit.table_template();
        OUTCOME_TRY( ( auto &&, plonk_table ),
                     NilFileHelper::DecodeMarshalledData<PlonkAssignTableType>(
                         gsl::span<const uint8_t>( reinterpret_cast<const uint8_t *>( table_string.data() ),
                                                   table_string.size() ),
                         ProofError::CIRCUIT_DESERIALIZATION ) );

        ConstraintSystemType constraint_sys(
            crypto3::marshalling::types::make_plonk_constraint_system<ProverEndianess, ConstraintSystemType>(
                plonk_constrains ) );

        if ( ( constraint_sys.max_gates_degree() == 0 ) && ( constraint_sys.max_lookup_gates_degree() == 0 ) )
        {
            logger_->warn( "The constrains are zeroed, the circuit is a constant function" );
            return outcome::failure( ProofError::CIRCUIT_DESERIALIZATION );
        }

        auto [plonk_table_desc, table_template] =
            crypto3::marshalling::types::make_assignment_table<ProverEndianess, AssignmentTableType>( plonk_table );

        if ( plonk_table_desc.witness_columns != config_.witness_columns ||
             plonk_table_desc.public_input_columns != config_.public_input_columns ||
             plonk_table_desc.constant_columns != config_.constant_columns ||
             plonk_table_desc.selector_columns != config_.selector_columns )
        {
            logger_->warn( "Circuit table has {}/{}/{}/{} columns, expected {}/{}/{}/{}",
                           plonk_table_desc.witness_columns,
                           plonk_table_desc.public_input_columns,
                           plonk_table_desc.constant_columns,
                           plonk_table_desc.selector_columns,
                           config_.witness_columns,
                           config_.public_input_columns,
                           config_.constant_columns,
                           config_.selector_columns );
            return outcome::failure( ProofError::CIRCUIT_DESERIALIZATION );
        }
        if ( plonk_table_desc.usable_rows_amount == 0 ||
             plonk_table_desc.rows_amount != GetPaddedRowsAmount( plonk_table_desc.usable_rows_amount ) )
        {
            logger_->warn( "Circuit table has {} rows for {} usable ones",
                           plonk_table_desc.rows_amount,
                           plonk_table_desc.usable_rows_amount );
            return outcome::failure( ProofError::CIRCUIT_DESERIALIZATION );
        }
        if ( circuit.num_inputs() > plonk_table_desc.usable_rows_amount )
        {
            logger_->warn( "Circuit declares {} inputs but its public input column has {} rows",
                           circuit.num_inputs(),
                           plonk_table_desc.usable_rows_amount );
            return outcome::failure( ProofError::CIRCUIT_DESERIALIZATION );
        }

        if ( circuit.num_inputs() > 0 && plonk_table_desc.public_input_columns == 0 )
        {
            logger_->warn( "Circuit declares {} inputs but has no public input column", circuit.num_inputs() );
            return outcome::failure( ProofError::CIRCUIT_DESERIALIZATION );
        }

        CircuitDimensions dimensions;
        dimensions.num_constraints = CountConstraints( constraint_sys );
        dimensions.num_vars   = static_cast<uint64_t>( plonk_table_desc.witness_columns ) *
                              plonk_table_desc.usable_rows_amount;
        dimensions.num_inputs = circuit.num_inputs();

        if ( circuit.num_inputs() > 0 )
        {
            constraint_sys =
                AddInputGate( constraint_sys, plonk_table_desc.constant_columns, plonk_table_desc.selector_columns );
        }

        return std::make_shared<PlaceholderCircuit>( std::move( constraint_sys ),
                                                     plonk_table_desc,
                                                     std::move( table_template ),
                                                     dimensions );
    }

    outcome::result<std::shared_ptr<GeneratorParams>> PlaceholderBackend::MakeGenerators(
        const CircuitDimensions &dimensions ) const
    {
        if ( config_.witness_columns == 0 || dimensions.num_vars == 0 ||
             dimensions.num_vars % config_.witness_columns != 0 )
        {
            logger_->error( "{} variables don't fill {} witness columns", dimensions.num_vars, config_.witness_columns );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }
        auto usable_rows_amount = static_cast<std::size_t>( dimensions.num_vars / config_.witness_columns );
        auto rows_amount        = GetPaddedRowsAmount( usable_rows_amount );

        return std::make_shared<PlaceholderGenerators>(
            MakeFRIParams( rows_amount, config_.max_fri_step, config_.expand_factor ),
            rows_amount );
    }

    std::shared_ptr<Transcript> PlaceholderBackend::MakeTranscript( const std::string &label ) const
    {
        return std::make_shared<PlaceholderTranscript>( label );
    }

    std::optional<FieldElement> PlaceholderBackend::GetFieldModulus() const
    {
        return GetModulus();
    }

    outcome::result<std::shared_ptr<Proof>> PlaceholderBackend::Prove( const CircuitInstance &instance,
                                                                       const Assignment      &vars,
                                                                       const Assignment      &inputs,
                                                                       const GeneratorParams &generators,
                                                                       Transcript            &transcript ) const
    {
        const auto *circuit = dynamic_cast<const PlaceholderCircuit *>( &instance );
        const auto *gens    = dynamic_cast<const PlaceholderGenerators *>( &generators );
        if ( circuit == nullptr || gens == nullptr )
        {
            logger_->error( "Circuit or generators were not made by this backend" );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }

        const auto &desc       = circuit->GetTableDescription();
        const auto  dimensions = circuit->GetDimensions();
        if ( gens->GetRowsAmount() != desc.rows_amount )
        {
            logger_->error( "Generators for {} rows can't prove a {} rows table", gens->GetRowsAmount(), desc.rows_amount );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }
        if ( vars.size() > dimensions.num_vars || inputs.size() != dimensions.num_inputs )
        {
            logger_->error( "{} values and {} inputs don't fit a circuit of {} variables and {} inputs",
                            vars.size(),
                            inputs.size(),
                            dimensions.num_vars,
                            dimensions.num_inputs );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }
        if ( !IsCanonical( vars ) || !IsCanonical( inputs ) )
        {
            logger_->error( "Values and inputs must be below the field modulus" );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }

        OUTCOME_TRY( ( auto &&, domain_tag ), DomainTag( transcript ) );
        auto table_vectors = MakeTableVectors( *circuit, vars, inputs, domain_tag );

        auto plonk_table = BuildPlonkAssignmentTable( desc.usable_rows_amount, table_vectors );
        auto [plonk_table_desc, assignment_table] =
            crypto3::marshalling::types::make_assignment_table<ProverEndianess, AssignmentTableType>( plonk_table );

        const auto &constrains_sys = circuit->GetConstraintSystem();
        LpcScheme   lpc_scheme( gens->GetFriParams() );

        auto proof = std::make_shared<PlaceholderProof>();
        try
        {
            PublicPreprocessedData public_preprocessed_data(
                PublicPreprocessor::process( constrains_sys,
                                             assignment_table.move_public_table(),
                                             plonk_table_desc,
                                             lpc_scheme,
                                             GetPermutationSize() ) );

            PrivatePreprocessedData private_preprocessed_data( PrivatePreprocessor::process(
                constrains_sys,
                assignment_table.move_private_table(),
                plonk_table_desc ) );

            ProofSnarkType snark = ProverType::process( public_preprocessed_data,
                                                        private_preprocessed_data,
                                                        plonk_table_desc,
                                                        constrains_sys,
                                                        lpc_scheme );

            if ( !VerifierType::process( public_preprocessed_data, snark, plonk_table_desc, constrains_sys, lpc_scheme ) )
            {
                logger_->error( "The generated proof doesn't verify, the witness doesn't satisfy the circuit" );
                return outcome::failure( ProofError::BACKEND_INVOCATION );
            }

            OUTCOME_TRY( ( auto &&, snark_bytes ),
                         NilFileHelper::EncodeMarshalledData( FillPlaceholderProof( snark, gens->GetFriParams() ) ) );
            proof->snark.assign( snark_bytes.begin(), snark_bytes.end() );
        }
        catch ( const std::exception &e )
        {
            logger_->error( "Placeholder prover failed: {}", e.what() );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }

        proof->dimensions         = dimensions;
        proof->transcript_binding = BindTranscript( transcript, dimensions, inputs, proof->snark );
        logger_->debug( "Placeholder proof of {} bytes for {} rows", proof->snark.size(), desc.rows_amount );
        return proof;
    }

    outcome::result<bool> PlaceholderBackend::Verify( const Proof           &proof,
                                                      const CircuitInstance &instance,
                                                      const Assignment      &inputs,
                                                      Transcript            &transcript,
                                                      const GeneratorParams &generators ) const
    {
        const auto *placeholder_proof = dynamic_cast<const PlaceholderProof *>( &proof );
        const auto *circuit           = dynamic_cast<const PlaceholderCircuit *>( &instance );
        const auto *gens              = dynamic_cast<const PlaceholderGenerators *>( &generators );
        if ( placeholder_proof == nullptr || circuit == nullptr || gens == nullptr )
        {
            logger_->error( "Proof, circuit or generators were not made by this backend" );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }

        const auto dimensions = circuit->GetDimensions();
        if ( placeholder_proof->dimensions != dimensions )
        {
            logger_->warn( "Proof was made for another circuit" );
            return false;
        }
        if ( inputs.size() != dimensions.num_inputs || !IsCanonical( inputs ) )
        {
            logger_->error( "{} inputs for a circuit of {} inputs, each below the field modulus",
                            inputs.size(),
                            dimensions.num_inputs );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }
        OUTCOME_TRY( ( auto &&, domain_tag ), DomainTag( transcript ) );
        if ( BindTranscript( transcript, dimensions, inputs, placeholder_proof->snark ) !=
             placeholder_proof->transcript_binding )
        {
            logger_->warn( "Transcript binding doesn't match the proof and public inputs" );
            return false;
        }

        auto marshalled_proof = NilFileHelper::DecodeMarshalledData<ProofType>(
            gsl::span<const uint8_t>( reinterpret_cast<const uint8_t *>( placeholder_proof->snark.data() ),
                                      placeholder_proof->snark.size() ),
            ProofError::PROOF_DESERIALIZATION );
        if ( !marshalled_proof )
        {
            logger_->warn( "Proof snark can't be decoded" );
            return false;
        }

        const auto &desc = circuit->GetTableDescription();

        // the verifier only reads the public part of the table, the fixed columns it commits carry
        // the caller's inputs and label
        auto table_vectors = MakeTableVectors( *circuit, Assignment{}, inputs, domain_tag );

        auto plonk_table = BuildPlonkAssignmentTable( desc.usable_rows_amount, table_vectors );
        auto [plonk_table_desc, assignment_table] =
            crypto3::marshalling::types::make_assignment_table<ProverEndianess, AssignmentTableType>( plonk_table );

        const auto &constrains_sys = circuit->GetConstraintSystem();
        LpcScheme   lpc_scheme( gens->GetFriParams() );

        try
        {
            PublicPreprocessedData public_preprocessed_data(
                PublicPreprocessor::process( constrains_sys,
                                             assignment_table.move_public_table(),
                                             plonk_table_desc,
                                             lpc_scheme,
                                             GetPermutationSize() ) );

            auto proof_snark = crypto3::marshalling::types::make_placeholder_proof<ProverEndianess, ProofSnarkType>(
                marshalled_proof.value() );
            return VerifierType::process( public_preprocessed_data,
                                          proof_snark,
                                          plonk_table_desc,
                                          constrains_sys,
                                          lpc_scheme );
        }
        catch ( const std::exception &e )
        {
            logger_->error( "Placeholder verifier failed: {}", e.what() );
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }
    }

    outcome::result<std::vector<uint8_t>> PlaceholderBackend::SerializeProof( const Proof &proof ) const
    {
        const auto *placeholder_proof = dynamic_cast<const PlaceholderProof *>( &proof );
        if ( placeholder_proof == nullptr || placeholder_proof->transcript_binding.size() != FieldElement::BYTE_SIZE )
        {
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }

        std::vector<uint8_t> serialized( PROOF_HEADER_SIZE + placeholder_proof->snark.size() );
        auto                *out = serialized.data();
        for ( auto dimension : { placeholder_proof->dimensions.num_constraints,
                                 placeholder_proof->dimensions.num_vars,
                                 placeholder_proof->dimensions.num_inputs } )
        {
            boost::endian::store_little_u64( out, dimension );
            out += sizeof( uint64_t );
        }
        out = std::copy( placeholder_proof->transcript_binding.begin(), placeholder_proof->transcript_binding.end(), out );
        std::copy( placeholder_proof->snark.begin(), placeholder_proof->snark.end(), out );
        return serialized;
    }

    outcome::result<std::shared_ptr<Proof>> PlaceholderBackend::DeserializeProof( gsl::span<const uint8_t> bytes ) const
    {
        // every byte past the header belongs to the snark, so only a short proof is malformed
        if ( bytes.size() <= PROOF_HEADER_SIZE )
        {
            logger_->warn( "Proof of {} bytes has no room for a snark", bytes.size() );
            return outcome::failure( ProofError::PROOF_DESERIALIZATION );
        }

        auto        proof = std::make_shared<PlaceholderProof>();
        const auto *in    = bytes.data();
        proof->dimensions.num_constraints = boost::endian::load_little_u64( in );
        proof->dimensions.num_vars        = boost::endian::load_little_u64( in + sizeof( uint64_t ) );
        proof->dimensions.num_inputs      = boost::endian::load_little_u64( in + 2 * sizeof( uint64_t ) );
        in += 3 * sizeof( uint64_t );
        proof->transcript_binding.assign( in, in + FieldElement::BYTE_SIZE );
        in += FieldElement::BYTE_SIZE;
        proof->snark.assign( in, bytes.data() + bytes.size() );
        return proof;
    }

    outcome::result<std::vector<uint8_t>> PlaceholderBackend::EncodeCircuit(
        const PlonkConstraintSystemType &constraints,
        const PlonkAssignTableType      &table_template,
        uint64_t                         num_inputs )
    {
        OUTCOME_TRY( ( auto &&, constraint_bytes ), NilFileHelper::EncodeMarshalledData( constraints ) );
        OUTCOME_TRY( ( auto &&, table_bytes ), NilFileHelper::EncodeMarshalledData( table_template ) );

        proto::CircuitInstance circuit;
        circuit.set_num_inputs( num_inputs );
        circuit.set_constraint_system( std::string( constraint_bytes.begin(), constraint_bytes.end() ) );
        circuit.set_table_template( std::string( table_bytes.begin(), table_bytes.end() ) );

        std::vector<uint8_t> serialized( circuit.ByteSizeLong() );
        if ( !circuit.SerializeToArray( serialized.data(), static_cast<int>( serialized.size() ) ) )
        {
            return outcome::failure( ProofError::BACKEND_INVOCATION );
        }
        return serialized;
    }

    PlaceholderBackend::PlonkAssignTableType PlaceholderBackend::BuildPlonkAssignmentTable(
        std::size_t         usable_rows_amount,
        const TableVectors &table_vectors )
    {
        std::size_t padded_rows_amount = GetPaddedRowsAmount( usable_rows_amount );
        auto        columns            = [padded_rows_amount]( const std::vector<FieldValueType> &values )
        { return values.size() / padded_rows_amount; };

        auto filled_val = PlonkAssignTableType( std::make_tuple(
            nil::marshalling::types::integral<TTypeBase, std::size_t>( columns( table_vectors.witness_values ) ),
            nil::marshalling::types::integral<TTypeBase, std::size_t>( columns( table_vectors.public_input_values ) ),
            nil::marshalling::types::integral<TTypeBase, std::size_t>( columns( table_vectors.constant_values ) ),
            nil::marshalling::types::integral<TTypeBase, std::size_t>( columns( table_vectors.selector_values ) ),
            nil::marshalling::types::integral<TTypeBase, std::size_t>( usable_rows_amount ),
            nil::marshalling::types::integral<TTypeBase, std::size_t>( padded_rows_amount ),
            nil::crypto3::marshalling::types::fill_field_element_vector<FieldValueType, ProverEndianess>(
                table_vectors.witness_values ),
            nil::crypto3::marshalling::types::fill_field_element_vector<FieldValueType, ProverEndianess>(
                table_vectors.public_input_values ),
            nil::crypto3::marshalling::types::fill_field_element_vector<FieldValueType, ProverEndianess>(
                table_vectors.constant_values ),
            nil::crypto3::marshalling::types::fill_field_element_vector<FieldValueType, ProverEndianess>(
                table_vectors.selector_values ) ) );

        return filled_val;
    }

    std::size_t PlaceholderBackend::GetPaddedRowsAmount( std::size_t usable_rows_amount )
    {
        std::size_t padded_rows_amount = std::pow( 2, std::ceil( std::log2( usable_rows_amount ) ) );
        if ( padded_rows_amount == usable_rows_amount )
        {
            padded_rows_amount *= 2;
        }
        if ( padded_rows_amount < 8 )
        {
            padded_rows_amount = 8;
        }
        return padded_rows_amount;
    }

    PlaceholderBackend::FieldValueType PlaceholderBackend::ToFieldValue( const FieldElement::Bytes &bytes )
    {
        ModulusType integral;
        nil::crypto3::multiprecision::import_bits( integral, bytes.begin(), bytes.end(), 8, false );
        integral %= ModulusType( BlueprintFieldType::modulus );
        return FieldValueType( typename BlueprintFieldType::integral_type( integral ) );
    }

    FieldElement::Bytes PlaceholderBackend::FromFieldValue( const FieldValueType &value )
    {
        std::vector<uint8_t> exported;
        nil::crypto3::multiprecision::export_bits( ModulusType( value.data ), std::back_inserter( exported ), 8, false );

        FieldElement::Bytes repr{};
        repr.fill( 0 );
        std::copy_n( exported.begin(), std::min( exported.size(), repr.size() ), repr.begin() );
        return repr;
    }

    FieldElement PlaceholderBackend::GetModulus()
    {
        std::vector<uint8_t> exported;
        nil::crypto3::multiprecision::export_bits( ModulusType( BlueprintFieldType::modulus ),
                                                   std::back_inserter( exported ),
                                                   8,
                                                   false );
        return FieldElement::FromNarrowBytes( exported ).value();
    }

    PlaceholderBackend::FriParams PlaceholderBackend::MakeFRIParams( std::size_t rows_amount,
                                                                     std::size_t max_step,
                                                                     std::size_t expand_factor ) const
    {
        std::size_t table_rows_log = std::ceil( std::log2( rows_amount ) );
        std::size_t r              = table_rows_log - 1;

        return Lpc::fri_type::params_type(
            ( 1 << table_rows_log ) - 1, // max_degree
            crypto3::math::calculate_domain_set<BlueprintFieldType>( table_rows_log + expand_factor, r ),
            GenerateStepList( r, max_step ),
            expand_factor );
    }

    std::vector<std::size_t> PlaceholderBackend::GenerateStepList( const std::size_t r, std::size_t max_step ) const
    {
        max_step = std::max<std::size_t>( max_step, 1 );

        std::vector<std::size_t> step_list;
        std::size_t              steps_sum = 0;
        while ( steps_sum != r )
        {
            if ( r - steps_sum <= max_step )
            {
                while ( r - steps_sum != 1 )
                {
                    step_list.emplace_back( r - steps_sum - 1 );
                    steps_sum += step_list.back();
                }
                step_list.emplace_back( 1 );
                steps_sum += step_list.back();
            }
            else
            {
                step_list.emplace_back( max_step );
                steps_sum += step_list.back();
            }
        }
        return step_list;
    }

    PlaceholderBackend::ProofType PlaceholderBackend::FillPlaceholderProof( const ProofSnarkType &proof,
                                                                            const FriParams      &commitment_params ) const
    {
        nil::marshalling::types::array_list<
            TTypeBase,
            typename crypto3::marshalling::types::commitment<TTypeBase,
                                                             typename ProofSnarkType::commitment_scheme_type>::type,
            nil::marshalling::option::sequence_size_field_prefix<
                nil::marshalling::types::integral<TTypeBase, std::uint8_t>>>
            filled_commitments;
        for ( const auto &it : proof.commitments )
        {
            filled_commitments.value().push_back(
                crypto3::marshalling::types::fill_commitment<ProverEndianess,
                                                             typename ProofSnarkType::commitment_scheme_type>(
                    it.second ) );
        }

        return ProofType( std::make_tuple(
            filled_commitments,
            crypto3::marshalling::types::fill_placeholder_evaluation_proof<ProverEndianess, ProofSnarkType>(
                proof.eval_proof,
                commitment_params ) ) );
    }

    std::size_t PlaceholderBackend::GetPermutationSize() const
    {
        return config_.witness_columns + config_.public_input_columns + config_.component_constant_columns;
    }

    std::vector<uint8_t> PlaceholderBackend::BindTranscript( Transcript              &transcript,
                                                             const CircuitDimensions &dimensions,
                                                             const Assignment        &inputs,
                                                             const std::string       &snark ) const
    {
        for ( auto dimension : { dimensions.num_constraints, dimensions.num_vars, dimensions.num_inputs } )
        {
            transcript.Append( base::uint64_t_to_bytes( dimension ) );
        }
        for ( const auto &input : inputs )
        {
            transcript.Append( input );
        }
        transcript.Append(
            gsl::span<const uint8_t>( reinterpret_cast<const uint8_t *>( snark.data() ), snark.size() ) );
        return transcript.Challenge();
    }
}
