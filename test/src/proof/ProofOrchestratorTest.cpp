/**
 * @file       ProofOrchestratorTest.cpp
 * @brief      Tests of the prove and verify flows against a mocked backend
 * @date       2026-10-17
 */

#include <gtest/gtest.h>

#include "mock/src/proof/proof_backend_mock.hpp"
#include "proof/ProofOrchestrator.hpp"
#include "testutil/outcome.hpp"
#include "witness/WitnessWriter.hpp"

using namespace nizk;
using ::testing::_;
using ::testing::Eq;
using ::testing::InSequence;
using ::testing::Return;

namespace
{
    class FakeGenerators : public GeneratorParams
    {
    };

    class FakeProof : public Proof
    {
    };
}

class ProofOrchestratorTest : public ::testing::Test
{
public:
    void SetUp() override
    {
        backend_    = std::make_shared<ProofBackendMock>();
        instance_   = std::make_shared<CircuitInstanceMock>();
        transcript_ = std::make_shared<TranscriptMock>();
        generators_ = std::make_shared<FakeGenerators>();
        proof_      = std::make_shared<FakeProof>();

        witness_ = { FieldElement::One(), FieldElement::FromUint64( 3 ), FieldElement::FromUint64( 9 ) };
        auto witness_file = WitnessWriter().Encode( witness_, FieldElement::FromUint64( 0xffffffffffffffc5ull ) );
        ASSERT_TRUE( witness_file );
        witness_bytes_ = witness_file.value();

        input_bytes_.assign( FieldElement::FromUint64( 9 ).ToBytes().begin(),
                             FieldElement::FromUint64( 9 ).ToBytes().end() );

        ON_CALL( *instance_, GetDimensions() ).WillByDefault( Return( dimensions_ ) );
    }

    void ExpectCircuit()
    {
        EXPECT_CALL( *backend_, DeserializeCircuit( _ ) )
            .WillOnce( Return( outcome::result<std::shared_ptr<CircuitInstance>>( instance_ ) ) );
    }

    void ExpectGenerators()
    {
        EXPECT_CALL( *backend_, MakeGenerators( Eq( dimensions_ ) ) )
            .WillOnce( Return( outcome::result<std::shared_ptr<GeneratorParams>>( generators_ ) ) );
    }

    std::shared_ptr<ProofBackendMock>    backend_;
    std::shared_ptr<CircuitInstanceMock> instance_;
    std::shared_ptr<TranscriptMock>      transcript_;
    std::shared_ptr<FakeGenerators>      generators_;
    std::shared_ptr<FakeProof>           proof_;

    CircuitDimensions         dimensions_{ 2, 3, 1 };
    std::vector<FieldElement> witness_;
    std::vector<uint8_t>      witness_bytes_;
    std::vector<uint8_t>      input_bytes_;
    std::vector<uint8_t>      circuit_bytes_ = { 0xc1, 0x2c };
    std::vector<uint8_t>      proof_bytes_   = { 0x50, 0x7f, 0x00, 0x01 };
};

/**
 * @given a circuit, a three element witness and one public input
 * @when proving through a backend that accepts everything
 * @then the backend sees the witness and input in order, seeded with the configured label
 */
TEST_F( ProofOrchestratorTest, ProveDrivesTheBackend )
{
    ProofConfig config;
    config.transcript_label = "orchestrator_test";
    ProofOrchestrator orchestrator( backend_, config );

    auto expected_vars   = AssignmentBuilder::BuildPrivate( witness_ );
    Assignment expected_inputs = { FieldElement::FromUint64( 9 ).ToBytes() };

    {
        InSequence seq;
        ExpectCircuit();
        ExpectGenerators();
        EXPECT_CALL( *backend_, MakeTranscript( "orchestrator_test" ) ).WillOnce( Return( transcript_ ) );
        EXPECT_CALL( *backend_, Prove( _, Eq( expected_vars ), Eq( expected_inputs ), _, _ ) )
            .WillOnce( Return( outcome::result<std::shared_ptr<Proof>>( proof_ ) ) );
        EXPECT_CALL( *backend_, SerializeProof( _ ) )
            .WillOnce( Return( outcome::result<std::vector<uint8_t>>( proof_bytes_ ) ) );
    }

    EXPECT_OUTCOME_TRUE( proof, orchestrator.Prove( circuit_bytes_, witness_bytes_, input_bytes_ ) );
    EXPECT_EQ( proof, proof_bytes_ );
}

TEST_F( ProofOrchestratorTest, DefaultLabel )
{
    ProofOrchestrator orchestrator( backend_ );
    EXPECT_EQ( orchestrator.GetConfig().transcript_label, "nizk_example" );

    ExpectCircuit();
    ExpectGenerators();
    EXPECT_CALL( *backend_, DeserializeProof( _ ) )
        .WillOnce( Return( outcome::result<std::shared_ptr<Proof>>( proof_ ) ) );
    EXPECT_CALL( *backend_, MakeTranscript( "nizk_example" ) ).WillOnce( Return( transcript_ ) );
    EXPECT_CALL( *backend_, Verify( _, _, _, _, _ ) ).WillOnce( Return( outcome::result<bool>( true ) ) );

    EXPECT_OUTCOME_EQ( orchestrator.Verify( circuit_bytes_, proof_bytes_, input_bytes_ ), true );
}

TEST_F( ProofOrchestratorTest, WitnessErrorsStopBeforeTheBackend )
{
    ProofOrchestrator orchestrator( backend_ );
    EXPECT_CALL( *backend_, DeserializeCircuit( _ ) ).Times( 0 );
    EXPECT_CALL( *backend_, Prove( _, _, _, _, _ ) ).Times( 0 );

    witness_bytes_[0] = 'x';
    EXPECT_OUTCOME_ERROR( res,
                          orchestrator.Prove( circuit_bytes_, witness_bytes_, input_bytes_ ),
                          WitnessReader::Error::MALFORMED_HEADER );

    witness_bytes_[0] = 'w';
    witness_bytes_.pop_back();
    EXPECT_OUTCOME_ERROR( res2,
                          orchestrator.Prove( circuit_bytes_, witness_bytes_, input_bytes_ ),
                          WitnessReader::Error::TRUNCATED_WITNESS );
}

TEST_F( ProofOrchestratorTest, ProveRejectsShortPublicInput )
{
    ProofOrchestrator orchestrator( backend_ );
    ExpectCircuit();
    ExpectGenerators();
    EXPECT_CALL( *backend_, Prove( _, _, _, _, _ ) ).Times( 0 );

    input_bytes_.resize( 31 );
    EXPECT_OUTCOME_ERROR( res,
                          orchestrator.Prove( circuit_bytes_, witness_bytes_, input_bytes_ ),
                          AssignmentBuilder::Error::TRUNCATED_PUBLIC_INPUT );
}

TEST_F( ProofOrchestratorTest, ProveReportsBackendFailures )
{
    ProofOrchestrator orchestrator( backend_ );
    ExpectCircuit();
    ExpectGenerators();
    EXPECT_CALL( *backend_, MakeTranscript( _ ) ).WillOnce( Return( transcript_ ) );
    EXPECT_CALL( *backend_, Prove( _, _, _, _, _ ) )
        .WillOnce( Return( outcome::failure( ProofError::CIRCUIT_DESERIALIZATION ) ) );
    EXPECT_CALL( *backend_, SerializeProof( _ ) ).Times( 0 );

    EXPECT_OUTCOME_ERROR( res,
                          orchestrator.Prove( circuit_bytes_, witness_bytes_, input_bytes_ ),
                          ProofError::BACKEND_INVOCATION );
}

TEST_F( ProofOrchestratorTest, GeneratorFailureIsBackendFailure )
{
    ProofOrchestrator orchestrator( backend_ );
    ExpectCircuit();
    EXPECT_CALL( *backend_, MakeGenerators( _ ) )
        .WillOnce( Return( outcome::failure( std::make_error_code( std::errc::not_enough_memory ) ) ) );

    EXPECT_OUTCOME_ERROR( res,
                          orchestrator.Prove( circuit_bytes_, witness_bytes_, input_bytes_ ),
                          ProofError::BACKEND_INVOCATION );
}

TEST_F( ProofOrchestratorTest, CircuitFailureIsDeserializationError )
{
    ProofOrchestrator orchestrator( backend_ );
    EXPECT_CALL( *backend_, DeserializeCircuit( _ ) )
        .WillRepeatedly( Return( outcome::failure( std::make_error_code( std::errc::invalid_argument ) ) ) );

    EXPECT_OUTCOME_ERROR( res,
                          orchestrator.Prove( circuit_bytes_, witness_bytes_, input_bytes_ ),
                          ProofError::CIRCUIT_DESERIALIZATION );
    EXPECT_OUTCOME_ERROR( res2,
                          orchestrator.Verify( circuit_bytes_, proof_bytes_, input_bytes_ ),
                          ProofError::CIRCUIT_DESERIALIZATION );
    EXPECT_OUTCOME_ERROR( res3, orchestrator.Inspect( circuit_bytes_ ), ProofError::CIRCUIT_DESERIALIZATION );
}

/**
 * @given a backend that judges the proof false
 * @when verifying
 * @then false is a result and not an error
 */
TEST_F( ProofOrchestratorTest, VerifyPassesRejection )
{
    ProofOrchestrator orchestrator( backend_ );
    Assignment expected_inputs = { FieldElement::FromUint64( 9 ).ToBytes() };

    ExpectCircuit();
    ExpectGenerators();
    EXPECT_CALL( *backend_, DeserializeProof( _ ) )
        .WillOnce( Return( outcome::result<std::shared_ptr<Proof>>( proof_ ) ) );
    EXPECT_CALL( *backend_, MakeTranscript( _ ) ).WillOnce( Return( transcript_ ) );
    EXPECT_CALL( *backend_, Verify( _, _, Eq( expected_inputs ), _, _ ) )
        .WillOnce( Return( outcome::result<bool>( false ) ) );

    EXPECT_OUTCOME_EQ( orchestrator.Verify( circuit_bytes_, proof_bytes_, input_bytes_ ), false );
}

TEST_F( ProofOrchestratorTest, VerifyRejectsUndecodableProof )
{
    ProofOrchestrator orchestrator( backend_ );
    ExpectCircuit();
    EXPECT_CALL( *backend_, DeserializeProof( _ ) )
        .WillOnce( Return( outcome::failure( std::make_error_code( std::errc::bad_message ) ) ) );
    EXPECT_CALL( *backend_, Verify( _, _, _, _, _ ) ).Times( 0 );

    EXPECT_OUTCOME_ERROR( res,
                          orchestrator.Verify( circuit_bytes_, proof_bytes_, input_bytes_ ),
                          ProofError::PROOF_DESERIALIZATION );
}

TEST_F( ProofOrchestratorTest, VerifyReportsBackendFailures )
{
    ProofOrchestrator orchestrator( backend_ );
    ExpectCircuit();
    ExpectGenerators();
    EXPECT_CALL( *backend_, DeserializeProof( _ ) )
        .WillOnce( Return( outcome::result<std::shared_ptr<Proof>>( proof_ ) ) );
    EXPECT_CALL( *backend_, MakeTranscript( _ ) ).WillOnce( Return( transcript_ ) );
    EXPECT_CALL( *backend_, Verify( _, _, _, _, _ ) )
        .WillOnce( Return( outcome::failure( std::make_error_code( std::errc::io_error ) ) ) );

    EXPECT_OUTCOME_ERROR( res,
                          orchestrator.Verify( circuit_bytes_, proof_bytes_, input_bytes_ ),
                          ProofError::BACKEND_INVOCATION );
}

TEST_F( ProofOrchestratorTest, InspectReportsDimensions )
{
    ProofOrchestrator orchestrator( backend_ );
    ExpectCircuit();
    EXPECT_CALL( *backend_, MakeGenerators( _ ) ).Times( 0 );

    EXPECT_OUTCOME_TRUE( dimensions, orchestrator.Inspect( circuit_bytes_ ) );
    EXPECT_EQ( dimensions, dimensions_ );
}

/**
 * @given a backend whose field modulus is 9 and a witness format without any bound of its own
 * @when proving with a witness element or a public input that reaches 9
 * @then both are refused before the backend proves anything
 */
TEST_F( ProofOrchestratorTest, BackendModulusBoundsWitnessAndInputs )
{
    EXPECT_CALL( *backend_, GetFieldModulus() )
        .WillOnce( Return( std::optional<FieldElement>( FieldElement::FromUint64( 9 ) ) ) );
    ProofOrchestrator orchestrator( backend_ );
    EXPECT_CALL( *backend_, Prove( _, _, _, _, _ ) ).Times( 0 );

    EXPECT_CALL( *backend_, DeserializeCircuit( _ ) )
        .WillOnce( Return( outcome::result<std::shared_ptr<CircuitInstance>>( instance_ ) ) );
    EXPECT_CALL( *backend_, MakeGenerators( Eq( dimensions_ ) ) )
        .WillOnce( Return( outcome::result<std::shared_ptr<GeneratorParams>>( generators_ ) ) );

    EXPECT_OUTCOME_ERROR( res,
                          orchestrator.Prove( circuit_bytes_, witness_bytes_, input_bytes_ ),
                          WitnessReader::Error::NON_CANONICAL_ELEMENT );

    auto small_witness =
        WitnessWriter().Encode( { FieldElement::One(), FieldElement::FromUint64( 2 ), FieldElement::FromUint64( 8 ) },
                                FieldElement::FromUint64( 0xffffffffffffffc5ull ) );
    ASSERT_TRUE( small_witness );
    EXPECT_OUTCOME_ERROR( res2,
                          orchestrator.Prove( circuit_bytes_, small_witness.value(), input_bytes_ ),
                          AssignmentBuilder::Error::NON_CANONICAL_INPUT );
}
