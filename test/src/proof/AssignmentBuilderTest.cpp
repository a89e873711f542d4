/**
 * @file       AssignmentBuilderTest.cpp
 * @brief      Tests of the witness and public input shaping
 * @date       2026-10-17
 */

#include <gtest/gtest.h>

#include "mock/src/proof/proof_backend_mock.hpp"
#include "proof/AssignmentBuilder.hpp"
#include "testutil/outcome.hpp"

using namespace nizk;
using ::testing::_;
using ::testing::Return;

namespace
{
    std::vector<uint8_t> ConcatInputs( const std::vector<FieldElement> &inputs )
    {
        std::vector<uint8_t> bytes;
        for ( const auto &input : inputs )
        {
            bytes.insert( bytes.end(), input.ToBytes().begin(), input.ToBytes().end() );
        }
        return bytes;
    }
}

TEST( AssignmentBuilderTest, PrivateKeepsOrderAndEncoding )
{
    std::vector<FieldElement> witness = { FieldElement::One(), FieldElement::FromUint64( 77 ), FieldElement::Zero() };

    auto assignment = AssignmentBuilder::BuildPrivate( witness );

    ASSERT_EQ( assignment.size(), witness.size() );
    for ( std::size_t i = 0; i < witness.size(); ++i )
    {
        EXPECT_EQ( assignment[i], witness[i].ToBytes() );
    }
    EXPECT_TRUE( AssignmentBuilder::BuildPrivate( {} ).empty() );
}

/**
 * @given public input bytes for three inputs plus a few trailing bytes
 * @when split for circuits of 0 to 3 inputs
 * @then the leading chunks are taken verbatim and the rest ignored
 */
TEST( AssignmentBuilderTest, PublicTakesConsecutiveChunks )
{
    std::vector<FieldElement> inputs = { FieldElement::FromUint64( 5 ),
                                         FieldElement::FromUint64( 11 ),
                                         FieldElement::FromUint64( 55 ) };
    auto bytes = ConcatInputs( inputs );
    bytes.insert( bytes.end(), { 0xde, 0xad } );

    for ( uint64_t num_inputs = 0; num_inputs <= inputs.size(); ++num_inputs )
    {
        EXPECT_OUTCOME_TRUE( assignment, AssignmentBuilder::BuildPublic( bytes, num_inputs ) );
        ASSERT_EQ( assignment.size(), num_inputs );
        for ( std::size_t i = 0; i < num_inputs; ++i )
        {
            EXPECT_EQ( assignment[i], inputs[i].ToBytes() );
        }
    }
}

TEST( AssignmentBuilderTest, PublicRejectsShortInput )
{
    auto bytes = ConcatInputs( { FieldElement::One(), FieldElement::One() } );
    bytes.pop_back();

    EXPECT_OUTCOME_ERROR( res,
                          AssignmentBuilder::BuildPublic( bytes, 2 ),
                          AssignmentBuilder::Error::TRUNCATED_PUBLIC_INPUT );
    EXPECT_OUTCOME_ERROR( res2,
                          AssignmentBuilder::BuildPublic( {}, 1 ),
                          AssignmentBuilder::Error::TRUNCATED_PUBLIC_INPUT );
    EXPECT_OUTCOME_TRUE_1( AssignmentBuilder::BuildPublic( bytes, 1 ) );
}

/**
 * @given inputs 12 and 13 checked against the bound 13
 * @when building the public assignment
 * @then only the first input fits, and trailing bytes are never checked
 */
TEST( AssignmentBuilderTest, PublicInputsStayBelowTheBound )
{
    const auto bound = FieldElement::FromUint64( 13 );
    auto       bytes = ConcatInputs( { FieldElement::FromUint64( 12 ), FieldElement::FromUint64( 13 ) } );

    EXPECT_OUTCOME_TRUE_1( AssignmentBuilder::BuildPublic( bytes, 1, bound ) );
    EXPECT_OUTCOME_ERROR( res,
                          AssignmentBuilder::BuildPublic( bytes, 2, bound ),
                          AssignmentBuilder::Error::NON_CANONICAL_INPUT );
    EXPECT_OUTCOME_TRUE_1( AssignmentBuilder::BuildPublic( bytes, 2 ) );
}

TEST( AssignmentBuilderTest, CircuitErrorsBecomeDeserializationErrors )
{
    auto backend = std::make_shared<ProofBackendMock>();
    AssignmentBuilder builder( backend );

    EXPECT_CALL( *backend, DeserializeCircuit( _ ) )
        .WillOnce( Return( outcome::failure( ProofError::BACKEND_INVOCATION ) ) );

    std::vector<uint8_t> circuit_bytes = { 1, 2, 3 };
    EXPECT_OUTCOME_ERROR( res, builder.DeserializeCircuit( circuit_bytes ), ProofError::CIRCUIT_DESERIALIZATION );
}

TEST( AssignmentBuilderTest, CircuitIsReturnedUntouched )
{
    auto backend  = std::make_shared<ProofBackendMock>();
    auto instance = std::make_shared<CircuitInstanceMock>();
    AssignmentBuilder builder( backend );

    EXPECT_CALL( *instance, GetDimensions() ).WillRepeatedly( Return( CircuitDimensions{ 4, 8, 1 } ) );
    EXPECT_CALL( *backend, DeserializeCircuit( _ ) )
        .WillOnce( Return( outcome::result<std::shared_ptr<CircuitInstance>>( instance ) ) );

    std::vector<uint8_t> circuit_bytes = { 1, 2, 3 };
    EXPECT_OUTCOME_TRUE( loaded, builder.DeserializeCircuit( circuit_bytes ) );
    EXPECT_EQ( loaded.get(), instance.get() );
}
