/**
 * @file       FieldElementTest.cpp
 * @brief      Tests of the fixed width field element encoding
 * @date       2026-10-17
 */

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "witness/FieldElement.hpp"

using nizk::FieldElement;

/**
 * @given small integers
 * @when encoded as field elements
 * @then the value sits in the low bytes, little-endian
 */
TEST( FieldElementTest, FromUint64IsLittleEndian )
{
    auto element = FieldElement::FromUint64( 0x0102 );

    EXPECT_EQ( element.ToBytes()[0], 0x02 );
    EXPECT_EQ( element.ToBytes()[1], 0x01 );
    for ( std::size_t i = 2; i < FieldElement::BYTE_SIZE; ++i )
    {
        EXPECT_EQ( element.ToBytes()[i], 0 );
    }
    EXPECT_EQ( FieldElement::One(), FieldElement::FromUint64( 1 ) );
    EXPECT_TRUE( FieldElement::Zero().IsZero() );
    EXPECT_FALSE( FieldElement::One().IsZero() );
}

TEST( FieldElementTest, FromBytesNeedsExactWidth )
{
    std::vector<uint8_t> short_bytes( 31, 0 );
    std::vector<uint8_t> exact_bytes( 32, 0 );
    exact_bytes[0] = 7;

    EXPECT_OUTCOME_ERROR( res, FieldElement::FromBytes( short_bytes ), FieldElement::Error::INVALID_LENGTH );
    EXPECT_OUTCOME_TRUE( element, FieldElement::FromBytes( exact_bytes ) );
    EXPECT_EQ( element, FieldElement::FromUint64( 7 ) );
}

TEST( FieldElementTest, FromNarrowBytesZeroExtends )
{
    std::vector<uint8_t> narrow{ 0x34, 0x12 };
    std::vector<uint8_t> wide( 33, 0 );

    EXPECT_OUTCOME_EQ( FieldElement::FromNarrowBytes( narrow ), FieldElement::FromUint64( 0x1234 ) );
    EXPECT_OUTCOME_ERROR( res, FieldElement::FromNarrowBytes( wide ), FieldElement::Error::INVALID_LENGTH );
}

/**
 * @given numbers written as text
 * @when parsed
 * @then hex is read big-endian as humans write it and decimal matches it
 */
TEST( FieldElementTest, ParsesHexAndDecimal )
{
    EXPECT_OUTCOME_EQ( FieldElement::FromHex( "0x1234" ), FieldElement::FromUint64( 0x1234 ) );
    EXPECT_OUTCOME_EQ( FieldElement::FromHex( "0xabc" ), FieldElement::FromUint64( 0xabc ) );
    EXPECT_OUTCOME_EQ( FieldElement::FromDecimal( "4660" ), FieldElement::FromUint64( 0x1234 ) );
    EXPECT_OUTCOME_EQ( FieldElement::FromString( "0x10" ), FieldElement::FromUint64( 16 ) );
    EXPECT_OUTCOME_EQ( FieldElement::FromString( "10" ), FieldElement::FromUint64( 10 ) );

    EXPECT_OUTCOME_ERROR( res, FieldElement::FromHex( "1234" ), FieldElement::Error::INVALID_NUMBER );
    EXPECT_OUTCOME_ERROR( res, FieldElement::FromHex( "0xzz" ), FieldElement::Error::INVALID_NUMBER );
    EXPECT_OUTCOME_ERROR( res, FieldElement::FromDecimal( "12a" ), FieldElement::Error::INVALID_NUMBER );
    EXPECT_OUTCOME_ERROR( res, FieldElement::FromDecimal( "" ), FieldElement::Error::INVALID_NUMBER );
}

TEST( FieldElementTest, RejectsValuesWiderThan256Bits )
{
    // 2^256
    const std::string two_pow_256 =
        "115792089237316195423570985008687907853269984665640564039457584007913129639936";
    const std::string max_value =
        "115792089237316195423570985008687907853269984665640564039457584007913129639935";

    EXPECT_OUTCOME_ERROR( res, FieldElement::FromDecimal( two_pow_256 ), FieldElement::Error::VALUE_TOO_LARGE );
    EXPECT_OUTCOME_ERROR( res,
                          FieldElement::FromHex( "0x01" + std::string( 64, '0' ) ),
                          FieldElement::Error::VALUE_TOO_LARGE );

    EXPECT_OUTCOME_TRUE( max_element, FieldElement::FromDecimal( max_value ) );
    EXPECT_EQ( max_element.ToHex(), "0x" + std::string( 64, 'f' ) );
    // leading zero bytes don't count against the width
    EXPECT_OUTCOME_EQ( FieldElement::FromHex( "0x0000" + std::string( 64, 'f' ) ), max_element );
}

TEST( FieldElementTest, TextRoundTrip )
{
    auto element = FieldElement::FromUint64( 1234567890123ull );

    EXPECT_EQ( element.ToDecimal(), "1234567890123" );
    EXPECT_EQ( element.ToHex(), "0x" + std::string( 52, '0' ) + "011f71fb04cb" );
    EXPECT_OUTCOME_EQ( FieldElement::FromHex( element.ToHex() ), element );
}

TEST( FieldElementTest, ComparesNumerically )
{
    auto low  = FieldElement::FromUint64( 0xff );
    auto high = FieldElement::FromUint64( 0x100 );

    EXPECT_TRUE( low.IsLessThan( high ) );
    EXPECT_FALSE( high.IsLessThan( low ) );
    EXPECT_FALSE( low.IsLessThan( low ) );
    EXPECT_NE( low, high );
}
