

#include "base/hexutil.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace nizk::base;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected encoding
 */
TEST( Common, Hexutil_Hex )
{
    auto bin   = "00010204081020FF"_unhex;
    ASSERT_EQ( hex_lower( bin ), "00010204081020ff"s );
}

/**
 * @given Hexencoded string of even length
 * @when unhex
 * @then no exception, result matches expected value
 */
TEST( Common, Hexutil_UnhexEven )
{
    auto s = "00010204081020ff"s;

    std::vector<uint8_t> actual;
    ASSERT_NO_THROW( actual = unhex( s ).value() ) << "unhex result does not contain expected std::vector<uint8_t>";

    std::vector<uint8_t> expected{ 0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff };

    ASSERT_EQ( actual, expected );
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST( Common, Hexutil_UnhexOdd )
{
    EXPECT_OUTCOME_ERROR( res, unhex( "0" ), UnhexError::NOT_ENOUGH_INPUT );
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST( Common, Hexutil_UnhexInvalid )
{
    EXPECT_OUTCOME_ERROR( res, unhex( "keks" ), UnhexError::NON_HEX_INPUT );
}

/**
 * @given Hex string with and without the 0x prefix
 * @when unhexWith0x
 * @then only the prefixed one decodes
 */
TEST( Common, Hexutil_UnhexWith0x )
{
    EXPECT_OUTCOME_TRUE( bytes, unhexWith0x( "0x0aFF" ) );
    EXPECT_EQ( bytes, ( std::vector<uint8_t>{ 0x0a, 0xff } ) );

    EXPECT_OUTCOME_ERROR( res, unhexWith0x( "0aff" ), UnhexError::MISSING_0X_PREFIX );
}
