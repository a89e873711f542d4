#ifndef NIZK_TEST_TESTUTIL_LITERALS_HPP_
#define NIZK_TEST_TESTUTIL_LITERALS_HPP_

#include <cstdint>
#include <string_view>
#include <vector>

#include "base/hexutil.hpp"

/// decodes a hex literal, throws on invalid input
inline std::vector<uint8_t> operator""_unhex( const char *c, size_t s )
{
    return nizk::base::unhex( std::string_view( c, s ) ).value();
}

#endif
