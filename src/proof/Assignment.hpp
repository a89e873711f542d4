/**
 * @file       Assignment.hpp
 * @brief      Values bound to the witness or public input variables of a circuit
 * @date       2026-10-17
 */

#ifndef _NIZK_ASSIGNMENT_HPP_
#define _NIZK_ASSIGNMENT_HPP_

#include <vector>

#include "witness/FieldElement.hpp"

namespace nizk
{
    /// Ordered 32 byte little-endian encodings, one per variable
    using Assignment = std::vector<FieldElement::Bytes>;
}

#endif
