/**
 * @file       IProofBackend.cpp
 * @brief      Error category of the proof orchestration
 * @date       2026-10-17
 */

#include "proof/IProofBackend.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( nizk, ProofError, e )
{
    using nizk::ProofError;
    switch ( e )
    {
        case ProofError::CIRCUIT_DESERIALIZATION:
            return "The circuit bytes can't be decoded into a circuit instance";
        case ProofError::PROOF_DESERIALIZATION:
            return "The proof bytes can't be decoded into a proof";
        case ProofError::BACKEND_INVOCATION:
            return "The proof backend failed to run";
    }
    return "Unknown error";
}
