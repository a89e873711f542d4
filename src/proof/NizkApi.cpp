/**
 * @file       NizkApi.cpp
 * @brief      Proof generation and verification entry points with the default backend and settings
 * @date       2026-10-17
 */

#include "proof/NizkApi.hpp"

#include <memory>

#include "proof/PlaceholderBackend.hpp"
#include "proof/ProofOrchestrator.hpp"

namespace nizk
{
    namespace
    {
        const ProofOrchestrator &DefaultOrchestrator()
        {
            static const ProofOrchestrator orchestrator( std::make_shared<PlaceholderBackend>() );
            return orchestrator;
        }
    }

    outcome::result<std::vector<uint8_t>> Prove( gsl::span<const uint8_t> circuit,
                                                 gsl::span<const uint8_t> witness,
                                                 gsl::span<const uint8_t> public_inputs )
    {
        return DefaultOrchestrator().Prove( circuit, witness, public_inputs );
    }

    outcome::result<bool> Verify( gsl::span<const uint8_t> circuit,
                                  gsl::span<const uint8_t> proof,
                                  gsl::span<const uint8_t> public_inputs )
    {
        return DefaultOrchestrator().Verify( circuit, proof, public_inputs );
    }
}
