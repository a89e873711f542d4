/**
 * @file       NilFileHelper.hpp
 * @brief      Moves nil marshalling structures in and out of byte buffers
 * @date       2026-10-17
 */

#ifndef _NIZK_NIL_FILE_HELPER_HPP_
#define _NIZK_NIL_FILE_HELPER_HPP_

#include <cstdint>
#include <vector>

#include <gsl/span>
#include <nil/marshalling/status_type.hpp>

#include "outcome/outcome.hpp"
#include "proof/IProofBackend.hpp"

namespace nizk
{
    class NilFileHelper
    {
    public:
        template <typename MarshalledData>
        static outcome::result<std::vector<std::uint8_t>> EncodeMarshalledData( const MarshalledData &input )
        {
            std::vector<std::uint8_t> cv;
            cv.resize( input.length(), 0x00 );
            auto                          write_iter = cv.begin();
            nil::marshalling::status_type status     = input.write( write_iter, cv.size() );
            if ( status != nil::marshalling::status_type::success )
            {
                return outcome::failure( ProofError::BACKEND_INVOCATION );
            }
            return cv;
        }

        /**
         * @brief       Reads a marshalled structure that must take the whole buffer
         * @param[in]   bytes encoded structure
         * @param[in]   on_error error reported when the bytes don't decode
         */
        template <typename MarshalledData>
        static outcome::result<MarshalledData> DecodeMarshalledData( gsl::span<const std::uint8_t> bytes,
                                                                     ProofError                    on_error )
        {
            std::vector<std::uint8_t> v( bytes.begin(), bytes.end() );

            MarshalledData marshalled_data;
            auto           read_iter = v.cbegin();
            auto           status    = marshalled_data.read( read_iter, v.size() );
            if ( status != nil::marshalling::status_type::success || read_iter != v.cend() )
            {
                return outcome::failure( on_error );
            }
            return marshalled_data;
        }
    };
}

#endif
