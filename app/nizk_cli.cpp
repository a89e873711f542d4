/**
 * @file       nizk_cli.cpp
 * @brief      Command line wrapper over proof generation, verification and witness tooling
 * @date       2026-10-17
 */

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "base/logger.hpp"
#include "proof/PlaceholderBackend.hpp"
#include "proof/ProofOrchestrator.hpp"
#include "witness/FieldElement.hpp"
#include "witness/WitnessReader.hpp"
#include "witness/WitnessWriter.hpp"

using namespace nizk;

namespace
{
    constexpr int EXIT_VALID   = 0;
    constexpr int EXIT_INVALID = 1;
    constexpr int EXIT_ERROR   = 2;

    constexpr std::size_t WITNESS_PREVIEW_SIZE = 8;

    // cmd line options
    struct Options
    {
        std::string command;
        std::string circuit_path;
        std::string witness_path;
        std::string inputs_path;
        std::string public_inputs_hex;
        std::string proof_path;
        std::string output_path;
        std::string values;
        std::string log_level = "info";
        bool        check_modulus = false;

        ProofConfig                 proof_config;
        PlaceholderBackend::Config  backend_config;
    };

    std::vector<std::string> SplitList( const std::string &list )
    {
        std::vector<std::string> items;
        boost::algorithm::split( items, list, boost::algorithm::is_any_of( "," ), boost::algorithm::token_compress_on );
        items.erase( std::remove( items.begin(), items.end(), std::string() ), items.end() );
        return items;
    }

    boost::optional<Options> parseCommandLine( int argc, char **argv )
    {
        namespace po = boost::program_options;
        try
        {
            Options     o;
            std::string config_path;
            std::string expected_modulus;

            po::options_description desc( "nizk_cli <command> options\n"
                                          "commands: prove, verify, witness-info, witness-encode, info" );
            desc.add_options()( "help,h", "print usage message" )
                ( "circuit,c", po::value( &o.circuit_path ), "circuit file" )
                ( "witness,w", po::value( &o.witness_path ), "wtns witness file" )
                ( "inputs,i", po::value( &o.inputs_path ), "file with concatenated 32 byte little-endian public inputs" )
                ( "public-inputs-hex", po::value( &o.public_inputs_hex ),
                  "comma separated public inputs, decimal or 0x prefixed hex, instead of --inputs" )
                ( "proof,p", po::value( &o.proof_path ), "proof file, written by prove and read by verify" )
                ( "output,o", po::value( &o.output_path ), "witness file written by witness-encode" )
                ( "values", po::value( &o.values ), "comma separated witness values for witness-encode" )
                ( "config", po::value( &config_path ), "INI configuration file" )
                ( "log-level", po::value( &o.log_level ), "trace, debug, info, warn, err, critical or off" )
                ( "check-modulus", po::bool_switch( &o.check_modulus ),
                  "require witness files to use the proof field modulus and reduced elements" );

            po::options_description file_options( "configuration file options" );
            file_options.add_options()
                ( "transcript_label", po::value( &o.proof_config.transcript_label ), "transcript domain label" )
                ( "witness.max_version", po::value( &o.proof_config.witness_format.max_version ),
                  "newest accepted wtns version" )
                ( "witness.expected_modulus", po::value( &expected_modulus ), "required wtns field modulus" )
                ( "backend.witness_columns", po::value( &o.backend_config.witness_columns ), "witness columns" )
                ( "backend.public_input_columns", po::value( &o.backend_config.public_input_columns ),
                  "public input columns" )
                ( "backend.constant_columns", po::value( &o.backend_config.constant_columns ), "constant columns" )
                ( "backend.selector_columns", po::value( &o.backend_config.selector_columns ), "selector columns" )
                ( "backend.component_constant_columns", po::value( &o.backend_config.component_constant_columns ),
                  "constant columns in the permutation argument" )
                ( "backend.expand_factor", po::value( &o.backend_config.expand_factor ), "FRI expand factor" )
                ( "backend.max_fri_step", po::value( &o.backend_config.max_fri_step ), "largest FRI folding step" );

            po::options_description hidden;
            hidden.add_options()( "command", po::value( &o.command ), "command to run" );

            po::options_description cmdline_options;
            cmdline_options.add( desc ).add( hidden );

            po::positional_options_description positional;
            positional.add( "command", 1 );

            po::variables_map vm;
            po::store( po::command_line_parser( argc, argv ).options( cmdline_options ).positional( positional ).run(),
                       vm );
            po::notify( vm );

            if ( vm.count( "help" ) != 0 || o.command.empty() )
            {
                std::cerr << desc << "\n" << file_options << "\n";
                return boost::none;
            }

            if ( !config_path.empty() )
            {
                std::ifstream config_file( config_path );
                if ( !config_file )
                {
                    std::cerr << "Can't open configuration file " << config_path << std::endl;
                    return boost::none;
                }
                po::store( po::parse_config_file( config_file, file_options ), vm );
                po::notify( vm );
            }

            if ( !expected_modulus.empty() )
            {
                auto modulus = FieldElement::FromString( expected_modulus );
                if ( !modulus )
                {
                    std::cerr << "Invalid witness.expected_modulus: " << modulus.error().message() << std::endl;
                    return boost::none;
                }
                o.proof_config.witness_format.expected_modulus = modulus.value();
            }
            if ( o.check_modulus )
            {
                o.proof_config.witness_format.expected_modulus = PlaceholderBackend::GetModulus();
            }

            return o;
        }
        catch ( const std::exception &e )
        {
            std::cerr << e.what() << std::endl;
        }
        return boost::none;
    }

    outcome::result<std::vector<uint8_t>> ReadFile( const std::string &path )
    {
        boost::system::error_code ec;
        if ( path.empty() || !boost::filesystem::is_regular_file( path, ec ) )
        {
            return outcome::failure( std::make_error_code( std::errc::no_such_file_or_directory ) );
        }
        std::ifstream in( path, std::ios::in | std::ios::binary );
        std::vector<uint8_t> bytes( ( std::istreambuf_iterator<char>( in ) ), std::istreambuf_iterator<char>() );
        if ( in.bad() )
        {
            return outcome::failure( std::make_error_code( std::errc::io_error ) );
        }
        return bytes;
    }

    outcome::result<void> WriteFile( const std::string &path, const std::vector<uint8_t> &bytes )
    {
        std::ofstream out( path, std::ios::out | std::ios::binary | std::ios::trunc );
        out.write( reinterpret_cast<const char *>( bytes.data() ), bytes.size() );
        if ( !out )
        {
            return outcome::failure( std::make_error_code( std::errc::io_error ) );
        }
        return outcome::success();
    }

    outcome::result<std::vector<uint8_t>> ReadPublicInputs( const Options &options )
    {
        if ( options.public_inputs_hex.empty() )
        {
            return ReadFile( options.inputs_path );
        }
        std::vector<uint8_t> bytes;
        for ( const auto &value : SplitList( options.public_inputs_hex ) )
        {
            OUTCOME_TRY( ( auto &&, element ), FieldElement::FromString( value ) );
            bytes.insert( bytes.end(), element.ToBytes().begin(), element.ToBytes().end() );
        }
        return bytes;
    }

    outcome::result<int> RunProve( const Options &options, const ProofOrchestrator &orchestrator )
    {
        OUTCOME_TRY( ( auto &&, circuit ), ReadFile( options.circuit_path ) );
        OUTCOME_TRY( ( auto &&, witness ), ReadFile( options.witness_path ) );
        OUTCOME_TRY( ( auto &&, inputs ), ReadPublicInputs( options ) );
        OUTCOME_TRY( ( auto &&, proof ), orchestrator.Prove( circuit, witness, inputs ) );
        OUTCOME_TRY( WriteFile( options.proof_path, proof ) );
        std::cout << "Proof of " << proof.size() << " bytes written to " << options.proof_path << std::endl;
        return EXIT_VALID;
    }

    outcome::result<int> RunVerify( const Options &options, const ProofOrchestrator &orchestrator )
    {
        OUTCOME_TRY( ( auto &&, circuit ), ReadFile( options.circuit_path ) );
        OUTCOME_TRY( ( auto &&, proof ), ReadFile( options.proof_path ) );
        OUTCOME_TRY( ( auto &&, inputs ), ReadPublicInputs( options ) );
        OUTCOME_TRY( ( auto &&, valid ), orchestrator.Verify( circuit, proof, inputs ) );
        std::cout << ( valid ? "valid" : "invalid" ) << std::endl;
        return valid ? EXIT_VALID : EXIT_INVALID;
    }

    outcome::result<int> RunWitnessInfo( const Options &options )
    {
        OUTCOME_TRY( ( auto &&, bytes ), ReadFile( options.witness_path ) );
        WitnessReader reader( options.proof_config.witness_format );
        OUTCOME_TRY( ( auto &&, witness ), reader.Parse( bytes ) );

        auto zeros = std::count_if( witness.begin(), witness.end(), []( const FieldElement &e ) { return e.IsZero(); } );
        std::cout << "elements: " << witness.size() << " (" << zeros << " zero)" << std::endl;
        for ( std::size_t i = 0; i < std::min( witness.size(), WITNESS_PREVIEW_SIZE ); ++i )
        {
            std::cout << "[" << i << "] " << witness[i].ToHex() << std::endl;
        }
        return EXIT_VALID;
    }

    outcome::result<int> RunWitnessEncode( const Options &options )
    {
        std::vector<FieldElement> witness;
        for ( const auto &value : SplitList( options.values ) )
        {
            OUTCOME_TRY( ( auto &&, element ), FieldElement::FromString( value ) );
            witness.push_back( element );
        }
        WitnessWriter writer( options.proof_config.witness_format );
        OUTCOME_TRY( ( auto &&, bytes ), writer.Encode( witness, PlaceholderBackend::GetModulus() ) );
        OUTCOME_TRY( WriteFile( options.output_path, bytes ) );
        std::cout << witness.size() << " elements written to " << options.output_path << std::endl;
        return EXIT_VALID;
    }

    outcome::result<int> RunInfo( const Options &options, const ProofOrchestrator &orchestrator )
    {
        OUTCOME_TRY( ( auto &&, circuit ), ReadFile( options.circuit_path ) );
        OUTCOME_TRY( ( auto &&, dimensions ), orchestrator.Inspect( circuit ) );
        std::cout << "constraints: " << dimensions.num_constraints << std::endl;
        std::cout << "variables:   " << dimensions.num_vars << std::endl;
        std::cout << "inputs:      " << dimensions.num_inputs << std::endl;
        return EXIT_VALID;
    }
}

int main( int argc, char *argv[] )
{
    auto options = parseCommandLine( argc, argv );
    if ( !options )
    {
        return EXIT_ERROR;
    }

    if ( !base::setLogLevel( options->log_level ) )
    {
        std::cerr << "Unknown log level " << options->log_level << std::endl;
        return EXIT_ERROR;
    }
    auto logger = base::createLogger( "NizkCli" );

    ProofOrchestrator orchestrator( std::make_shared<PlaceholderBackend>( options->backend_config ),
                                    options->proof_config );

    outcome::result<int> result = EXIT_ERROR;
    if ( options->command == "prove" )
    {
        result = RunProve( *options, orchestrator );
    }
    else if ( options->command == "verify" )
    {
        result = RunVerify( *options, orchestrator );
    }
    else if ( options->command == "witness-info" )
    {
        result = RunWitnessInfo( *options );
    }
    else if ( options->command == "witness-encode" )
    {
        result = RunWitnessEncode( *options );
    }
    else if ( options->command == "info" )
    {
        result = RunInfo( *options, orchestrator );
    }
    else
    {
        logger->error( "Unknown command {}", options->command );
        return EXIT_ERROR;
    }

    if ( !result )
    {
        logger->error( "{} failed: {}", options->command, result.error().message() );
        return EXIT_ERROR;
    }
    return result.value();
}
