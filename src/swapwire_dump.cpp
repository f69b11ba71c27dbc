#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include <swapwire/encode.hpp>
#include <swapwire/inspect.hpp>
#include <swapwire/log.hpp>

auto main( int argc, char** argv ) -> int
{
  boost::program_options::options_description options;

  // clang-format off
  options.add_options()
    ( "help,h"     , "Print this help message and exit" )
    ( "version,v"  , "Print version string and exit" )
    ( "kind,k"     , boost::program_options::value< std::string >()->default_value( "instruction" ),
                     "Payload kind: instruction, farm-instruction, pool or config" )
    ( "data,d"     , boost::program_options::value< std::string >(), "Hex encoded payload" )
    ( "log-level,l", boost::program_options::value< std::string >()->default_value( "info" ), "Log level" );
  // clang-format on

  boost::program_options::variables_map args;

  try
  {
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );
  }
  catch( const boost::program_options::error& e )
  {
    std::cerr << "Invalid arguments: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  if( args.count( "help" ) )
  {
    std::cout << options << '\n';
    return EXIT_SUCCESS;
  }

  if( args.count( "version" ) )
  {
    std::cout << "v0.1.0\n";
    return EXIT_SUCCESS;
  }

  const auto level = args[ "log-level" ].as< std::string >();
  if( auto ec = swapwire::log::initialize( level ); ec )
  {
    LOG_ERROR( swapwire::log::instance(), "Invalid log level '{}': {}", level, ec.message() );
    return EXIT_FAILURE;
  }

  auto kind = swapwire::inspect::parse_kind( args[ "kind" ].as< std::string >() );
  if( !kind )
  {
    LOG_ERROR( swapwire::log::instance(), "Unknown payload kind: {}", args[ "kind" ].as< std::string >() );
    return EXIT_FAILURE;
  }

  if( !args.count( "data" ) )
  {
    LOG_ERROR( swapwire::log::instance(), "Payload is required" );
    return EXIT_FAILURE;
  }

  auto data = swapwire::encode::from_hex( args[ "data" ].as< std::string >() );
  if( !data )
  {
    LOG_ERROR( swapwire::log::instance(), "Could not parse payload: {}", data.error().message() );
    return EXIT_FAILURE;
  }

  LOG_DEBUG( swapwire::log::instance(), "Decoding {}", swapwire::log::payload( data->data(), data->size() ) );

  auto lines = swapwire::inspect::describe( *kind, *data );
  if( !lines )
  {
    LOG_ERROR( swapwire::log::instance(), "{}", lines.error().message() );
    return EXIT_FAILURE;
  }

  for( const auto& line: *lines )
    std::cout << line << '\n';

  return EXIT_SUCCESS;
}
