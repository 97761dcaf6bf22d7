// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "docmod.hh"

namespace {

docmod::ordered_node select_output( const docmod::AssemblyResult& result,
  docmod::OutputSection section )
{
  using docmod::OutputSection;

  switch ( section ) {
    case OutputSection::Options:
      return docmod::manual_input_to_yaml( *result.manual_input );
    case OutputSection::Config:
      return docmod::to_yaml( result.scrubbed_config );
    case OutputSection::Directives:
      return docmod::directives_to_yaml( result.directives );
    case OutputSection::Pkgs:
      return docmod::to_yaml( result.scrubbed_pkgs );
    case OutputSection::All:
      break;
  }

  docmod::ordered_node all = docmod::ordered_node::mapping();
  all[ "options" ] = select_output( result, OutputSection::Options );
  all[ "config" ] = select_output( result, OutputSection::Config );
  all[ "directives" ] = select_output( result, OutputSection::Directives );
  all[ "pkgs" ] = select_output( result, OutputSection::Pkgs );
  return all;
}

} // namespace

int main( int argc, char** argv ) {
  try {
    const docmod::Settings settings = docmod::SettingsLoader::load();
    auto logger = docmod::initialize_logger( settings.log_directory );
    docmod::set_log_level( settings.log_level );
    for ( const auto& warning : settings.warnings ) logger->warn( warning );

    // Input document from the named file, or stdin
    docmod::AssemblyInput input;
    if ( argc > 1 ) {
      std::ifstream file( argv[1] );
      if ( !file ) {
        throw std::runtime_error( std::string("cannot open ") + argv[1] );
      }
      input = docmod::parse_assembly_input( file );
    }
    else {
      input = docmod::parse_assembly_input( std::cin );
    }

    const docmod::DocumentationAssembly assembly;
    const docmod::AssemblyResult result = assembly.assemble( input );
    std::cout << docmod::ordered_node::serialize(
      select_output(result, settings.output) );
    return EXIT_SUCCESS;
  }
  catch ( const docmod::CompositionError& ex ) {
    std::cerr << "[docmod] the configuration is inconsistent:\n";
    for ( const auto& failure : ex.failures() ) {
      std::cerr << "  [" << failure.fragment << "] " << failure.message << '\n';
    }
    return EXIT_FAILURE;
  }
  catch ( const std::exception& ex ) {
    try {
      docmod::get_logger()->critical( "Fatal error: {}", ex.what() );
    }
    catch ( const std::exception& ) {
      std::cerr << "[docmod] error: " << ex.what() << '\n';
    }
    return EXIT_FAILURE;
  }
}
