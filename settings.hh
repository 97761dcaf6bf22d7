// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

// Standard library includes
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docmod {

  // Sections of the result written by the command-line driver
  enum class OutputSection { Options, Config, Directives, Pkgs, All };

  inline std::optional< OutputSection > output_section_from_name(
    std::string_view name )
  {
    if ( name == "options" ) return OutputSection::Options;
    if ( name == "config" ) return OutputSection::Config;
    if ( name == "directives" ) return OutputSection::Directives;
    if ( name == "pkgs" ) return OutputSection::Pkgs;
    if ( name == "all" ) return OutputSection::All;
    return std::nullopt;
  }

  // Runtime knobs of the driver. Populated once by SettingsLoader; nothing
  // else reads the environment.
  struct Settings final {
    std::string log_level{ "info" };
    std::string log_directory{};
    OutputSection output{ OutputSection::All };
    std::vector< std::string > warnings{};  // reported once logging is up
  };

  class SettingsLoader final {
  public:
    // DOCMOD_LOG_LEVEL, DOCMOD_LOG_DIR, DOCMOD_OUTPUT
    static inline Settings load();

  private:
    static inline std::string read_env( const char* name );
  };

} // namespace docmod

inline std::string docmod::SettingsLoader::read_env( const char* name ) {
  const char* raw = std::getenv( name );
  if ( raw == nullptr ) return std::string();
  return std::string( raw );
}

inline docmod::Settings docmod::SettingsLoader::load() {
  Settings settings{};

  const std::string level = read_env( "DOCMOD_LOG_LEVEL" );
  if ( !level.empty() ) settings.log_level = level;

  settings.log_directory = read_env( "DOCMOD_LOG_DIR" );

  const std::string output = read_env( "DOCMOD_OUTPUT" );
  if ( !output.empty() ) {
    if ( auto section = output_section_from_name(output) ) {
      settings.output = *section;
    }
    else {
      settings.warnings.push_back( "Unknown DOCMOD_OUTPUT '" + output
        + "'; writing all sections" );
    }
  }
  return settings;
}
