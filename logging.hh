// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace docmod {

namespace internal {

  inline constexpr std::size_t LOG_MAX_FILE_SIZE_BYTES = 10 * 1024 * 1024;
  inline constexpr std::size_t LOG_MAX_FILES = 5;

  inline std::once_flag& logger_once_flag() {
    static std::once_flag flag;
    return flag;
  }

  inline std::shared_ptr< spdlog::logger >& shared_logger() {
    static std::shared_ptr< spdlog::logger > logger;
    return logger;
  }

} // namespace internal

  // Creates the process-wide "docmod" logger on first call. Console output
  // goes to stderr because stdout carries the YAML documents. An empty
  // directory means no file sink.
  inline std::shared_ptr< spdlog::logger > initialize_logger(
    const std::string& log_directory = std::string() )
  {
    std::call_once( internal::logger_once_flag(), [&log_directory]() {
      auto console_sink
        = std::make_shared< spdlog::sinks::stderr_color_sink_mt >();
      console_sink->set_pattern( "[docmod] [%l] %v" );
      std::vector< spdlog::sink_ptr > sinks{ console_sink };

      if ( !log_directory.empty() ) {
        const std::filesystem::path path_log_dir{ log_directory };
        std::error_code error_directory;
        std::filesystem::create_directories( path_log_dir, error_directory );
        if ( error_directory ) {
          throw std::runtime_error( "Unable to create log directory at "
            + path_log_dir.string() );
        }
        const std::filesystem::path path_log_file = path_log_dir / "docmod.log";
        auto file_sink = std::make_shared<
          spdlog::sinks::rotating_file_sink_mt >( path_log_file.string(),
            internal::LOG_MAX_FILE_SIZE_BYTES, internal::LOG_MAX_FILES );
        file_sink->set_pattern(
          R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","msg":"%v"})" );
        sinks.push_back( file_sink );
      }

      auto logger = std::make_shared< spdlog::logger >( "docmod",
        sinks.begin(), sinks.end() );
      logger->set_level( spdlog::level::info );
      spdlog::register_logger( logger );
      internal::shared_logger() = logger;
    });
    return internal::shared_logger();
  }

  inline std::shared_ptr< spdlog::logger > get_logger() {
    if ( !internal::shared_logger() ) {
      throw std::runtime_error( "Logger not initialized" );
    }
    return internal::shared_logger();
  }

  // Logger for library code: the process-wide logger once it exists,
  // otherwise a silent one. Never throws.
  inline std::shared_ptr< spdlog::logger > library_logger() {
    if ( auto logger = internal::shared_logger() ) return logger;
    static const std::shared_ptr< spdlog::logger > silent
      = std::make_shared< spdlog::logger >( "docmod-silent",
        std::make_shared< spdlog::sinks::null_sink_mt >() );
    return silent;
  }

  inline void set_log_level( const std::string& str_level ) {
    auto& logger = internal::shared_logger();
    if ( !logger ) return;
    const auto level = spdlog::level::from_str( str_level );
    // from_str maps unknown names to "off"
    if ( level == spdlog::level::off && str_level != "off" ) {
      logger->warn( "Unknown log level {}; defaulting to info", str_level );
      logger->set_level( spdlog::level::info );
      return;
    }
    logger->set_level( level );
  }

} // namespace docmod
