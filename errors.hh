// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docmod {

  // Malformed input tree: a cycle, an artifact without an identity, a value
  // of the wrong kind at a fixed path, or a bad option declaration
  class StructuralError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // One failed assertion of an active fragment
  struct AssertionFailure {
    std::string fragment;
    std::string message;
  };

  // Every assertion that failed during a single composition pass
  class CompositionError : public std::runtime_error {
  public:
    inline explicit CompositionError( std::vector< AssertionFailure > failures )
      : std::runtime_error( summarize(failures) ),
        failures_( std::move(failures) ) {}

    inline const std::vector< AssertionFailure >& failures() const {
      return failures_;
    }

    // Messages only, in the order the assertions were checked
    inline std::vector< std::string > messages() const {
      std::vector< std::string > out;
      out.reserve( failures_.size() );
      for ( const auto& f : failures_ ) out.push_back( f.message );
      return out;
    }

  private:
    static std::string summarize(
      const std::vector< AssertionFailure >& failures )
    {
      std::ostringstream oss;
      oss << failures.size() << " failed assertion"
        << ( failures.size() == 1 ? "" : "s" ) << ':';
      for ( const auto& f : failures ) {
        oss << "\n- [" << f.fragment << "] " << f.message;
      }
      return oss.str();
    }

    std::vector< AssertionFailure > failures_;
  };

} // namespace docmod
