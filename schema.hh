// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

// Standard library includes
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "config_tree.hh"
#include "errors.hh"
#include "logging.hh"

namespace docmod {

  // Declared option types. They only feed the documentation; no value is
  // checked against them.
  enum class OptionType {
    Bool,
    Int,
    Str,
    Lines,
    ListOfStr,
    ListOfPathOrStr,
    Package,
    ListOfPackage,
    Attrs
  };

  inline const char* to_string( OptionType type ) {
    switch ( type ) {
      case OptionType::Bool: return "boolean";
      case OptionType::Int: return "signed integer";
      case OptionType::Str: return "string";
      case OptionType::Lines: return "strings concatenated with \"\\n\"";
      case OptionType::ListOfStr: return "list of strings";
      case OptionType::ListOfPathOrStr: return "list of (path or string)";
      case OptionType::Package: return "package";
      case OptionType::ListOfPackage: return "list of packages";
      case OptionType::Attrs: return "attribute set";
    }
    return "unspecified";
  }

  // Short names accepted in YAML module declarations
  inline std::optional< OptionType > option_type_from_name(
    const std::string& name )
  {
    if ( name == "bool" ) return OptionType::Bool;
    if ( name == "int" ) return OptionType::Int;
    if ( name == "str" ) return OptionType::Str;
    if ( name == "lines" ) return OptionType::Lines;
    if ( name == "listOf str" ) return OptionType::ListOfStr;
    if ( name == "listOf (either path str)" ) return OptionType::ListOfPathOrStr;
    if ( name == "package" ) return OptionType::Package;
    if ( name == "listOf package" ) return OptionType::ListOfPackage;
    if ( name == "attrs" ) return OptionType::Attrs;
    return std::nullopt;
  }

  // One declared option. Immutable once handed to the registry.
  struct OptionSpec {
    std::string path;
    OptionType type = OptionType::Attrs;
    std::optional< ConfigTree > default_value;
    std::string description;
    std::optional< std::string > example;
    std::string declared_in;

    // Declared by a module that is documented but not imported; its default
    // never reaches the configuration
    bool documentation_only = false;
  };

  // Renamed option: settings at from are moved to to
  struct OptionRename {
    std::string from;
    std::string to;
  };

  class OptionRegistry {
  public:
    // Rejects a duplicate path and a path nested inside (or enclosing) an
    // option that is already declared
    inline void declare( OptionSpec spec );
    inline void rename( const std::string& from, const std::string& to );

    inline const OptionSpec* find( const std::string& path ) const;
    inline const std::vector< OptionSpec >& options() const {
      return options_;
    }
    inline const std::vector< OptionRename >& renames() const {
      return renames_;
    }

    // Tree of every declared default; options without one, and
    // documentation-only options, are absent
    inline ConfigTree defaults() const;

    // Moves settings made through renamed paths to their new location and
    // logs a warning for each. Setting both paths is a StructuralError.
    inline ConfigTree apply_renames( const ConfigTree& settings ) const;

  private:
    std::vector< OptionSpec > options_;
    std::vector< OptionRename > renames_;
  };

namespace internal {

  // True when a is b or a path inside b
  inline bool path_within( const std::string& a, const std::string& b ) {
    if ( a == b ) return true;
    return a.size() > b.size() && a.compare( 0, b.size(), b ) == 0
      && a[ b.size() ] == PATH_DELIMITER;
  }

} // namespace internal

} // namespace docmod

inline void docmod::OptionRegistry::declare( OptionSpec spec ) {
  if ( spec.path.empty() ) {
    throw StructuralError( "option declared without a path" );
  }
  for ( const auto& existing : options_ ) {
    if ( internal::path_within(spec.path, existing.path)
      || internal::path_within(existing.path, spec.path) )
    {
      std::ostringstream oss;
      oss << spec.path << ": conflicts with option '" << existing.path
        << "' declared in " << existing.declared_in;
      throw StructuralError( oss.str() );
    }
  }
  options_.push_back( std::move(spec) );
}

inline void docmod::OptionRegistry::rename( const std::string& from,
  const std::string& to )
{
  if ( from.empty() || to.empty() || from == to ) {
    throw StructuralError( "invalid option rename '" + from + "' -> '"
      + to + "'" );
  }
  renames_.push_back( OptionRename{ from, to } );
}

inline const docmod::OptionSpec* docmod::OptionRegistry::find(
  const std::string& path ) const
{
  for ( const auto& spec : options_ ) {
    if ( spec.path == path ) return &spec;
  }
  return nullptr;
}

inline docmod::ConfigTree docmod::OptionRegistry::defaults() const {
  ConfigTree tree = ConfigTree::map();
  for ( const auto& spec : options_ ) {
    if ( spec.default_value && !spec.documentation_only ) {
      tree = with_path( tree, spec.path, *spec.default_value );
    }
  }
  return tree;
}

inline docmod::ConfigTree docmod::OptionRegistry::apply_renames(
  const ConfigTree& settings ) const
{
  ConfigTree out = settings;
  for ( const auto& r : renames_ ) {
    const ConfigTree* old_value = docmod::find( out, r.from );
    if ( !old_value ) continue;

    if ( docmod::find(out, r.to) ) {
      std::ostringstream oss;
      oss << r.from << ": renamed to '" << r.to
        << "', but both the old and the new option are set";
      throw StructuralError( oss.str() );
    }

    library_logger()->warn( "The option `{}' has been renamed to `{}'.",
      r.from, r.to );
    const ConfigTree moved = *old_value;
    out = with_path( erase_path(out, r.from), r.to, moved );
  }
  return out;
}
