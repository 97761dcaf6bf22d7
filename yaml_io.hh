// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

// Standard library includes
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "assembly.hh"
#include "config_tree.hh"
#include "errors.hh"
#include "logging.hh"
#include "schema.hh"

namespace docmod {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map keeps documents in the order they were written.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // YAML node -> tree. A mapping carrying ARTIFACT_KEY is an artifact: the
  // marker is either true or the artifact's intrinsic name, and an optional
  // "outPath" string is what its build returns. Nothing else inside an
  // artifact mapping is read.
  inline ConfigTree from_yaml( const ordered_node& node,
    const std::string& path = std::string() );

  // Tree -> YAML node. Artifacts cannot be written; scrub first.
  inline ordered_node to_yaml( const ConfigTree& tree,
    const std::string& path = std::string() );

  // Reads a full input document:
  //   config:  settings (renamed option paths are accepted)
  //   pkgs:    package set
  //   modules: extra option declarations from user modules
  inline AssemblyInput parse_assembly_input( const std::string& text );
  inline AssemblyInput parse_assembly_input( std::istream& in );

  // Options document handed to downstream manual tooling
  inline ordered_node manual_input_to_yaml( const ManualInput& input );

  inline ordered_node directives_to_yaml( const InstallDirectives& d );

namespace internal {

  inline const std::string ARTIFACT_KEY = "_artifact";
  inline const std::string OUT_PATH_KEY = "outPath";
  inline const std::string USER_MODULE = "configuration.nix";

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline ordered_node make_string_list( const std::vector< std::string >& v ) {
    std::vector< ordered_node > out;
    out.reserve( v.size() );
    for ( const auto& s : v ) out.push_back( make_node_from(s) );
    return make_node_from( out );
  }

  [[noreturn]] inline void throw_yaml_error( const std::string& path,
    const std::string& msg )
  {
    std::ostringstream oss;
    oss << ( path.empty() ? "<document>" : path ) << ": " << msg;
    throw StructuralError( oss.str() );
  }

  // Anchors and aliases would let one document node appear at several tree
  // positions, so they are refused outright
  inline void reject_anchors_and_aliases( const ordered_node& node,
    const std::string& path )
  {
    if ( node.is_anchor() || node.is_alias() ) {
      throw_yaml_error( path, std::string("YAML ")
        + ( node.is_anchor() ? "anchors" : "aliases" ) + " are not allowed" );
    }
    if ( node.is_mapping() ) {
      for ( const auto& [mk, mv] : node.map_items() ) {
        reject_anchors_and_aliases( mv,
          child_path(path, mk.get_value< std::string >()) );
      }
    }
    else if ( node.is_sequence() ) {
      for ( std::size_t i = 0; i < node.size(); ++i ) {
        reject_anchors_and_aliases( node.at(i), seq_indexed(path, i) );
      }
    }
  }

  inline ConfigTree artifact_from_yaml( const ordered_node& node,
    const std::string& path )
  {
    const ordered_node& marker = node.at( ARTIFACT_KEY );
    std::string name;
    if ( marker.is_string() ) {
      name = to_native_checked< std::string >( marker );
    }
    else if ( !marker.is_boolean() || !marker.get_value< bool >() ) {
      throw_yaml_error( path, "'" + ARTIFACT_KEY
        + "' must be true or the artifact's name" );
    }

    Artifact::Builder build;
    if ( node.contains(OUT_PATH_KEY) ) {
      const ordered_node& out_path = node.at( OUT_PATH_KEY );
      if ( !out_path.is_string() ) {
        throw_yaml_error( child_path(path, OUT_PATH_KEY), "must be a string" );
      }
      const std::string location = to_native_checked< std::string >( out_path );
      build = [location]() { return location; };
    }
    return ConfigTree( Artifact(std::move(build), std::move(name)) );
  }

  inline std::optional< std::string > optional_string( const ordered_node& m,
    const std::string& key, const std::string& path )
  {
    if ( !m.contains(key) || m.at(key).is_null() ) return std::nullopt;
    if ( !m.at(key).is_string() ) {
      throw_yaml_error( child_path(path, key), "must be a string" );
    }
    return to_native_checked< std::string >( m.at(key) );
  }

  inline OptionSpec option_from_yaml( const ordered_node& m,
    const std::string& path )
  {
    if ( !m.is_mapping() ) throw_yaml_error( path, "must be a mapping" );

    OptionSpec spec;
    std::optional< std::string > opt_path = optional_string( m, "path", path );
    if ( !opt_path ) throw_yaml_error( path, "option without a 'path'" );
    spec.path = *opt_path;

    if ( auto type_name = optional_string(m, "type", path) ) {
      std::optional< OptionType > type = option_type_from_name( *type_name );
      if ( !type ) {
        throw_yaml_error( child_path(path, "type"),
          "unknown option type '" + *type_name + "'" );
      }
      spec.type = *type;
    }
    if ( m.contains("default") ) {
      spec.default_value = from_yaml( m.at("default"),
        child_path(path, "default") );
    }
    spec.description = optional_string( m, "description", path )
      .value_or( std::string() );
    spec.example = optional_string( m, "example", path );
    spec.declared_in = optional_string( m, "declaredIn", path )
      .value_or( USER_MODULE );
    return spec;
  }

} // namespace internal

} // namespace docmod

inline docmod::ConfigTree docmod::from_yaml( const ordered_node& node,
  const std::string& path )
{
  using internal::to_native_checked;

  if ( node.is_null() ) return ConfigTree();
  if ( node.is_boolean() ) return ConfigTree( node.get_value< bool >() );
  if ( node.is_integer() ) {
    return ConfigTree( to_native_checked< std::int64_t >(node) );
  }
  if ( node.is_float_number() ) {
    return ConfigTree( to_native_checked< double >(node) );
  }
  if ( node.is_string() ) {
    return ConfigTree( to_native_checked< std::string >(node) );
  }

  if ( node.is_sequence() ) {
    List items;
    items.reserve( node.size() );
    for ( std::size_t i = 0; i < node.size(); ++i ) {
      items.push_back( from_yaml(node.at(i), internal::seq_indexed(path, i)) );
    }
    return ConfigTree( std::move(items) );
  }

  if ( node.is_mapping() ) {
    if ( node.contains(internal::ARTIFACT_KEY) ) {
      return internal::artifact_from_yaml( node, path );
    }
    auto m = std::make_shared< ConfigMap >();
    for ( const auto& [mk, mv] : node.map_items() ) {
      const std::string key = mk.get_value< std::string >();
      m->set( key, from_yaml(mv, internal::child_path(path, key)) );
    }
    return ConfigTree( m );
  }

  internal::throw_yaml_error( path, "unsupported YAML node" );
}

inline docmod::ordered_node docmod::to_yaml( const ConfigTree& tree,
  const std::string& path )
{
  using internal::make_node_from;

  if ( tree.is_artifact() ) {
    internal::throw_yaml_error( path,
      "artifacts cannot be serialized; scrub the tree first" );
  }

  if ( tree.is_list() ) {
    const List& items = tree.as_list();
    std::vector< ordered_node > out;
    out.reserve( items.size() );
    for ( std::size_t i = 0; i < items.size(); ++i ) {
      out.push_back( to_yaml(items[i], internal::seq_indexed(path, i)) );
    }
    return make_node_from( out );
  }

  if ( tree.is_map() ) {
    ordered_node m = ordered_node::mapping();
    for ( const auto& [key, value] : tree.as_map() ) {
      m[ key ] = to_yaml( value, internal::child_path(path, key) );
    }
    return m;
  }

  const Scalar& s = tree.as_scalar();
  if ( const bool* b = std::get_if< bool >(&s) ) return make_node_from( *b );
  if ( const std::int64_t* i = std::get_if< std::int64_t >(&s) ) {
    return make_node_from( *i );
  }
  if ( const double* d = std::get_if< double >(&s) ) return make_node_from( *d );
  if ( const std::string* str = std::get_if< std::string >(&s) ) {
    return make_node_from( *str );
  }
  return ordered_node();
}

inline docmod::AssemblyInput docmod::parse_assembly_input(
  const std::string& text )
{
  ordered_node doc = ordered_node::deserialize( text );
  internal::reject_anchors_and_aliases( doc, std::string() );

  AssemblyInput input;
  if ( doc.is_null() ) return input;
  if ( !doc.is_mapping() ) {
    internal::throw_yaml_error( "", "input document must be a mapping" );
  }

  for ( const auto& [mk, mv] : doc.map_items() ) {
    const std::string key = mk.get_value< std::string >();
    if ( key == "config" ) {
      if ( !mv.is_null() ) input.settings = from_yaml( mv, std::string() );
      if ( !input.settings.is_map() ) {
        internal::throw_yaml_error( key, "must be a mapping" );
      }
    }
    else if ( key == "pkgs" ) {
      if ( !mv.is_null() ) input.pkgs = from_yaml( mv, std::string() );
      if ( !input.pkgs.is_map() ) {
        internal::throw_yaml_error( key, "must be a mapping" );
      }
    }
    else if ( key == "modules" ) {
      if ( mv.is_null() ) continue;
      if ( !mv.is_sequence() ) {
        internal::throw_yaml_error( key, "must be a sequence" );
      }
      for ( std::size_t i = 0; i < mv.size(); ++i ) {
        input.user_options.push_back( internal::option_from_yaml(mv.at(i),
          internal::seq_indexed(key, i)) );
      }
    }
    else {
      library_logger()->warn( "ignoring unknown top-level key '{}'", key );
    }
  }
  return input;
}

// Read from an input stream until end-of-file, then parse the resulting
// string
inline docmod::AssemblyInput docmod::parse_assembly_input( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_assembly_input( ss.str() );
}

inline docmod::ordered_node docmod::manual_input_to_yaml(
  const ManualInput& input )
{
  using internal::make_node_from;

  ordered_node options = ordered_node::mapping();
  for ( const auto& doc : input.options ) {
    ordered_node entry = ordered_node::mapping();
    entry[ "type" ] = make_node_from( doc.type );
    entry[ "description" ] = make_node_from( doc.description );
    if ( doc.has_default ) {
      entry[ "default" ] = to_yaml( doc.default_value, doc.path );
    }
    if ( doc.example ) entry[ "example" ] = make_node_from( *doc.example );
    entry[ "declarations" ] = internal::make_string_list( doc.declarations );
    options[ doc.path ] = entry;
  }

  ordered_node out = ordered_node::mapping();
  out[ "version" ] = make_node_from( input.version );
  out[ "revision" ] = make_node_from( input.revision );
  out[ "extraSources" ] = internal::make_string_list( input.extra_sources );
  out[ "options" ] = options;
  return out;
}

inline docmod::ordered_node docmod::directives_to_yaml(
  const InstallDirectives& d )
{
  using internal::make_node_from;
  using internal::make_string_list;

  ordered_node out = ordered_node::mapping();
  out[ "installManPages" ] = make_node_from( d.install_man_pages );
  out[ "installInfoPages" ] = make_node_from( d.install_info_pages );
  out[ "installDocPages" ] = make_node_from( d.install_doc_pages );
  out[ "generateManCaches" ] = make_node_from( d.generate_man_caches );
  out[ "pathsToLink" ] = make_string_list( d.paths_to_link );
  out[ "extraOutputsToInstall" ] = make_string_list(
    d.extra_outputs_to_install );
  out[ "systemPackages" ] = make_string_list( d.system_packages );
  out[ "helpLine" ] = make_node_from( d.help_line );
  return out;
}
