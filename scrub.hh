// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

// Standard library includes
#include <cstddef>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "config_tree.hh"
#include "errors.hh"

namespace docmod {

  // Decides whether a node is a build artifact
  using ArtifactPredicate = std::function< bool( const ConfigTree& node ) >;

  // Logical name for an artifact found at a dotted tree position
  using ArtifactNamer = std::function< std::string( const ConfigTree& node,
    const std::string& path ) >;

  // Matches artifact nodes by their tag alone
  inline bool is_artifact_node( const ConfigTree& node ) {
    return node.is_artifact();
  }

  // Intrinsic name when the artifact reports one, otherwise prefix.path.
  // An artifact that reports no name at the root of an unprefixed walk has
  // no identity at all.
  inline ArtifactNamer path_namer( const std::string& prefix = std::string() ) {
    return [prefix]( const ConfigTree& node, const std::string& path )
      -> std::string
    {
      if ( node.is_artifact() && node.as_artifact().has_intrinsic_name() ) {
        return node.as_artifact().intrinsic_name();
      }
      std::string name = prefix;
      if ( !path.empty() ) {
        // A list walked from the root yields element paths like "[2]"
        name = path.front() == '[' ? prefix + path
          : internal::child_path( prefix, path );
      }
      if ( name.empty() ) {
        throw StructuralError(
          "<root>: artifact reports no name and has no tree position" );
      }
      return name;
    };
  }

  // Structure-preserving copy of a tree with every artifact replaced by the
  // placeholder "${name}". Maps and lists are walked depth-first; scalars
  // (placeholders included) pass through unchanged. A map that encloses
  // itself is a StructuralError. Artifacts are never realised.
  inline ConfigTree scrub( const ConfigTree& tree,
    const ArtifactPredicate& is_artifact = is_artifact_node,
    const ArtifactNamer& name_of = path_namer() );

  // Scrubs a package set, naming artifacts after their attribute path under
  // prefix (e.g. "pkgs.hello")
  inline ConfigTree scrub_derivations( const std::string& prefix,
    const ConfigTree& pkg_set )
  {
    return scrub( pkg_set, is_artifact_node, path_namer(prefix) );
  }

namespace internal {

  class ScrubWalker {
  public:
    inline ScrubWalker( const ArtifactPredicate& is_artifact,
      const ArtifactNamer& name_of )
      : is_artifact_( is_artifact ), name_of_( name_of ) {}

    inline ConfigTree walk( const ConfigTree& node );

  private:
    inline ConfigTree walk_map( const ConfigTree& node );
    inline ConfigTree walk_list( const ConfigTree& node );

    [[noreturn]] inline void throw_error_at( const std::string& msg ) const;

    const ArtifactPredicate& is_artifact_;
    const ArtifactNamer& name_of_;

    // Tracks the position as dotted keys with sequence-element indexing,
    // e.g. ["environment", "systemPackages[0]"]
    std::vector< std::string > path_stack_;

    // Maps on the current descent chain (cycle detection)
    std::unordered_set< const ConfigMap* > chain_;
  };

} // namespace internal

} // namespace docmod

inline docmod::ConfigTree docmod::scrub( const ConfigTree& tree,
  const ArtifactPredicate& is_artifact, const ArtifactNamer& name_of )
{
  if ( !is_artifact || !name_of ) {
    throw StructuralError( "scrub requires an artifact predicate and namer" );
  }
  internal::ScrubWalker walker( is_artifact, name_of );
  return walker.walk( tree );
}

[[noreturn]] inline void docmod::internal::ScrubWalker::throw_error_at(
  const std::string& msg ) const
{
  std::ostringstream oss;
  const std::string path = join_path( path_stack_ );
  oss << ( path.empty() ? "<root>" : path ) << ": " << msg;
  throw StructuralError( oss.str() );
}

inline docmod::ConfigTree docmod::internal::ScrubWalker::walk(
  const ConfigTree& node )
{
  if ( is_artifact_(node) ) {
    return ConfigTree( make_placeholder(name_of_(node, join_path(path_stack_))) );
  }
  if ( node.is_map() ) return walk_map( node );
  if ( node.is_list() ) return walk_list( node );

  // Scalars, and artifacts the predicate declined, are terminal
  return node;
}

inline docmod::ConfigTree docmod::internal::ScrubWalker::walk_map(
  const ConfigTree& node )
{
  const ConfigMap* self = node.map_ptr().get();
  if ( chain_.count(self) ) {
    throw_error_at( "cyclic reference to an enclosing map" );
  }
  chain_.insert( self );

  auto out = std::make_shared< ConfigMap >();
  for ( const auto& [key, child] : *self ) {
    path_stack_.push_back( key );
    out->set( key, walk(child) );
    path_stack_.pop_back();
  }

  chain_.erase( self );
  return ConfigTree( out );
}

inline docmod::ConfigTree docmod::internal::ScrubWalker::walk_list(
  const ConfigTree& node )
{
  const List& items = node.as_list();
  List out;
  out.reserve( items.size() );

  // Elements replace the parent's last segment with "key[i]"
  const bool at_root = path_stack_.empty();
  if ( at_root ) path_stack_.push_back( std::string() );
  const std::string parent_segment = path_stack_.back();

  for ( std::size_t i = 0; i < items.size(); ++i ) {
    path_stack_.back() = seq_indexed( parent_segment, i );
    out.push_back( walk(items[i]) );
  }

  path_stack_.back() = parent_segment;
  if ( at_root ) path_stack_.pop_back();
  return ConfigTree( std::move(out) );
}
