// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

// Standard library includes
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hh"

namespace docmod {

  class ConfigTree;
  class ConfigMap;

  // Map children are shared between trees. Trees are never mutated once they
  // have been handed to the scrubber or the composer.
  using MapPtr = std::shared_ptr< ConfigMap >;
  using List = std::vector< ConfigTree >;
  using Scalar = std::variant< std::nullptr_t, bool, std::int64_t, double,
    std::string >;

  // Opaque build output. The only things visible to this library are the
  // optional intrinsic name and the identity of the artifact itself.
  class Artifact {
  public:
    using Builder = std::function< std::string() >;

    inline explicit Artifact( Builder build,
      std::string intrinsic_name = std::string() );

    inline bool has_intrinsic_name() const;
    inline const std::string& intrinsic_name() const;

    // Same build, reporting a different intrinsic name
    inline Artifact renamed( std::string name ) const;

    // Runs the build and returns its output location. Potentially expensive
    // and side-effecting; nothing in the scrubber or the composer calls it.
    inline std::string realise() const;

    inline bool operator==( const Artifact& other ) const {
      return record_ == other.record_;
    }
    inline bool operator!=( const Artifact& other ) const {
      return !( *this == other );
    }

  private:
    struct Record {
      std::string name;
      Builder build;
    };
    std::shared_ptr< const Record > record_;
  };

  // Tagged tree node: scalar, list, map or artifact
  class ConfigTree {
  public:
    using Node = std::variant< Scalar, List, MapPtr, Artifact >;

    inline ConfigTree()
      : node_( Scalar(std::in_place_type< std::nullptr_t >, nullptr) ) {}
    inline ConfigTree( std::nullptr_t )
      : node_( Scalar(std::in_place_type< std::nullptr_t >, nullptr) ) {}
    inline ConfigTree( bool b )
      : node_( Scalar(std::in_place_type< bool >, b) ) {}
    inline ConfigTree( int i )
      : node_( Scalar(std::in_place_type< std::int64_t >, i) ) {}
    inline ConfigTree( std::int64_t i )
      : node_( Scalar(std::in_place_type< std::int64_t >, i) ) {}
    inline ConfigTree( double d )
      : node_( Scalar(std::in_place_type< double >, d) ) {}
    inline ConfigTree( const char* s )
      : node_( Scalar(std::in_place_type< std::string >, s) ) {}
    inline ConfigTree( std::string s )
      : node_( Scalar(std::in_place_type< std::string >, std::move(s)) ) {}
    inline ConfigTree( Scalar s ) : node_( std::move(s) ) {}
    inline ConfigTree( List l ) : node_( std::move(l) ) {}
    inline ConfigTree( MapPtr m ) : node_( std::move(m) ) {}
    inline ConfigTree( Artifact a ) : node_( std::move(a) ) {}

    // Builders for literal trees, e.g.
    //   ConfigTree::map({ { "enable", true },
    //     { "extra", ConfigTree::list({ "a", "b" }) } })
    static inline ConfigTree map( std::initializer_list<
      std::pair< std::string, ConfigTree > > entries = {} );
    static inline ConfigTree list( std::initializer_list< ConfigTree > items );

    inline bool is_scalar() const {
      return std::holds_alternative< Scalar >( node_ );
    }
    inline bool is_list() const {
      return std::holds_alternative< List >( node_ );
    }
    inline bool is_map() const {
      return std::holds_alternative< MapPtr >( node_ );
    }
    inline bool is_artifact() const {
      return std::holds_alternative< Artifact >( node_ );
    }
    inline bool is_null() const;
    inline bool is_bool() const;
    inline bool is_string() const;

    // Checked accessors; a mismatch is a StructuralError
    inline const Scalar& as_scalar() const;
    inline const List& as_list() const;
    inline const ConfigMap& as_map() const;
    inline const MapPtr& map_ptr() const;
    inline const Artifact& as_artifact() const;
    inline bool as_bool() const;
    inline const std::string& as_string() const;

    inline const Node& node() const { return node_; }

    // "null", "bool", "int", "float", "string", "list", "map" or "artifact"
    inline std::string kind_name() const;

    // Structural equality. Maps compare key-wise, artifacts by identity.
    inline bool operator==( const ConfigTree& other ) const;
    inline bool operator!=( const ConfigTree& other ) const {
      return !( *this == other );
    }

  private:
    Node node_;
  };

  // Insertion-ordered string-keyed map. Keys are unique.
  class ConfigMap {
  public:
    using Entry = std::pair< std::string, ConfigTree >;
    using const_iterator = std::vector< Entry >::const_iterator;

    inline const ConfigTree* find( const std::string& key ) const;
    inline bool contains( const std::string& key ) const {
      return find( key ) != nullptr;
    }

    // Replaces an existing entry in place, otherwise appends
    inline void set( const std::string& key, ConfigTree value );
    inline bool erase( const std::string& key );

    inline std::size_t size() const { return entries_.size(); }
    inline bool empty() const { return entries_.empty(); }
    inline const_iterator begin() const { return entries_.begin(); }
    inline const_iterator end() const { return entries_.end(); }

  private:
    std::vector< Entry > entries_;
  };

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';
  inline const std::string PLACEHOLDER_OPEN = "${";
  inline const std::string PLACEHOLDER_CLOSE = "}";

  // Divide a dotted path by PATH_DELIMITER instances
  inline std::vector< std::string > split_segments( const std::string& path ) {
    std::vector< std::string > segs;
    if ( path.empty() ) return segs;
    std::size_t start = 0;
    while ( true ) {
      std::size_t pos = path.find( PATH_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( path.substr(start) );
        break;
      }
      segs.push_back( path.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  inline std::string join_path( const std::vector< std::string >& segs,
    std::size_t count = std::string::npos )
  {
    std::string s;
    const std::size_t n = std::min( count, segs.size() );
    for ( std::size_t i = 0; i < n; ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, std::size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  inline std::string child_path( const std::string& prefix,
    const std::string& key )
  {
    if ( prefix.empty() ) return key;
    return prefix + PATH_DELIMITER + key;
  }

  inline ConfigTree with_segments( const ConfigTree& node,
    const std::vector< std::string >& segs, std::size_t i, ConfigTree value )
  {
    if ( i == segs.size() ) return value;

    MapPtr copy;
    if ( node.is_map() ) copy = std::make_shared< ConfigMap >( node.as_map() );
    else if ( node.is_null() ) copy = std::make_shared< ConfigMap >();
    else {
      std::ostringstream oss;
      oss << join_path( segs, i ) << ": cannot set '" << join_path( segs )
        << "' through a " << node.kind_name();
      throw StructuralError( oss.str() );
    }

    const ConfigTree* child = copy->find( segs[i] );
    ConfigTree next = child ? *child : ConfigTree();
    copy->set( segs[i], with_segments(next, segs, i + 1, std::move(value)) );
    return ConfigTree( copy );
  }

  // Returns std::nullopt when the node became an empty map and should be
  // dropped from its parent
  inline std::optional< ConfigTree > erase_segments( const ConfigTree& node,
    const std::vector< std::string >& segs, std::size_t i )
  {
    if ( !node.is_map() ) return node;
    const ConfigTree* child = node.as_map().find( segs[i] );
    if ( !child ) return node;

    auto copy = std::make_shared< ConfigMap >( node.as_map() );
    if ( i + 1 == segs.size() ) {
      copy->erase( segs[i] );
    }
    else {
      std::optional< ConfigTree > sub = erase_segments( *child, segs, i + 1 );
      if ( sub ) copy->set( segs[i], *sub );
      else copy->erase( segs[i] );
    }

    if ( copy->empty() && i > 0 ) return std::nullopt;
    return ConfigTree( copy );
  }

  [[noreturn]] inline void throw_kind_mismatch( const std::string& path,
    const char* expected, const ConfigTree& found )
  {
    std::ostringstream oss;
    oss << ( path.empty() ? "<root>" : path ) << ": expected a " << expected
      << ", found a " << found.kind_name();
    throw StructuralError( oss.str() );
  }

} // namespace internal

  // Placeholder string standing in for an artifact: "${name}"
  inline std::string make_placeholder( const std::string& name ) {
    return internal::PLACEHOLDER_OPEN + name + internal::PLACEHOLDER_CLOSE;
  }

  inline bool is_placeholder( const ConfigTree& node ) {
    if ( !node.is_string() ) return false;
    const std::string& s = node.as_string();
    return s.size() > internal::PLACEHOLDER_OPEN.size()
      + internal::PLACEHOLDER_CLOSE.size()
      && s.compare( 0, internal::PLACEHOLDER_OPEN.size(),
        internal::PLACEHOLDER_OPEN ) == 0
      && s.back() == internal::PLACEHOLDER_CLOSE.back();
  }

  // Node at a dotted path, or nullptr. The empty path is the root.
  inline const ConfigTree* find( const ConfigTree& tree,
    const std::string& path )
  {
    const ConfigTree* cur = &tree;
    for ( const auto& seg : internal::split_segments(path) ) {
      if ( !cur->is_map() ) return nullptr;
      cur = cur->as_map().find( seg );
      if ( !cur ) return nullptr;
    }
    return cur;
  }

  // Copy of the tree with a value set at a dotted path. Missing or null
  // intermediate nodes become maps; the input is left untouched.
  inline ConfigTree with_path( const ConfigTree& tree, const std::string& path,
    ConfigTree value )
  {
    if ( path.empty() ) return value;
    return internal::with_segments( tree, internal::split_segments(path), 0,
      std::move(value) );
  }

  // Copy of the tree without the entry at a dotted path. Maps left empty by
  // the removal are removed as well (except the root).
  inline ConfigTree erase_path( const ConfigTree& tree,
    const std::string& path )
  {
    if ( path.empty() ) return ConfigTree::map();
    std::optional< ConfigTree > out = internal::erase_segments( tree,
      internal::split_segments(path), 0 );
    return out ? *out : ConfigTree::map();
  }

  // Typed reads off fixed paths. Missing or null values yield the fallback.
  inline bool get_bool( const ConfigTree& tree, const std::string& path,
    bool fallback = false )
  {
    const ConfigTree* n = find( tree, path );
    if ( !n || n->is_null() ) return fallback;
    if ( !n->is_bool() ) internal::throw_kind_mismatch( path, "bool", *n );
    return n->as_bool();
  }

  inline std::string get_string( const ConfigTree& tree,
    const std::string& path, const std::string& fallback = std::string() )
  {
    const ConfigTree* n = find( tree, path );
    if ( !n || n->is_null() ) return fallback;
    if ( !n->is_string() ) internal::throw_kind_mismatch( path, "string", *n );
    return n->as_string();
  }

  inline List get_list( const ConfigTree& tree, const std::string& path ) {
    const ConfigTree* n = find( tree, path );
    if ( !n || n->is_null() ) return List();
    if ( !n->is_list() ) internal::throw_kind_mismatch( path, "list", *n );
    return n->as_list();
  }

  // List of strings; any other element kind is a StructuralError
  inline std::vector< std::string > get_strings( const ConfigTree& tree,
    const std::string& path )
  {
    std::vector< std::string > out;
    const List items = get_list( tree, path );
    for ( std::size_t i = 0; i < items.size(); ++i ) {
      if ( !items[i].is_string() ) {
        internal::throw_kind_mismatch( internal::seq_indexed(path, i),
          "string", items[i] );
      }
      out.push_back( items[i].as_string() );
    }
    return out;
  }

} // namespace docmod

// Artifact member function definitions

inline docmod::Artifact::Artifact( Builder build, std::string intrinsic_name )
  : record_( std::make_shared< const Record >(
      Record{ std::move(intrinsic_name), std::move(build) }) ) {}

inline bool docmod::Artifact::has_intrinsic_name() const {
  return !record_->name.empty();
}

inline const std::string& docmod::Artifact::intrinsic_name() const {
  return record_->name;
}

inline docmod::Artifact docmod::Artifact::renamed( std::string name ) const {
  return Artifact( record_->build, std::move(name) );
}

inline std::string docmod::Artifact::realise() const {
  if ( !record_->build ) {
    std::ostringstream oss;
    oss << "artifact '"
      << ( has_intrinsic_name() ? record_->name : std::string("<unnamed>") )
      << "' has no build attached";
    throw StructuralError( oss.str() );
  }
  return record_->build();
}

// ConfigTree member function definitions

inline docmod::ConfigTree docmod::ConfigTree::map( std::initializer_list<
  std::pair< std::string, ConfigTree > > entries )
{
  auto m = std::make_shared< ConfigMap >();
  for ( const auto& e : entries ) m->set( e.first, e.second );
  return ConfigTree( m );
}

inline docmod::ConfigTree docmod::ConfigTree::list(
  std::initializer_list< ConfigTree > items )
{
  return ConfigTree( List(items) );
}

inline bool docmod::ConfigTree::is_null() const {
  const Scalar* s = std::get_if< Scalar >( &node_ );
  return s && std::holds_alternative< std::nullptr_t >( *s );
}

inline bool docmod::ConfigTree::is_bool() const {
  const Scalar* s = std::get_if< Scalar >( &node_ );
  return s && std::holds_alternative< bool >( *s );
}

inline bool docmod::ConfigTree::is_string() const {
  const Scalar* s = std::get_if< Scalar >( &node_ );
  return s && std::holds_alternative< std::string >( *s );
}

inline const docmod::Scalar& docmod::ConfigTree::as_scalar() const {
  if ( !is_scalar() ) internal::throw_kind_mismatch( "", "scalar", *this );
  return std::get< Scalar >( node_ );
}

inline const docmod::List& docmod::ConfigTree::as_list() const {
  if ( !is_list() ) internal::throw_kind_mismatch( "", "list", *this );
  return std::get< List >( node_ );
}

inline const docmod::ConfigMap& docmod::ConfigTree::as_map() const {
  return *map_ptr();
}

inline const docmod::MapPtr& docmod::ConfigTree::map_ptr() const {
  if ( !is_map() ) internal::throw_kind_mismatch( "", "map", *this );
  return std::get< MapPtr >( node_ );
}

inline const docmod::Artifact& docmod::ConfigTree::as_artifact() const {
  if ( !is_artifact() ) internal::throw_kind_mismatch( "", "artifact", *this );
  return std::get< Artifact >( node_ );
}

inline bool docmod::ConfigTree::as_bool() const {
  if ( !is_bool() ) internal::throw_kind_mismatch( "", "bool", *this );
  return std::get< bool >( std::get< Scalar >(node_) );
}

inline const std::string& docmod::ConfigTree::as_string() const {
  if ( !is_string() ) internal::throw_kind_mismatch( "", "string", *this );
  return std::get< std::string >( std::get< Scalar >(node_) );
}

inline std::string docmod::ConfigTree::kind_name() const {
  if ( const Scalar* s = std::get_if< Scalar >(&node_) ) {
    switch ( s->index() ) {
      case 0: return "null";
      case 1: return "bool";
      case 2: return "int";
      case 3: return "float";
      default: return "string";
    }
  }
  if ( is_list() ) return "list";
  if ( is_map() ) return "map";
  return "artifact";
}

inline bool docmod::ConfigTree::operator==( const ConfigTree& other ) const {
  if ( node_.index() != other.node_.index() ) return false;

  if ( is_scalar() ) return as_scalar() == other.as_scalar();
  if ( is_list() ) return as_list() == other.as_list();
  if ( is_artifact() ) return as_artifact() == other.as_artifact();

  const MapPtr& a = map_ptr();
  const MapPtr& b = other.map_ptr();
  if ( a == b ) return true;
  if ( a->size() != b->size() ) return false;
  for ( const auto& [key, value] : *a ) {
    const ConfigTree* theirs = b->find( key );
    if ( !theirs || !( value == *theirs ) ) return false;
  }
  return true;
}

// ConfigMap member function definitions

inline const docmod::ConfigTree* docmod::ConfigMap::find(
  const std::string& key ) const
{
  for ( const auto& entry : entries_ ) {
    if ( entry.first == key ) return &entry.second;
  }
  return nullptr;
}

inline void docmod::ConfigMap::set( const std::string& key, ConfigTree value ) {
  for ( auto& entry : entries_ ) {
    if ( entry.first == key ) {
      entry.second = std::move( value );
      return;
    }
  }
  entries_.emplace_back( key, std::move(value) );
}

inline bool docmod::ConfigMap::erase( const std::string& key ) {
  for ( auto it = entries_.begin(); it != entries_.end(); ++it ) {
    if ( it->first == key ) {
      entries_.erase( it );
      return true;
    }
  }
  return false;
}
