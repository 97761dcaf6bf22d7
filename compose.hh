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
#include <utility>
#include <vector>

#include "config_tree.hh"
#include "errors.hh"
#include "logging.hh"

namespace docmod {

  // Fragment activation test, evaluated once against the composition base
  using Predicate = std::function< bool( const ConfigTree& base ) >;

  // Invariant checked against the fully merged tree
  struct Assertion {
    std::function< bool( const ConfigTree& merged ) > check;
    std::string message;
  };

  // Independently authored partial configuration, applied only when its
  // predicate holds. A fragment without a predicate is always active.
  struct Fragment {
    std::string name;
    Predicate predicate;
    ConfigTree payload = ConfigTree::map();
    std::vector< Assertion > assertions;
  };

  // Read-only result of a successful composition pass
  class ResolvedConfig {
  public:
    inline const ConfigTree& tree() const { return tree_; }

    // Names of the fragments whose predicate held, in declaration order
    inline const std::vector< std::string >& active_fragments() const {
      return active_;
    }

    inline const ConfigTree* find( const std::string& path ) const {
      return docmod::find( tree_, path );
    }
    inline bool get_bool( const std::string& path,
      bool fallback = false ) const
    {
      return docmod::get_bool( tree_, path, fallback );
    }
    inline std::string get_string( const std::string& path,
      const std::string& fallback = std::string() ) const
    {
      return docmod::get_string( tree_, path, fallback );
    }
    inline List get_list( const std::string& path ) const {
      return docmod::get_list( tree_, path );
    }
    inline std::vector< std::string > get_strings(
      const std::string& path ) const
    {
      return docmod::get_strings( tree_, path );
    }

  private:
    friend ResolvedConfig compose( const ConfigTree& base,
      const std::vector< Fragment >& fragments );

    inline ResolvedConfig( ConfigTree tree, std::vector< std::string > active )
      : tree_( std::move(tree) ), active_( std::move(active) ) {}

    ConfigTree tree_;
    std::vector< std::string > active_;
  };

  // Deep merge of an overlay onto a base. Maps merge key-wise (keys only in
  // the overlay are added), lists append, and anything else is replaced by
  // the overlay. Neither input is modified.
  inline ConfigTree merge( const ConfigTree& base, const ConfigTree& overlay ) {
    if ( overlay.is_list() && base.is_list() ) {
      List joined = base.as_list();
      const List& tail = overlay.as_list();
      joined.insert( joined.end(), tail.begin(), tail.end() );
      return ConfigTree( std::move(joined) );
    }

    if ( !overlay.is_map() || !base.is_map() ) return overlay;

    // Copy the base map, then merge overlay keys into the copy
    auto result = std::make_shared< ConfigMap >( base.as_map() );
    for ( const auto& [key, value] : overlay.as_map() ) {
      if ( const ConfigTree* prior = result->find(key) ) {
        result->set( key, merge(*prior, value) );
      }
      else {
        result->set( key, value );
      }
    }
    return ConfigTree( result );
  }

  // Folds the payloads of all active fragments over base in declaration
  // order, then checks every assertion of every active fragment. All failing
  // assertions are reported together in a CompositionError; nothing is
  // returned unless all of them hold.
  inline ResolvedConfig compose( const ConfigTree& base,
    const std::vector< Fragment >& fragments );

  // Predicate helpers

  inline Predicate always() {
    return []( const ConfigTree& ) { return true; };
  }

  // True when the bool at path is set (missing counts as false)
  inline Predicate when_enabled( const std::string& path ) {
    return [path]( const ConfigTree& base ) {
      return get_bool( base, path, false );
    };
  }

  inline Predicate all_of( std::vector< Predicate > predicates ) {
    return [predicates = std::move(predicates)]( const ConfigTree& base ) {
      for ( const auto& p : predicates ) {
        if ( p && !p(base) ) return false;
      }
      return true;
    };
  }

} // namespace docmod

inline docmod::ResolvedConfig docmod::compose( const ConfigTree& base,
  const std::vector< Fragment >& fragments )
{
  auto logger = library_logger();

  // 1) Evaluate every predicate exactly once, against the base
  std::vector< const Fragment* > active;
  std::vector< std::string > active_names;
  for ( const auto& fragment : fragments ) {
    if ( !fragment.payload.is_map() && !fragment.payload.is_null() ) {
      std::ostringstream oss;
      oss << "fragment '" << fragment.name << "': payload must be a map, found a "
        << fragment.payload.kind_name();
      throw StructuralError( oss.str() );
    }
    const bool on = !fragment.predicate || fragment.predicate( base );
    logger->debug( "fragment '{}' is {}", fragment.name,
      on ? "active" : "inactive" );
    if ( on ) {
      active.push_back( &fragment );
      active_names.push_back( fragment.name );
    }
  }

  // 2) Merge active payloads in declaration order
  ConfigTree merged = base;
  for ( const Fragment* fragment : active ) {
    if ( fragment->payload.is_null() ) continue;
    merged = merge( merged, fragment->payload );
  }

  // 3) Check all assertions, collecting every failure
  std::vector< AssertionFailure > failures;
  for ( const Fragment* fragment : active ) {
    for ( const auto& assertion : fragment->assertions ) {
      if ( !assertion.check ) {
        std::ostringstream oss;
        oss << "fragment '" << fragment->name
          << "': assertion without a check (\"" << assertion.message << "\")";
        throw StructuralError( oss.str() );
      }
      if ( !assertion.check(merged) ) {
        logger->debug( "assertion failed in fragment '{}': {}", fragment->name,
          assertion.message );
        failures.push_back( AssertionFailure{ fragment->name,
          assertion.message } );
      }
    }
  }

  // 4) All or nothing
  if ( !failures.empty() ) throw CompositionError( std::move(failures) );

  logger->debug( "composed {} of {} fragments", active.size(),
    fragments.size() );
  return ResolvedConfig( std::move(merged), std::move(active_names) );
}
