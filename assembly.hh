// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

// Standard library includes
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "compose.hh"
#include "config_tree.hh"
#include "documentation.hh"
#include "errors.hh"
#include "logging.hh"
#include "schema.hh"
#include "scrub.hh"

namespace docmod {

  enum class ManualFormat { ManPages, Html, HelpCommand };

  inline const char* to_string( ManualFormat format ) {
    switch ( format ) {
      case ManualFormat::ManPages: return "manpages";
      case ManualFormat::Html: return "html";
      case ManualFormat::HelpCommand: return "nixos-help";
    }
    return "unknown";
  }

  // Documentation entry for one option, with its default already scrubbed
  struct OptionDoc {
    std::string path;
    std::string type;
    std::string description;
    bool has_default = false;
    ConfigTree default_value;
    std::optional< std::string > example;
    std::vector< std::string > declarations;
  };

  struct ManualInput {
    std::string version;
    std::string revision;
    std::vector< std::string > extra_sources;
    std::vector< OptionDoc > options;
  };

  // Produces the human-readable manual. Implementations live outside this
  // library and only ever receive scrubbed values.
  class ManualRenderer {
  public:
    virtual ~ManualRenderer() = default;

    // Renders one output format and returns its location
    virtual std::string render( const ManualInput& input,
      ManualFormat format ) = 0;
  };

  // Plain installation settings read off the resolved configuration
  struct InstallDirectives {
    bool install_man_pages = false;
    bool install_info_pages = false;
    bool install_doc_pages = false;
    bool generate_man_caches = false;
    std::vector< std::string > paths_to_link;
    std::vector< std::string > extra_outputs_to_install;
    std::vector< std::string > system_packages;
    std::string help_line;
  };

  struct AssemblyInput {
    ConfigTree settings = ConfigTree::map();
    ConfigTree pkgs = ConfigTree::map();
    std::vector< OptionSpec > user_options;
  };

  struct AssemblyResult {
    ResolvedConfig resolved;
    ConfigTree scrubbed_config;
    ConfigTree scrubbed_pkgs;
    std::shared_ptr< const ManualInput > manual_input;
    InstallDirectives directives;
  };

  // One documentation-generation pass: scrub the package set, pick and
  // scrub the options to document, wire up the lazily rendered manual,
  // compose the documentation fragments and derive install directives.
  // Scrub and composition errors propagate unchanged.
  class DocumentationAssembly {
  public:
    inline explicit DocumentationAssembly(
      std::shared_ptr< ManualRenderer > renderer = nullptr )
      : renderer_( std::move(renderer) ) {}

    inline AssemblyResult assemble( const AssemblyInput& input ) const;

    // Manual outputs whose builds call the renderer
    inline ManualArtifacts manual_artifacts(
      std::shared_ptr< const ManualInput > input ) const;

    static inline std::vector< OptionDoc > document_options(
      const std::vector< OptionSpec >& options,
      const std::vector< std::string >& strip_prefixes );

    // Declaration path relative to the first matching module source
    static inline std::string strip_declaration( const std::string& decl,
      const std::vector< std::string >& prefixes );

    static inline InstallDirectives derive_directives(
      const ResolvedConfig& resolved );

  private:
    std::shared_ptr< ManualRenderer > renderer_;
  };

namespace internal {

  // Artifacts of a list read off a fixed path, replaced by their placeholder
  // names; strings are kept verbatim
  inline std::vector< std::string > scrubbed_names( const List& items,
    const std::string& path )
  {
    const ConfigTree scrubbed = scrub( ConfigTree(items), is_artifact_node,
      path_namer(path) );
    std::vector< std::string > out;
    const List& elements = scrubbed.as_list();
    for ( std::size_t i = 0; i < elements.size(); ++i ) {
      if ( !elements[i].is_string() ) {
        throw_kind_mismatch( seq_indexed(path, i), "string or package",
          elements[i] );
      }
      std::string s = elements[i].as_string();
      if ( is_artifact_node(items[i]) ) {
        s = s.substr( PLACEHOLDER_OPEN.size(),
          s.size() - PLACEHOLDER_OPEN.size() - PLACEHOLDER_CLOSE.size() );
      }
      out.push_back( std::move(s) );
    }
    return out;
  }

} // namespace internal

} // namespace docmod

inline docmod::AssemblyResult docmod::DocumentationAssembly::assemble(
  const AssemblyInput& input ) const
{
  auto logger = library_logger();

  // 1) Declared options. User modules come last, so redeclaring a base or
  // documentation-only option is a StructuralError.
  OptionRegistry registry;
  declare_documentation_options( registry );
  declare_environment_options( registry );
  declare_documentation_renames( registry );
  declare_extra_doc_options( registry, input.pkgs );
  const std::size_t base_count = registry.options().size();
  for ( const auto& spec : input.user_options ) registry.declare( spec );

  // 2) Composition base: defaults overlaid with the user's settings
  const ConfigTree settings = registry.apply_renames( input.settings );
  const ConfigTree base = merge( registry.defaults(), settings );

  // 3) Documentation toggles are read off the base; no fragment sets them
  const bool all_modules = get_bool( base, DOC_NIXOS_ALL_MODULES );
  const std::vector< std::string > extra_sources = internal::scrubbed_names(
    get_list(base, DOC_NIXOS_EXTRA_SOURCES), DOC_NIXOS_EXTRA_SOURCES );
  const std::string version = get_string( base, NIXOS_RELEASE, "unstable" );

  // 4) Package set with every derivation replaced by its attribute path
  ConfigTree scrubbed_pkgs = scrub_derivations( "pkgs", input.pkgs );

  // 5) Options to document: base modules, the extra doc modules, and the
  // user's modules only when asked for
  std::vector< OptionSpec > documented( registry.options().begin(),
    registry.options().begin() + static_cast< std::ptrdiff_t >( base_count ) );
  if ( all_modules ) {
    documented.insert( documented.end(),
      registry.options().begin() + static_cast< std::ptrdiff_t >( base_count ),
      registry.options().end() );
  }

  auto manual_input = std::make_shared< ManualInput >();
  manual_input->version = version;
  manual_input->revision = "release-" + version;
  manual_input->extra_sources = extra_sources;
  manual_input->options = document_options( documented, extra_sources );
  logger->info( "documenting {} options ({} from user modules)",
    manual_input->options.size(),
    all_modules ? registry.options().size() - base_count : 0 );

  // 6) Manual outputs, built only if something realises them
  const ManualArtifacts manual = manual_artifacts( manual_input );

  // 7) Compose the module's fragments over the base
  ResolvedConfig resolved = compose( base,
    documentation_fragments(input.pkgs, manual) );
  logger->info( "composed documentation configuration; active fragments: {}",
    resolved.active_fragments().size() );

  ConfigTree scrubbed_config = scrub( resolved.tree() );
  InstallDirectives directives = derive_directives( resolved );

  return AssemblyResult{ std::move(resolved), std::move(scrubbed_config),
    std::move(scrubbed_pkgs), std::move(manual_input),
    std::move(directives) };
}

inline docmod::ManualArtifacts docmod::DocumentationAssembly::manual_artifacts(
  std::shared_ptr< const ManualInput > input ) const
{
  std::shared_ptr< ManualRenderer > renderer = renderer_;
  auto build = [renderer, input]( ManualFormat format ) -> Artifact::Builder {
    return [renderer, input, format]() -> std::string {
      if ( !renderer ) {
        throw StructuralError( std::string("no manual renderer attached to "
          "build the ") + to_string(format) + " output" );
      }
      return renderer->render( *input, format );
    };
  };

  ManualArtifacts m;
  m.manpages = ConfigTree( Artifact(build(ManualFormat::ManPages),
    "manual.manpages") );
  m.manual_html = ConfigTree( Artifact(build(ManualFormat::Html),
    "manual.manualHTML") );
  m.nixos_help = ConfigTree( Artifact(build(ManualFormat::HelpCommand),
    "nixos-help") );

  Artifact::Builder html = build( ManualFormat::Html );
  const ConfigTree index( Artifact([html]() {
      return html() + "/share/doc/nixos/index.html";
    }, "manual.manualHTMLIndex") );

  m.bundle = ConfigTree::map({
    { "manpages", m.manpages },
    { "manualHTML", m.manual_html },
    { "manualHTMLIndex", index }
  });
  return m;
}

inline std::vector< docmod::OptionDoc >
  docmod::DocumentationAssembly::document_options(
    const std::vector< OptionSpec >& options,
    const std::vector< std::string >& strip_prefixes )
{
  std::vector< OptionDoc > docs;
  docs.reserve( options.size() );
  for ( const auto& spec : options ) {
    OptionDoc doc;
    doc.path = spec.path;
    doc.type = to_string( spec.type );
    doc.description = spec.description;
    doc.example = spec.example;
    if ( spec.default_value ) {
      // Artifacts without a name of their own are named after the option
      doc.has_default = true;
      doc.default_value = scrub( *spec.default_value, is_artifact_node,
        path_namer(spec.path) );
    }
    if ( !spec.declared_in.empty() ) {
      doc.declarations.push_back(
        strip_declaration(spec.declared_in, strip_prefixes) );
    }
    docs.push_back( std::move(doc) );
  }
  return docs;
}

inline std::string docmod::DocumentationAssembly::strip_declaration(
  const std::string& decl, const std::vector< std::string >& prefixes )
{
  for ( const auto& prefix : prefixes ) {
    if ( prefix.empty() ) continue;
    const std::string dir = prefix.back() == '/' ? prefix : prefix + '/';
    if ( decl.size() > dir.size() && decl.compare(0, dir.size(), dir) == 0 ) {
      return decl.substr( dir.size() );
    }
  }
  return decl;
}

inline docmod::InstallDirectives
  docmod::DocumentationAssembly::derive_directives(
    const ResolvedConfig& resolved )
{
  InstallDirectives d;
  const bool docs = resolved.get_bool( DOC_ENABLE );
  d.install_man_pages = docs && resolved.get_bool( DOC_MAN_ENABLE );
  d.install_info_pages = docs && resolved.get_bool( DOC_INFO_ENABLE );
  d.install_doc_pages = docs && resolved.get_bool( DOC_DOC_ENABLE );
  d.generate_man_caches = d.install_man_pages
    && resolved.get_bool( DOC_MAN_CACHES );
  d.paths_to_link = resolved.get_strings( ENV_PATHS_TO_LINK );
  d.extra_outputs_to_install = resolved.get_strings( ENV_EXTRA_OUTPUTS );
  d.system_packages = internal::scrubbed_names(
    resolved.get_list(ENV_SYSTEM_PACKAGES), ENV_SYSTEM_PACKAGES );
  d.help_line = resolved.get_string( GETTY_HELP_LINE );
  return d;
}
