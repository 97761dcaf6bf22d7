// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

// Standard library includes
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "compose.hh"
#include "config_tree.hh"
#include "errors.hh"
#include "schema.hh"

namespace docmod {

  // Module files that declare the options below
  inline const std::string DOCUMENTATION_MODULE
    = "nixos/modules/misc/documentation.nix";
  inline const std::string MAN_DB_MODULE = "nixos/modules/misc/man-db.nix";
  inline const std::string MANDOC_MODULE = "nixos/modules/misc/mandoc.nix";
  inline const std::string SYSTEM_PATH_MODULE
    = "nixos/modules/config/system-path.nix";
  inline const std::string GETTY_MODULE
    = "nixos/modules/services/ttys/getty.nix";
  inline const std::string TOP_LEVEL_MODULE
    = "nixos/modules/system/activation/top-level.nix";
  inline const std::string VERSION_MODULE = "nixos/modules/misc/version.nix";

  // Modules documented even though no configuration imports them
  inline const std::string QEMU_VM_MODULE
    = "nixos/modules/virtualisation/qemu-vm.nix";

  // Option paths read by the fragments and the assembly
  inline const std::string DOC_ENABLE = "documentation.enable";
  inline const std::string DOC_MAN_ENABLE = "documentation.man.enable";
  inline const std::string DOC_MAN_CACHES = "documentation.man.generateCaches";
  inline const std::string DOC_MAN_DB_ENABLE = "documentation.man.man-db.enable";
  inline const std::string DOC_MANDOC_ENABLE = "documentation.man.mandoc.enable";
  inline const std::string DOC_INFO_ENABLE = "documentation.info.enable";
  inline const std::string DOC_DOC_ENABLE = "documentation.doc.enable";
  inline const std::string DOC_DEV_ENABLE = "documentation.dev.enable";
  inline const std::string DOC_NIXOS_ENABLE = "documentation.nixos.enable";
  inline const std::string DOC_NIXOS_ALL_MODULES
    = "documentation.nixos.includeAllModules";
  inline const std::string DOC_NIXOS_EXTRA_SOURCES
    = "documentation.nixos.extraModuleSources";

  inline const std::string ENV_PATHS_TO_LINK = "environment.pathsToLink";
  inline const std::string ENV_EXTRA_OUTPUTS
    = "environment.extraOutputsToInstall";
  inline const std::string ENV_SYSTEM_PACKAGES = "environment.systemPackages";
  inline const std::string ENV_EXTRA_SETUP = "environment.extraSetup";
  inline const std::string GETTY_HELP_LINE = "services.getty.helpLine";
  inline const std::string SYSTEM_BUILD = "system.build";
  inline const std::string SYSTEM_BUILD_MANUAL = "system.build.manual";
  inline const std::string NIXOS_RELEASE = "system.nixos.release";

  inline const std::string NIXOS_HELP_LINE
    = "\nRun 'nixos-help' for the NixOS manual.";

  // Lazily built manual outputs wired into the configuration
  struct ManualArtifacts {
    ConfigTree bundle;       // manpages, manualHTML and manualHTMLIndex
    ConfigTree manpages;
    ConfigTree manual_html;
    ConfigTree nixos_help;
  };

  // Package from the package set, named after its attribute path unless it
  // reports a name of its own. Missing or non-package attributes are a
  // StructuralError.
  inline ConfigTree package_ref( const ConfigTree& pkgs,
    const std::string& attr );

  inline void declare_documentation_options( OptionRegistry& registry );

  // Options of other modules that the documentation fragments write to
  inline void declare_environment_options( OptionRegistry& registry );

  // Options of modules that are documented without being imported. They are
  // declared documentation-only so user modules cannot redeclare them.
  inline void declare_extra_doc_options( OptionRegistry& registry,
    const ConfigTree& pkgs );

  // Old option paths and their replacements
  inline void declare_documentation_renames( OptionRegistry& registry );

  // The module's conditional configuration, every fragment gated on
  // documentation.enable
  inline std::vector< Fragment > documentation_fragments(
    const ConfigTree& pkgs, const ManualArtifacts& manual );

namespace internal {

  inline OptionSpec option( std::string path, OptionType type,
    std::optional< ConfigTree > default_value, std::string description,
    std::string declared_in, std::optional< std::string > example
      = std::nullopt )
  {
    OptionSpec spec;
    spec.path = std::move( path );
    spec.type = type;
    spec.default_value = std::move( default_value );
    spec.description = std::move( description );
    spec.example = std::move( example );
    spec.declared_in = std::move( declared_in );
    return spec;
  }

  inline Fragment fragment( std::string name, Predicate predicate,
    ConfigTree payload, std::vector< Assertion > assertions = {} )
  {
    Fragment f;
    f.name = std::move( name );
    f.predicate = std::move( predicate );
    f.payload = std::move( payload );
    f.assertions = std::move( assertions );
    return f;
  }

  inline ConfigTree strings( std::initializer_list< const char* > items ) {
    List out;
    for ( const char* s : items ) out.emplace_back( s );
    return ConfigTree( std::move(out) );
  }

  inline std::string install_info_script() {
    const std::string install_info
      = make_placeholder( "pkgs.buildPackages.texinfo" ) + "/bin/install-info";
    return
      "if [ -w $out/share/info ]; then\n"
      "  shopt -s nullglob\n"
      "  for i in $out/share/info/*.info $out/share/info/*.info.gz; do\n"
      "      " + install_info + " $i $out/share/info/dir\n"
      "  done\n"
      "fi\n";
  }

} // namespace internal

} // namespace docmod

inline docmod::ConfigTree docmod::package_ref( const ConfigTree& pkgs,
  const std::string& attr )
{
  const std::string full = internal::child_path( "pkgs", attr );
  const ConfigTree* node = docmod::find( pkgs, attr );
  if ( !node ) throw StructuralError( full + ": no such package" );
  if ( !node->is_artifact() ) {
    internal::throw_kind_mismatch( full, "package", *node );
  }
  const Artifact& artifact = node->as_artifact();
  if ( artifact.has_intrinsic_name() ) return *node;
  return ConfigTree( artifact.renamed(full) );
}

inline void docmod::declare_documentation_options( OptionRegistry& registry ) {
  using internal::option;

  registry.declare( option(DOC_ENABLE, OptionType::Bool, ConfigTree(true),
    "Whether to install documentation of packages from "
    "environment.systemPackages into the generated system path.\n\n"
    "See \"Multiple-output packages\" chapter in the nixpkgs manual for more "
    "info.", DOCUMENTATION_MODULE) );

  registry.declare( option(DOC_MAN_ENABLE, OptionType::Bool, ConfigTree(true),
    "Whether to install manual pages.\n"
    "This also includes `man` outputs.", DOCUMENTATION_MODULE) );

  registry.declare( option(DOC_MAN_CACHES, OptionType::Bool, ConfigTree(false),
    "Whether to generate the manual page index caches.\n"
    "This allows searching for a page or keyword using utilities like "
    "apropos(1) and the `-k` option of man(1).", DOCUMENTATION_MODULE) );

  registry.declare( option(DOC_MAN_DB_ENABLE, OptionType::Bool,
    ConfigTree(true),
    "Whether to use man-db as the default man page viewer.",
    MAN_DB_MODULE) );

  registry.declare( option(DOC_MANDOC_ENABLE, OptionType::Bool,
    ConfigTree(false),
    "Whether to use mandoc as the default man page viewer.",
    MANDOC_MODULE) );

  registry.declare( option(DOC_INFO_ENABLE, OptionType::Bool, ConfigTree(true),
    "Whether to install info pages and the `info` command.\n"
    "This also includes \"info\" outputs.", DOCUMENTATION_MODULE) );

  registry.declare( option(DOC_DOC_ENABLE, OptionType::Bool, ConfigTree(true),
    "Whether to install documentation distributed in packages' "
    "`/share/doc`.\nUsually plain text and/or HTML.\n"
    "This also includes \"doc\" outputs.", DOCUMENTATION_MODULE) );

  registry.declare( option(DOC_DEV_ENABLE, OptionType::Bool, ConfigTree(false),
    "Whether to install documentation targeted at developers.\n"
    "- This includes man pages targeted at developers if "
    "documentation.man.enable is set (this also includes \"devman\" "
    "outputs).\n"
    "- This includes info pages targeted at developers if "
    "documentation.info.enable is set (this also includes \"devinfo\" "
    "outputs).\n"
    "- This includes other pages targeted at developers if "
    "documentation.doc.enable is set (this also includes \"devdoc\" "
    "outputs).", DOCUMENTATION_MODULE) );

  registry.declare( option(DOC_NIXOS_ENABLE, OptionType::Bool,
    ConfigTree(true),
    "Whether to install NixOS's own documentation.\n"
    "- This includes man pages like configuration.nix(5) if "
    "documentation.man.enable is set.\n"
    "- This includes the HTML manual and the `nixos-help` command if "
    "documentation.doc.enable is set.", DOCUMENTATION_MODULE) );

  registry.declare( option(DOC_NIXOS_ALL_MODULES, OptionType::Bool,
    ConfigTree(false),
    "Whether the generated NixOS's documentation should include "
    "documentation for all the options from all the NixOS modules included "
    "in the current configuration.nix. Disabling this will make the manual "
    "generator to ignore options defined outside of baseModules.",
    DOCUMENTATION_MODULE) );

  registry.declare( option(DOC_NIXOS_EXTRA_SOURCES,
    OptionType::ListOfPathOrStr, ConfigTree(List()),
    "Which extra NixOS module paths the generated NixOS's documentation "
    "should strip from options.", DOCUMENTATION_MODULE,
    std::string("# e.g. with options from modules in ${pkgs.customModules}/nix:\n"
      "[ pkgs.customModules ]")) );
}

inline void docmod::declare_environment_options( OptionRegistry& registry ) {
  using internal::option;

  registry.declare( option(ENV_PATHS_TO_LINK, OptionType::ListOfStr,
    ConfigTree(List()),
    "List of directories to be symlinked in /run/current-system/sw.",
    SYSTEM_PATH_MODULE) );

  registry.declare( option(ENV_EXTRA_OUTPUTS, OptionType::ListOfStr,
    ConfigTree(List()),
    "List of additional package outputs to be symlinked into "
    "/run/current-system/sw.", SYSTEM_PATH_MODULE) );

  registry.declare( option(ENV_SYSTEM_PACKAGES, OptionType::ListOfPackage,
    ConfigTree(List()),
    "The set of packages that appear in /run/current-system/sw.",
    SYSTEM_PATH_MODULE) );

  registry.declare( option(ENV_EXTRA_SETUP, OptionType::Lines,
    ConfigTree(""),
    "Shell fragments to be run after the system environment has been "
    "created.", SYSTEM_PATH_MODULE) );

  registry.declare( option(GETTY_HELP_LINE, OptionType::Lines, ConfigTree(""),
    "Help line printed by mingetty below the welcome line.",
    GETTY_MODULE) );

  registry.declare( option(SYSTEM_BUILD, OptionType::Attrs,
    ConfigTree::map(),
    "Attribute set of derivations used to set up the system.",
    TOP_LEVEL_MODULE) );

  registry.declare( option(NIXOS_RELEASE, OptionType::Str, ConfigTree("24.05"),
    "The NixOS release (e.g. `24.05`).", VERSION_MODULE) );
}

inline void docmod::declare_extra_doc_options( OptionRegistry& registry,
  const ConfigTree& pkgs )
{
  auto doc_only = []( OptionSpec spec ) {
    spec.documentation_only = true;
    return spec;
  };
  using internal::option;

  registry.declare( doc_only(option("virtualisation.memorySize",
    OptionType::Int, ConfigTree(1024),
    "The memory size in megabytes of the virtual machine.",
    QEMU_VM_MODULE)) );

  registry.declare( doc_only(option("virtualisation.cores", OptionType::Int,
    ConfigTree(1),
    "Specify the number of cores the guest is permitted to use.",
    QEMU_VM_MODULE)) );

  std::optional< ConfigTree > qemu;
  const ConfigTree* found = docmod::find( pkgs, "qemu_kvm" );
  if ( found && found->is_artifact() ) qemu = package_ref( pkgs, "qemu_kvm" );
  registry.declare( doc_only(option("virtualisation.qemu.package",
    OptionType::Package, qemu, "QEMU package to use.", QEMU_VM_MODULE)) );
}

inline void docmod::declare_documentation_renames( OptionRegistry& registry ) {
  registry.rename( "programs.info.enable", DOC_INFO_ENABLE );
  registry.rename( "programs.man.enable", DOC_MAN_ENABLE );
  registry.rename( "services.nixosManual.enable", DOC_NIXOS_ENABLE );
}

inline std::vector< docmod::Fragment > docmod::documentation_fragments(
  const ConfigTree& pkgs, const ManualArtifacts& manual )
{
  using internal::fragment;
  using internal::strings;

  const Predicate enabled = when_enabled( DOC_ENABLE );

  // A missing info package only matters when info pages are wanted
  const ConfigTree* texinfo_node = docmod::find( pkgs, "texinfoInteractive" );
  const bool has_texinfo = texinfo_node && texinfo_node->is_artifact();
  List info_packages;
  if ( has_texinfo ) {
    info_packages.push_back( package_ref(pkgs, "texinfoInteractive") );
  }

  std::vector< Fragment > out;

  out.push_back( fragment("assertions", enabled, ConfigTree::map(), {
    Assertion{ []( const ConfigTree& cfg ) {
        return !( get_bool(cfg, DOC_MAN_DB_ENABLE)
          && get_bool(cfg, DOC_MANDOC_ENABLE) );
      },
      "man-db and mandoc can't be used as the default man page viewer at "
      "the same time!" }
  }) );

  // The man page viewer itself is configured by man-db or mandoc
  out.push_back( fragment("man",
    all_of({ enabled, when_enabled(DOC_MAN_ENABLE) }),
    with_path( with_path(ConfigTree::map(), ENV_PATHS_TO_LINK,
      strings({ "/share/man" })), ENV_EXTRA_OUTPUTS, strings({ "man" }) )) );

  out.push_back( fragment("man-dev",
    all_of({ enabled, when_enabled(DOC_MAN_ENABLE),
      when_enabled(DOC_DEV_ENABLE) }),
    with_path( ConfigTree::map(), ENV_EXTRA_OUTPUTS, strings({ "devman" }) )) );

  ConfigTree info = ConfigTree::map();
  info = with_path( info, ENV_SYSTEM_PACKAGES,
    ConfigTree(std::move(info_packages)) );
  info = with_path( info, ENV_PATHS_TO_LINK, strings({ "/share/info" }) );
  info = with_path( info, ENV_EXTRA_OUTPUTS, strings({ "info" }) );
  info = with_path( info, ENV_EXTRA_SETUP, internal::install_info_script() );
  out.push_back( fragment("info",
    all_of({ enabled, when_enabled(DOC_INFO_ENABLE) }), info, {
      Assertion{ [has_texinfo]( const ConfigTree& ) { return has_texinfo; },
        DOC_INFO_ENABLE + " requires pkgs.texinfoInteractive in the "
        "package set" }
    }) );

  out.push_back( fragment("info-dev",
    all_of({ enabled, when_enabled(DOC_INFO_ENABLE),
      when_enabled(DOC_DEV_ENABLE) }),
    with_path( ConfigTree::map(), ENV_EXTRA_OUTPUTS, strings({ "devinfo" }) )) );

  out.push_back( fragment("doc",
    all_of({ enabled, when_enabled(DOC_DOC_ENABLE) }),
    with_path( with_path(ConfigTree::map(), ENV_PATHS_TO_LINK,
      strings({ "/share/doc" })), ENV_EXTRA_OUTPUTS, strings({ "doc" }) )) );

  out.push_back( fragment("doc-dev",
    all_of({ enabled, when_enabled(DOC_DOC_ENABLE),
      when_enabled(DOC_DEV_ENABLE) }),
    with_path( ConfigTree::map(), ENV_EXTRA_OUTPUTS, strings({ "devdoc" }) )) );

  const Predicate nixos = all_of({ enabled, when_enabled(DOC_NIXOS_ENABLE) });

  out.push_back( fragment("nixos", nixos,
    with_path( ConfigTree::map(), SYSTEM_BUILD_MANUAL, manual.bundle )) );

  out.push_back( fragment("nixos-man",
    all_of({ nixos, when_enabled(DOC_MAN_ENABLE) }),
    with_path( ConfigTree::map(), ENV_SYSTEM_PACKAGES,
      ConfigTree::list({ manual.manpages }) )) );

  ConfigTree nixos_doc = ConfigTree::map();
  nixos_doc = with_path( nixos_doc, ENV_SYSTEM_PACKAGES,
    ConfigTree::list({ manual.manual_html, manual.nixos_help }) );
  nixos_doc = with_path( nixos_doc, GETTY_HELP_LINE, NIXOS_HELP_LINE );
  out.push_back( fragment("nixos-doc",
    all_of({ nixos, when_enabled(DOC_DOC_ENABLE) }), nixos_doc) );

  return out;
}
