#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "assembly.hh"
#include "logging_test_fixture.hh"

using namespace docmod;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    docmod::test::ensure_logger_initialized();
    return true;
}();

// Renderer that remembers every request instead of building anything
class RecordingRenderer : public ManualRenderer {
public:
    std::string render(const ManualInput& input, ManualFormat format) override {
        formats.push_back(format);
        versions.push_back(input.version);
        return std::string("/store/manual-") + to_string(format);
    }

    std::vector<ManualFormat> formats;
    std::vector<std::string> versions;
};

ConfigTree store_artifact(const std::string& out_path) {
    return ConfigTree(Artifact([out_path]() { return out_path; }));
}

AssemblyInput sample_input() {
    AssemblyInput input;
    input.pkgs = ConfigTree::map({
        {"hello", store_artifact("/store/hello")},
        {"texinfoInteractive", store_artifact("/store/texinfo-interactive")},
        {"qemu_kvm", store_artifact("/store/qemu")},
        {"buildPackages", ConfigTree::map({{"texinfo", store_artifact("/store/texinfo")}})},
    });
    return input;
}

OptionSpec user_option(const std::string& path, const std::string& declared_in) {
    OptionSpec spec;
    spec.path = path;
    spec.type = OptionType::Bool;
    spec.default_value = ConfigTree(false);
    spec.description = "Whether to enable the foo service.";
    spec.declared_in = declared_in;
    return spec;
}

const OptionDoc* find_doc(const ManualInput& manual, const std::string& path) {
    for (const auto& doc : manual.options) {
        if (doc.path == path) return &doc;
    }
    return nullptr;
}

bool contains_artifact(const ConfigTree& tree) {
    if (tree.is_artifact()) return true;
    if (tree.is_list()) {
        for (const auto& item : tree.as_list()) {
            if (contains_artifact(item)) return true;
        }
    }
    if (tree.is_map()) {
        for (const auto& entry : tree.as_map()) {
            if (contains_artifact(entry.second)) return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("default assembly derives the install directives") {
    auto renderer = std::make_shared<RecordingRenderer>();
    const DocumentationAssembly assembly(renderer);

    const AssemblyResult result = assembly.assemble(sample_input());

    const InstallDirectives& d = result.directives;
    REQUIRE(d.install_man_pages);
    REQUIRE(d.install_info_pages);
    REQUIRE(d.install_doc_pages);
    REQUIRE_FALSE(d.generate_man_caches);
    REQUIRE(d.paths_to_link == std::vector<std::string>{"/share/man", "/share/info", "/share/doc"});
    REQUIRE(d.extra_outputs_to_install == std::vector<std::string>{"man", "info", "doc"});
    REQUIRE(d.system_packages == std::vector<std::string>{"pkgs.texinfoInteractive", "manual.manpages",
                                                          "manual.manualHTML", "nixos-help"});
    REQUIRE(d.help_line == NIXOS_HELP_LINE);

    // Nothing was rendered while assembling
    REQUIRE(renderer->formats.empty());
}

TEST_CASE("scrubbed outputs carry placeholders and no artifacts") {
    const DocumentationAssembly assembly;

    const AssemblyResult result = assembly.assemble(sample_input());

    REQUIRE_FALSE(contains_artifact(result.scrubbed_config));
    REQUIRE_FALSE(contains_artifact(result.scrubbed_pkgs));
    REQUIRE(get_string(result.scrubbed_config, "system.build.manual.manpages") == "${manual.manpages}");
    REQUIRE(get_string(result.scrubbed_config, "system.build.manual.manualHTMLIndex") ==
            "${manual.manualHTMLIndex}");
    REQUIRE(get_string(result.scrubbed_pkgs, "hello") == "${pkgs.hello}");
    REQUIRE(get_string(result.scrubbed_pkgs, "buildPackages.texinfo") == "${pkgs.buildPackages.texinfo}");

    // The resolved configuration keeps the real artifacts
    REQUIRE(result.resolved.find("system.build.manual.manpages")->is_artifact());
}

TEST_CASE("manual artifacts render on demand") {
    auto renderer = std::make_shared<RecordingRenderer>();
    const DocumentationAssembly assembly(renderer);

    const AssemblyResult result = assembly.assemble(sample_input());

    const ConfigTree* index = result.resolved.find("system.build.manual.manualHTMLIndex");
    REQUIRE(index != nullptr);
    REQUIRE(index->as_artifact().realise() == "/store/manual-html/share/doc/nixos/index.html");
    REQUIRE(renderer->formats == std::vector<ManualFormat>{ManualFormat::Html});
    REQUIRE(renderer->versions == std::vector<std::string>{"24.05"});

    const ConfigTree* manpages = result.resolved.find("system.build.manual.manpages");
    REQUIRE(manpages->as_artifact().realise() == "/store/manual-manpages");
    REQUIRE(renderer->formats.size() == 2);
}

TEST_CASE("realising the manual without a renderer is an error") {
    const DocumentationAssembly assembly;

    const AssemblyResult result = assembly.assemble(sample_input());

    const ConfigTree* html = result.resolved.find("system.build.manual.manualHTML");
    REQUIRE_THROWS_AS(html->as_artifact().realise(), StructuralError);
}

TEST_CASE("manual input lists the base and extra options with scrubbed defaults") {
    const DocumentationAssembly assembly;

    const AssemblyResult result = assembly.assemble(sample_input());
    const ManualInput& manual = *result.manual_input;

    REQUIRE(manual.version == "24.05");
    REQUIRE(manual.revision == "release-24.05");

    const OptionDoc* enable = find_doc(manual, DOC_ENABLE);
    REQUIRE(enable != nullptr);
    REQUIRE(enable->type == "boolean");
    REQUIRE(enable->has_default);
    REQUIRE(enable->default_value == ConfigTree(true));
    REQUIRE(enable->declarations == std::vector<std::string>{DOCUMENTATION_MODULE});

    const OptionDoc* qemu = find_doc(manual, "virtualisation.qemu.package");
    REQUIRE(qemu != nullptr);
    REQUIRE(qemu->default_value == ConfigTree("${pkgs.qemu_kvm}"));

    REQUIRE(find_doc(manual, "virtualisation.memorySize") != nullptr);
}

TEST_CASE("user options are documented only when all modules are included") {
    const DocumentationAssembly assembly;
    AssemblyInput input = sample_input();
    input.user_options.push_back(user_option("services.foo.enable", "/src/my-modules/services/foo.nix"));

    const AssemblyResult without = assembly.assemble(input);
    REQUIRE(find_doc(*without.manual_input, "services.foo.enable") == nullptr);
    // Declared defaults still reach the configuration
    REQUIRE(*without.resolved.find("services.foo.enable") == ConfigTree(false));

    input.settings = ConfigTree::map({
        {"documentation", ConfigTree::map({{"nixos", ConfigTree::map({
            {"includeAllModules", true},
            {"extraModuleSources", ConfigTree::list({"/src/my-modules"})},
        })}})},
    });
    const AssemblyResult with = assembly.assemble(input);

    const OptionDoc* foo = find_doc(*with.manual_input, "services.foo.enable");
    REQUIRE(foo != nullptr);
    REQUIRE(foo->declarations == std::vector<std::string>{"services/foo.nix"});
    REQUIRE(with.manual_input->extra_sources == std::vector<std::string>{"/src/my-modules"});
}

TEST_CASE("module sources given as packages are named by placeholder") {
    const DocumentationAssembly assembly;
    AssemblyInput input = sample_input();
    input.settings = with_path(ConfigTree::map(), DOC_NIXOS_EXTRA_SOURCES,
                               ConfigTree::list({ConfigTree(Artifact([]() { return std::string("/store/custom"); },
                                                                     "pkgs.customModules"))}));

    const AssemblyResult result = assembly.assemble(input);

    REQUIRE(result.manual_input->extra_sources == std::vector<std::string>{"pkgs.customModules"});
}

TEST_CASE("settings made through renamed options are honoured") {
    const DocumentationAssembly assembly;
    AssemblyInput input = sample_input();
    input.settings = ConfigTree::map({
        {"programs", ConfigTree::map({{"man", ConfigTree::map({{"enable", false}})}})},
        {"documentation", ConfigTree::map({{"man", ConfigTree::map({{"generateCaches", true}})}})},
    });

    const AssemblyResult result = assembly.assemble(input);

    REQUIRE_FALSE(result.directives.install_man_pages);
    // Caches only matter when man pages are installed
    REQUIRE_FALSE(result.directives.generate_man_caches);
    REQUIRE(result.directives.paths_to_link == std::vector<std::string>{"/share/info", "/share/doc"});
}

TEST_CASE("man page caches follow generateCaches") {
    const DocumentationAssembly assembly;
    AssemblyInput input = sample_input();
    input.settings = with_path(ConfigTree::map(), DOC_MAN_CACHES, true);

    REQUIRE(assembly.assemble(input).directives.generate_man_caches);
}

TEST_CASE("assertion failures propagate from assembly") {
    const DocumentationAssembly assembly;
    AssemblyInput input = sample_input();
    input.settings = with_path(ConfigTree::map(), DOC_MANDOC_ENABLE, true);

    REQUIRE_THROWS_AS(assembly.assemble(input), CompositionError);
}

TEST_CASE("declarations are stripped of the first matching source prefix") {
    const std::vector<std::string> prefixes{"/src/a", "/src/b/"};

    REQUIRE(DocumentationAssembly::strip_declaration("/src/a/x.nix", prefixes) == "x.nix");
    REQUIRE(DocumentationAssembly::strip_declaration("/src/b/y/z.nix", prefixes) == "y/z.nix");
    REQUIRE(DocumentationAssembly::strip_declaration("/src/ab/x.nix", prefixes) == "/src/ab/x.nix");
    REQUIRE(DocumentationAssembly::strip_declaration("/src/a", prefixes) == "/src/a");
}

TEST_CASE("user modules cannot redeclare options of documented-only modules") {
    const DocumentationAssembly assembly;
    AssemblyInput input = sample_input();
    OptionSpec cores;
    cores.path = "virtualisation.cores";
    cores.type = OptionType::Int;
    cores.default_value = ConfigTree(4);
    input.user_options.push_back(cores);

    REQUIRE_THROWS_AS(assembly.assemble(input), StructuralError);
    REQUIRE_THROWS_WITH(assembly.assemble(input), Catch::Contains(QEMU_VM_MODULE));
}

TEST_CASE("documented-only options stay out of the configuration") {
    const DocumentationAssembly assembly;

    const AssemblyResult result = assembly.assemble(sample_input());

    REQUIRE(result.resolved.find("virtualisation") == nullptr);

    std::size_t cores_entries = 0;
    for (const auto& doc : result.manual_input->options) {
        if (doc.path == "virtualisation.cores") ++cores_entries;
    }
    REQUIRE(cores_entries == 1);
}

TEST_CASE("module source strings that look like placeholders are kept verbatim") {
    const DocumentationAssembly assembly;
    AssemblyInput input = sample_input();
    input.settings = with_path(ConfigTree::map(), DOC_NIXOS_EXTRA_SOURCES,
                               ConfigTree::list({"${literal}", "/src/plain"}));

    const AssemblyResult result = assembly.assemble(input);

    REQUIRE(result.manual_input->extra_sources == std::vector<std::string>{"${literal}", "/src/plain"});
}
