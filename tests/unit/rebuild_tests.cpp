#include <doctest/doctest.h>
#include <octpkg/builder.hpp>
#include <octpkg/fetcher.hpp>
#include <octpkg/installer.hpp>
#include <octpkg/rebuild.hpp>

#include "test_support.hpp"

using namespace octpkg;
using namespace octpkg::testing;

namespace {

void write_installed(const std::string& prefix, const std::string& name, const std::string& version,
                     const std::string& depends = "") {
    write_text(prefix + "/" + name + "-" + version + "/packinfo/DESCRIPTION",
               description_text(name, version, depends));
}

RebuildOptions options_for(const std::string& prefix) {
    RebuildOptions options;
    options.prefix = prefix;
    options.archprefix = prefix;
    options.arch = "x86_64-pc-linux-gnu";
    return options;
}

} // namespace

TEST_CASE("rebuild_registry scans installed package directories") {
    TempDir tmp;
    std::string prefix = tmp.sub("packages");
    write_installed(prefix, "a", "1.0.0", "b (>= 1.0.0)");
    write_installed(prefix, "b", "1.1.0");
    fs::create_directories(prefix + "/b-1.1.0/x86_64-pc-linux-gnu");
    fs::create_directories(prefix + "/not-a-package");

    auto result = rebuild_registry(options_for(prefix));
    REQUIRE(result.isOk());
    const Registry& reg = result.value().registry;
    CHECK(reg.names() == std::vector<std::string>{"a", "b"});
    CHECK(reg.find("a")->directory == prefix + "/a-1.0.0");
    CHECK(reg.find("a")->arch_directory.empty());
    CHECK(reg.find("a")->dependencies.size() == 1);
    CHECK(reg.find("b")->arch_directory == prefix + "/b-1.1.0/x86_64-pc-linux-gnu");
    CHECK(result.value().warnings.empty());
}

TEST_CASE("rebuild_registry returns an empty registry for a missing prefix") {
    TempDir tmp;
    auto result = rebuild_registry(options_for(tmp.sub("nothing")));
    REQUIRE(result.isOk());
    CHECK(result.value().registry.empty());
}

TEST_CASE("rebuild_registry keeps the newest of duplicate installs") {
    TempDir tmp;
    std::string prefix = tmp.sub("packages");
    write_installed(prefix, "a", "1.0.0");
    write_installed(prefix, "a", "1.2.0");

    auto result = rebuild_registry(options_for(prefix));
    REQUIRE(result.isOk());
    CHECK(result.value().registry.find("a")->version == "1.2.0");
    CHECK(result.value().warnings.size() == 1);
}

TEST_CASE("rebuild_registry skips unreadable descriptions with a warning") {
    TempDir tmp;
    std::string prefix = tmp.sub("packages");
    write_installed(prefix, "a", "1.0.0");
    write_text(prefix + "/broken-1.0.0/packinfo/DESCRIPTION", "Name: broken\n");

    auto result = rebuild_registry(options_for(prefix));
    REQUIRE(result.isOk());
    CHECK(result.value().registry.names() == std::vector<std::string>{"a"});
    CHECK(result.value().warnings.size() == 1);
}

TEST_CASE("rebuild_registry keeps only the requested names") {
    TempDir tmp;
    std::string prefix = tmp.sub("packages");
    write_installed(prefix, "a", "1.0.0");
    write_installed(prefix, "b", "1.0.0");

    RebuildOptions options = options_for(prefix);
    options.names = {"b"};
    auto result = rebuild_registry(options);
    REQUIRE(result.isOk());
    CHECK(result.value().registry.names() == std::vector<std::string>{"b"});
}

TEST_CASE("rebuild_registry after corruption reproduces the installed set") {
    TempDir tmp;
    Config config = sandbox_config(tmp);
    Registry local{Installer::User};
    Registry global{Installer::System};
    Session session;
    RecordingActivator activator;
    DefaultArchiveFetcher fetcher;
    MakeToolchain toolchain;
    InstallOrchestrator orchestrator(config, local, global, session, activator, fetcher, toolchain);
    orchestrator.set_privileged(false);

    auto installed = orchestrator.install({write_source_package(tmp.sub("src/a"), "a", "1.0.0", "b"),
                                           write_source_package(tmp.sub("src/b"), "b", "2.1.0"),
                                           write_source_package(tmp.sub("src/c"), "c", "0.3.0")},
                                          {});
    REQUIRE(installed.isOk());
    REQUIRE(installed.value().ok());

    auto before = load_registry(config.local_list, Installer::User);
    REQUIRE(before.isOk());

    write_text(config.local_list, "{\"$schema\": \"octpkg.registry.v1\", \"packages\": [{\"na");
    auto corrupt = load_registry(config.local_list, Installer::User);
    REQUIRE(corrupt.isErr());
    CHECK(corrupt.error().code() == ErrorCode::CorruptRegistry);

    RebuildOptions options;
    options.prefix = config.prefix;
    options.archprefix = config.archprefix;
    options.arch = config.arch;
    auto rebuilt = rebuild_registry(options);
    REQUIRE(rebuilt.isOk());

    const Registry& after = rebuilt.value().registry;
    REQUIRE(after.names() == before.value().names());
    for (const auto& [name, record] : before.value().records()) {
        const PackageRecord* r = after.find(name);
        REQUIRE(r != nullptr);
        CHECK(r->version == record.version);
        CHECK(r->directory == record.directory);
        CHECK(r->dependencies.size() == record.dependencies.size());
    }
}

TEST_CASE("rebuild_registry carries provenance over from the previous registry") {
    TempDir tmp;
    std::string prefix = tmp.sub("packages");
    write_installed(prefix, "a", "1.0.0");

    Registry previous;
    PackageRecord old = make_record("a", "1.0.0");
    old.directory = prefix + "/a-1.0.0";
    old.installed_at = "2024-02-02T10:00:00Z";
    old.source = "https://example.org/a-1.0.0.tar.gz";
    previous.upsert(old);

    auto result = rebuild_registry(options_for(prefix), &previous);
    REQUIRE(result.isOk());
    CHECK(result.value().registry.find("a")->installed_at == old.installed_at);
    CHECK(result.value().registry.find("a")->source == old.source);
}
