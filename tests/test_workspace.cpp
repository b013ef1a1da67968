#include <catch2/catch.hpp>
#include <packmeta/workspace.hpp>
#include <packmeta/log.hpp>
#include <packmeta/resolver.hpp>
#include "test_support.hpp"
#include <cstdio>

using namespace packmeta;
using packmeta::testing::TempDir;
namespace fs = std::filesystem;

// Virtual root with three members, one excluded directory and one non-member
static void setup_workspace(const TempDir& td) {
    td.write_file("Package.toml", R"(
[workspace]
members = ["crates/*", "tools/cli"]
exclude = ["crates/deprecated"]
)");
    td.write_file("crates/server/Package.toml", R"(
[package]
name = "server"
version = "0.2.0"
)");
    td.write_file("crates/client/Package.toml", R"(
[package]
name = "client"
version = "0.1.0"
)");
    td.write_file("crates/deprecated/Package.toml", R"(
[package]
name = "deprecated"
)");
    td.write_file("tools/cli/Package.toml", R"(
[package]
name = "cli"
)");
    td.write_file("tools/other/Package.toml", R"(
[package]
name = "other"
)");
    td.mkdir("crates/server/src/deep");
}

TEST_CASE("find_manifest walks up to the nearest manifest", "[workspace]") {
    TempDir td;
    setup_workspace(td);

    auto r = find_manifest(td.path / "crates" / "server" / "src" / "deep");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == td.path / "crates" / "server" / "Package.toml");
}

TEST_CASE("find_manifest fails without any manifest", "[workspace]") {
    TempDir td;
    td.mkdir("empty");
    auto r = find_manifest(td.path / "empty", "Unlikely-Name-1234.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::WorkspaceDiscovery);
}

TEST_CASE("discover from a member directory", "[workspace]") {
    TempDir td;
    setup_workspace(td);

    auto r = Workspace::discover(td.path / "crates" / "server" / "src" / "deep");
    REQUIRE(r.is_ok());
    const Workspace& ws = r.value();

    REQUIRE(ws.root_dir() == td.path);
    REQUIRE(ws.root_manifest_path() == td.path / "Package.toml");
    REQUIRE(ws.is_virtual());
    REQUIRE(ws.member_count() == 3);

    // sorted by name
    REQUIRE(ws.members()[0].name == "cli");
    REQUIRE(ws.members()[1].name == "client");
    REQUIRE(ws.members()[2].name == "server");
    REQUIRE(ws.members()[2].version == "0.2.0");
    REQUIRE(ws.members()[2].root_dir == td.path / "crates" / "server");

    REQUIRE(ws.current() != nullptr);
    REQUIRE(ws.current()->name == "server");
    REQUIRE(resolve_package(ws, std::string("deprecated")).error().code == PackError::UnknownPackage);
    REQUIRE(resolve_package(ws, std::string("other")).error().code == PackError::UnknownPackage);
}

TEST_CASE("discover from a virtual root has no current member", "[workspace]") {
    TempDir td;
    setup_workspace(td);

    auto r = Workspace::discover(td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().current() == nullptr);
    REQUIRE(r.value().member_count() == 3);
}

TEST_CASE("root with a package is itself a member", "[workspace]") {
    TempDir td;
    td.write_file("Package.toml", R"(
[package]
name = "app"

[workspace]
members = ["libs/*"]
)");
    td.write_file("libs/core/Package.toml", "[package]\nname = \"core\"\n");

    auto r = Workspace::discover(td.path);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().is_virtual());
    REQUIRE(r.value().member_count() == 2);
    REQUIRE(r.value().current()->name == "app");
}

TEST_CASE("a package outside any workspace stands alone", "[workspace]") {
    TempDir td;
    td.write_file("solo/Package.toml", "[package]\nname = \"solo\"\nversion = \"1.0.0\"\n");

    auto r = Workspace::discover(td.path / "solo");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().member_count() == 1);
    REQUIRE(r.value().current()->name == "solo");
    REQUIRE(r.value().root_dir() == td.path / "solo");
}

TEST_CASE("a package the workspace does not list stands alone", "[workspace]") {
    TempDir td;
    setup_workspace(td);

    auto r = Workspace::discover(td.path / "tools" / "other");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().member_count() == 1);
    REQUIRE(r.value().current()->name == "other");
}

TEST_CASE("duplicate member names are kept", "[workspace]") {
    TempDir td;
    td.write_file("Package.toml", "[workspace]\nmembers = [\"a\", \"b\", \"c\"]\n");
    td.write_file("a/Package.toml", "[package]\nname = \"a\"\n");
    td.write_file("b/Package.toml", "[package]\nname = \"b\"\n");
    td.write_file("c/Package.toml", "[package]\nname = \"b\"\n");

    auto r = Workspace::discover(td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().member_count() == 3);

    // name lookups go through the resolver, which refuses to pick one
    auto b = resolve_package(r.value(), std::string("b"));
    REQUIRE(b.is_err());
    REQUIRE(b.error().code == PackError::AmbiguousPackage);
    REQUIRE(resolve_package(r.value(), std::string("a")).value()->manifest_path ==
            td.path / "a" / "Package.toml");
}

TEST_CASE("member without a package name is an error", "[workspace]") {
    TempDir td;
    td.write_file("Package.toml", "[workspace]\nmembers = [\"a\"]\n");
    td.write_file("a/Package.toml", "[package]\nversion = \"1.0.0\"\n");

    auto r = Workspace::discover(td.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::WorkspaceDiscovery);
    REQUIRE(r.error().file == (td.path / "a" / "Package.toml").string());
}

TEST_CASE("nested workspace is an error", "[workspace]") {
    TempDir td;
    td.write_file("Package.toml", "[workspace]\nmembers = [\"inner\"]\n");
    td.write_file("inner/Package.toml", "[package]\nname = \"inner\"\n[workspace]\nmembers = []\n");

    auto r = Workspace::discover(td.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::WorkspaceDiscovery);
}

TEST_CASE("malformed member manifest surfaces the parse error", "[workspace]") {
    TempDir td;
    td.write_file("Package.toml", "[workspace]\nmembers = [\"a\"]\n");
    td.write_file("a/Package.toml", "[package\nname = \"a\"\n");

    auto r = Workspace::discover(td.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::ManifestParse);
}

TEST_CASE("custom manifest file name", "[workspace]") {
    TempDir td;
    td.write_file("pkg/Pack.toml", "[package]\nname = \"custom\"\n");

    auto r = Workspace::discover(td.path / "pkg", "Pack.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().manifest_name() == "Pack.toml");
    REQUIRE(r.value().current()->manifest_path == td.path / "pkg" / "Pack.toml");
}

TEST_CASE("in-memory workspace", "[workspace]") {
    std::vector<WorkspaceMember> members(2);
    members[0].name = "a";
    members[1].name = "b";

    Workspace ws("/ws", members, 1);
    REQUIRE(ws.current()->name == "b");
    REQUIRE_FALSE(ws.is_virtual());

    Workspace no_current("/ws", members);
    REQUIRE(no_current.current() == nullptr);
    REQUIRE_FALSE(no_current.is_virtual());

    Workspace virtual_root("/ws", members, std::nullopt, true);
    REQUIRE(virtual_root.is_virtual());
    REQUIRE(virtual_root.current() == nullptr);

    Workspace bad_index("/ws", members, 7);
    REQUIRE(bad_index.current() == nullptr);
}

TEST_CASE("recursive member globs skip directories without a manifest quietly", "[workspace]") {
    TempDir td;
    td.write_file("Package.toml", "[workspace]\nmembers = [\"libs/**\"]\n");
    td.write_file("libs/core/Package.toml", "[package]\nname = \"core\"\n");
    td.write_file("libs/net/Package.toml", "[package]\nname = \"net\"\n");
    td.mkdir("libs/core/src/detail");
    td.mkdir("libs/net/include");

    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    log::set_level(log::Warn);
    log::set_sink(tmp);
    auto r = Workspace::discover(td.path);
    log::set_sink(nullptr);
    long written = std::ftell(tmp);
    std::fclose(tmp);

    REQUIRE(r.is_ok());
    REQUIRE(r.value().member_count() == 2);
    REQUIRE(r.value().members()[0].name == "core");
    REQUIRE(r.value().members()[1].name == "net");
    REQUIRE(written == 0);
}
