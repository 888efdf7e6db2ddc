#include <doctest/doctest.h>
#include <octpkg/session.hpp>

#include "test_support.hpp"

using namespace octpkg;
using namespace octpkg::testing;

TEST_CASE("SearchPath prepends directories and ignores repeats") {
    SearchPath path;
    path.activate("/p/a", "");
    path.activate("/p/b", "/arch/b");
    path.activate("/p/a", "");

    CHECK(path.entries() == std::vector<std::string>{"/arch/b", "/p/b", "/p/a"});
    CHECK(path.join(':') == "/arch/b:/p/b:/p/a");
    CHECK(path.contains("/p/b"));
}

TEST_CASE("SearchPath deactivate removes both directories") {
    SearchPath path;
    path.activate("/p/a", "");
    path.activate("/p/b", "/arch/b");
    path.deactivate("/p/b", "/arch/b");
    path.deactivate("/p/missing", "");

    CHECK(path.entries() == std::vector<std::string>{"/p/a"});
}

TEST_CASE("Session tracks loaded names in order") {
    Session session;
    session.mark_loaded("b");
    session.mark_loaded("a");
    session.mark_loaded("b");
    CHECK(session.loaded == std::vector<std::string>{"b", "a"});
    CHECK(session.loaded_set() == std::set<std::string>{"a", "b"});

    session.mark_unloaded("b");
    CHECK_FALSE(session.is_loaded("b"));
    CHECK(session.is_loaded("a"));
}

TEST_CASE("load_session treats a missing file as an empty session") {
    TempDir tmp;
    auto session = load_session(tmp.sub("session.json"));
    REQUIRE(session.isOk());
    CHECK(session.value().loaded.empty());
    CHECK(session.value().path.entries().empty());
}

TEST_CASE("save_session then load_session restores names and path") {
    TempDir tmp;
    std::string file = tmp.sub("state/session.json");

    Session session;
    session.path.activate("/p/b", "");
    session.mark_loaded("b");
    session.path.activate("/p/a", "/arch/a");
    session.mark_loaded("a");
    REQUIRE(save_session(session, file).isOk());

    auto loaded = load_session(file);
    REQUIRE(loaded.isOk());
    CHECK(loaded.value().loaded == session.loaded);
    CHECK(loaded.value().path.entries() == session.path.entries());
}

TEST_CASE("load_session rejects a foreign file") {
    TempDir tmp;
    write_text(tmp.sub("session.json"), R"({"loaded": ["a"]})");
    auto session = load_session(tmp.sub("session.json"));
    REQUIRE(session.isErr());
    CHECK(session.error().code() == ErrorCode::IoError);

    write_text(tmp.sub("broken.json"), "{");
    CHECK(load_session(tmp.sub("broken.json")).isErr());
}
