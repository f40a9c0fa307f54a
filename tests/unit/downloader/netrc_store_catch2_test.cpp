#include <catch2/catch_test_macros.hpp>

#include <ruget/downloader/downloader.hpp>

#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <string>

using namespace ruget::downloader;
using ruget::test::ScopedEnvVar;
using ruget::test_support::TempDirScope;

TEST_CASE("Netrc: Lookup", "[downloader][netrc]") {
    SECTION("Single-line and multi-line entries") {
        auto store = makeNetrcStore("machine api.example.com login alice password s3cret\n"
                                    "\n"
                                    "machine files.example.org\n"
                                    "  login bob\n"
                                    "  password hunter2\n");
        auto a = store->lookup("api.example.com");
        REQUIRE(a);
        CHECK(a->login == "alice");
        CHECK(a->password == "s3cret");

        auto b = store->lookup("FILES.example.org");
        REQUIRE(b);
        CHECK(b->login == "bob");
        CHECK(b->password == "hunter2");

        CHECK_FALSE(store->lookup("other.example.net"));
    }

    SECTION("First matching machine wins") {
        auto store = makeNetrcStore("machine h login first password one\n"
                                    "machine h login second password two\n");
        auto c = store->lookup("h");
        REQUIRE(c);
        CHECK(c->login == "first");
    }

    SECTION("Default applies when no machine matches") {
        auto store = makeNetrcStore("default login anon password guest\n"
                                    "machine h login user password pw\n");
        CHECK(store->lookup("h")->login == "user");
        CHECK(store->lookup("elsewhere")->login == "anon");
    }

    SECTION("Incomplete entries are ignored") {
        auto store = makeNetrcStore("machine h login onlylogin\n");
        CHECK_FALSE(store->lookup("h"));
    }

    SECTION("Comments, account and macdef are skipped") {
        auto store = makeNetrcStore("# personal credentials\n"
                                    "machine h login u account acct password p\n"
                                    "macdef init\n"
                                    "machine evil login x password y\n"
                                    "\n"
                                    "machine g login v password q\n");
        CHECK(store->lookup("h")->password == "p");
        CHECK_FALSE(store->lookup("evil"));
        CHECK(store->lookup("g")->login == "v");
    }
}

TEST_CASE("Netrc: Files", "[downloader][netrc]") {
    auto tmp = TempDirScope::unique_under("ruget-netrc");

    SECTION("Missing file yields an empty store") {
        auto r = loadNetrcStore(tmp.path() / "absent");
        REQUIRE(r);
        CHECK_FALSE(r.value()->lookup("anything"));
    }

    SECTION("Reads an existing file") {
        auto path = ruget::test::write_file(tmp.path() / ".netrc",
                                            "machine h login u password p\n");
        auto r = loadNetrcStore(path);
        REQUIRE(r);
        CHECK(r.value()->lookup("h")->login == "u");
    }

    SECTION("NETRC overrides the home directory") {
        ScopedEnvVar netrc("NETRC", (tmp.path() / "custom").string());
        CHECK(defaultNetrcPath() == tmp.path() / "custom");
    }

    SECTION("Falls back to ~/.netrc") {
        ScopedEnvVar netrc("NETRC", std::nullopt);
        ScopedEnvVar home("HOME", tmp.path().string());
        CHECK(defaultNetrcPath() == tmp.path() / ".netrc");
    }
}
