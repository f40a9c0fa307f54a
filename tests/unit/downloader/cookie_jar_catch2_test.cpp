#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <ruget/downloader/downloader.hpp>

#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace ruget;
using namespace ruget::downloader;
using Catch::Matchers::ContainsSubstring;
using ruget::test_support::TempDirScope;

namespace {

constexpr const char* kJar = "# Netscape HTTP Cookie File\n"
                             "\n"
                             ".example.com\tTRUE\t/\tFALSE\t4102444800\tpersist\tkeep-me\n"
                             "example.com\tFALSE\t/\tFALSE\t0\tsession\tdrop-me\n"
                             "#HttpOnly_example.com\tFALSE\t/\tTRUE\t0\tsecret\tdrop-too\n"
                             "#HttpOnly_example.com\tFALSE\t/\tTRUE\t4102444800\tsid\tkeep-too\n";

} // namespace

TEST_CASE("filterSessionCookies: Netscape cookie files", "[downloader][cookies]") {
    const auto out = filterSessionCookies(kJar);

    SECTION("Cookies with an expiry are kept") {
        CHECK_THAT(out, ContainsSubstring("persist\tkeep-me"));
        CHECK_THAT(out, ContainsSubstring("#HttpOnly_example.com\tFALSE\t/\tTRUE\t4102444800"));
    }

    SECTION("Session cookies are dropped, HttpOnly ones included") {
        CHECK_FALSE(out.find("drop-me") != std::string::npos);
        CHECK_FALSE(out.find("drop-too") != std::string::npos);
    }

    SECTION("Comments and blank lines survive") {
        CHECK(out.rfind("# Netscape HTTP Cookie File\n\n", 0) == 0);
    }

    SECTION("Empty input stays empty") {
        CHECK(filterSessionCookies("").empty());
    }

    SECTION("A last line without newline is still filtered") {
        CHECK(filterSessionCookies("h\tFALSE\t/\tFALSE\t0\tn\tv").empty());
        CHECK(filterSessionCookies("h\tFALSE\t/\tFALSE\t5\tn\tv") == "h\tFALSE\t/\tFALSE\t5\tn\tv");
    }
}

TEST_CASE("Curl adapter: Cookie jar load and save", "[downloader][cookies][curl]") {
    HttpGlobalScope curlScope;
    auto tmp = TempDirScope::unique_under("ruget-cookies");
    const auto in = ruget::test::write_file(tmp.path() / "in.txt", kJar);
    const auto saved = tmp.path() / "saved.txt";

    HttpSettings settings;
    settings.loadCookies = in;
    settings.saveCookies = saved;

    SECTION("Loaded cookies are saved without session cookies by default") {
        auto http = makeCurlHttpAdapter(settings);
        REQUIRE(http->flushCookies());
        REQUIRE(fs::exists(saved));
        const auto jar = ruget::test::read_file(saved);
        CHECK_THAT(jar, ContainsSubstring("keep-me"));
        CHECK_FALSE(jar.find("drop-me") != std::string::npos);
    }

    SECTION("Session cookies are saved when asked to keep them") {
        settings.keepSessionCookies = true;
        auto http = makeCurlHttpAdapter(settings);
        REQUIRE(http->flushCookies());
        const auto jar = ruget::test::read_file(saved);
        CHECK_THAT(jar, ContainsSubstring("keep-me"));
        CHECK_THAT(jar, ContainsSubstring("drop-me"));
    }

    SECTION("A save location in a missing directory is an I/O error") {
        settings.saveCookies = tmp.path() / "missing" / "jar.txt";
        auto http = makeCurlHttpAdapter(settings);
        auto r = http->flushCookies();
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::IoError);
    }

    SECTION("Without a save location flushing does nothing") {
        settings.saveCookies.reset();
        auto http = makeCurlHttpAdapter(settings);
        CHECK(http->flushCookies());
        CHECK_FALSE(fs::exists(saved));
    }
}
