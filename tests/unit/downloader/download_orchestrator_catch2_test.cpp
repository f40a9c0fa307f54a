#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <catch2/matchers/catch_matchers_vector.hpp>

#include <ruget/downloader/download_engine.hpp>

#include "../../common/fake_http_adapter.h"
#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace ruget;
using namespace ruget::downloader;
using ruget::test::FakeHttpAdapter;
using ruget::test::FakeResource;
using ruget::test::RecordingEventLog;
using ruget::test_support::TempDirScope;
using namespace std::chrono_literals;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

struct Harness {
    TempDirScope tmp = TempDirScope::unique_under("ruget-orchestrator");
    std::shared_ptr<FakeHttpAdapter> http = std::make_shared<FakeHttpAdapter>();
    std::shared_ptr<RecordingEventLog> events = std::make_shared<RecordingEventLog>();
    std::shared_ptr<ruget::test::CountingProgress> progress =
        std::make_shared<ruget::test::CountingProgress>();
    DownloadOptions options;

    Harness() {
        options.workers = 1;
        options.maxRetries = 0;
        options.backoff.baseDelay = 1ms;
        options.backoff.maxDelay = 2ms;
        options.backoff.jitter = false;
        options.outputDir = tmp.path() / "out";
        options.failureLog = tmp.path() / "failures.log";
    }

    DownloadOrchestrator make() {
        return DownloadOrchestrator(options, http, nullptr, events, progress);
    }

    std::vector<std::string> failureLogLines() const {
        std::vector<std::string> lines;
        std::ifstream in(options.failureLog);
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }

    bool hasChunkTemps(const fs::path& output, std::size_t count) const {
        for (std::size_t i = 0; i < count; ++i) {
            if (fs::exists(chunkTempPath(output, i)))
                return true;
        }
        return false;
    }
};

} // namespace

TEST_CASE("selectStrategy: Choosing single or multi stream", "[downloader][strategy]") {
    ProbeResult probe;
    probe.status = 200;
    probe.contentLength = 4 * kMiB;
    probe.acceptsRanges = true;

    SECTION("Large ranged resources with several workers are split") {
        auto s = selectStrategy(probe, 4, false);
        REQUIRE(std::holds_alternative<MultiStream>(s));
        CHECK(std::get<MultiStream>(s).contentLength == 4 * kMiB);
        CHECK(std::get<MultiStream>(s).workers == 4);
    }

    SECTION("Exactly the threshold is split") {
        probe.contentLength = kMultiStreamThreshold;
        CHECK(std::holds_alternative<MultiStream>(selectStrategy(probe, 2, false)));
    }

    SECTION("Below the threshold stays single stream") {
        probe.contentLength = kMultiStreamThreshold - 1;
        CHECK(std::holds_alternative<SingleStream>(selectStrategy(probe, 8, false)));
    }

    SECTION("No range support stays single stream") {
        probe.acceptsRanges = false;
        CHECK(std::holds_alternative<SingleStream>(selectStrategy(probe, 8, false)));
    }

    SECTION("Unknown length stays single stream") {
        probe.contentLength.reset();
        CHECK(std::holds_alternative<SingleStream>(selectStrategy(probe, 8, false)));
    }

    SECTION("One worker stays single stream") {
        CHECK(std::holds_alternative<SingleStream>(selectStrategy(probe, 1, false)));
    }

    SECTION("Resuming a partial file stays single stream") {
        CHECK(std::holds_alternative<SingleStream>(selectStrategy(probe, 8, true)));
    }

    SECTION("Failed probe stays single stream") {
        CHECK(std::holds_alternative<SingleStream>(selectStrategy(std::nullopt, 8, false)));
        probe.status = 500;
        CHECK(std::holds_alternative<SingleStream>(selectStrategy(probe, 8, false)));
    }
}

TEST_CASE("DownloadOrchestrator: Resume", "[downloader][orchestrator][resume]") {
    Harness h;
    const std::string url = "https://mirror.example.com/pkg/file.tar";
    const auto payload = ruget::test::make_payload(2000);
    h.http->addResource(url, FakeResource{payload});
    h.options.resume = true;
    const auto output = h.tmp.path() / "out" / "file.tar";

    SECTION("A complete local file only costs a HEAD request") {
        ruget::test::write_file(output, payload);
        auto orchestrator = h.make();

        auto r = orchestrator.run({url});
        REQUIRE(r);
        CHECK(r.value().succeeded == 1);
        CHECK(h.http->count("HEAD", url) == 1);
        CHECK(h.http->count("GET", url) == 0);
        CHECK(h.events->complete == 1);
        CHECK(ruget::test::read_file(output) == payload);
    }

    SECTION("A partial file is completed with one open-ended range request") {
        ruget::test::write_file(output, payload.substr(0, 700));
        auto orchestrator = h.make();

        auto r = orchestrator.run({url});
        REQUIRE(r);
        auto gets = h.http->requests("GET", url);
        REQUIRE(gets.size() == 1);
        CHECK(gets[0].header("Range").value_or("") == "bytes=700-");
        CHECK(ruget::test::read_file(output) == payload);
        CHECK(h.events->resumes == 1);
        CHECK(h.events->resumedFrom == 700);
        CHECK(h.progress->current == payload.size());
    }

    SECTION("Unknown remote length downloads from scratch") {
        FakeResource res{payload};
        res.reportLength = false;
        h.http->addResource(url, res);
        ruget::test::write_file(output, std::string(700, 'z'));
        auto orchestrator = h.make();

        auto r = orchestrator.run({url});
        REQUIRE(r);
        auto gets = h.http->requests("GET", url);
        REQUIRE(gets.size() == 1);
        CHECK_FALSE(gets[0].header("Range").has_value());
        CHECK(ruget::test::read_file(output) == payload);
    }

    SECTION("Without resume an existing file is overwritten") {
        h.options.resume = false;
        ruget::test::write_file(output, std::string(5000, 'z'));
        auto orchestrator = h.make();

        auto r = orchestrator.run({url});
        REQUIRE(r);
        auto gets = h.http->requests("GET", url);
        REQUIRE(gets.size() == 1);
        CHECK_FALSE(gets[0].header("Range").has_value());
        CHECK(ruget::test::read_file(output) == payload);
    }

    SECTION("A partial large file is resumed single-stream") {
        const auto big = ruget::test::make_payload(2 * kMiB, 3);
        h.http->addResource(url, FakeResource{big});
        h.options.workers = 4;
        ruget::test::write_file(output, big.substr(0, 100));
        auto orchestrator = h.make();

        auto r = orchestrator.run({url});
        REQUIRE(r);
        auto gets = h.http->requests("GET", url);
        REQUIRE(gets.size() == 1);
        CHECK(gets[0].header("Range").value_or("") == "bytes=100-");
        CHECK(ruget::test::read_file(output) == big);
    }

    SECTION("A failed resume is counted once when the retry pass completes it") {
        ruget::test::write_file(output, payload.substr(0, 700));
        h.http->failGets(url, 500, 1);
        auto orchestrator = h.make();

        auto r = orchestrator.run({url});
        REQUIRE(r);
        CHECK(ruget::test::read_file(output) == payload);
        CHECK(h.progress->current == payload.size());
        CHECK(h.progress->expected == payload.size());
    }
}

TEST_CASE("DownloadOrchestrator: Multi-stream transfers", "[downloader][orchestrator][chunks]") {
    Harness h;
    h.options.workers = 4;
    const std::string url = "https://mirror.example.com/images/disk.img";
    const auto output = h.tmp.path() / "out" / "disk.img";

    SECTION("Large ranged resources are fetched in chunks and reassembled") {
        const auto payload = ruget::test::make_payload(kMiB + 3, 11);
        h.http->addResource(url, FakeResource{payload});
        auto orchestrator = h.make();

        auto r = orchestrator.downloadUrl(url, std::nullopt);
        REQUIRE(r);
        CHECK(r.value() == output);
        CHECK(ruget::test::read_file(output) == payload);
        CHECK_FALSE(h.hasChunkTemps(output, 4));

        auto gets = h.http->requests("GET", url);
        REQUIRE(gets.size() == 4);
        for (const auto& g : gets)
            CHECK(g.header("Range").has_value());
        CHECK(h.events->chunks == 4);
        CHECK(h.progress->current == payload.size());
        CHECK(h.progress->expected == payload.size());
    }

    SECTION("Chunks survive a server that ignores Range") {
        const auto payload = ruget::test::make_payload(kMiB + 5, 12);
        FakeResource res{payload};
        res.ignoreRange = true;
        h.http->addResource(url, res);
        auto orchestrator = h.make();

        auto r = orchestrator.downloadUrl(url, std::nullopt);
        REQUIRE(r);
        CHECK(ruget::test::read_file(output) == payload);
    }

    SECTION("Small resources use a single plain GET") {
        const auto payload = ruget::test::make_payload(1000);
        h.http->addResource(url, FakeResource{payload});
        auto orchestrator = h.make();

        REQUIRE(orchestrator.downloadUrl(url, std::nullopt));
        auto gets = h.http->requests("GET", url);
        REQUIRE(gets.size() == 1);
        CHECK_FALSE(gets[0].header("Range").has_value());
    }

    SECTION("Servers without range support get a single plain GET") {
        const auto payload = ruget::test::make_payload(2 * kMiB);
        FakeResource res{payload};
        res.acceptRanges = false;
        h.http->addResource(url, res);
        auto orchestrator = h.make();

        REQUIRE(orchestrator.downloadUrl(url, std::nullopt));
        CHECK(h.http->count("GET", url) == 1);
        CHECK(ruget::test::read_file(output) == payload);
    }

    SECTION("A failed chunk fails the URL and leaves nothing behind") {
        const auto payload = ruget::test::make_payload(2 * kMiB);
        h.http->addResource(url, FakeResource{payload});
        h.http->failGets(url, 500, 1);
        auto orchestrator = h.make();

        auto r = orchestrator.downloadUrl(url, std::nullopt);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::HttpStatus);
        CHECK_THAT(r.error().message, Catch::Matchers::ContainsSubstring("chunk"));
        CHECK_FALSE(fs::exists(output));
        CHECK_FALSE(h.hasChunkTemps(output, 4));
        CHECK(h.progress->current == 0);
        CHECK(h.progress->expected == 0);
    }

    SECTION("A batch retry after a failed chunk counts each byte once") {
        const auto payload = ruget::test::make_payload(2 * kMiB, 13);
        h.http->addResource(url, FakeResource{payload});
        h.http->failGets(url, 500, 1);
        auto orchestrator = h.make();

        auto r = orchestrator.run({url});
        REQUIRE(r);
        CHECK(r.value().succeeded == 1);
        CHECK(ruget::test::read_file(output) == payload);
        CHECK(h.progress->current == payload.size());
        CHECK(h.progress->expected == payload.size());
    }
}

TEST_CASE("DownloadOrchestrator: Request concurrency", "[downloader][orchestrator][workers]") {
    Harness h;
    h.options.workers = 4;
    h.http->setRequestDelay(5ms);
    std::vector<std::string> urls;
    for (int i = 0; i < 4; ++i) {
        urls.push_back("https://mirror.example.com/set/part" + std::to_string(i) + ".bin");
        h.http->addResource(urls.back(),
                            FakeResource{ruget::test::make_payload(2 * kMiB, 40 + i)});
    }

    SECTION("Chunked URLs in a parallel batch never exceed the worker count") {
        auto orchestrator = h.make();
        auto r = orchestrator.run(urls);
        REQUIRE(r);
        CHECK(r.value().succeeded == 4);
        CHECK(h.http->count("GET") == 16);
        CHECK(h.http->peakInFlight() <= 4);
        CHECK(h.http->peakInFlight() >= 1);
    }

    SECTION("One worker means one request at a time") {
        h.options.workers = 1;
        auto orchestrator = h.make();
        REQUIRE(orchestrator.run(urls));
        CHECK(h.http->peakInFlight() == 1);
    }
}

TEST_CASE("DownloadOrchestrator: Batches", "[downloader][orchestrator][batch]") {
    Harness h;
    h.options.workers = 3;
    const std::vector<std::string> urls = {"https://a.example.com/one.bin",
                                           "https://b.example.com/two.bin",
                                           "https://c.example.com/three.bin"};
    for (std::size_t i = 0; i < urls.size(); ++i)
        h.http->addResource(urls[i], FakeResource{ruget::test::make_payload(4096, 100 + i)});

    SECTION("A URL that fails the first pass is recovered by the retry pass") {
        h.http->failGets(urls[1], 500, 1);
        auto orchestrator = h.make();

        auto r = orchestrator.run(urls);
        REQUIRE(r);
        CHECK(r.value().succeeded == 3);
        CHECK(r.value().total == 3);
        CHECK(r.value().failures.empty());
        CHECK_THAT(r.value().retriedUrls, Catch::Matchers::Equals(std::vector<std::string>{urls[1]}));
        CHECK(h.http->count("HEAD", urls[1]) == 2);
        CHECK(h.http->count("HEAD", urls[0]) == 1);
        CHECK_FALSE(fs::exists(h.options.failureLog));
        CHECK(h.events->summarySucceeded == 3);
        CHECK(h.events->summaryTotal == 3);
        CHECK(fs::file_size(h.tmp.path() / "out" / "two.bin") == 4096);
    }

    SECTION("Permanent failures are logged once and the rest still succeed") {
        h.options.maxRetries = 1;
        const std::string missing = "https://d.example.com/gone.bin";
        auto batch = urls;
        batch.push_back(missing);
        auto orchestrator = h.make();

        auto r = orchestrator.run(batch);
        REQUIRE(r);
        CHECK(r.value().succeeded == 3);
        CHECK(r.value().total == 4);
        REQUIRE(r.value().failures.size() == 1);
        CHECK(r.value().failures[0].url == missing);
        // Two attempts in each of the two passes
        CHECK(h.http->count("GET", missing) == 4);

        auto lines = h.failureLogLines();
        REQUIRE(lines.size() == 1);
        CHECK_THAT(lines[0], Catch::Matchers::StartsWith(missing + "\t"));
    }

    SECTION("When every URL fails the batch is an error") {
        const std::string url = urls[0];
        h.options.maxRetries = 2;
        h.http->failGets(url, 500, 100);
        auto orchestrator = h.make();

        auto r = orchestrator.run({url});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::AllDownloadsFailed);
        CHECK(exitCodeFor(r.error().code) == 2);
        CHECK(h.http->count("GET", url) == 6);

        auto lines = h.failureLogLines();
        REQUIRE(lines.size() == 1);
        CHECK_THAT(lines[0], Catch::Matchers::StartsWith(url + "\t"));
    }

    SECTION("Failure log is appended across runs") {
        h.http->failGets(urls[0], 500, 100);
        {
            auto orchestrator = h.make();
            CHECK_FALSE(orchestrator.run({urls[0]}));
        }
        {
            auto orchestrator = h.make();
            CHECK_FALSE(orchestrator.run({urls[0]}));
        }
        CHECK(h.failureLogLines().size() == 2);
    }

    SECTION("Several URLs with one output path are rejected before any request") {
        h.options.outputPath = h.tmp.path() / "single.bin";
        auto orchestrator = h.make();

        auto r = orchestrator.run(urls);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
        CHECK(h.http->requests().empty());
    }

    SECTION("An empty batch is rejected") {
        auto orchestrator = h.make();
        auto r = orchestrator.run({});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("DownloadOrchestrator: Output naming", "[downloader][orchestrator][naming]") {
    Harness h;

    SECTION("Content-Disposition names the file") {
        const std::string url = "https://cdn.example.com/download?id=42";
        FakeResource res{"report body"};
        res.contentDisposition = "attachment; filename=\"report.pdf\"";
        h.http->addResource(url, res);
        auto orchestrator = h.make();

        auto r = orchestrator.downloadUrl(url, std::nullopt);
        REQUIRE(r);
        CHECK(r.value() == h.tmp.path() / "out" / "report.pdf");
        CHECK(ruget::test::read_file(r.value()) == "report body");
    }

    SECTION("The URL path names the file and the directory is created") {
        const std::string url = "https://cdn.example.com/releases/tool-1.2.tar.gz?sig=abc";
        h.http->addResource(url, FakeResource{"archive"});
        h.options.outputDir = h.tmp.path() / "nested" / "deeper";
        auto orchestrator = h.make();

        auto r = orchestrator.downloadUrl(url, std::nullopt);
        REQUIRE(r);
        CHECK(r.value() == h.tmp.path() / "nested" / "deeper" / "tool-1.2.tar.gz");
        CHECK(fs::exists(r.value()));
    }

    SECTION("An explicit output path wins") {
        const std::string url = "https://cdn.example.com/a.txt";
        h.http->addResource(url, FakeResource{"hello"});
        h.options.outputPath = h.tmp.path() / "custom" / "name.txt";
        auto orchestrator = h.make();

        auto r = orchestrator.run({url});
        REQUIRE(r);
        CHECK(ruget::test::read_file(h.tmp.path() / "custom" / "name.txt") == "hello");
    }
}

TEST_CASE("FailureList: Concurrent appends", "[downloader][failures]") {
    FailureList list;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&list, t]() {
            for (int i = 0; i < 100; ++i)
                list.append({"https://x.example.com/" + std::to_string(t) + "/" +
                                 std::to_string(i),
                             {},
                             "boom"});
        });
    }
    for (auto& th : threads)
        th.join();

    CHECK(list.size() == 800);
    CHECK(list.drain().size() == 800);
    CHECK(list.size() == 0);
}

TEST_CASE("appendFailureLog: Line format", "[downloader][failures]") {
    auto tmp = TempDirScope::unique_under("ruget-failure-log");
    const auto path = tmp.path() / "failures.log";

    SECTION("Tabs and newlines in messages are flattened") {
        REQUIRE(appendFailureLog(path, {{"https://x.example.com/f", {}, "bad\tthing\nhappened"}}));
        CHECK(ruget::test::read_file(path) == "https://x.example.com/f\tbad thing happened\n");
    }

    SECTION("Nothing to log leaves no file") {
        REQUIRE(appendFailureLog(path, {}));
        CHECK_FALSE(fs::exists(path));
    }

    SECTION("Unwritable locations are reported") {
        auto r = appendFailureLog(tmp.path() / "no" / "such" / "dir.log",
                                  {{"https://x.example.com/f", {}, "err"}});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::IoError);
    }
}
