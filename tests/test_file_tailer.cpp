#include <catch2/catch_test_macros.hpp>
#include "tailer/file_tailer.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace alertwatch;
using PollResult = FileTailer::PollResult;

namespace {

void write_file(const std::string& path, const std::string& content,
                std::ios::openmode mode = std::ios::app) {
    std::ofstream ofs(path, std::ios::out | std::ios::binary | mode);
    ofs << content;
}

void append_lines(const std::string& path, const std::string& prefix, int count) {
    std::string content;
    for (int i = 0; i < count; ++i) {
        content += prefix + std::to_string(i) + "\n";
    }
    write_file(path, content);
}

void cleanup(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + ".1");
}

// Poll until the tailer stops producing lines; returns the last non-LINE result
PollResult drain(FileTailer& tailer) {
    PollResult result = tailer.poll();
    while (result == PollResult::LINE) {
        result = tailer.poll();
    }
    return result;
}

TailerConfig fast_config() {
    TailerConfig cfg;
    cfg.idle_interval = std::chrono::milliseconds{10};
    cfg.reopen_backoff = std::chrono::milliseconds{10};
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Opening
// ============================================================================

TEST_CASE("FileTailer: waits for a missing file", "[tailer]") {
    const std::string path = "/tmp/test_alertwatch_tail_missing.log";
    cleanup(path);

    std::vector<std::string> lines;
    FileTailer tailer(path, [&](std::string_view l) { lines.emplace_back(l); });

    CHECK(tailer.poll() == PollResult::WAITING);
    CHECK(tailer.poll() == PollResult::WAITING);
    CHECK_FALSE(tailer.is_open());

    write_file(path, "");
    CHECK(tailer.poll() == PollResult::OPENED);
    CHECK(tailer.is_open());

    cleanup(path);
}

TEST_CASE("FileTailer: existing content is not replayed", "[tailer]") {
    const std::string path = "/tmp/test_alertwatch_tail_existing.log";
    cleanup(path);
    append_lines(path, "history-", 5);

    std::vector<std::string> lines;
    FileTailer tailer(path, [&](std::string_view l) { lines.emplace_back(l); });

    REQUIRE(tailer.poll() == PollResult::OPENED);
    CHECK(drain(tailer) == PollResult::IDLE);
    CHECK(lines.empty());

    append_lines(path, "live-", 2);
    CHECK(drain(tailer) == PollResult::IDLE);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "live-0");
    CHECK(lines[1] == "live-1");

    cleanup(path);
}

// ============================================================================
// Reading
// ============================================================================

TEST_CASE("FileTailer: partial line is held until complete", "[tailer]") {
    const std::string path = "/tmp/test_alertwatch_tail_partial.log";
    cleanup(path);
    write_file(path, "");

    std::vector<std::string> lines;
    FileTailer tailer(path, [&](std::string_view l) { lines.emplace_back(l); });
    REQUIRE(tailer.poll() == PollResult::OPENED);

    write_file(path, R"({"status": 5)");
    CHECK(tailer.poll() == PollResult::IDLE);
    CHECK(lines.empty());

    write_file(path, "02}\n");
    CHECK(tailer.poll() == PollResult::LINE);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == R"({"status": 502})");
    CHECK(tailer.lines_read() == 1);

    cleanup(path);
}

TEST_CASE("FileTailer: handler exceptions propagate", "[tailer]") {
    const std::string path = "/tmp/test_alertwatch_tail_throw.log";
    cleanup(path);
    write_file(path, "");

    FileTailer tailer(path, [](std::string_view) { throw std::runtime_error("handler failed"); });
    REQUIRE(tailer.poll() == PollResult::OPENED);

    append_lines(path, "x-", 1);
    CHECK_THROWS_AS(tailer.poll(), std::runtime_error);

    cleanup(path);
}

// ============================================================================
// Rotation / truncation / deletion
// ============================================================================

TEST_CASE("FileTailer: rename rotation processes every line once", "[tailer][rotation]") {
    const std::string path = "/tmp/test_alertwatch_tail_rotate.log";
    cleanup(path);
    write_file(path, "");

    constexpr int kOld = 7;
    constexpr int kNew = 4;

    std::vector<std::string> lines;
    FileTailer tailer(path, [&](std::string_view l) { lines.emplace_back(l); });
    REQUIRE(tailer.poll() == PollResult::OPENED);

    append_lines(path, "old-", kOld);
    CHECK(drain(tailer) == PollResult::IDLE);

    // Rotate: rename away and recreate under the original name
    std::filesystem::rename(path, path + ".1");
    write_file(path, "", std::ios::trunc);

    CHECK(tailer.poll() == PollResult::ROTATED);
    CHECK(tailer.poll() == PollResult::OPENED);

    append_lines(path, "new-", kNew);
    CHECK(drain(tailer) == PollResult::IDLE);

    REQUIRE(lines.size() == static_cast<size_t>(kOld + kNew));
    for (int i = 0; i < kOld; ++i) {
        CHECK(lines[static_cast<size_t>(i)] == "old-" + std::to_string(i));
    }
    for (int i = 0; i < kNew; ++i) {
        CHECK(lines[static_cast<size_t>(kOld + i)] == "new-" + std::to_string(i));
    }

    cleanup(path);
}

TEST_CASE("FileTailer: lines written before rotation is noticed are kept", "[tailer][rotation]") {
    const std::string path = "/tmp/test_alertwatch_tail_rotate_late.log";
    cleanup(path);
    write_file(path, "");

    std::vector<std::string> lines;
    FileTailer tailer(path, [&](std::string_view l) { lines.emplace_back(l); });
    REQUIRE(tailer.poll() == PollResult::OPENED);

    // Old handle still sees lines appended before the rename
    append_lines(path, "old-", 3);
    std::filesystem::rename(path, path + ".1");
    write_file(path, "", std::ios::trunc);

    CHECK(drain(tailer) == PollResult::ROTATED);
    CHECK(lines.size() == 3);

    cleanup(path);
}

TEST_CASE("FileTailer: rotation during open is still detected", "[tailer][rotation]") {
    const std::string path = "/tmp/test_alertwatch_tail_rotate_open.log";
    cleanup(path);
    write_file(path, "");

    std::vector<std::string> lines;
    FileTailer tailer(path, [&](std::string_view l) { lines.emplace_back(l); });

    // Rotate after the handle is open but before its identity is recorded
    bool rotated = false;
    tailer.set_open_hook([&] {
        if (rotated) return;
        rotated = true;
        std::filesystem::rename(path, path + ".1");
        write_file(path, "", std::ios::trunc);
    });

    REQUIRE(tailer.poll() == PollResult::OPENED);
    REQUIRE(rotated);

    // The open handle points at the renamed file, so the new one must be picked up
    CHECK(tailer.poll() == PollResult::ROTATED);
    CHECK(tailer.poll() == PollResult::OPENED);

    append_lines(path, "fresh-", 2);
    CHECK(drain(tailer) == PollResult::IDLE);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "fresh-0");
    CHECK(lines[1] == "fresh-1");

    cleanup(path);
}

TEST_CASE("FileTailer: truncation restarts from the beginning", "[tailer][rotation]") {
    const std::string path = "/tmp/test_alertwatch_tail_truncate.log";
    cleanup(path);
    write_file(path, "");

    std::vector<std::string> lines;
    FileTailer tailer(path, [&](std::string_view l) { lines.emplace_back(l); });
    REQUIRE(tailer.poll() == PollResult::OPENED);

    append_lines(path, "before-truncate-", 3);
    CHECK(drain(tailer) == PollResult::IDLE);
    REQUIRE(lines.size() == 3);

    // copytruncate-style: same inode, shorter content
    write_file(path, "after\n", std::ios::trunc);

    CHECK(drain(tailer) == PollResult::TRUNCATED);
    CHECK(drain(tailer) == PollResult::IDLE);
    REQUIRE(lines.size() == 4);
    CHECK(lines[3] == "after");

    cleanup(path);
}

TEST_CASE("FileTailer: deleted file closes and waits", "[tailer][rotation]") {
    const std::string path = "/tmp/test_alertwatch_tail_deleted.log";
    cleanup(path);
    write_file(path, "");

    FileTailer tailer(path, [](std::string_view) {});
    REQUIRE(tailer.poll() == PollResult::OPENED);

    std::filesystem::remove(path);
    CHECK(tailer.poll() == PollResult::CLOSED);
    CHECK_FALSE(tailer.is_open());
    CHECK(tailer.poll() == PollResult::WAITING);

    write_file(path, "");
    CHECK(tailer.poll() == PollResult::OPENED);

    cleanup(path);
}

// ============================================================================
// run()
// ============================================================================

TEST_CASE("FileTailer: run stops on request", "[tailer]") {
    const std::string path = "/tmp/test_alertwatch_tail_run.log";
    cleanup(path);
    write_file(path, "");

    std::atomic<int> seen{0};
    FileTailer tailer(path, [&](std::string_view) { seen.fetch_add(1); }, fast_config());

    std::jthread worker([&tailer](std::stop_token stop) { tailer.run(stop); });

    // Give the loop time to open and seek to end before writing
    std::this_thread::sleep_for(std::chrono::milliseconds{300});

    append_lines(path, "run-", 3);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (seen.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    CHECK(seen.load() == 3);

    worker.request_stop();
    worker.join();

    cleanup(path);
}
