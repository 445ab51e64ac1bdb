#include <catch2/catch_test_macros.hpp>
#include "audit/file_sink.hpp"
#include "audit/log_sink.hpp"
#include "audit/security_event_emitter.hpp"
#include "validator/review_queue.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace docgate;

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(ifs, line);) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

void cleanup_rotation_files(const std::string& base, int max_files) {
    std::filesystem::remove(base);
    for (int i = 1; i <= max_files + 2; ++i) {
        std::filesystem::remove(base + "." + std::to_string(i));
    }
}

SecurityEvent blocked_event() {
    SecurityEvent e;
    e.event_type = SecurityEventType::DISTRIBUTION_BLOCKED;
    e.severity = EventSeverity::CRITICAL;
    e.resource = "docs/a.md";
    return e;
}

} // anonymous namespace

// ============================================================================
// FileSink
// ============================================================================

TEST_CASE("FileSink: writes one JSON line per event", "[audit][file]") {
    const std::string path = "/tmp/docgate_test_events.jsonl";
    cleanup_rotation_files(path, 2);

    {
        SecurityEventEmitter emitter;
        FileSink::Config cfg;
        cfg.output_file = path;
        cfg.time_based_rotation = false;
        emitter.add_sink(std::make_unique<FileSink>(cfg));

        emitter.emit(blocked_event());
        emitter.emit(blocked_event());
    }

    const auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);
    for (const auto& line : lines) {
        const auto j = nlohmann::json::parse(line);
        CHECK(j["event_type"] == "DISTRIBUTION_BLOCKED");
        CHECK(j["resource"] == "docs/a.md");
    }
    CHECK(nlohmann::json::parse(lines[1])["previous_hash"] ==
          nlohmann::json::parse(lines[0])["record_hash"]);

    cleanup_rotation_files(path, 2);
}

TEST_CASE("FileSink: size-based rotation triggers", "[audit][rotation]") {
    const std::string path = "/tmp/docgate_test_rotation_size.jsonl";
    cleanup_rotation_files(path, 5);

    FileSink::Config cfg;
    cfg.output_file = path;
    cfg.max_file_size_bytes = 100;  // Very small to trigger rotation
    cfg.max_files = 3;
    cfg.size_based_rotation = true;
    cfg.time_based_rotation = false;

    {
        FileSink sink(cfg);
        std::string line(60, 'a');
        line += '\n';

        CHECK(sink.write(blocked_event(), line));
        CHECK(sink.write(blocked_event(), line));
        CHECK(sink.write(blocked_event(), line));  // rotates first
        sink.flush();

        REQUIRE(sink.rotation_count() >= 1);
    }

    REQUIRE(std::filesystem::exists(path + ".1"));
    cleanup_rotation_files(path, 5);
}

TEST_CASE("FileSink: max_files bounds rotated generations", "[audit][rotation]") {
    const std::string path = "/tmp/docgate_test_rotation_max.jsonl";
    cleanup_rotation_files(path, 5);

    FileSink::Config cfg;
    cfg.output_file = path;
    cfg.max_file_size_bytes = 50;
    cfg.max_files = 2;
    cfg.size_based_rotation = true;
    cfg.time_based_rotation = false;

    {
        FileSink sink(cfg);
        std::string line(60, 'b');
        line += '\n';
        for (int i = 0; i < 6; ++i) {
            CHECK(sink.write(blocked_event(), line));
        }
        CHECK(sink.rotation_count() == 5);
    }

    CHECK(std::filesystem::exists(path + ".1"));
    CHECK(std::filesystem::exists(path + ".2"));
    CHECK_FALSE(std::filesystem::exists(path + ".3"));
    cleanup_rotation_files(path, 5);
}

TEST_CASE("FileSink: creates missing parent directory", "[audit][file]") {
    const auto dir = std::filesystem::temp_directory_path() / "docgate_test_sink_dir";
    std::filesystem::remove_all(dir);

    FileSink::Config cfg;
    cfg.output_file = (dir / "nested" / "events.jsonl").string();
    {
        FileSink sink(cfg);
        CHECK(sink.write(blocked_event(), "{}\n"));
        CHECK(sink.name() == "file:" + cfg.output_file);
    }
    CHECK(std::filesystem::exists(cfg.output_file));
    std::filesystem::remove_all(dir);
}

TEST_CASE("LogSink: always succeeds", "[audit]") {
    LogSink sink;
    CHECK(sink.write(blocked_event(), "{}\n"));
    CHECK(sink.name() == "log");
}

// ============================================================================
// FileReviewQueue
// ============================================================================

TEST_CASE("FileReviewQueue: appends pending review records", "[validator][review]") {
    const std::string path = "/tmp/docgate_test_review_queue.jsonl";
    std::filesystem::remove(path);

    {
        FileReviewQueue queue(path);
        ReviewItem item;
        item.metadata.document_id = "docs/release.md";
        item.metadata.requested_by = "bob";
        item.content_length = 120;
        item.has_secrets = true;
        item.secret_types = {"AWS_ACCESS_KEY_ID"};

        CHECK(queue.flag(item, "Secrets detected in content: AWS_ACCESS_KEY_ID"));
        CHECK(queue.flagged_count() == 1);
    }

    const auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    const auto j = nlohmann::json::parse(lines[0]);
    CHECK(j["status"] == "PENDING");
    CHECK(j["document_id"] == "docs/release.md");
    CHECK(j["requested_by"] == "bob");
    CHECK(j["has_secrets"] == true);
    CHECK(j["secret_types"][0] == "AWS_ACCESS_KEY_ID");
    CHECK(j["content_length"] == 120);

    std::filesystem::remove(path);
}
