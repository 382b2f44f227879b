#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>

using namespace gaistream;

// ── trim / to_lower ──────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t hello \r\n") == "hello");
}

TEST_CASE("trim: empty and all-whitespace return empty", "[util]") {
    REQUIRE(trim("").empty());
    REQUIRE(trim("   \t\n  ").empty());
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("Text/Event-Stream") == "text/event-stream");
    REQUIRE(to_lower("already") == "already");
}

// ── split / contains ─────────────────────────────────────────────

TEST_CASE("split: normal delimiter", "[util]") {
    auto parts = split("mode=passthrough&x=1", '&');
    REQUIRE(parts == std::vector<std::string>{"mode=passthrough", "x=1"});
}

TEST_CASE("split: empty parts preserved", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "", "b"});
}

TEST_CASE("split: empty string", "[util]") {
    REQUIRE(split("", ',').empty());
}

TEST_CASE("contains: substring test", "[util]") {
    REQUIRE(contains("/v1/chat/completions", "/chat/completions"));
    REQUIRE_FALSE(contains("/v1/stream", "/sse"));
}

// ── base64 ───────────────────────────────────────────────────────

TEST_CASE("base64_encode: known vectors", "[util]") {
    REQUIRE(base64_encode("").empty());
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_encode("hello") == "aGVsbG8=");
}

TEST_CASE("base64_decode: padding is stripped", "[util]") {
    std::string out;
    REQUIRE(base64_decode("Zg==", out));
    REQUIRE(out == "f");
    REQUIRE(base64_decode("aGVsbG8=", out));
    REQUIRE(out == "hello");
}

TEST_CASE("base64_decode: binary bytes survive", "[util]") {
    std::string raw("\x00\xff\x10\x80", 4);
    std::string out;
    REQUIRE(base64_decode(base64_encode(raw), out));
    REQUIRE(out == raw);
}

TEST_CASE("base64_decode: malformed input rejected", "[util]") {
    std::string out;
    REQUIRE_FALSE(base64_decode("abc", out));
    REQUIRE_FALSE(base64_decode("!!!!", out));
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
    REQUIRE(expand_home("").empty());
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/.gaistream");
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/.gaistream").size());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parents and replaces content", "[util]") {
    auto dir = std::filesystem::temp_directory_path() / ("gaistream_util_" + std::to_string(epoch_nanos()));
    std::string path = (dir / "nested" / "file.json").string();

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "second");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}
