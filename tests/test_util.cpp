#include <catch2/catch.hpp>
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace smsrelay;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all-whitespace string becomes empty", "[util]") {
    REQUIRE(trim(" \t\r\n ").empty());
}

// ── to_lower ─────────────────────────────────────────────────────

TEST_CASE("to_lower: header names and values", "[util]") {
    REQUIRE(to_lower("Content-Length") == "content-length");
    REQUIRE(to_lower("Chunked, GZIP") == "chunked, gzip");
    REQUIRE(to_lower("").empty());
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: expands leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    }
    REQUIRE(expand_home("/abs/path") == "/abs/path");
}

// ── redact_url ───────────────────────────────────────────────────

TEST_CASE("redact_url: masks Telegram bot token", "[util]") {
    REQUIRE(redact_url("https://api.telegram.org/bot123:ABC/sendMessage?chat_id=1") ==
            "https://api.telegram.org/bot***/sendMessage?chat_id=1");
}

TEST_CASE("redact_url: leaves other URLs alone", "[util]") {
    REQUIRE(redact_url("https://example.com/bottles/1") == "https://example.com/bottles/1");
    REQUIRE(redact_url("http://h/cb?x=1&") == "http://h/cb?x=1&");
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent dirs and replaces content", "[util]") {
    auto base = std::filesystem::temp_directory_path() /
                ("smsrelay_util_" + std::to_string(::getpid()));
    auto file = base / "nested" / "out.txt";

    REQUIRE(atomic_write_file(file.string(), "first"));
    REQUIRE(atomic_write_file(file.string(), "second"));

    std::ifstream in(file);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "second");
    REQUIRE_FALSE(std::filesystem::exists(file.string() + ".tmp"));

    std::filesystem::remove_all(base);
}
