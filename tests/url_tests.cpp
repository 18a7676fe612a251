// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/url.hpp>

using namespace ferry::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/file.zip");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "example.com");
        CHECK(url.path() == "/file.zip");
        CHECK(url.is_secure());
        CHECK(url.str() == "https://example.com/file.zip");
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://example.com:8080/path");
        REQUIRE(result.has_value());
        CHECK(result->port() == "8080");
        CHECK(result->base() == "http://example.com:8080");
        CHECK(!result->is_secure());
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://example.com/file.zip?v=1#section");
        REQUIRE(result.has_value());
        CHECK(result->query() == "v=1");
        CHECK(result->fragment() == "section");
    }

    SECTION("Host only gets root path") {
        auto result = Url::parse("https://example.com");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK_FALSE(Url::parse("example.com/file.zip").has_value());
    CHECK_FALSE(Url::parse("").has_value());
    CHECK_FALSE(Url::parse("https:///file.zip").has_value());
    CHECK_FALSE(Url::parse("http://example.com:80a/x").has_value());

    auto bad = Url::parse("no-scheme");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error() == DownloadErrc::invalid_url);
}

TEST_CASE("Url::filename extraction", "[url]") {
    SECTION("Simple filename") {
        CHECK(Url::parse("https://example.com/myfile.zip")->filename() == "myfile.zip");
    }

    SECTION("Query is not part of the name") {
        CHECK(Url::parse("https://example.com/download.php?id=123")->filename() == "download.php");
    }

    SECTION("Percent-encoded name is decoded") {
        CHECK(Url::parse("https://example.com/my%20file.tar.gz")->filename() == "my file.tar.gz");
    }

    SECTION("Directory path has no filename") {
        CHECK(Url::parse("https://example.com/folder/")->filename().empty());
    }
}

TEST_CASE("percent_decode keeps malformed escapes", "[url]") {
    CHECK(percent_decode("a%2Fb") == "a/b");
    CHECK(percent_decode("100%") == "100%");
    CHECK(percent_decode("%zz") == "%zz");
}

TEST_CASE("Url::default_port", "[url]") {
    CHECK(Url::parse("https://example.com")->default_port() == 443);
    CHECK(Url::parse("http://example.com")->default_port() == 80);
    CHECK(Url::parse("ftp://example.com")->default_port() == 21);
}
