#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/http.hpp"

#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    const std::string input = "hello world!";
    const std::string expected = "hello%20world%21";
    REQUIRE(voice_bridge::utils::url_encode(input) == expected);
    REQUIRE(voice_bridge::utils::url_encode("+15551234567") == "%2B15551234567");
}

TEST_CASE("parse_url splits scheme host port and path") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    voice_bridge::utils::parse_url("https://example.com:8443/path/file",
                                   scheme, host, port, base_path);
    REQUIRE(scheme == "https");
    REQUIRE(host == "example.com");
    REQUIRE(port == 8443);
    REQUIRE(base_path == "/path/file");
}

TEST_CASE("parse_url defaults secure websocket port") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    voice_bridge::utils::parse_url("wss://generativelanguage.googleapis.com",
                                   scheme, host, port, base_path);
    REQUIRE(scheme == "wss");
    REQUIRE(port == 443);
    REQUIRE(base_path == "/");
}

TEST_CASE("build_url omits default ports") {
    REQUIRE(voice_bridge::utils::build_url("wss", "host.example", 443, "/ws") ==
            "wss://host.example/ws");
    REQUIRE(voice_bridge::utils::build_url("http", "localhost", 8000, "health") ==
            "http://localhost:8000/health");
}

TEST_CASE("xml_escape replaces markup characters") {
    REQUIRE(voice_bridge::utils::xml_escape("a<b>&\"c'") == "a&lt;b&gt;&amp;&quot;c&apos;");
}
