#include <catch2/catch_test_macros.hpp>

#include "rtchat/transport/connection.hpp"
#include "rtchat/transport/endpoint.hpp"

using namespace rtchat;

TEST_CASE("percent_encode matches encodeURIComponent", "[transport][endpoint]") {
    REQUIRE(percent_encode("abcXYZ019") == "abcXYZ019");
    REQUIRE(percent_encode("-_.!~*'()") == "-_.!~*'()");
    REQUIRE(percent_encode("a b") == "a%20b");
    REQUIRE(percent_encode("a+b/c?d=e&f#g") == "a%2Bb%2Fc%3Fd%3De%26f%23g");
    REQUIRE(percent_encode("\xC3\xA9") == "%C3%A9");
    REQUIRE(percent_encode("") == "");
}

TEST_CASE("build_socket_endpoint", "[transport][endpoint]") {
    SECTION("https selects wss on 443") {
        auto endpoint = build_socket_endpoint("https://campus.example.edu", "42", "tok");
        REQUIRE(endpoint.has_value());
        REQUIRE(endpoint->secure);
        REQUIRE(endpoint->host == "campus.example.edu");
        REQUIRE(endpoint->port == 443);
        REQUIRE(endpoint->target == "/ws/messages/42/?token=tok");
        REQUIRE(endpoint->url() == "wss://campus.example.edu/ws/messages/42/?token=tok");
    }

    SECTION("http selects ws and keeps an explicit port") {
        auto endpoint = build_socket_endpoint("http://localhost:8000/app/", "room 1", "a/b+c");
        REQUIRE(endpoint.has_value());
        REQUIRE_FALSE(endpoint->secure);
        REQUIRE(endpoint->port == 8000);
        REQUIRE(endpoint->host_header() == "localhost:8000");
        REQUIRE(endpoint->url() == "ws://localhost:8000/ws/messages/room%201/?token=a%2Fb%2Bc");
    }

    SECTION("ws and wss base URLs are accepted") {
        REQUIRE(build_socket_endpoint("wss://chat.example.edu", "1", "t")->secure);
        REQUIRE_FALSE(build_socket_endpoint("ws://chat.example.edu", "1", "t")->secure);
    }

    SECTION("Unparseable endpoint is a precondition failure") {
        auto endpoint = build_socket_endpoint("not a url", "1", "t");
        REQUIRE_FALSE(endpoint.has_value());
        REQUIRE(endpoint.error().code == ConnectionError::Code::InvalidEndpoint);
        REQUIRE(endpoint.error().is_precondition());
    }

    SECTION("Other schemes are rejected") {
        auto endpoint = build_socket_endpoint("ftp://files.example.edu", "1", "t");
        REQUIRE_FALSE(endpoint.has_value());
        REQUIRE(endpoint.error().code == ConnectionError::Code::InvalidEndpoint);
    }
}

TEST_CASE("Tokens are redacted from logged URLs", "[transport][endpoint]") {
    REQUIRE(redact_token("wss://h/ws/messages/1/?token=secret") == "wss://h/ws/messages/1/?token=***");
    REQUIRE(redact_token("ws://h/?a=1&token=s3&b=2") == "ws://h/?a=1&token=***&b=2");
    REQUIRE(redact_token("ws://h/?mytoken=keep") == "ws://h/?mytoken=keep");
    REQUIRE(redact_token("ws://h/?token=") == "ws://h/?token=");

    auto endpoint = build_socket_endpoint("https://campus.example.edu", "42", "secret");
    REQUIRE(endpoint->redacted_url().find("secret") == std::string::npos);
}

TEST_CASE("Connection preconditions", "[transport][preconditions]") {
    ConnectionTarget target{"42", "https://campus.example.edu", "tok"};
    REQUIRE(check_preconditions(target).has_value());

    SECTION("Missing, blank and stringified-empty tokens count as no credential") {
        for (const std::optional<std::string>& token :
             {std::optional<std::string>{}, std::optional<std::string>{""},
              std::optional<std::string>{"  "}, std::optional<std::string>{"undefined"},
              std::optional<std::string>{"null"}}) {
            target.auth_token = token;
            auto checked = check_preconditions(target);
            REQUIRE_FALSE(checked.has_value());
            REQUIRE(checked.error().code == ConnectionError::Code::MissingCredential);
            REQUIRE(checked.error().message == "no credential");
        }
    }

    SECTION("Missing conversation id") {
        target.conversation_id.reset();
        REQUIRE(check_preconditions(target).error().code == ConnectionError::Code::MissingConversation);

        target.conversation_id = "";
        REQUIRE(check_preconditions(target).error().code == ConnectionError::Code::MissingConversation);
    }
}
