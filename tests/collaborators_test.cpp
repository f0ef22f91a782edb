#include <catch2/catch_test_macros.hpp>

#include "rtchat/session/collaborators.hpp"

#include <cstdlib>

using namespace rtchat;

TEST_CASE("StaticCredentialStore", "[session][credentials]") {
    StaticCredentialStore store;
    REQUIRE_FALSE(store.get_auth_token().has_value());

    store.set_token("abc");
    REQUIRE(store.get_auth_token() == "abc");

    store.set_token(std::nullopt);
    REQUIRE_FALSE(store.get_auth_token().has_value());

    REQUIRE(StaticCredentialStore("xyz").get_auth_token() == "xyz");
}

TEST_CASE("EnvCredentialStore reads the variable on every call", "[session][credentials]") {
    const char* variable = "RTCHAT_TEST_TOKEN_VAR";
    ::unsetenv(variable);

    EnvCredentialStore store(variable);
    REQUIRE_FALSE(store.get_auth_token().has_value());

    ::setenv(variable, "from-env", 1);
    REQUIRE(store.get_auth_token() == "from-env");

    ::unsetenv(variable);
    REQUIRE_FALSE(store.get_auth_token().has_value());
}

TEST_CASE("Message caches", "[session][cache]") {
    ChatMessage m;
    m.content = "cached";

    SECTION("InMemoryMessageCache stores per conversation") {
        InMemoryMessageCache cache;
        REQUIRE_FALSE(cache.load("42").has_value());

        cache.store("42", {m});
        auto loaded = cache.load("42");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->size() == 1);
        REQUIRE(loaded->front().content == "cached");
        REQUIRE_FALSE(cache.load("43").has_value());

        cache.invalidate("42");
        REQUIRE_FALSE(cache.load("42").has_value());
    }

    SECTION("NullMessageCache never hits") {
        NullMessageCache cache;
        cache.store("42", {m});
        REQUIRE_FALSE(cache.load("42").has_value());
    }
}
