#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// External collaborators
// ═══════════════════════════════════════════════════════════════════════════
// Interfaces the session consumes but does not implement in full: token
// storage, the REST history/group endpoints, and an optional message cache.

#include "rtchat/protocol/chat_types.hpp"
#include "rtchat/session/session_error.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rtchat {

// ─────────────────────────────────────────────────────────────────────────────
// Credentials
// ─────────────────────────────────────────────────────────────────────────────

class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    /// Current bearer token, if any. Must be safe to call from any thread.
    [[nodiscard]] virtual std::optional<std::string> get_auth_token() const = 0;
};

class StaticCredentialStore final : public ICredentialStore {
public:
    StaticCredentialStore() = default;
    explicit StaticCredentialStore(std::string token)
        : token_(std::move(token))
    {}

    [[nodiscard]] std::optional<std::string> get_auth_token() const override;

    void set_token(std::optional<std::string> token);

private:
    mutable std::mutex mutex_;
    std::optional<std::string> token_;
};

/// Reads the token from an environment variable on every call.
class EnvCredentialStore final : public ICredentialStore {
public:
    static constexpr const char* kDefaultVariable = "RTCHAT_TOKEN";

    explicit EnvCredentialStore(std::string variable = kDefaultVariable)
        : variable_(std::move(variable))
    {}

    [[nodiscard]] std::optional<std::string> get_auth_token() const override;

private:
    std::string variable_;
};

// ─────────────────────────────────────────────────────────────────────────────
// History and group metadata
// ─────────────────────────────────────────────────────────────────────────────

class IHistorySource {
public:
    virtual ~IHistorySource() = default;

    /// Messages already stored for the conversation, oldest first.
    [[nodiscard]] virtual HistoryResult<std::vector<ChatMessage>> fetch_history(
        const std::string& conversation_id
    ) = 0;
};

class IGroupDirectory {
public:
    virtual ~IGroupDirectory() = default;

    [[nodiscard]] virtual HistoryResult<GroupInfo> fetch_group(
        const std::string& conversation_id
    ) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Message cache
// ─────────────────────────────────────────────────────────────────────────────

class IMessageCache {
public:
    virtual ~IMessageCache() = default;

    [[nodiscard]] virtual std::optional<std::vector<ChatMessage>> load(
        const std::string& conversation_id
    ) = 0;

    virtual void store(const std::string& conversation_id, const std::vector<ChatMessage>& messages) = 0;

    virtual void invalidate(const std::string& conversation_id) = 0;
};

/// Caches nothing.
class NullMessageCache final : public IMessageCache {
public:
    std::optional<std::vector<ChatMessage>> load(const std::string& /*conversation_id*/) override {
        return std::nullopt;
    }

    void store(const std::string& /*conversation_id*/, const std::vector<ChatMessage>& /*messages*/) override {}

    void invalidate(const std::string& /*conversation_id*/) override {}
};

/// Process-local cache keyed by conversation id.
class InMemoryMessageCache final : public IMessageCache {
public:
    std::optional<std::vector<ChatMessage>> load(const std::string& conversation_id) override;
    void store(const std::string& conversation_id, const std::vector<ChatMessage>& messages) override;
    void invalidate(const std::string& conversation_id) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<ChatMessage>> entries_;
};

}  // namespace rtchat
