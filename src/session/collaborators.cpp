#include "rtchat/session/collaborators.hpp"

#include <cstdlib>

namespace rtchat {

std::optional<std::string> StaticCredentialStore::get_auth_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
}

void StaticCredentialStore::set_token(std::optional<std::string> token) {
    std::lock_guard<std::mutex> lock(mutex_);
    token_ = std::move(token);
}

std::optional<std::string> EnvCredentialStore::get_auth_token() const {
    const char* value = std::getenv(variable_.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::vector<ChatMessage>> InMemoryMessageCache::load(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(conversation_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryMessageCache::store(const std::string& conversation_id, const std::vector<ChatMessage>& messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[conversation_id] = messages;
}

void InMemoryMessageCache::invalidate(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(conversation_id);
}

}  // namespace rtchat
