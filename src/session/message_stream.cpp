#include "rtchat/session/message_stream.hpp"

#include <algorithm>
#include <iterator>

namespace rtchat {

void MessageStream::append(ChatMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(std::move(message));
}

HistoryResult<std::size_t> MessageStream::seed(std::vector<ChatMessage> history) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!messages_.empty()) {
        return tl::unexpected(HistoryError::already_live());
    }
    messages_ = std::move(history);
    return messages_.size();
}

std::vector<ChatMessage> MessageStream::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::vector<ChatMessage> MessageStream::read_from(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= messages_.size()) {
        return {};
    }
    return {messages_.begin() + static_cast<std::ptrdiff_t>(index), messages_.end()};
}

void MessageStream::for_each(const std::function<void(const ChatMessage&)>& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& message : messages_) {
        fn(message);
    }
}

std::size_t MessageStream::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

bool MessageStream::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.empty();
}

std::vector<DateGroup> MessageStream::group_by_date() const {
    return rtchat::group_by_date(snapshot());
}

std::vector<DateGroup> group_by_date(const std::vector<ChatMessage>& messages) {
    std::vector<DateGroup> groups;
    for (const auto& message : messages) {
        const std::string date = message.created_at ? format_date(*message.created_at) : std::string{};
        auto it = std::find_if(groups.begin(), groups.end(), [&](const DateGroup& g) {
            return g.date == date;
        });
        if (it == groups.end()) {
            groups.push_back(DateGroup{date, {}});
            it = std::prev(groups.end());
        }
        it->messages.push_back(message);
    }
    return groups;
}

}  // namespace rtchat
