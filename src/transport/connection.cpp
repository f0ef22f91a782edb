#include "rtchat/transport/connection.hpp"

#include <algorithm>
#include <cctype>

namespace rtchat {

bool is_usable_token(const std::optional<std::string>& token) noexcept {
    if (!token) {
        return false;
    }
    const std::string& value = *token;
    const bool blank = std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        return false;
    }
    return value != "undefined" && value != "null";
}

ConnectionResult<void> check_preconditions(const ConnectionTarget& target) {
    if (is_usable_token(target.auth_token) == false) {
        return tl::unexpected(ConnectionError::missing_credential());
    }
    if (!target.conversation_id || target.conversation_id->empty()) {
        return tl::unexpected(ConnectionError::missing_conversation());
    }
    return {};
}

}  // namespace rtchat
