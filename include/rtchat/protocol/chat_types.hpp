#ifndef RTCHAT_PROTOCOL_CHAT_TYPES_HPP
#define RTCHAT_PROTOCOL_CHAT_TYPES_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtchat {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Participant
// ═══════════════════════════════════════════════════════════════════════════
// The backend serializes users as {id, username, full_name}. Ids are numeric
// on the wire but treated as opaque strings here.

struct Participant {
    std::string id;
    std::string username;
    std::string full_name;

    /// full_name when set, otherwise username.
    [[nodiscard]] std::string display_name() const;

    [[nodiscard]] Json to_json() const;
    static Participant from_json(const Json& j);
};

// ═══════════════════════════════════════════════════════════════════════════
// ChatMessage
// ═══════════════════════════════════════════════════════════════════════════

struct ChatMessage {
    /// Server-assigned id; absent for a provisional local send.
    std::optional<std::string> id;
    Participant sender;
    std::string content;

    /// created_at exactly as delivered (ISO-8601).
    std::string created_at_raw;
    std::optional<std::chrono::system_clock::time_point> created_at;

    /// True for a record produced by a local submit and not yet echoed back.
    bool provisional = false;

    [[nodiscard]] Json to_json() const;

    /// Throws nlohmann::json::exception on a structurally wrong object; the
    /// frame parser turns that into a FrameError.
    static ChatMessage from_json(const Json& j);
};

// ═══════════════════════════════════════════════════════════════════════════
// TypingPresence
// ═══════════════════════════════════════════════════════════════════════════

struct TypingPresence {
    bool remote_is_typing = false;
    /// Who the last typing signal came from, when the backend said.
    std::optional<std::string> user_id;

    bool operator==(const TypingPresence&) const = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// GroupInfo
// ═══════════════════════════════════════════════════════════════════════════
// Conversation metadata as served by the group directory.

struct GroupInfo {
    std::string id;
    std::string name;
    std::vector<Participant> members;

    /// Header title for a conversation: the group name, or for an unnamed
    /// (direct) conversation the first member that is not the local user,
    /// or "Chat".
    [[nodiscard]] std::string display_name(std::string_view local_participant_id) const;

    static GroupInfo from_json(const Json& j);
};

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

/// Stringify an id that may arrive as a JSON number or string. Null and
/// other types yield an empty string.
[[nodiscard]] std::string id_to_string(const Json& value);

/// Parse "YYYY-MM-DDTHH:MM:SS[.fraction][Z|+hh:mm|-hh:mm]". A missing zone
/// is read as UTC.
[[nodiscard]] std::optional<std::chrono::system_clock::time_point> parse_iso8601(std::string_view text);

/// UTC calendar date "YYYY-MM-DD".
[[nodiscard]] std::string format_date(std::chrono::system_clock::time_point tp);

}  // namespace rtchat

#endif  // RTCHAT_PROTOCOL_CHAT_TYPES_HPP
