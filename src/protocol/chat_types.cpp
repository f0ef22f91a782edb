#include "rtchat/protocol/chat_types.hpp"

#include <charconv>
#include <format>

namespace rtchat {

namespace {

// Read exactly `width` digits at `pos`, advancing it.
bool read_fixed(std::string_view text, std::size_t& pos, std::size_t width, int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    const char* first = text.data() + pos;
    const char* last = first + width;
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) {
        return false;
    }
    pos += width;
    return true;
}

std::string string_field(const Json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_string() == false) {
        return {};
    }
    return it->get<std::string>();
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Participant
// ─────────────────────────────────────────────────────────────────────────────

std::string Participant::display_name() const {
    if (!full_name.empty()) {
        return full_name;
    }
    return username;
}

Json Participant::to_json() const {
    return {{"id", id}, {"username", username}, {"full_name", full_name}};
}

Participant Participant::from_json(const Json& j) {
    Participant p;
    if (j.is_object() == false) {
        // Some payloads carry just the sender id.
        p.id = id_to_string(j);
        return p;
    }
    if (j.contains("id")) {
        p.id = id_to_string(j.at("id"));
    }
    p.username = string_field(j, "username");
    p.full_name = string_field(j, "full_name");
    return p;
}

// ─────────────────────────────────────────────────────────────────────────────
// ChatMessage
// ─────────────────────────────────────────────────────────────────────────────

Json ChatMessage::to_json() const {
    Json j = {
        {"sender", sender.to_json()},
        {"content", content},
        {"created_at", created_at_raw}
    };
    if (id) {
        j["id"] = *id;
    }
    return j;
}

ChatMessage ChatMessage::from_json(const Json& j) {
    ChatMessage msg;
    msg.content = j.at("content").get<std::string>();

    if (j.contains("id")) {
        auto id = id_to_string(j.at("id"));
        if (!id.empty()) {
            msg.id = std::move(id);
        }
    }
    if (j.contains("sender")) {
        msg.sender = Participant::from_json(j.at("sender"));
    }
    msg.created_at_raw = string_field(j, "created_at");
    if (!msg.created_at_raw.empty()) {
        msg.created_at = parse_iso8601(msg.created_at_raw);
    }
    return msg;
}

// ─────────────────────────────────────────────────────────────────────────────
// GroupInfo
// ─────────────────────────────────────────────────────────────────────────────

std::string GroupInfo::display_name(std::string_view local_participant_id) const {
    if (!name.empty()) {
        return name;
    }
    for (const auto& member : members) {
        if (member.id != local_participant_id) {
            return member.display_name();
        }
    }
    return "Chat";
}

GroupInfo GroupInfo::from_json(const Json& j) {
    GroupInfo info;
    if (j.contains("id")) {
        info.id = id_to_string(j.at("id"));
    }
    info.name = string_field(j, "name");
    if (j.contains("members") && j.at("members").is_array()) {
        for (const auto& member : j.at("members")) {
            info.members.push_back(Participant::from_json(member));
        }
    }
    return info;
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

std::string id_to_string(const Json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<std::int64_t>());
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<std::uint64_t>());
    }
    return {};
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(std::string_view text) {
    using namespace std::chrono;

    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    const bool date_ok = read_fixed(text, pos, 4, year)
        && expect(text, pos, '-') && read_fixed(text, pos, 2, month)
        && expect(text, pos, '-') && read_fixed(text, pos, 2, day);
    if (!date_ok) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    const bool time_ok = read_fixed(text, pos, 2, hour)
        && expect(text, pos, ':') && read_fixed(text, pos, 2, minute)
        && expect(text, pos, ':') && read_fixed(text, pos, 2, second);
    if (!time_ok) {
        return std::nullopt;
    }

    const year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                             std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    system_clock::time_point tp = sys_days{ymd};
    tp += hours{hour} + minutes{minute} + seconds{second};

    // Fractional seconds: keep microsecond precision, ignore the rest.
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::int64_t micros = 0;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
        tp += duration_cast<system_clock::duration>(microseconds{micros});
    }

    if (pos == text.size()) {
        return tp;
    }
    if (text[pos] == 'Z' && pos + 1 == text.size()) {
        return tp;
    }
    if (text[pos] == '+' || text[pos] == '-') {
        const int sign = (text[pos] == '+') ? 1 : -1;
        ++pos;
        int off_h = 0, off_m = 0;
        if (!read_fixed(text, pos, 2, off_h)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
        }
        if (!read_fixed(text, pos, 2, off_m) || pos != text.size()) {
            return std::nullopt;
        }
        // Local time = UTC + offset, so UTC = local - offset.
        tp -= sign * (hours{off_h} + minutes{off_m});
        return tp;
    }
    return std::nullopt;
}

std::string format_date(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const year_month_day ymd{floor<days>(tp)};
    return std::format("{:04}-{:02}-{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

}  // namespace rtchat
