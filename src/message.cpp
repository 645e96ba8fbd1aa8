#include "relaychat/message.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace relaychat {

namespace {

Message stamped(MessageKind kind, ClientId sender, const std::string& name,
                const std::string& body) {
    Message m;
    m.kind = kind;
    m.sender_id = sender;
    m.sender_name = name;
    m.body = body;
    m.ts = std::chrono::system_clock::now();
    return m;
}

}

Message make_chat(ClientId sender, const std::string& name, const std::string& body) {
    return stamped(MessageKind::Chat, sender, name, body);
}

Message make_join(ClientId who, const std::string& name) {
    return stamped(MessageKind::Join, who, name, name + " joined the chat");
}

Message make_leave(ClientId who, const std::string& name) {
    return stamped(MessageKind::Leave, who, name, name + " left the chat");
}

Message make_system(const std::string& text) {
    return stamped(MessageKind::System, kNoClient, "", text);
}

Message make_handshake(const std::string& desired_name) {
    return stamped(MessageKind::Handshake, kNoClient, "", desired_name);
}

const char* kind_to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::Chat:      return "chat";
        case MessageKind::Join:      return "join";
        case MessageKind::Leave:     return "leave";
        case MessageKind::System:    return "system";
        case MessageKind::Handshake: return "handshake";
    }
    return "unknown";
}

bool is_valid_kind(std::uint8_t raw) {
    return raw >= static_cast<std::uint8_t>(MessageKind::Chat) &&
           raw <= static_cast<std::uint8_t>(MessageKind::Handshake);
}

std::string normalize_display_name(const std::string& raw) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    std::size_t begin = 0;
    std::size_t end = raw.size();
    while (begin < end && is_space(raw[begin])) ++begin;
    while (end > begin && is_space(raw[end - 1])) --end;

    std::string name = raw.substr(begin, end - begin);
    if (name.empty() || name.size() > kMaxDisplayName) return "";

    for (unsigned char c : name) {
        if (std::iscntrl(c)) return "";
    }
    return name;
}

std::string format_timestamp(std::chrono::system_clock::time_point ts) {
    auto tt = std::chrono::system_clock::to_time_t(ts);
    std::tm tm;
    localtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%d/%m/%Y %H:%M:%S");
    return oss.str();
}

std::string render(const Message& msg) {
    std::ostringstream oss;
    oss << "[" << format_timestamp(msg.ts) << "] ";

    switch (msg.kind) {
        case MessageKind::Chat:
            oss << msg.sender_name << ": " << msg.body;
            break;
        case MessageKind::Join:
        case MessageKind::Leave:
            oss << "*** " << msg.body;
            break;
        case MessageKind::System:
            oss << "[SYSTEM] " << msg.body;
            break;
        case MessageKind::Handshake:
            oss << "[HANDSHAKE] " << msg.body;
            break;
    }
    return oss.str();
}

}
