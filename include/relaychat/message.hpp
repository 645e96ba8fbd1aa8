#ifndef RELAYCHAT_MESSAGE_HPP
#define RELAYCHAT_MESSAGE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace relaychat {

using ClientId = std::uint64_t;

// Id 0 is never assigned to a client. Broadcasts pass it as the excluded id
// when nobody is excluded, and server-originated messages carry it as sender.
constexpr ClientId kNoClient = 0;

constexpr std::size_t kMaxDisplayName = 32;

enum class MessageKind : std::uint8_t {
    Chat = 1,
    Join = 2,
    Leave = 3,
    System = 4,
    Handshake = 5
};

struct Message {
    MessageKind kind{MessageKind::System};
    ClientId sender_id{kNoClient};
    std::string sender_name;
    std::string body;
    std::chrono::system_clock::time_point ts{};
};

Message make_chat(ClientId sender, const std::string& name, const std::string& body);
Message make_join(ClientId who, const std::string& name);
Message make_leave(ClientId who, const std::string& name);
Message make_system(const std::string& text);
Message make_handshake(const std::string& desired_name);

const char* kind_to_string(MessageKind kind);
bool is_valid_kind(std::uint8_t raw);

// Trims surrounding whitespace. Returns an empty string when the result is
// not an acceptable display name (empty, too long, or has control characters).
std::string normalize_display_name(const std::string& raw);

// "dd/mm/YYYY HH:MM:SS" in local time.
std::string format_timestamp(std::chrono::system_clock::time_point ts);

// One terminal line for the message, without a trailing newline.
std::string render(const Message& msg);

}

#endif
