#include "relaychat/frame.hpp"

#include <string>

namespace relaychat {

namespace {

void put_u16_be(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void put_u32_be(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void put_u64_be(std::vector<std::uint8_t>& out, std::uint64_t v) {
    put_u32_be(out, static_cast<std::uint32_t>(v >> 32));
    put_u32_be(out, static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
}

std::uint16_t get_u16_be(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((std::uint16_t(p[0]) << 8) | std::uint16_t(p[1]));
}

std::uint32_t get_u32_be(const std::uint8_t* p) {
    return (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) |
           (std::uint32_t(p[2]) << 8) | std::uint32_t(p[3]);
}

std::uint64_t get_u64_be(const std::uint8_t* p) {
    return (std::uint64_t(get_u32_be(p)) << 32) | std::uint64_t(get_u32_be(p + 4));
}

}

std::vector<std::uint8_t> encode_frame(const Message& msg) {
    if (msg.sender_name.size() > kMaxDisplayName)
        throw FramingError("sender name too long");

    std::size_t body_len = kFrameHeaderSize + msg.sender_name.size() + msg.body.size();
    if (body_len > kMaxFrameBody)
        throw FramingError("message too large: " + std::to_string(body_len) + " bytes");

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        msg.ts.time_since_epoch()).count();

    std::vector<std::uint8_t> out;
    out.reserve(kLengthPrefixSize + body_len);

    put_u32_be(out, static_cast<std::uint32_t>(body_len));
    out.push_back(kProtocolVersion);
    out.push_back(static_cast<std::uint8_t>(msg.kind));
    put_u64_be(out, static_cast<std::uint64_t>(millis));
    put_u16_be(out, static_cast<std::uint16_t>(msg.sender_name.size()));
    put_u32_be(out, static_cast<std::uint32_t>(msg.body.size()));
    out.insert(out.end(), msg.sender_name.begin(), msg.sender_name.end());
    out.insert(out.end(), msg.body.begin(), msg.body.end());
    return out;
}

std::uint32_t decode_length_prefix(const std::uint8_t* prefix) {
    std::uint32_t len = get_u32_be(prefix);
    if (len < kFrameHeaderSize)
        throw FramingError("frame too short: " + std::to_string(len) + " bytes");
    if (len > kMaxFrameBody)
        throw FramingError("frame too large: " + std::to_string(len) + " bytes");
    return len;
}

Message decode_frame_body(const std::vector<std::uint8_t>& body) {
    if (body.size() < kFrameHeaderSize)
        throw FramingError("bad frame len");

    const std::uint8_t* p = body.data();
    if (p[0] != kProtocolVersion)
        throw FramingError("bad version " + std::to_string(p[0]));
    if (!is_valid_kind(p[1]))
        throw FramingError("bad kind " + std::to_string(p[1]));

    Message m;
    m.kind = static_cast<MessageKind>(p[1]);
    p += 2;

    auto millis = static_cast<std::int64_t>(get_u64_be(p)); p += 8;
    std::uint16_t name_len = get_u16_be(p); p += 2;
    std::uint32_t text_len = get_u32_be(p); p += 4;

    if (name_len > kMaxDisplayName)
        throw FramingError("sender name too long");
    if (kFrameHeaderSize + std::size_t(name_len) + std::size_t(text_len) != body.size())
        throw FramingError("bad sizes");

    if (millis > kMaxTimestampMillis || millis < -kMaxTimestampMillis)
        throw FramingError("timestamp out of range");

    m.ts = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(millis)));
    m.sender_name.assign(reinterpret_cast<const char*>(p), name_len);
    p += name_len;
    m.body.assign(reinterpret_cast<const char*>(p), text_len);
    return m;
}

}
