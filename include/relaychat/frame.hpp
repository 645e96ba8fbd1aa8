#ifndef RELAYCHAT_FRAME_HPP
#define RELAYCHAT_FRAME_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "relaychat/message.hpp"

// Wire format: [u32 body_len, big-endian][body]
//
// body:
//   VERSION   (1B)
//   KIND      (1B)
//   TIMESTAMP (8B, signed ms since epoch)
//   NAME_LEN  (2B)
//   BODY_LEN  (4B)
//   NAME      (NAME_LEN bytes)
//   BODY      (BODY_LEN bytes)
//
// All integers big-endian. The length prefix is read by the connection layer;
// this file only builds frames and validates bodies.
namespace relaychat {

constexpr std::uint8_t kProtocolVersion = 0x01;
constexpr std::size_t kLengthPrefixSize = 4;
constexpr std::size_t kFrameHeaderSize = 1 + 1 + 8 + 2 + 4;
constexpr std::uint32_t kMaxFrameBody = 64 * 1024;

// Largest TIMESTAMP magnitude system_clock can hold. Anything beyond is a
// framing error.
constexpr std::int64_t kMaxTimestampMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::duration::max()).count();

class FramingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws FramingError if the message does not fit in kMaxFrameBody or the
// sender name is longer than kMaxDisplayName.
std::vector<std::uint8_t> encode_frame(const Message& msg);

// Validates the 4-byte prefix and returns the body length that follows.
std::uint32_t decode_length_prefix(const std::uint8_t* prefix);

// Parses a complete body (without the prefix). sender_id is not carried on
// the wire and is left as kNoClient.
Message decode_frame_body(const std::vector<std::uint8_t>& body);

}

#endif
