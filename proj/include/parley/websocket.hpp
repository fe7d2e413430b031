#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace parley {
namespace ws {

enum class OpCode : std::uint8_t {
    Continuation = 0x0,
    Text         = 0x1,
    Binary       = 0x2,
    Close        = 0x8,
    Ping         = 0x9,
    Pong         = 0xA
};

using MaskKey = std::array<std::uint8_t, 4>;

struct FrameHeader {
    bool          fin{false};
    std::uint8_t  rsv{0};          // RSV1..RSV3, must be zero (no extensions)
    OpCode        opcode{OpCode::Continuation};
    bool          masked{false};
    std::uint64_t length{0};       // payload length
    MaskKey       mask{};
    std::size_t   header_size{0};  // bytes before the payload
};

constexpr std::size_t MAX_FRAME_HEADER_SIZE = 14;        // 2 + 8 + 4
constexpr std::size_t MAX_CONTROL_PAYLOAD   = 125;
constexpr std::size_t MAX_HANDSHAKE_SIZE    = 8 * 1024;
constexpr const char* HANDSHAKE_GUID        = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

namespace close_code {
constexpr std::uint16_t NORMAL         = 1000;
constexpr std::uint16_t GOING_AWAY     = 1001;
constexpr std::uint16_t PROTOCOL_ERROR = 1002;
constexpr std::uint16_t TOO_BIG        = 1009;
}

// Codes a peer may put on the wire (RFC 6455 7.4). 1005, 1006 and 1015
// are reserved for local use.
inline bool is_valid_close_code(std::uint16_t code) noexcept {
    if (code >= 3000 && code <= 4999) return true;
    return (code >= 1000 && code <= 1003) || (code >= 1007 && code <= 1014);
}

inline bool is_control(OpCode op) noexcept {
    return (static_cast<std::uint8_t>(op) & 0x08) != 0;
}

/// Parse a frame header. Returns false if `len` does not yet hold the full
/// header; on success out.header_size tells where the payload starts.
bool read_header(const std::uint8_t* data, std::size_t len, FrameHeader& out);

/// Append one FIN frame to `out`. Pass a mask for client->server frames.
void encode_frame(OpCode opcode, std::string_view payload,
                  std::vector<std::uint8_t>& out, const MaskKey* mask = nullptr);

/// Append a Close frame carrying `code`.
void encode_close(std::uint16_t code, std::vector<std::uint8_t>& out,
                  const MaskKey* mask = nullptr);

/// XOR `len` bytes in place. `offset` is the position of data[0] within the
/// frame payload, so a payload can be unmasked in pieces.
void apply_mask(std::uint8_t* data, std::size_t len, const MaskKey& mask,
                std::size_t offset = 0) noexcept;

// Handshake

enum class HandshakeStatus {
    Incomplete,
    Ok,
    Bad
};

struct HandshakeRequest {
    std::string method;
    std::string target;
    std::string host;
    std::string key;
    std::string version;
    bool upgrade_websocket{false};
    bool connection_upgrade{false};
};

/// Base64(SHA-1(key + GUID)), the Sec-WebSocket-Accept value.
std::string accept_key(std::string_view client_key);

/// 16 random bytes, Base64 encoded.
std::string generate_client_key();

MaskKey random_mask();

/// Server side: parse an upgrade request. `consumed` is set to the size of
/// the request head when the result is Ok or Bad.
HandshakeStatus parse_handshake(std::string_view data, HandshakeRequest& out, std::size_t& consumed);

std::string handshake_response(const HandshakeRequest& req);
std::string bad_request_response();

// Client side
std::string client_handshake(std::string_view host, std::string_view target, std::string_view key);
HandshakeStatus parse_handshake_response(std::string_view data, std::string_view key, std::size_t& consumed);

} // namespace ws
} // namespace parley
