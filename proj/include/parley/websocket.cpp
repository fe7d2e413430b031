#include "parley/websocket.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace parley {
namespace ws {

namespace {

std::string base64(const unsigned char* data, std::size_t len) {
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data, static_cast<int>(len));
    out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// "keep-alive, Upgrade" contains token "upgrade"
bool has_token(std::string_view list, std::string_view token) {
    while (!list.empty()) {
        std::size_t comma = list.find(',');
        std::string_view item = trim(list.substr(0, comma));
        if (iequals(item, token)) return true;
        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return false;
}

// Splits the head into lines and calls fn(name, value) per header line.
// Returns the first line (request/status line).
template <typename Fn>
std::string_view for_each_header(std::string_view head, Fn fn) {
    std::size_t eol = head.find("\r\n");
    std::string_view first = head.substr(0, eol);
    if (eol == std::string_view::npos) return first;
    head.remove_prefix(eol + 2);

    while (!head.empty()) {
        eol = head.find("\r\n");
        std::string_view line = head.substr(0, eol);
        std::size_t colon = line.find(':');
        if (colon != std::string_view::npos) {
            fn(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        }
        if (eol == std::string_view::npos) break;
        head.remove_prefix(eol + 2);
    }
    return first;
}

// Locates the end of an HTTP head. Returns Incomplete/Bad, or Ok with
// `consumed` set.
HandshakeStatus find_head(std::string_view data, std::size_t& consumed) {
    const std::size_t end = data.find("\r\n\r\n");
    if (end == std::string_view::npos) {
        return data.size() > MAX_HANDSHAKE_SIZE ? HandshakeStatus::Bad
                                                : HandshakeStatus::Incomplete;
    }
    consumed = end + 4;
    return consumed > MAX_HANDSHAKE_SIZE ? HandshakeStatus::Bad : HandshakeStatus::Ok;
}

} // namespace

bool read_header(const std::uint8_t* data, std::size_t len, FrameHeader& out) {
    if (len < 2) return false;

    out.fin    = (data[0] & 0x80) != 0;
    out.rsv    = static_cast<std::uint8_t>((data[0] >> 4) & 0x07);
    out.opcode = static_cast<OpCode>(data[0] & 0x0F);
    out.masked = (data[1] & 0x80) != 0;

    std::uint64_t length = data[1] & 0x7F;
    std::size_t pos = 2;

    if (length == 126) {
        if (len < 4) return false;
        length = (static_cast<std::uint64_t>(data[2]) << 8) | data[3];
        pos = 4;
    } else if (length == 127) {
        if (len < 10) return false;
        length = 0;
        for (std::size_t i = 2; i < 10; ++i) length = (length << 8) | data[i];
        pos = 10;
    }

    if (out.masked) {
        if (len < pos + 4) return false;
        std::memcpy(out.mask.data(), data + pos, 4);
        pos += 4;
    } else {
        out.mask = MaskKey{};
    }

    out.length      = length;
    out.header_size = pos;
    return true;
}

void encode_frame(OpCode opcode, std::string_view payload,
                  std::vector<std::uint8_t>& out, const MaskKey* mask) {
    const std::uint8_t mask_bit = mask ? 0x80 : 0x00;
    const std::size_t len = payload.size();

    out.push_back(static_cast<std::uint8_t>(0x80 | static_cast<std::uint8_t>(opcode)));
    if (len < 126) {
        out.push_back(static_cast<std::uint8_t>(mask_bit | len));
    } else if (len <= 0xFFFF) {
        out.push_back(static_cast<std::uint8_t>(mask_bit | 126));
        out.push_back(static_cast<std::uint8_t>((len >> 8) & 0xFF));
        out.push_back(static_cast<std::uint8_t>(len & 0xFF));
    } else {
        out.push_back(static_cast<std::uint8_t>(mask_bit | 127));
        for (int i = 7; i >= 0; --i)
            out.push_back(static_cast<std::uint8_t>((static_cast<std::uint64_t>(len) >> (i * 8)) & 0xFF));
    }

    if (mask) out.insert(out.end(), mask->begin(), mask->end());

    const std::size_t start = out.size();
    out.insert(out.end(), payload.begin(), payload.end());
    if (mask) apply_mask(out.data() + start, len, *mask);
}

void encode_close(std::uint16_t code, std::vector<std::uint8_t>& out, const MaskKey* mask) {
    const char body[2] = {static_cast<char>((code >> 8) & 0xFF),
                          static_cast<char>(code & 0xFF)};
    encode_frame(OpCode::Close, std::string_view(body, sizeof(body)), out, mask);
}

void apply_mask(std::uint8_t* data, std::size_t len, const MaskKey& mask,
                std::size_t offset) noexcept {
    for (std::size_t i = 0; i < len; ++i) data[i] ^= mask[(offset + i) & 3];
}

std::string accept_key(std::string_view client_key) {
    std::string material(client_key);
    material += HANDSHAKE_GUID;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(material.data(), material.size(), md, &md_len, EVP_sha1(), nullptr) != 1)
        throw std::runtime_error("EVP_Digest(sha1) failed");

    return base64(md, md_len);
}

std::string generate_client_key() {
    unsigned char raw[16];
    if (RAND_bytes(raw, static_cast<int>(sizeof(raw))) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return base64(raw, sizeof(raw));
}

MaskKey random_mask() {
    MaskKey m{};
    if (RAND_bytes(m.data(), static_cast<int>(m.size())) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return m;
}

HandshakeStatus parse_handshake(std::string_view data, HandshakeRequest& out, std::size_t& consumed) {
    const HandshakeStatus head = find_head(data, consumed);
    if (head != HandshakeStatus::Ok) {
        if (head == HandshakeStatus::Bad) consumed = data.size();
        return head;
    }

    out = HandshakeRequest{};
    const std::string_view request_line =
        for_each_header(data.substr(0, consumed - 4), [&](std::string_view name, std::string_view value) {
            if (iequals(name, "host")) {
                out.host.assign(value);
            } else if (iequals(name, "upgrade")) {
                out.upgrade_websocket = has_token(value, "websocket");
            } else if (iequals(name, "connection")) {
                out.connection_upgrade = has_token(value, "upgrade");
            } else if (iequals(name, "sec-websocket-key")) {
                out.key.assign(value);
            } else if (iequals(name, "sec-websocket-version")) {
                out.version.assign(value);
            }
        });

    // METHOD SP target SP HTTP/1.1
    const std::size_t sp1 = request_line.find(' ');
    const std::size_t sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos) return HandshakeStatus::Bad;

    out.method.assign(request_line.substr(0, sp1));
    out.target.assign(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
    const std::string_view http = request_line.substr(sp2 + 1);

    if (out.method != "GET" || http.substr(0, 5) != "HTTP/") return HandshakeStatus::Bad;
    if (!out.upgrade_websocket || !out.connection_upgrade) return HandshakeStatus::Bad;
    if (out.key.empty() || out.version != "13") return HandshakeStatus::Bad;

    return HandshakeStatus::Ok;
}

std::string handshake_response(const HandshakeRequest& req) {
    return "HTTP/1.1 101 Switching Protocols\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Accept: " + accept_key(req.key) + "\r\n"
           "\r\n";
}

std::string bad_request_response() {
    static const char body[] = "Expected a WebSocket upgrade request\n";
    return "HTTP/1.1 400 Bad Request\r\n"
           "Content-Type: text/plain\r\n"
           "Content-Length: " + std::to_string(sizeof(body) - 1) + "\r\n"
           "Sec-WebSocket-Version: 13\r\n"
           "Connection: close\r\n"
           "\r\n" + body;
}

std::string client_handshake(std::string_view host, std::string_view target, std::string_view key) {
    std::string out;
    out.reserve(256);
    out += "GET ";
    out += target.empty() ? std::string_view("/") : target;
    out += " HTTP/1.1\r\nHost: ";
    out += host;
    out += "\r\nUpgrade: websocket\r\nConnection: Upgrade\r\nSec-WebSocket-Key: ";
    out += key;
    out += "\r\nSec-WebSocket-Version: 13\r\n\r\n";
    return out;
}

HandshakeStatus parse_handshake_response(std::string_view data, std::string_view key, std::size_t& consumed) {
    const HandshakeStatus head = find_head(data, consumed);
    if (head != HandshakeStatus::Ok) return head;

    std::string accept;
    const std::string_view status_line =
        for_each_header(data.substr(0, consumed - 4), [&](std::string_view name, std::string_view value) {
            if (iequals(name, "sec-websocket-accept")) accept.assign(value);
        });

    // HTTP/1.1 101 Switching Protocols
    const std::size_t sp = status_line.find(' ');
    if (sp == std::string_view::npos || status_line.substr(sp + 1, 3) != "101")
        return HandshakeStatus::Bad;
    if (accept != accept_key(key)) return HandshakeStatus::Bad;

    return HandshakeStatus::Ok;
}

} // namespace ws
} // namespace parley
