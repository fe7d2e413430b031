#include "parley_server/server_config.hpp"
#include "parley_server/log.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace parley_server {

static inline void ltrim(std::string& s) {
    std::size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    s.erase(0, i);
}

static inline void rtrim(std::string& s) {
    std::size_t i = s.size();
    while (i > 0 && std::isspace(static_cast<unsigned char>(s[i - 1]))) --i;
    s.erase(i);
}

static inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

static inline void strip_comment(std::string& s) {
    // '#' starts a comment unless it is inside a quoted string
    bool quoted = false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) { s.erase(i); return; }
    }
}

static inline bool strip_quotes(std::string& s) {
    trim(s);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
        return true;
    }
    return false;
}

static inline long long parse_int(const std::string& raw, const std::string& key, int lineno) {
    std::string s = raw;
    trim(s);
    if (s.empty())
        throw std::runtime_error("Empty int value for key '" + key + "' at line " + std::to_string(lineno));

    std::size_t idx = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &idx, 10);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid int for key '" + key + "' at line " +
                                 std::to_string(lineno) + ": " + s);
    }
    if (idx != s.size()) {
        throw std::runtime_error("Invalid trailing chars for key '" + key + "' at line " +
                                 std::to_string(lineno) + ": " + s);
    }
    return v;
}

static inline std::string parse_string(const std::string& raw) {
    std::string s = raw;
    trim(s);
    strip_quotes(s); // if not quoted, keep as-is
    return s;
}

static inline void require(bool ok, const std::string& what, int lineno) {
    if (!ok) throw std::runtime_error(what + " (line " + std::to_string(lineno) + ")");
}

ServerConfig ServerConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    ServerConfig cfg{};
    std::string line;
    int lineno = 0;

    while (std::getline(in, line)) {
        ++lineno;

        strip_comment(line);
        trim(line);
        if (line.empty()) continue;

        // Expect: key = value
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Config parse error at line " + std::to_string(lineno) +
                                     ": expected 'key = value'");
        }

        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);

        trim(key);
        trim(val);

        if (key == "bind_address") {
            cfg.bind_address = parse_string(val);
            require(!cfg.bind_address.empty(), "bind_address cannot be empty", lineno);
        } else if (key == "port") {
            const long long v = parse_int(val, key, lineno);
            require(v > 0 && v <= 65535, "port out of range (1..65535)", lineno);
            cfg.port = static_cast<int>(v);
        } else if (key == "max_connections") {
            const long long v = parse_int(val, key, lineno);
            require(v >= 0 && v <= 1000000, "max_connections must be in 0..1000000", lineno);
            cfg.max_connections = static_cast<int>(v);
        } else if (key == "history_limit") {
            const long long v = parse_int(val, key, lineno);
            require(v >= 1, "history_limit must be >= 1", lineno);
            cfg.history_limit = static_cast<std::size_t>(v);
        } else if (key == "default_room") {
            cfg.default_room = parse_string(val);
            require(!cfg.default_room.empty(), "default_room cannot be empty", lineno);
        } else if (key == "max_name_length") {
            const long long v = parse_int(val, key, lineno);
            require(v >= 1, "max_name_length must be >= 1", lineno);
            cfg.max_name_length = static_cast<std::size_t>(v);
        } else if (key == "max_message_bytes") {
            const long long v = parse_int(val, key, lineno);
            require(v >= 1, "max_message_bytes must be >= 1", lineno);
            cfg.max_message_bytes = static_cast<std::size_t>(v);
        } else if (key == "max_outbuf_bytes") {
            const long long v = parse_int(val, key, lineno);
            require(v >= 1024, "max_outbuf_bytes must be >= 1024", lineno);
            cfg.max_outbuf_bytes = static_cast<std::size_t>(v);
        } else if (key == "log_level") {
            cfg.log_level = parse_string(val);
            LogLevel ignored;
            require(parse_log_level(cfg.log_level, ignored),
                    "log_level must be one of debug, info, warn, error", lineno);
        } else {
            // unknown key: ignore (lets you add more later without breaking)
        }
    }

    return cfg;
}

} // namespace parley_server
