#pragma once

#include <cstddef>
#include <string>

namespace parley_server {

struct ServerConfig {
    std::string bind_address    = "0.0.0.0";
    int         port            = 6789;
    int         max_connections = 1024;   // 0 => unlimited

    // Chat
    std::size_t history_limit   = 100;
    std::string default_room    = "general";
    std::size_t max_name_length = 64;

    // Transport limits
    std::size_t max_message_bytes = 64 * 1024;     // reassembled inbound message
    std::size_t max_outbuf_bytes  = 1024 * 1024;   // pending outbound bytes per connection

    std::string log_level = "info";

    static ServerConfig from_file(const std::string& path);
};

} // namespace parley_server
