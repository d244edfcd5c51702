#pragma once

#include <cstddef>
#include <string>

namespace connect4 {

struct ServiceOptions {
    std::string listen_address = "0.0.0.0:50051";
    std::string control_socket = "/tmp/connect4_service.sock";
    bool enable_control = true;
    size_t control_workers = 4;
    std::string log_config = "log4cplus.ini";
    long shutdown_grace_ms = 5000;
    bool enable_pdeathsig = false;
    bool show_version = false;
};

struct ClientOptions {
    std::string target = "localhost:50051";
    // Empty means the field is left unset on the wire.
    std::string client_id;
    std::string account_id;
    long timeout_ms = 5000;
    // Empty logs to the console only.
    std::string log_config;
    bool show_version = false;
};

/**
 * Parse command-line flags. Accepts both "--flag value" and "--flag=value".
 * Returns false and fills `error` on unknown flags or malformed values.
 */
bool parse_service_options(int argc, const char* const* argv, ServiceOptions& options, std::string& error);
bool parse_client_options(int argc, const char* const* argv, ClientOptions& options, std::string& error);

} // namespace connect4
