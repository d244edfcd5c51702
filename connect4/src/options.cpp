#include "options.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>

namespace connect4 {

namespace {

const char* const kServiceValueFlags[] = {"--listen", "--control-socket", "--config", "--workers",
                                          "--shutdown-grace-ms"};
const char* const kClientValueFlags[] = {"--target", "--client-id", "--account-id", "--timeout-ms", "--config"};

// True when argv[i] is the last argument and names a flag that takes a value.
template <size_t N>
bool missing_value(const char* const (&flags)[N], int argc, const char* const* argv, int i) {
    if (i + 1 < argc) {
        return false;
    }
    for (const char* flag : flags) {
        if (std::strcmp(argv[i], flag) == 0) {
            return true;
        }
    }
    return false;
}

// Matches "--name value" (consuming the next argument) or "--name=value".
bool match_value(const char* name, int argc, const char* const* argv, int& i, std::string& value) {
    size_t len = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0 && i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    return false;
}

bool parse_long(const std::string& text, long min_value, long& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < min_value) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

bool parse_service_options(int argc, const char* const* argv, ServiceOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string value;

        if (missing_value(kServiceValueFlags, argc, argv, i)) {
            error = std::string(argv[i]) + " requires a value";
            return false;
        }

        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            options.show_version = true;
            continue;
        }
        if (std::strcmp(argv[i], "--pdeathsig") == 0) {
            options.enable_pdeathsig = true;
            continue;
        }
        if (std::strcmp(argv[i], "--no-control") == 0) {
            options.enable_control = false;
            continue;
        }
        if (match_value("--listen", argc, argv, i, value)) {
            if (value.empty()) {
                error = "--listen requires a value";
                return false;
            }
            options.listen_address = value;
            continue;
        }
        if (match_value("--control-socket", argc, argv, i, value)) {
            options.control_socket = value;
            continue;
        }
        if (match_value("--config", argc, argv, i, value)) {
            options.log_config = value;
            continue;
        }
        if (match_value("--workers", argc, argv, i, value)) {
            long workers = 0;
            if (!parse_long(value, 1, workers)) {
                error = "Invalid --workers value: " + value;
                return false;
            }
            options.control_workers = static_cast<size_t>(workers);
            continue;
        }
        if (match_value("--shutdown-grace-ms", argc, argv, i, value)) {
            if (!parse_long(value, 0, options.shutdown_grace_ms)) {
                error = "Invalid --shutdown-grace-ms value: " + value;
                return false;
            }
            continue;
        }

        error = std::string("Unknown argument: ") + argv[i];
        return false;
    }
    return true;
}

bool parse_client_options(int argc, const char* const* argv, ClientOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string value;

        if (missing_value(kClientValueFlags, argc, argv, i)) {
            error = std::string(argv[i]) + " requires a value";
            return false;
        }

        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            options.show_version = true;
            continue;
        }
        if (match_value("--target", argc, argv, i, value)) {
            options.target = value;
            continue;
        }
        if (match_value("--client-id", argc, argv, i, value)) {
            options.client_id = value;
            continue;
        }
        if (match_value("--account-id", argc, argv, i, value)) {
            options.account_id = value;
            continue;
        }
        if (match_value("--config", argc, argv, i, value)) {
            options.log_config = value;
            continue;
        }
        if (match_value("--timeout-ms", argc, argv, i, value)) {
            if (!parse_long(value, 1, options.timeout_ms)) {
                error = "Invalid --timeout-ms value: " + value;
                return false;
            }
            continue;
        }

        error = std::string("Unknown argument: ") + argv[i];
        return false;
    }
    return true;
}

} // namespace connect4
