#include "client.hpp"
#include "logger.hpp"

#include <log4cplus/initializer.h>

#include <iostream>

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    // Console only unless --config names a file; the service's log4cplus.ini
    // writes into the service log.
    connect4::init_logging("");

    return connect4::client::client_main(argc, argv, std::cout, std::cerr);
}
