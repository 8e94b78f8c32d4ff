#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "status.hpp"
#include "validate.hpp"

namespace xcbm
{

// Runtime options shared by the programs, populated from the command line
struct Config
{
    std::string host = "localhost";                 // Where the bus bridge daemon is listening
    std::uint16_t port = 1541;                      // ...and on which port
    std::uint8_t device = DEFAULT_DEVICE_NUM;       // Device addressed when a command doesn't name one
    std::vector<CbmErrorNumber> ignore_init_errors; // Statuses treated as success after "i" commands
    std::string history_file = "./.xcbm_history.txt";
};

} // namespace xcbm
