#pragma once

#include <istream>
#include <memory>
#include <tuple>

#include <xcbm/core/cbm.hpp>
#include <xcbm/core/config.hpp>
#include <xcbm/core/status.hpp>

// Based on command line arguments, set up the loggers and then connect to the bus and return a ready-to-use Cbm
// together with the options the program needs.  Returns a null Cbm if the program shouldn't continue (help was
// requested, or the arguments were bad).
namespace xcbm
{
std::tuple<std::unique_ptr<Cbm>, Config> build_cbm(int argc, char** argv);

// Reads a drive error number, e.g. "74"; for use by Boost.Program_options
std::istream& operator>>(std::istream& in, CbmErrorNumber& number);
} // namespace xcbm
