#ifndef _LOGGER_HPP_
#define _LOGGER_HPP_

#include <iostream>

#include "logger/ofstream.hpp"

namespace lgr {
  extern ofstream<> file; // per-rank log, see courier.logging.file

  extern std::ostream& out;
  extern std::ostream& err;
}

#endif
