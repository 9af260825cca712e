#include "logger/logger.hpp"

namespace lgr {
  ofstream<> file;

  std::ostream& out = std::cout;
  std::ostream& err = std::cerr;
}
