#include "courier/errors.hpp"

#include "fmt/format.h"

namespace courier {
  TransportError::TransportError( int code, const std::string& message )
    : Error( fmt::format("transport error {}: {}", code, message) ), _code(code) {}
}
