#include "courier/codec.hpp"

#include "fmt/format.h"

namespace courier {
  void Reader::read( void* dest, std::size_t n ) {
    if ( n > _left )
      throw CodecError( fmt::format("decoding needs {} more bytes but only {} are left", n, _left) );
    if ( n ) std::memcpy( dest, _p, n );
    _p += n;
    _left -= n;
  }

  std::size_t Reader::read_length() {
    length_t len = 0;
    read( &len, sizeof(len) );
    return static_cast<std::size_t>(len);
  }
}
