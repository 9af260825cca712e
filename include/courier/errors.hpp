#ifndef _COURIER_ERRORS_HPP_
#define _COURIER_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace courier {
  struct Error : public std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // payload is neither buffer-like nor encodable. Raised before any transport call
  struct UnsupportedPayload : public Error {
    using Error::Error;
  };

  // caller-declared counts or displacements are inconsistent. Raised before any transport call
  struct CountMismatch : public Error {
    using Error::Error;
  };

  // the engine truncated an incoming message into a smaller receive buffer
  struct BufferSizeMismatch : public Error {
    using Error::Error;
  };

  struct InvalidRequestState : public Error {
    using Error::Error;
  };

  struct CodecError : public Error {
    using Error::Error;
  };

  // engine-level failure, propagated verbatim
  struct TransportError : public Error {
  private:
    int _code = 0;

  public:
    TransportError( int code, const std::string& message );

    inline int code() const noexcept { return _code; }
  };
}

#endif
