#ifndef _COURIER_RESOLVER_HPP_
#define _COURIER_RESOLVER_HPP_

#include <optional>
#include <vector>

#include "courier/parameters.hpp"
#include "courier/payload.hpp"
#include "courier/transport.hpp"

// Turns caller payloads into descriptors. Everything here fails before the
// transport is asked to move a byte.
namespace courier {
  // Buffers are described in place. Objects are encoded into scratch owned by the
  // descriptor. A PROC_NULL peer yields an empty descriptor.
  Descriptor resolve_send( const Payload& payload, int dest );

  // rvalue buffers, which requests outliving the call copy into their Message
  bool is_temporary( const Payload& payload ) noexcept;

  // objects and empty payloads are received through probe and scratch
  bool is_generic_receive( const Payload& payload ) noexcept;

  // A generic receive probes the transport first, matched when asked, and sizes the
  // scratch to exactly the probed byte count. envelope is left untouched otherwise.
  Descriptor resolve_recv( const Payload& payload, int source, int tag, Transport& transport,
                           Envelope& envelope, bool matched );

  Message resolve_collective( Kind kind, const Layout& layout, const Payload& send, const Payload& recv,
                              const std::optional<std::vector<int>>& counts = std::nullopt );
}

#endif
