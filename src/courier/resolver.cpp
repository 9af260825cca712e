#include "courier/resolver.hpp"
#include "courier/errors.hpp"

#include "fmt/format.h"

namespace courier {
  namespace {
    void reject_opaque( const Payload& payload, const char* role ) {
      if ( const auto* o = payload.opaque() )
        throw UnsupportedPayload( fmt::format( "cannot {} a value of type {}: it is neither buffer-like nor encodable",
                                               role, o->type_name ) );
    }

    void check_point_to_point( const Buffer& b ) {
      if ( b.in_place )
        throw UnsupportedPayload( "IN_PLACE is only meaningful to collectives" );
      if ( b.counts || b.displs )
        throw UnsupportedPayload( "per-participant counts are only meaningful to vector collectives" );
    }

    const Buffer* collective_buffer( const Payload& payload, Kind kind, const char* role ) {
      if ( const auto* o = payload.opaque() )
        throw UnsupportedPayload( fmt::format( "{}: {} payload of type {} is not buffer-like", name(kind), role, o->type_name ) );
      if ( const auto* o = payload.object() )
        throw UnsupportedPayload( fmt::format( "{}: generic {} payload of type {} goes through the object collectives",
                                               name(kind), role, o->type_name ) );
      return payload.buffer();
    }

    Element element_of( const Buffer* b ) {
      return ( b && !b->in_place ) ? b->element : byte_element();
    }

    // other is the element of the opposite side, used where this side has none of its own
    Descriptor collective_side( const Buffer* b, bool active, std::vector<int>& counts,
                                std::vector<int>& displs, const Element& other ) {
      if ( b && b->in_place ) return Descriptor::in_place( other, b->count );
      if ( !active ) return Descriptor::empty( b ? b->element : other );
      // derived counts go out even without a buffer, the engine reads them on every rank
      if ( !counts.empty() ) {
        if ( !b ) return Descriptor::vectored( nullptr, 0, other, std::move(counts), std::move(displs) );
        return Descriptor::vectored( b->address, b->count, b->element, std::move(counts), std::move(displs) );
      }
      if ( !b ) return Descriptor::empty(other);
      return Descriptor( b->address, b->count, b->element );
    }
  }

  Descriptor resolve_send( const Payload& payload, int dest ) {
    reject_opaque( payload, "send" );
    if ( const auto* b = payload.buffer() ) {
      check_point_to_point(*b);
      Descriptor d( b->address, b->count, b->element );
      if ( dest == PROC_NULL ) return Descriptor::empty( b->element );
      return d;
    }
    if ( const auto* o = payload.object() ) {
      if ( dest == PROC_NULL ) return Descriptor::owning({});
      return Descriptor::owning( o->encode() );
    }
    return Descriptor::owning({});
  }

  bool is_temporary( const Payload& payload ) noexcept {
    const auto* b = payload.buffer();
    return b && b->temporary;
  }

  bool is_generic_receive( const Payload& payload ) noexcept {
    return payload.object() || payload.is_empty();
  }

  Descriptor resolve_recv( const Payload& payload, int source, int tag, Transport& transport,
                           Envelope& envelope, bool matched ) {
    reject_opaque( payload, "receive" );
    if ( const auto* b = payload.buffer() ) {
      check_point_to_point(*b);
      if ( b->read_only )
        throw UnsupportedPayload( fmt::format( "cannot receive into a read-only buffer of {}", b->element.name() ) );
      Descriptor d( b->address, b->count, b->element );
      if ( source == PROC_NULL ) return Descriptor::empty( b->element );
      return d;
    }
    if ( const auto* o = payload.object(); o && !o->decode )
      throw UnsupportedPayload( fmt::format( "cannot receive into a read-only object of type {}", o->type_name ) );

    if ( source == PROC_NULL ) return Descriptor::owning({});
    envelope = transport.probe( source, tag, matched );
    return Descriptor::owning( std::vector<char>( envelope.bytes ) );
  }

  Message resolve_collective( Kind kind, const Layout& layout, const Payload& send, const Payload& recv,
                              const std::optional<std::vector<int>>& counts ) {
    const Buffer* sb = collective_buffer( send, kind, "send" );
    const Buffer* rb = collective_buffer( recv, kind, "receive" );
    const bool send_in_place = sb && sb->in_place;
    const bool recv_in_place = rb && rb->in_place;

    if ( layout.inter && ( send_in_place || recv_in_place ) )
      throw UnsupportedPayload( fmt::format( "{}: IN_PLACE is not defined on an intercommunicator", name(kind) ) );
    if ( send_in_place && recv_in_place )
      throw UnsupportedPayload( fmt::format( "{}: only one side may be IN_PLACE", name(kind) ) );

    // bcast carries its one buffer on the send side and writes it on receivers
    const bool send_active = kind == Kind::BCAST ? !layout.is_idle() : sends( kind, layout );
    const bool recv_active = receives( kind, layout );
    if ( kind == Kind::BCAST && recv_active && sb && sb->read_only )
      throw UnsupportedPayload( "bcast: a receiving participant passed a read-only buffer" );
    if ( recv_active && rb && rb->read_only && !recv_in_place )
      throw UnsupportedPayload( fmt::format( "{}: cannot receive into a read-only buffer", name(kind) ) );

    auto ps = derive_collective( kind, layout, sb, rb, counts );

    Message m;
    m.send = collective_side( sb, send_active, ps.send_counts, ps.send_displs, element_of(rb) );
    m.recv = collective_side( rb, recv_active, ps.recv_counts, ps.recv_displs,
                              sb && !send_in_place ? sb->element : element_of(rb) );
    return m;
  }
}
