#include "courier/courier.hpp"
#include "courier/errors.hpp"
#include "courier/resolver.hpp"
#include "logger/logger.hpp"

#include "fmt/format.h"

namespace courier {
  namespace {
    Status receive_into( Transport& transport, const Descriptor& d, int source_rank, int tag ) {
      Operation op;
      op.kind = Kind::RECV;
      op.recv = &d;
      op.source = source_rank;
      op.recvtag = tag;
      return transport.execute(op);
    }

    // receives exactly the message a generic receive has probed
    Status receive_probed( Transport& transport, const Descriptor& d, Envelope& env ) {
      if ( env.matched ) return transport.receive( d, env );
      return receive_into( transport, d, env.source, env.tag );
    }

    void check_truncation( const Status& s ) {
      if ( !s.truncated() ) return;
      lgr::file << "truncated recv from " << s.source << " with tag " << s.tag << std::endl;
      throw BufferSizeMismatch( fmt::format( "message from {} with tag {} does not fit the receive buffer", s.source, s.tag ) );
    }

    Operation send_operation( const Descriptor* d, int dest_rank, int tag, SendMode mode ) {
      Operation op;
      op.kind = Kind::SEND;
      op.send = d;
      op.dest = dest_rank;
      op.sendtag = tag;
      op.mode = mode;
      return op;
    }

    Operation recv_operation( const Descriptor* d, int source_rank, int tag ) {
      Operation op;
      op.kind = Kind::RECV;
      op.recv = d;
      op.source = source_rank;
      op.recvtag = tag;
      return op;
    }
  }

  template < typename Comm >
  Status P2P_Comm<Comm>::send( int dest_rank, int tag, const Payload& send_buf, SendMode mode ) const {
    auto d = resolve_send( send_buf, dest_rank );
    if ( dest_rank == PROC_NULL ) return Status{};
    return _transport().execute( send_operation( &d, dest_rank, tag, mode ) );
  }

  template < typename Comm >
  Request P2P_Comm<Comm>::Isend( int dest_rank, int tag, const Payload& send_buf, SendMode mode ) const {
    auto message = std::make_unique<Message>();
    message->send = resolve_send( send_buf, dest_rank );
    if ( dest_rank == PROC_NULL ) return Request::completed();
    if ( is_temporary(send_buf) ) message->send.retain();
    return Request::issue( _shared(), send_operation( nullptr, dest_rank, tag, mode ), std::move(message) );
  }

  template < typename Comm >
  Request P2P_Comm<Comm>::send_init( int dest_rank, int tag, const Payload& send_buf, SendMode mode ) const {
    auto message = std::make_unique<Message>();
    message->send = resolve_send( send_buf, dest_rank );
    if ( is_temporary(send_buf) ) message->send.retain();
    return Request::persist( dest_rank == PROC_NULL ? nullptr : _shared(),
                             send_operation( nullptr, dest_rank, tag, mode ), std::move(message) );
  }

  template < typename Comm >
  Status P2P_Comm<Comm>::recv( int source_rank, int tag, const Payload& recv_buf ) const {
    Envelope env;
    const bool generic = is_generic_receive(recv_buf);
    auto d = resolve_recv( recv_buf, source_rank, tag, _transport(), env, config().recv_mprobe );
    if ( source_rank == PROC_NULL ) return Status{};

    auto s = generic ? receive_probed( _transport(), d, env ) : receive_into( _transport(), d, source_rank, tag );
    check_truncation(s);
    if ( const auto* o = recv_buf.object() ) o->decode( d.scratch().data(), s.bytes );
    return s;
  }

  template < typename Comm >
  Descriptor P2P_Comm<Comm>::recv_generic( int source_rank, int tag, Status& status ) const {
    Envelope env;
    auto d = resolve_recv( Payload(), source_rank, tag, _transport(), env, config().recv_mprobe );
    status = Status{};
    if ( source_rank == PROC_NULL ) return d;
    status = receive_probed( _transport(), d, env );
    check_truncation(status);
    return d;
  }

  template < typename Comm >
  Request P2P_Comm<Comm>::Irecv( int source_rank, int tag, const Payload& recv_buf ) const {
    if ( is_generic_receive(recv_buf) )
      throw UnsupportedPayload( "Irecv needs a buffer-like payload, generic receives go through Irecv_object" );
    Envelope env;
    auto message = std::make_unique<Message>();
    message->recv = resolve_recv( recv_buf, source_rank, tag, _transport(), env, false );
    if ( source_rank == PROC_NULL ) return Request::completed();
    return Request::issue( _shared(), recv_operation( nullptr, source_rank, tag ), std::move(message) );
  }

  template < typename Comm >
  Request P2P_Comm<Comm>::recv_init( int source_rank, int tag, const Payload& recv_buf ) const {
    if ( is_generic_receive(recv_buf) )
      throw UnsupportedPayload( "recv_init needs a buffer-like payload" );
    Envelope env;
    auto message = std::make_unique<Message>();
    message->recv = resolve_recv( recv_buf, source_rank, tag, _transport(), env, false );
    return Request::persist( source_rank == PROC_NULL ? nullptr : _shared(),
                             recv_operation( nullptr, source_rank, tag ), std::move(message) );
  }

  template < typename Comm >
  Request P2P_Comm<Comm>::Irecv_bytes( int source_rank, int tag, std::size_t capacity ) const {
    if ( source_rank == PROC_NULL ) return Request::completed();
    auto message = std::make_unique<Message>();
    message->recv = Descriptor::owning( std::vector<char>( capacity ? capacity : config().irecv_bufsz ) );
    return Request::issue( _shared(), recv_operation( nullptr, source_rank, tag ), std::move(message) );
  }

  template < typename Comm >
  Status P2P_Comm<Comm>::sendrecv( int dest_rank, int send_tag, const Payload& send_buf,
                                   int source_rank, int recv_tag, const Payload& recv_buf ) const {
    if ( is_generic_receive(recv_buf) ) {
      // a probe ahead of the send would deadlock a symmetric exchange
      auto req = Isend( dest_rank, send_tag, send_buf );
      auto s = recv( source_rank, recv_tag, recv_buf );
      req.wait();
      return s;
    }

    Envelope env;
    auto sd = resolve_send( send_buf, dest_rank );
    auto rd = resolve_recv( recv_buf, source_rank, recv_tag, _transport(), env, false );
    if ( dest_rank == PROC_NULL && source_rank == PROC_NULL ) return Status{};
    if ( dest_rank == PROC_NULL ) {
      auto s = receive_into( _transport(), rd, source_rank, recv_tag );
      check_truncation(s);
      return s;
    }
    if ( source_rank == PROC_NULL ) {
      _transport().execute( send_operation( &sd, dest_rank, send_tag, SendMode::STD ) );
      return Status{};
    }

    Operation op = send_operation( &sd, dest_rank, send_tag, SendMode::STD );
    op.kind = Kind::SENDRECV;
    op.recv = &rd;
    op.source = source_rank;
    op.recvtag = recv_tag;
    auto s = _transport().execute(op);
    check_truncation(s);
    return s;
  }

  template < typename Comm >
  Envelope P2P_Comm<Comm>::probe( int source_rank, int tag ) const {
    if ( source_rank == PROC_NULL ) return Envelope{};
    return _transport().probe( source_rank, tag, false );
  }

  template < typename Comm >
  std::optional<Envelope> P2P_Comm<Comm>::iprobe( int source_rank, int tag ) const {
    if ( source_rank == PROC_NULL ) return Envelope{};
    return _transport().iprobe( source_rank, tag );
  }
}

namespace courier {
  template struct P2P_Comm<Comm>;
}
