#ifndef _COURIER_P2P_HPP_
#define _COURIER_P2P_HPP_

#include <memory>
#include <optional>

#include "courier/payload.hpp"
#include "courier/request.hpp"
#include "courier/transport.hpp"

namespace courier {
  template < typename Comm >
  struct P2P_Comm {
  private:
    inline Transport& _transport() const {
      return static_cast<const Comm&>(*this).transport();
    }

    inline std::shared_ptr<Transport> _shared() const {
      return static_cast<const Comm&>(*this).shared_transport();
    }

    // probes, sizes scratch to the probed message and receives it. The returned
    // descriptor owns the bytes
    Descriptor recv_generic( int source_rank, int tag, Status& status ) const;

    Request Irecv_bytes( int source_rank, int tag, std::size_t capacity ) const;

  public:
    // a PROC_NULL peer returns an empty status without touching the transport
    Status send( int dest_rank, int tag, const Payload& send_buf, SendMode mode = SendMode::STD ) const;
    Request Isend( int dest_rank, int tag, const Payload& send_buf, SendMode mode = SendMode::STD ) const;
    Request send_init( int dest_rank, int tag, const Payload& send_buf, SendMode mode = SendMode::STD ) const;

    // objects and nullptr are received generically, nullptr discards the message
    Status recv( int source_rank, int tag, const Payload& recv_buf ) const;
    // buffer-like payloads only. Generic receives go through Irecv_object
    Request Irecv( int source_rank, int tag, const Payload& recv_buf ) const;
    Request recv_init( int source_rank, int tag, const Payload& recv_buf ) const;

    Status sendrecv( int dest_rank, int send_tag, const Payload& send_buf,
                     int source_rank, int recv_tag, const Payload& recv_buf ) const;

    Envelope probe( int source_rank = ANY_SOURCE, int tag = ANY_TAG ) const;
    std::optional<Envelope> iprobe( int source_rank = ANY_SOURCE, int tag = ANY_TAG ) const;

    template < typename T >
    inline Status send_object( int dest_rank, int tag, const T& obj, SendMode mode = SendMode::STD ) const {
      return send( dest_rank, tag, courier::object(obj), mode );
    }

    template < typename T >
    inline Request Isend_object( int dest_rank, int tag, const T& obj, SendMode mode = SendMode::STD ) const {
      return Isend( dest_rank, tag, courier::object(obj), mode );
    }

    // nullopt when source_rank is PROC_NULL
    template < typename T >
    std::optional<T> recv_object( int source_rank = ANY_SOURCE, int tag = ANY_TAG, Status* status = nullptr ) const {
      Status s;
      auto d = recv_generic( source_rank, tag, s );
      if ( status ) *status = s;
      if ( source_rank == PROC_NULL ) return std::nullopt;
      return courier::decode<T>( d.scratch().data(), s.bytes );
    }

    // receives into scratch of capacity bytes, the configured irecv_bufsz when 0. A
    // larger message fails with BufferSizeMismatch at completion
    template < typename T >
    inline ObjectRequest<T> Irecv_object( int source_rank = ANY_SOURCE, int tag = ANY_TAG, std::size_t capacity = 0 ) const {
      return ObjectRequest<T>( Irecv_bytes( source_rank, tag, capacity ) );
    }

    template < typename S, typename R = S >
    std::optional<R> sendrecv_object( int dest_rank, int send_tag, const S& obj,
                                      int source_rank = ANY_SOURCE, int recv_tag = ANY_TAG ) const {
      auto req = Isend_object( dest_rank, send_tag, obj );
      auto res = recv_object<R>( source_rank, recv_tag );
      req.wait();
      return res;
    }
  };
}

#endif
