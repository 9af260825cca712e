#include "courier/courier.hpp"
#include "courier/resolver.hpp"

#include <limits>

#include "fmt/format.h"

namespace courier::impl {
  int encoded_size( const std::vector<char>& bytes ) {
    if ( bytes.size() > static_cast<std::size_t>( std::numeric_limits<int>::max() ) )
      throw CountMismatch( fmt::format( "encoded object of {} bytes exceeds the largest transfer count", bytes.size() ) );
    return static_cast<int>( bytes.size() );
  }

  std::size_t total_size( const std::vector<int>& sizes ) noexcept {
    std::size_t n = 0;
    for ( auto s : sizes ) n += static_cast<std::size_t>(s);
    return n;
  }
}

namespace courier {
  template < typename Comm >
  void Collective_Comm<Comm>::run( Kind kind, int root, by op, const Payload& send_buf, const Payload& recv_buf,
                                   const std::optional<std::vector<int>>& counts ) const {
    auto& transport = _transport();
    auto message = resolve_collective( kind, Layout::of( transport, root ), send_buf, recv_buf, counts );
    Operation o;
    o.kind = kind;
    o.send = &message.send;
    o.recv = &message.recv;
    o.root = root;
    o.op = op;
    transport.execute(o);
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::post( Kind kind, int root, by op, const Payload& send_buf, const Payload& recv_buf,
                                       const std::optional<std::vector<int>>& counts ) const {
    auto transport = _shared();
    auto message = std::make_unique<Message>(
      resolve_collective( kind, Layout::of( *transport, root ), send_buf, recv_buf, counts ) );
    if ( is_temporary(send_buf) ) message->send.retain();
    Operation o;
    o.kind = kind;
    o.root = root;
    o.op = op;
    return Request::issue( std::move(transport), o, std::move(message) );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::barrier( const char* ) const {
    run( Kind::BARRIER, 0, by::SUM, {}, {} );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Ibarrier() const {
    return post( Kind::BARRIER, 0, by::SUM, {}, {} );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::broadcast( int root, const Payload& buffer ) const {
    run( Kind::BCAST, root, by::SUM, buffer, {} );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Ibroadcast( int root, const Payload& buffer ) const {
    return post( Kind::BCAST, root, by::SUM, buffer, {} );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::gather( int root, const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::GATHER, root, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Igather( int root, const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::GATHER, root, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::gatherv( int root, const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::GATHERV, root, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Igatherv( int root, const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::GATHERV, root, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::scatter( int root, const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::SCATTER, root, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Iscatter( int root, const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::SCATTER, root, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::scatterv( int root, const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::SCATTERV, root, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Iscatterv( int root, const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::SCATTERV, root, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::allgather( const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::ALLGATHER, 0, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Iallgather( const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::ALLGATHER, 0, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::allgatherv( const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::ALLGATHERV, 0, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Iallgatherv( const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::ALLGATHERV, 0, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::alltoall( const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::ALLTOALL, 0, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Ialltoall( const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::ALLTOALL, 0, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::alltoallv( const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::ALLTOALLV, 0, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Ialltoallv( const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::ALLTOALLV, 0, by::SUM, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::reduce( by op, int root, const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::REDUCE, root, op, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Ireduce( by op, int root, const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::REDUCE, root, op, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::allreduce( by op, const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::ALLREDUCE, 0, op, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Iallreduce( by op, const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::ALLREDUCE, 0, op, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::reduce_scatter_block( by op, const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::REDUCE_SCATTER_BLOCK, 0, op, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Ireduce_scatter_block( by op, const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::REDUCE_SCATTER_BLOCK, 0, op, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::reduce_scatter( by op, const Payload& send_buf, const Payload& recv_buf,
                                              std::vector<int> counts ) const {
    run( Kind::REDUCE_SCATTER, 0, op, send_buf, recv_buf, std::move(counts) );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Ireduce_scatter( by op, const Payload& send_buf, const Payload& recv_buf,
                                                  std::vector<int> counts ) const {
    return post( Kind::REDUCE_SCATTER, 0, op, send_buf, recv_buf, std::move(counts) );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::scan( by op, const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::SCAN, 0, op, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Iscan( by op, const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::SCAN, 0, op, send_buf, recv_buf );
  }

  template < typename Comm >
  void Collective_Comm<Comm>::exscan( by op, const Payload& send_buf, const Payload& recv_buf ) const {
    run( Kind::EXSCAN, 0, op, send_buf, recv_buf );
  }

  template < typename Comm >
  Request Collective_Comm<Comm>::Iexscan( by op, const Payload& send_buf, const Payload& recv_buf ) const {
    return post( Kind::EXSCAN, 0, op, send_buf, recv_buf );
  }
}

namespace courier {
  template struct Collective_Comm<Comm>;
}
