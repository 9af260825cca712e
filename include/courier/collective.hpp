#ifndef _COURIER_COLLECTIVE_HPP_
#define _COURIER_COLLECTIVE_HPP_

#include <limits>
#include <memory>
#include <optional>
#include <vector>

#include "courier/codec.hpp"
#include "courier/errors.hpp"
#include "courier/parameters.hpp"
#include "courier/payload.hpp"
#include "courier/request.hpp"

namespace courier::impl {
  template < typename T >
  std::vector<T> decode_blocks( const std::vector<char>& bytes, const std::vector<int>& sizes ) {
    std::vector<T> res;
    res.reserve( sizes.size() );
    std::size_t offset = 0;
    for ( auto n : sizes ) {
      res.push_back( courier::decode<T>( bytes.data() + offset, static_cast<std::size_t>(n) ) );
      offset += static_cast<std::size_t>(n);
    }
    return res;
  }

  // throws CountMismatch past the largest transfer count
  int encoded_size( const std::vector<char>& bytes );

  std::size_t total_size( const std::vector<int>& sizes ) noexcept;
}

namespace courier {
  // Roots follow the intercommunicator convention on an InterComm: ROOT on the root,
  // PROC_NULL on the rest of its group, the root's rank on the remote group.
  template < typename Comm >
  struct Collective_Comm {
  private:
    inline Transport& _transport() const {
      return static_cast<const Comm&>(*this).transport();
    }

    inline std::shared_ptr<Transport> _shared() const {
      return static_cast<const Comm&>(*this).shared_transport();
    }

    void run( Kind kind, int root, by op, const Payload& send_buf, const Payload& recv_buf,
              const std::optional<std::vector<int>>& counts = std::nullopt ) const;

    Request post( Kind kind, int root, by op, const Payload& send_buf, const Payload& recv_buf,
                  const std::optional<std::vector<int>>& counts = std::nullopt ) const;

  public:
    void barrier( const char* = "" ) const; // NOTE const char* is mainly for labeling barriers for users
    Request Ibarrier() const;

    void broadcast( int root, const Payload& buffer ) const;
    Request Ibroadcast( int root, const Payload& buffer ) const;

    // recv_buf only matters on the root
    void gather( int root, const Payload& send_buf, const Payload& recv_buf ) const;
    Request Igather( int root, const Payload& send_buf, const Payload& recv_buf ) const;
    void gatherv( int root, const Payload& send_buf, const Payload& recv_buf ) const;
    Request Igatherv( int root, const Payload& send_buf, const Payload& recv_buf ) const;

    // send_buf only matters on the root
    void scatter( int root, const Payload& send_buf, const Payload& recv_buf ) const;
    Request Iscatter( int root, const Payload& send_buf, const Payload& recv_buf ) const;
    void scatterv( int root, const Payload& send_buf, const Payload& recv_buf ) const;
    Request Iscatterv( int root, const Payload& send_buf, const Payload& recv_buf ) const;

    void allgather( const Payload& send_buf, const Payload& recv_buf ) const;
    Request Iallgather( const Payload& send_buf, const Payload& recv_buf ) const;
    void allgatherv( const Payload& send_buf, const Payload& recv_buf ) const;
    Request Iallgatherv( const Payload& send_buf, const Payload& recv_buf ) const;

    void alltoall( const Payload& send_buf, const Payload& recv_buf ) const;
    Request Ialltoall( const Payload& send_buf, const Payload& recv_buf ) const;
    void alltoallv( const Payload& send_buf, const Payload& recv_buf ) const;
    Request Ialltoallv( const Payload& send_buf, const Payload& recv_buf ) const;

    void reduce( by op, int root, const Payload& send_buf, const Payload& recv_buf ) const;
    Request Ireduce( by op, int root, const Payload& send_buf, const Payload& recv_buf ) const;
    void allreduce( by op, const Payload& send_buf, const Payload& recv_buf ) const;
    Request Iallreduce( by op, const Payload& send_buf, const Payload& recv_buf ) const;

    void reduce_scatter_block( by op, const Payload& send_buf, const Payload& recv_buf ) const;
    Request Ireduce_scatter_block( by op, const Payload& send_buf, const Payload& recv_buf ) const;
    // counts[i] elements of the reduction land on rank i
    void reduce_scatter( by op, const Payload& send_buf, const Payload& recv_buf, std::vector<int> counts ) const;
    Request Ireduce_scatter( by op, const Payload& send_buf, const Payload& recv_buf, std::vector<int> counts ) const;

    void scan( by op, const Payload& send_buf, const Payload& recv_buf ) const;
    Request Iscan( by op, const Payload& send_buf, const Payload& recv_buf ) const;
    void exscan( by op, const Payload& send_buf, const Payload& recv_buf ) const;
    Request Iexscan( by op, const Payload& send_buf, const Payload& recv_buf ) const;

    // Generic objects. Each exchanges encoded lengths first, then runs the vector
    // collective with packed displacements.

    // obj is only read on the root
    template < typename T >
    T broadcast_object( int root, const T& obj ) const {
      const auto layout = Layout::of( _transport(), root );
      std::vector<char> bytes;
      if ( layout.is_root() ) bytes = courier::encode(obj);
      int n = impl::encoded_size(bytes);
      broadcast( root, n );
      if ( layout.is_idle() ) return obj;
      if ( !layout.is_root() ) bytes.resize(n);
      broadcast( root, bytes );
      return layout.is_root() ? obj : courier::decode<T>(bytes);
    }

    // the objects of all senders, in rank order, on the root only
    template < typename T >
    std::optional<std::vector<T>> gather_object( int root, const T& obj ) const {
      const auto layout = Layout::of( _transport(), root );
      std::vector<char> bytes;
      if ( sends( Kind::GATHER, layout ) ) bytes = courier::encode(obj);
      int n = impl::encoded_size(bytes);

      std::vector<int> sizes;
      if ( layout.is_root() ) sizes.resize( layout.peers() );
      gather( root, n, layout.is_root() ? Payload(sizes) : Payload() );

      std::vector<char> all;
      if ( layout.is_root() ) all.resize( impl::total_size(sizes) );
      gatherv( root, bytes, layout.is_root() ? Payload( courier::buffer(all).vectored(sizes) ) : Payload() );

      if ( !layout.is_root() ) return std::nullopt;
      return impl::decode_blocks<T>( all, sizes );
    }

    // objs is only read on the root and holds one object per receiver
    template < typename T >
    T scatter_object( int root, const std::vector<T>& objs ) const {
      const auto layout = Layout::of( _transport(), root );
      std::vector<int> sizes;
      std::vector<char> all;
      if ( layout.is_root() ) {
        if ( objs.size() != static_cast<std::size_t>( layout.peers() ) )
          throw CountMismatch( "scatter_object: one object per participant is required" );
        for ( const auto& x : objs ) {
          auto b = courier::encode(x);
          sizes.push_back( impl::encoded_size(b) );
          all.insert( all.end(), b.begin(), b.end() );
        }
      }

      int n = 0;
      const bool receiving = receives( Kind::SCATTER, layout );
      scatter( root, layout.is_root() ? Payload(sizes) : Payload(), receiving ? Payload(n) : Payload() );

      std::vector<char> mine( n );
      scatterv( root, layout.is_root() ? Payload( courier::buffer(all).vectored(sizes) ) : Payload(),
                receiving ? Payload(mine) : Payload() );
      if ( !receiving ) return T{};
      return courier::decode<T>(mine);
    }

    template < typename T >
    std::vector<T> allgather_object( const T& obj ) const {
      const auto layout = Layout::of( _transport() );
      auto bytes = courier::encode(obj);
      int n = impl::encoded_size(bytes);

      std::vector<int> sizes( layout.peers() );
      allgather( n, sizes );

      std::vector<char> all( impl::total_size(sizes) );
      allgatherv( bytes, courier::buffer(all).vectored(sizes) );
      return impl::decode_blocks<T>( all, sizes );
    }

    // objs[i] goes to participant i
    template < typename T >
    std::vector<T> alltoall_object( const std::vector<T>& objs ) const {
      const auto layout = Layout::of( _transport() );
      if ( objs.size() != static_cast<std::size_t>( layout.peers() ) )
        throw CountMismatch( "alltoall_object: one object per participant is required" );

      std::vector<int> send_sizes;
      std::vector<char> send_all;
      for ( const auto& x : objs ) {
        auto b = courier::encode(x);
        send_sizes.push_back( impl::encoded_size(b) );
        send_all.insert( send_all.end(), b.begin(), b.end() );
      }

      std::vector<int> recv_sizes( layout.peers() );
      alltoall( send_sizes, recv_sizes );

      std::vector<char> recv_all( impl::total_size(recv_sizes) );
      alltoallv( courier::buffer(send_all).vectored(send_sizes), courier::buffer(recv_all).vectored(recv_sizes) );
      return impl::decode_blocks<T>( recv_all, recv_sizes );
    }

    // fold( fold( x0, x1 ), x2 ) ... in rank order, on the root only
    template < typename T, typename F >
    std::optional<T> reduce_object( int root, const T& obj, F fold ) const {
      auto all = gather_object( root, obj );
      if ( !all || all->empty() ) return std::nullopt;
      T acc = std::move( (*all)[0] );
      for ( std::size_t i = 1; i < all->size(); ++i ) acc = fold( acc, (*all)[i] );
      return acc;
    }

    template < typename T, typename F >
    T allreduce_object( const T& obj, F fold ) const {
      auto all = allgather_object(obj);
      T acc = std::move( all[0] );
      for ( std::size_t i = 1; i < all.size(); ++i ) acc = fold( acc, all[i] );
      return acc;
    }
  };
}

#endif
