#include "courier/parameters.hpp"
#include "courier/errors.hpp"

#include <cstdint>

#include "fmt/format.h"

namespace courier {
  Layout Layout::of( const Transport& transport, int root ) {
    Layout l;
    l.size = transport.size();
    l.rank = transport.rank();
    l.root = root;
    l.inter = transport.is_inter();
    l.remote_size = l.inter ? transport.remote_size() : l.size;
    return l;
  }

  std::vector<int> packed_displacements( const std::vector<int>& counts ) {
    std::vector<int> displs( counts.size(), 0 );
    int acc = 0;
    for ( std::size_t i = 0; i < counts.size(); ++i ) {
      displs[i] = acc;
      acc += counts[i];
    }
    return displs;
  }

  bool sends( Kind kind, const Layout& layout ) noexcept {
    switch ( kind ) {
    case Kind::BARRIER : return false;
    case Kind::BCAST :
    case Kind::SCATTER :
    case Kind::SCATTERV : return layout.is_root();
    case Kind::GATHER :
    case Kind::GATHERV :
    case Kind::REDUCE : return !layout.inter || ( !layout.is_root() && !layout.is_idle() );
    default : return !layout.is_idle();
    }
  }

  bool receives( Kind kind, const Layout& layout ) noexcept {
    switch ( kind ) {
    case Kind::BARRIER : return false;
    case Kind::GATHER :
    case Kind::GATHERV :
    case Kind::REDUCE : return layout.is_root();
    case Kind::BCAST : return !layout.is_root() && !layout.is_idle();
    case Kind::SCATTER :
    case Kind::SCATTERV : return !layout.inter || ( !layout.is_root() && !layout.is_idle() );
    default : return !layout.is_idle();
    }
  }
}

namespace courier {
  namespace {
    std::int64_t total( const std::vector<int>& counts ) {
      std::int64_t s = 0;
      for ( auto c : counts ) s += c;
      return s;
    }

    int count_of( const Buffer* b ) noexcept { return b ? b->count : 0; }

    void check_counts( const std::string& what, const std::vector<int>& counts, int peers ) {
      if ( counts.size() != static_cast<std::size_t>(peers) )
        throw CountMismatch( fmt::format( "{}: {} counts given for {} participants", what, counts.size(), peers ) );
      for ( std::size_t i = 0; i < counts.size(); ++i )
        if ( counts[i] < 0 )
          throw CountMismatch( fmt::format( "{}: negative count {} for participant {}", what, counts[i], i ) );
    }

    // counts and displacements of one vector side. Missing counts fall back to an equal
    // split of the buffer, missing displacements to the packed layout
    void vector_side( const std::string& what, const Buffer& b, int peers,
                      std::vector<int>& counts, std::vector<int>& displs ) {
      if ( b.counts ) {
        counts = *b.counts;
      } else {
        if ( b.displs )
          throw CountMismatch( fmt::format( "{}: displacements given without counts", what ) );
        if ( peers == 0 || b.count % peers != 0 )
          throw CountMismatch( fmt::format( "{}: {} elements do not split evenly over {} participants", what, b.count, peers ) );
        counts.assign( peers, b.count / peers );
      }
      check_counts( what, counts, peers );

      if ( b.displs ) {
        displs = *b.displs;
        if ( displs.size() != counts.size() )
          throw CountMismatch( fmt::format( "{}: {} displacements given for {} participants", what, displs.size(), peers ) );
        // overlap and ordering are the caller's business, staying inside the buffer is not
        for ( std::size_t i = 0; i < counts.size(); ++i ) {
          if ( counts[i] == 0 ) continue;
          if ( displs[i] < 0 || static_cast<std::int64_t>(displs[i]) + counts[i] > b.count )
            throw CountMismatch( fmt::format( "{}: block {} of {} elements at displacement {} overruns a buffer of {}",
                                              what, i, counts[i], displs[i], b.count ) );
        }
      } else {
        if ( total(counts) != b.count )
          throw CountMismatch( fmt::format( "{}: counts sum to {} but the buffer holds {} elements",
                                            what, total(counts), b.count ) );
        displs = packed_displacements(counts);
      }
    }

    void check_equal( const char* what, int sent, int received ) {
      if ( sent != received )
        throw CountMismatch( fmt::format( "{}: {} elements sent against {} received", what, sent, received ) );
    }

    void check_divisible( const char* what, int count, int peers ) {
      if ( peers == 0 || count % peers != 0 )
        throw CountMismatch( fmt::format( "{}: {} elements do not split evenly over {} participants", what, count, peers ) );
    }
  }

  ParameterSet derive_collective( Kind kind, const Layout& layout, const Buffer* send, const Buffer* recv,
                                  const std::optional<std::vector<int>>& counts ) {
    ParameterSet ps;
    const int n = layout.peers();
    const bool send_in_place = send && send->in_place;
    const bool recv_in_place = recv && recv->in_place;
    const char* what = name(kind);

    switch ( kind ) {
    case Kind::GATHER :
      if ( !layout.is_root() ) break;
      check_divisible( what, count_of(recv), n );
      if ( !layout.inter && !send_in_place ) check_equal( what, count_of(send), count_of(recv) / n );
      break;

    case Kind::GATHERV :
      if ( !layout.is_root() ) break;
      if ( !recv ) throw CountMismatch( "gatherv: the root needs a receive buffer" );
      vector_side( "gatherv receive", *recv, n, ps.recv_counts, ps.recv_displs );
      if ( !layout.inter && !send_in_place ) check_equal( what, count_of(send), ps.recv_counts[layout.rank] );
      break;

    case Kind::SCATTER :
      if ( !layout.is_root() ) break;
      check_divisible( what, count_of(send), n );
      if ( !layout.inter && !recv_in_place ) check_equal( what, count_of(send) / n, count_of(recv) );
      break;

    case Kind::SCATTERV :
      if ( !layout.is_root() ) break;
      if ( !send ) throw CountMismatch( "scatterv: the root needs a send buffer" );
      vector_side( "scatterv send", *send, n, ps.send_counts, ps.send_displs );
      if ( !layout.inter && !recv_in_place ) check_equal( what, ps.send_counts[layout.rank], count_of(recv) );
      break;

    case Kind::ALLGATHER :
      check_divisible( what, count_of(recv), n );
      if ( !layout.inter && !send_in_place ) check_equal( what, count_of(send), count_of(recv) / n );
      break;

    case Kind::ALLGATHERV :
      if ( !recv ) throw CountMismatch( "allgatherv: a receive buffer is required" );
      vector_side( "allgatherv receive", *recv, n, ps.recv_counts, ps.recv_displs );
      if ( !layout.inter && !send_in_place ) check_equal( what, count_of(send), ps.recv_counts[layout.rank] );
      break;

    case Kind::ALLTOALL :
      check_divisible( what, count_of(recv), n );
      if ( send_in_place ) break;
      check_divisible( what, count_of(send), n );
      if ( !layout.inter ) check_equal( what, count_of(send), count_of(recv) );
      break;

    case Kind::ALLTOALLV :
      if ( !recv ) throw CountMismatch( "alltoallv: a receive buffer is required" );
      vector_side( "alltoallv receive", *recv, n, ps.recv_counts, ps.recv_displs );
      if ( send_in_place ) break;
      if ( !send ) throw CountMismatch( "alltoallv: a send buffer is required" );
      vector_side( "alltoallv send", *send, n, ps.send_counts, ps.send_displs );
      break;

    case Kind::REDUCE :
      if ( layout.is_root() && !layout.inter && !send_in_place )
        check_equal( what, count_of(send), count_of(recv) );
      break;

    case Kind::ALLREDUCE :
    case Kind::SCAN :
    case Kind::EXSCAN :
      if ( !send_in_place ) check_equal( what, count_of(send), count_of(recv) );
      break;

    case Kind::REDUCE_SCATTER_BLOCK :
      if ( send_in_place ) check_divisible( what, count_of(recv), layout.size );
      else if ( !layout.inter ) check_equal( what, count_of(send), count_of(recv) * layout.size );
      break;

    case Kind::REDUCE_SCATTER : {
      // the split of a reduce_scatter is never guessed
      if ( !counts ) throw CountMismatch( "reduce_scatter: per-participant counts are required" );
      check_counts( what, *counts, layout.size );
      const int in = send_in_place ? count_of(recv) : count_of(send);
      if ( !layout.inter && total(*counts) != in )
        throw CountMismatch( fmt::format( "reduce_scatter: counts sum to {} but {} elements are reduced", total(*counts), in ) );
      if ( !send_in_place && count_of(recv) < (*counts)[layout.rank] )
        throw CountMismatch( fmt::format( "reduce_scatter: receive buffer of {} elements is short of {}",
                                          count_of(recv), (*counts)[layout.rank] ) );
      ps.recv_counts = *counts;
      ps.recv_displs = packed_displacements(*counts);
      break;
    }

    default :
      break;
    }
    return ps;
  }
}
