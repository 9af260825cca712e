#include "courier/transport.hpp"

#include <thread>

namespace courier {
  const char* name( Kind kind ) noexcept {
    switch ( kind ) {
    case Kind::SEND : return "send";
    case Kind::RECV : return "recv";
    case Kind::SENDRECV : return "sendrecv";
    case Kind::BARRIER : return "barrier";
    case Kind::BCAST : return "bcast";
    case Kind::GATHER : return "gather";
    case Kind::GATHERV : return "gatherv";
    case Kind::SCATTER : return "scatter";
    case Kind::SCATTERV : return "scatterv";
    case Kind::ALLGATHER : return "allgather";
    case Kind::ALLGATHERV : return "allgatherv";
    case Kind::ALLTOALL : return "alltoall";
    case Kind::ALLTOALLV : return "alltoallv";
    case Kind::REDUCE : return "reduce";
    case Kind::ALLREDUCE : return "allreduce";
    case Kind::REDUCE_SCATTER_BLOCK : return "reduce_scatter_block";
    case Kind::REDUCE_SCATTER : return "reduce_scatter";
    case Kind::SCAN : return "scan";
    case Kind::EXSCAN : return "exscan";
    }
    return "unknown";
  }

  // returns tickets.size() as the index when no ticket is live
  std::pair<std::size_t, Status> Transport::wait_any( const std::vector<Ticket>& tickets ) {
    bool any = false;
    for ( const auto& t : tickets ) any = any || static_cast<bool>(t);
    if ( !any ) return { tickets.size(), Status{} };
    while ( true ) {
      for ( std::size_t i = 0; i < tickets.size(); ++i ) {
        if ( !tickets[i] ) continue;
        if ( auto s = test(tickets[i]) ) return { i, *s };
      }
      std::this_thread::yield();
    }
  }

  std::vector<std::pair<std::size_t, Status>> Transport::wait_some( const std::vector<Ticket>& tickets ) {
    std::vector<std::pair<std::size_t, Status>> done;
    auto first = wait_any(tickets);
    if ( first.first == tickets.size() ) return done;
    done.push_back(first);
    for ( std::size_t i = first.first + 1; i < tickets.size(); ++i ) {
      if ( !tickets[i] ) continue;
      if ( auto s = test(tickets[i]) ) done.emplace_back( i, *s );
    }
    return done;
  }

  std::vector<Status> Transport::wait_all( const std::vector<Ticket>& tickets ) {
    std::vector<Status> statuses( tickets.size() );
    for ( std::size_t i = 0; i < tickets.size(); ++i )
      if ( tickets[i] ) statuses[i] = wait(tickets[i]);
    return statuses;
  }
}
