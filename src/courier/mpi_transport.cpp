#include "courier/mpi_transport.hpp"
#include "courier/errors.hpp"
#include "logger/logger.hpp"

#include <stdexcept>

#include "fmt/format.h"

namespace courier {
  std::string error_string( int code ) {
    char buf[MPI_MAX_ERROR_STRING];
    int len = 0;
    if ( MPI_Error_string( code, buf, &len ) != MPI_SUCCESS )
      return fmt::format( "unknown MPI error {}", code );
    return std::string( buf, len );
  }

  void check( int code, const char* what ) {
    if ( code == MPI_SUCCESS ) return;
    auto msg = fmt::format( "{}: {}", what, error_string(code) );
    lgr::file << "transport error " << code << " in " << msg << std::endl;
    throw TransportError( code, msg );
  }

  namespace impl {
    void comm_release( MPI_Comm& comm ) {
      if ( comm == MPI_COMM_NULL ) return;
      int finalized = 0;
      MPI_Finalized(&finalized);
      if ( !finalized ) MPI_Comm_free(&comm);
    }

    MPI_Comm comm_null() {
      return MPI_COMM_NULL;
    }
  }

  MPI_Op mpi_op( by op ) noexcept {
    switch ( op ) {
    case by::PROD : return MPI_PROD;
    case by::MAX : return MPI_MAX;
    case by::MIN : return MPI_MIN;
    case by::LAND : return MPI_LAND;
    case by::LOR : return MPI_LOR;
    case by::LXOR : return MPI_LXOR;
    case by::BAND : return MPI_BAND;
    case by::BOR : return MPI_BOR;
    case by::BXOR : return MPI_BXOR;
    default : return MPI_SUM;
    }
  }
}

namespace courier {
  namespace {
    inline MPI_Request* unbox( Ticket t ) noexcept { return static_cast<MPI_Request*>(t.raw); }

    int error_class( int code ) {
      int cls = MPI_ERR_OTHER;
      MPI_Error_class( code, &cls );
      return cls;
    }

    // a truncated receive is reported through Status, every other failure is raised
    int settle( int rc, const char* what ) {
      if ( rc == MPI_SUCCESS ) return MPI_SUCCESS;
      if ( error_class(rc) == MPI_ERR_TRUNCATE ) return MPI_ERR_TRUNCATE;
      check( rc, what );
      return rc;
    }

    // for the multiple-completion calls, whose per-request errors sit in the statuses
    int status_error( int rc, const MPI_Status& st ) {
      if ( rc == MPI_SUCCESS ) return MPI_SUCCESS;
      if ( error_class(rc) != MPI_ERR_IN_STATUS ) return rc;
      if ( st.MPI_ERROR == MPI_SUCCESS ) return MPI_SUCCESS;
      return error_class(st.MPI_ERROR) == MPI_ERR_TRUNCATE ? MPI_ERR_TRUNCATE : st.MPI_ERROR;
    }

    Status status_of( const MPI_Status& st, int error ) {
      Status s;
      s.source = st.MPI_SOURCE;
      s.tag = st.MPI_TAG;
      s.error = error;
      int n = 0;
      if ( MPI_Get_count( &st, MPI_BYTE, &n ) == MPI_SUCCESS && n != MPI_UNDEFINED && n > 0 )
        s.bytes = static_cast<std::size_t>(n);
      int flag = 0;
      MPI_Test_cancelled( &st, &flag );
      s.cancelled = flag;
      return s;
    }

    std::vector<MPI_Request> unbox_all( const std::vector<Ticket>& tickets ) {
      std::vector<MPI_Request> raw( tickets.size(), MPI_REQUEST_NULL );
      for ( std::size_t i = 0; i < tickets.size(); ++i )
        if ( tickets[i] ) raw[i] = *unbox(tickets[i]);
      return raw;
    }

    // MPI resets completed requests to MPI_REQUEST_NULL, the boxes must see it
    void rebox_all( const std::vector<MPI_Request>& raw, const std::vector<Ticket>& tickets ) {
      for ( std::size_t i = 0; i < tickets.size(); ++i )
        if ( tickets[i] ) *unbox(tickets[i]) = raw[i];
    }
  }

  std::shared_ptr<MpiTransport> MpiTransport::adopt( MPI_Comm comm ) {
    return std::make_shared<MpiTransport>( CommHandle::adopt(comm) );
  }

  std::shared_ptr<MpiTransport> MpiTransport::borrow( MPI_Comm comm ) {
    return std::make_shared<MpiTransport>( CommHandle::borrow(comm) );
  }

  int MpiTransport::rank() const {
    int rank = 0;
    check( MPI_Comm_rank( native(), &rank ), "MPI_Comm_rank" );
    return rank;
  }

  int MpiTransport::size() const {
    int size = 0;
    check( MPI_Comm_size( native(), &size ), "MPI_Comm_size" );
    return size;
  }

  bool MpiTransport::is_inter() const {
    int flag = 0;
    check( MPI_Comm_test_inter( native(), &flag ), "MPI_Comm_test_inter" );
    return flag;
  }

  int MpiTransport::remote_size() const {
    if ( !is_inter() ) return size();
    int size = 0;
    check( MPI_Comm_remote_size( native(), &size ), "MPI_Comm_remote_size" );
    return size;
  }

  std::shared_ptr<Transport> MpiTransport::duplicate() const {
    MPI_Comm comm;
    check( MPI_Comm_dup( native(), &comm ), "MPI_Comm_dup" );
    return adopt(comm);
  }

  std::shared_ptr<Transport> MpiTransport::split( std::optional<int> color, int key ) const {
    MPI_Comm comm;
    check( MPI_Comm_split( native(), color ? *color : MPI_UNDEFINED, key, &comm ), "MPI_Comm_split" );
    if ( comm == MPI_COMM_NULL ) return nullptr;
    return adopt(comm);
  }
}

namespace courier {
  int MpiTransport::collective( const Operation& op, MPI_Request* req ) const {
    const MPI_Comm comm = native();
    const Descriptor& s = *op.send;
    const Descriptor& r = *op.recv;
    const void* sbuf = s.is_in_place() ? MPI_IN_PLACE : s.address();
    void* rbuf = r.is_in_place() ? MPI_IN_PLACE : r.address();
    const MPI_Datatype stype = s.element().native();
    const MPI_Datatype rtype = r.element().native();
    const int peers = remote_size();
    const MPI_Op o = mpi_op(op.op);

    switch ( op.kind ) {
    case Kind::BARRIER :
      return req ? MPI_Ibarrier( comm, req ) : MPI_Barrier( comm );

    case Kind::BCAST :
      return req ? MPI_Ibcast( s.address(), s.count(), stype, op.root, comm, req )
        : MPI_Bcast( s.address(), s.count(), stype, op.root, comm );

    case Kind::GATHER :
      return req ? MPI_Igather( sbuf, s.count(), stype, rbuf, r.count() / peers, rtype, op.root, comm, req )
        : MPI_Gather( sbuf, s.count(), stype, rbuf, r.count() / peers, rtype, op.root, comm );

    case Kind::GATHERV :
      return req ? MPI_Igatherv( sbuf, s.count(), stype, rbuf, r.counts_data(), r.displs_data(), rtype, op.root, comm, req )
        : MPI_Gatherv( sbuf, s.count(), stype, rbuf, r.counts_data(), r.displs_data(), rtype, op.root, comm );

    case Kind::SCATTER :
      return req ? MPI_Iscatter( sbuf, s.count() / peers, stype, rbuf, r.count(), rtype, op.root, comm, req )
        : MPI_Scatter( sbuf, s.count() / peers, stype, rbuf, r.count(), rtype, op.root, comm );

    case Kind::SCATTERV :
      return req ? MPI_Iscatterv( sbuf, s.counts_data(), s.displs_data(), stype, rbuf, r.count(), rtype, op.root, comm, req )
        : MPI_Scatterv( sbuf, s.counts_data(), s.displs_data(), stype, rbuf, r.count(), rtype, op.root, comm );

    case Kind::ALLGATHER :
      return req ? MPI_Iallgather( sbuf, s.count(), stype, rbuf, r.count() / peers, rtype, comm, req )
        : MPI_Allgather( sbuf, s.count(), stype, rbuf, r.count() / peers, rtype, comm );

    case Kind::ALLGATHERV :
      return req ? MPI_Iallgatherv( sbuf, s.count(), stype, rbuf, r.counts_data(), r.displs_data(), rtype, comm, req )
        : MPI_Allgatherv( sbuf, s.count(), stype, rbuf, r.counts_data(), r.displs_data(), rtype, comm );

    case Kind::ALLTOALL :
      return req ? MPI_Ialltoall( sbuf, s.count() / peers, stype, rbuf, r.count() / peers, rtype, comm, req )
        : MPI_Alltoall( sbuf, s.count() / peers, stype, rbuf, r.count() / peers, rtype, comm );

    case Kind::ALLTOALLV :
      return req ? MPI_Ialltoallv( sbuf, s.counts_data(), s.displs_data(), stype,
                                   rbuf, r.counts_data(), r.displs_data(), rtype, comm, req )
        : MPI_Alltoallv( sbuf, s.counts_data(), s.displs_data(), stype,
                         rbuf, r.counts_data(), r.displs_data(), rtype, comm );

    case Kind::REDUCE : {
      const int count = s.is_in_place() ? r.count() : s.count();
      return req ? MPI_Ireduce( sbuf, rbuf, count, stype, o, op.root, comm, req )
        : MPI_Reduce( sbuf, rbuf, count, stype, o, op.root, comm );
    }

    case Kind::ALLREDUCE :
      return req ? MPI_Iallreduce( sbuf, rbuf, r.count(), rtype, o, comm, req )
        : MPI_Allreduce( sbuf, rbuf, r.count(), rtype, o, comm );

    case Kind::REDUCE_SCATTER_BLOCK : {
      // in place, the receive buffer holds the whole input
      const int count = s.is_in_place() ? r.count() / size() : r.count();
      return req ? MPI_Ireduce_scatter_block( sbuf, rbuf, count, rtype, o, comm, req )
        : MPI_Reduce_scatter_block( sbuf, rbuf, count, rtype, o, comm );
    }

    case Kind::REDUCE_SCATTER :
      return req ? MPI_Ireduce_scatter( sbuf, rbuf, r.counts_data(), rtype, o, comm, req )
        : MPI_Reduce_scatter( sbuf, rbuf, r.counts_data(), rtype, o, comm );

    case Kind::SCAN :
      return req ? MPI_Iscan( sbuf, rbuf, r.count(), rtype, o, comm, req )
        : MPI_Scan( sbuf, rbuf, r.count(), rtype, o, comm );

    case Kind::EXSCAN :
      return req ? MPI_Iexscan( sbuf, rbuf, r.count(), rtype, o, comm, req )
        : MPI_Exscan( sbuf, rbuf, r.count(), rtype, o, comm );

    default :
      throw std::logic_error( fmt::format( "{} is not a collective", name(op.kind) ) );
    }
  }

  Status MpiTransport::execute( const Operation& op ) {
    const MPI_Comm comm = native();
    switch ( op.kind ) {
    case Kind::SEND : {
      const auto& s = *op.send;
      check( (*pick_send<false>(op.mode))( s.address(), s.count(), s.element().native(), op.dest, op.sendtag, comm ), "send" );
      Status st;
      st.source = op.dest;
      st.tag = op.sendtag;
      st.bytes = s.bytes();
      return st;
    }
    case Kind::RECV : {
      const auto& r = *op.recv;
      MPI_Status st;
      int rc = MPI_Recv( r.address(), r.count(), r.element().native(), op.source, op.recvtag, comm, &st );
      return status_of( st, settle( rc, "recv" ) );
    }
    case Kind::SENDRECV : {
      const auto& s = *op.send;
      const auto& r = *op.recv;
      MPI_Status st;
      int rc = MPI_Sendrecv( s.address(), s.count(), s.element().native(), op.dest, op.sendtag,
                             r.address(), r.count(), r.element().native(), op.source, op.recvtag, comm, &st );
      return status_of( st, settle( rc, "sendrecv" ) );
    }
    default :
      check( collective( op, nullptr ), name(op.kind) );
      return Status{};
    }
  }

  Envelope MpiTransport::probe( int source, int tag, bool matched ) {
    MPI_Status st;
    Envelope env;
    if ( matched ) {
      auto msg = std::make_unique<MPI_Message>( MPI_MESSAGE_NULL );
      check( MPI_Mprobe( source, tag, native(), msg.get(), &st ), "mprobe" );
      env.matched = Ticket{ msg.release() };
    } else {
      check( MPI_Probe( source, tag, native(), &st ), "probe" );
    }
    int n = 0;
    check( MPI_Get_count( &st, MPI_BYTE, &n ), "MPI_Get_count" );
    env.source = st.MPI_SOURCE;
    env.tag = st.MPI_TAG;
    env.bytes = static_cast<std::size_t>(n);
    return env;
  }

  std::optional<Envelope> MpiTransport::iprobe( int source, int tag ) {
    MPI_Status st;
    int flag = 0;
    check( MPI_Iprobe( source, tag, native(), &flag, &st ), "iprobe" );
    if ( !flag ) return std::nullopt;
    int n = 0;
    check( MPI_Get_count( &st, MPI_BYTE, &n ), "MPI_Get_count" );
    Envelope env;
    env.source = st.MPI_SOURCE;
    env.tag = st.MPI_TAG;
    env.bytes = static_cast<std::size_t>(n);
    return env;
  }

  Status MpiTransport::receive( const Descriptor& recv, Envelope& envelope ) {
    std::unique_ptr<MPI_Message> msg( static_cast<MPI_Message*>( std::exchange( envelope.matched, {} ).raw ) );
    if ( !msg ) throw std::logic_error( "receive without a matched probe" );
    MPI_Status st;
    int rc = MPI_Mrecv( recv.address(), recv.count(), recv.element().native(), msg.get(), &st );
    return status_of( st, settle( rc, "mrecv" ) );
  }
}

namespace courier {
  Ticket MpiTransport::post( const Operation& op ) {
    auto req = std::make_unique<MPI_Request>( MPI_REQUEST_NULL );
    const MPI_Comm comm = native();
    switch ( op.kind ) {
    case Kind::SEND : {
      const auto& s = *op.send;
      check( (*pick_send<true>(op.mode))( s.address(), s.count(), s.element().native(), op.dest, op.sendtag, comm, req.get() ), "isend" );
      break;
    }
    case Kind::RECV : {
      const auto& r = *op.recv;
      check( MPI_Irecv( r.address(), r.count(), r.element().native(), op.source, op.recvtag, comm, req.get() ), "irecv" );
      break;
    }
    case Kind::SENDRECV :
      throw std::invalid_argument( "sendrecv has no non-blocking form" );
    default :
      check( collective( op, req.get() ), name(op.kind) );
    }
    return Ticket{ req.release() };
  }

  Ticket MpiTransport::prepare( const Operation& op ) {
    auto req = std::make_unique<MPI_Request>( MPI_REQUEST_NULL );
    const MPI_Comm comm = native();
    switch ( op.kind ) {
    case Kind::SEND : {
      const auto& s = *op.send;
      check( (*pick_send_init(op.mode))( s.address(), s.count(), s.element().native(), op.dest, op.sendtag, comm, req.get() ), "send_init" );
      break;
    }
    case Kind::RECV : {
      const auto& r = *op.recv;
      check( MPI_Recv_init( r.address(), r.count(), r.element().native(), op.source, op.recvtag, comm, req.get() ), "recv_init" );
      break;
    }
    default :
      throw std::invalid_argument( fmt::format( "{} has no persistent form", name(op.kind) ) );
    }
    return Ticket{ req.release() };
  }

  void MpiTransport::start( Ticket ticket ) {
    check( MPI_Start( unbox(ticket) ), "MPI_Start" );
  }

  Status MpiTransport::wait( Ticket ticket ) {
    MPI_Status st;
    int rc = MPI_Wait( unbox(ticket), &st );
    return status_of( st, settle( rc, "wait" ) );
  }

  std::optional<Status> MpiTransport::test( Ticket ticket ) {
    MPI_Status st;
    int flag = 0;
    int rc = MPI_Test( unbox(ticket), &flag, &st );
    const int err = settle( rc, "test" );
    if ( !flag ) return std::nullopt;
    return status_of( st, err );
  }

  void MpiTransport::cancel( Ticket ticket ) {
    auto* req = unbox(ticket);
    if ( *req != MPI_REQUEST_NULL ) check( MPI_Cancel(req), "MPI_Cancel" );
  }

  void MpiTransport::free( Ticket ticket ) {
    std::unique_ptr<MPI_Request> req( unbox(ticket) );
    if ( req && *req != MPI_REQUEST_NULL ) check( MPI_Request_free( req.get() ), "MPI_Request_free" );
  }

  std::pair<std::size_t, Status> MpiTransport::wait_any( const std::vector<Ticket>& tickets ) {
    auto raw = unbox_all(tickets);
    int idx = MPI_UNDEFINED;
    MPI_Status st;
    int rc = MPI_Waitany( static_cast<int>(raw.size()), raw.data(), &idx, &st );
    rebox_all( raw, tickets );
    if ( idx == MPI_UNDEFINED ) {
      check( rc, "waitany" );
      return { tickets.size(), Status{} };
    }
    // the failed request is already released by MPI, its error travels in the status
    int err = rc;
    if ( rc != MPI_SUCCESS && error_class(rc) == MPI_ERR_TRUNCATE ) err = MPI_ERR_TRUNCATE;
    else if ( rc != MPI_SUCCESS ) lgr::file << "transport error " << rc << " in waitany: " << error_string(rc) << std::endl;
    return { static_cast<std::size_t>(idx), status_of( st, err ) };
  }

  std::vector<std::pair<std::size_t, Status>> MpiTransport::wait_some( const std::vector<Ticket>& tickets ) {
    auto raw = unbox_all(tickets);
    std::vector<int> idx( raw.size() );
    std::vector<MPI_Status> sts( raw.size() );
    int outcount = 0;
    int rc = MPI_Waitsome( static_cast<int>(raw.size()), raw.data(), &outcount, idx.data(), sts.data() );
    rebox_all( raw, tickets );
    if ( rc != MPI_SUCCESS && error_class(rc) != MPI_ERR_IN_STATUS ) check( rc, "waitsome" );

    std::vector<std::pair<std::size_t, Status>> done;
    if ( outcount == MPI_UNDEFINED ) return done;
    for ( int k = 0; k < outcount; ++k )
      done.emplace_back( static_cast<std::size_t>(idx[k]), status_of( sts[k], status_error( rc, sts[k] ) ) );
    return done;
  }

  std::vector<Status> MpiTransport::wait_all( const std::vector<Ticket>& tickets ) {
    auto raw = unbox_all(tickets);
    std::vector<MPI_Status> sts( raw.size() );
    int rc = MPI_Waitall( static_cast<int>(raw.size()), raw.data(), sts.data() );
    rebox_all( raw, tickets );
    if ( rc != MPI_SUCCESS && error_class(rc) != MPI_ERR_IN_STATUS ) check( rc, "waitall" );

    std::vector<Status> statuses( raw.size() );
    for ( std::size_t i = 0; i < raw.size(); ++i )
      if ( tickets[i] ) statuses[i] = status_of( sts[i], status_error( rc, sts[i] ) );
    return statuses;
  }
}
