#include "courier/courier.hpp"
#include "fake_transport.hpp"
#include "catch2/catch.hpp"

#include <map>
#include <string>
#include <vector>

using namespace courier;

namespace {
  struct NotEncodable {
    std::string name;
  };

  // restores the global configuration on scope exit
  struct ConfigGuard {
    Config saved = config();
    ~ConfigGuard() { configure(saved); }
  };
}

SCENARIO("buffer-like point to point", "[courier][p2p]") {
  auto t = fake::make();
  Comm comm(t);
  std::vector<double> a { 1.5, 2.5, 3.5 };

  comm.send( 0, 3, a );
  REQUIRE( t->executes == 1 );

  SECTION("received into a buffer of the same size") {
    std::vector<double> b(3);
    auto s = comm.recv( 0, 3, b );
    REQUIRE( b == a );
    REQUIRE( s.source == 0 );
    REQUIRE( s.tag == 3 );
    REQUIRE( s.count( element<double>() ) == 3 );
    REQUIRE( t->probes == 0 );
  }

  SECTION("received into a buffer too small") {
    std::vector<double> b(2);
    REQUIRE_THROWS_AS( comm.recv( 0, 3, b ), BufferSizeMismatch );
  }

  SECTION("received into a larger buffer") {
    std::vector<double> b(5, 0.0);
    auto s = comm.recv( ANY_SOURCE, ANY_TAG, b );
    REQUIRE( s.count( element<double>() ) == 3 );
    REQUIRE( b[2] == 3.5 );
    REQUIRE( b[3] == 0.0 );
  }
}

SCENARIO("generic point to point", "[courier][p2p]") {
  auto t = fake::make();
  Comm comm(t);
  std::map<std::string, int> m { {"e", 1}, {"p", 2} };
  comm.send_object( 0, 8, m );

  SECTION("matched probe") {
    auto got = comm.recv_object<std::map<std::string, int>>( 0, 8 );
    REQUIRE( got );
    REQUIRE( *got == m );
    REQUIRE( t->probes == 1 );
    REQUIRE( t->receives == 1 );
  }

  SECTION("plain probe") {
    ConfigGuard guard;
    Config cfg = config();
    cfg.recv_mprobe = false;
    configure(cfg);

    std::map<std::string, int> got;
    comm.recv( 0, 8, got );
    REQUIRE( got == m );
    REQUIRE( t->receives == 0 );
    REQUIRE( t->executes == 2 );
  }

  SECTION("discarded") {
    comm.recv( 0, 8, nullptr );
    REQUIRE( t->mailbox.empty() );
    REQUIRE_FALSE( comm.iprobe( 0, 8 ) );
  }

  SECTION("into a read-only object") {
    const std::map<std::string, int> frozen;
    REQUIRE_THROWS_AS( comm.recv( 0, 8, frozen ), UnsupportedPayload );
    REQUIRE( t->probes == 0 );
  }
}

SCENARIO("PROC_NULL peers", "[courier][p2p]") {
  auto t = fake::make();
  Comm comm(t);
  std::vector<int> v(4);
  std::string s = "unchanged";

  auto st = comm.send( PROC_NULL, 1, v );
  REQUIRE( st.source == PROC_NULL );
  REQUIRE( comm.recv( PROC_NULL, 1, v ).bytes == 0 );
  comm.recv( PROC_NULL, 1, s );
  REQUIRE( s == "unchanged" );
  REQUIRE_FALSE( comm.recv_object<std::string>( PROC_NULL, 1 ) );
  REQUIRE( comm.probe( PROC_NULL ).source == PROC_NULL );
  comm.sendrecv( PROC_NULL, 1, v, PROC_NULL, 1, v );

  auto r = comm.Isend( PROC_NULL, 1, v );
  REQUIRE_FALSE( r.is_active() );
  REQUIRE( comm.Irecv_object<std::string>( PROC_NULL, 1 ).wait() == std::nullopt );

  REQUIRE( t->calls() == 0 );

  SECTION("on one side of a sendrecv") {
    std::vector<int> w { 9, 8, 7, 6 };
    comm.sendrecv( 0, 2, w, PROC_NULL, 2, v );
    REQUIRE( t->mailbox.size() == 1 );
    auto got = comm.sendrecv( PROC_NULL, 2, w, 0, 2, v );
    REQUIRE( v == w );
    REQUIRE( got.tag == 2 );
  }
}

SCENARIO("unsupported payloads fail before the transport", "[courier][p2p]") {
  auto t = fake::make();
  Comm comm(t);
  NotEncodable n { "?" };
  std::string s;

  REQUIRE_THROWS_AS( comm.send( 0, 1, n ), UnsupportedPayload );
  REQUIRE_THROWS_AS( comm.recv( 0, 1, n ), UnsupportedPayload );
  REQUIRE_THROWS_AS( comm.Isend( 0, 1, n ), UnsupportedPayload );
  REQUIRE_THROWS_AS( comm.Irecv( 0, 1, s ), UnsupportedPayload );
  REQUIRE_THROWS_AS( comm.recv_init( 0, 1, s ), UnsupportedPayload );
  REQUIRE_THROWS_AS( comm.send( 0, 1, IN_PLACE ), UnsupportedPayload );
  REQUIRE( t->calls() == 0 );
}

SCENARIO("non-blocking point to point", "[courier][p2p]") {
  auto t = fake::make();
  Comm comm(t);
  int out[2] = { 147, 351 };
  int in[2] = { 0, 0 };

  std::vector<Request> reqs;
  reqs.push_back( comm.Irecv( 0, 147, in ) );
  reqs.push_back( comm.Isend( 0, 147, out ) );
  auto ss = waitall(reqs);
  REQUIRE( in[0] == 147 );
  REQUIRE( in[1] == 351 );
  REQUIRE( ss[0].bytes == sizeof(in) );

  SECTION("objects") {
    std::vector<std::string> names { "alpha", "beta" };
    auto sreq = comm.Isend_object( 0, 5, names );
    auto rreq = comm.Irecv_object<std::vector<std::string>>( 0, 5 );
    REQUIRE( rreq.wait() == names );
    sreq.wait();
  }

  SECTION("objects larger than the receive capacity") {
    comm.send_object( 0, 5, std::string( 100, 'x' ) );
    auto rreq = comm.Irecv_object<std::string>( 0, 5, 16 );
    REQUIRE_THROWS_AS( rreq.wait(), BufferSizeMismatch );
  }
}

SCENARIO("persistent point to point", "[courier][p2p][persistent]") {
  auto t = fake::make();
  Comm comm(t);
  double x = 0.0, y = 0.0;
  auto sreq = comm.send_init( 0, 4, x );
  auto rreq = comm.recv_init( 0, 4, y );
  REQUIRE( t->prepares == 2 );

  for ( int i = 1; i <= 3; ++i ) {
    x = i * 0.5;
    sreq.start();
    rreq.start();
    sreq.wait();
    rreq.wait();
    REQUIRE( y == i * 0.5 );
  }
  REQUIRE( t->prepares == 2 );
  sreq.free();
  rreq.free();
  REQUIRE( t->live_tickets() == 0 );
}

SCENARIO("requests keep their own copy of temporaries", "[courier][p2p]") {
  auto t = fake::make();
  Comm comm(t);

  SECTION("persistent send of a temporary vector") {
    auto sreq = comm.send_init( 0, 3, std::vector<int>{ 4, 5, 6 } );
    REQUIRE( sreq.message()->send.owns_scratch() );
    REQUIRE( sreq.message()->send.count() == 3 );
    REQUIRE( sreq.message()->send.element() == element<int>() );

    for ( int i = 0; i < 2; ++i ) {
      sreq.start();
      sreq.wait();
      std::vector<int> in(3);
      comm.recv( 0, 3, in );
      REQUIRE( in == std::vector<int>{ 4, 5, 6 } );
    }
    sreq.free();
  }

  SECTION("Isend of a scalar literal") {
    auto req = comm.Isend( 0, 1, 2.5 );
    REQUIRE( req.message()->send.owns_scratch() );
    double x = 0.0;
    comm.recv( 0, 1, x );
    REQUIRE( x == 2.5 );
    req.wait();
  }

  SECTION("lvalues are still sent in place") {
    std::vector<int> v { 1, 2 };
    auto req = comm.Isend( 0, 2, v );
    REQUIRE_FALSE( req.message()->send.owns_scratch() );
    REQUIRE( req.message()->send.address() == v.data() );
    req.wait();
    comm.recv( 0, 2, v );
  }
}

SCENARIO("sendrecv", "[courier][p2p]") {
  auto t = fake::make();
  Comm comm(t);

  SECTION("buffers") {
    std::vector<long> a { 1, 2, 3 }, b(3);
    auto s = comm.sendrecv( 0, 1, a, 0, 1, b );
    REQUIRE( b == a );
    REQUIRE( s.source == 0 );
  }

  SECTION("objects") {
    std::string hello = "hello", got;
    comm.sendrecv( 0, 1, hello, 0, 1, got );
    REQUIRE( got == hello );
    REQUIRE( *comm.sendrecv_object<std::string>( 0, 2, std::string("pong") ) == "pong" );
  }
}

SCENARIO("probing", "[courier][p2p]") {
  auto t = fake::make();
  Comm comm(t);
  REQUIRE_FALSE( comm.iprobe( 0, 1 ) );
  comm.send( 0, 1, std::vector<int>(6) );
  auto env = comm.iprobe();
  REQUIRE( env );
  REQUIRE( env->bytes == 6 * sizeof(int) );
  REQUIRE( env->tag == 1 );
  REQUIRE( comm.probe( 0, 1 ).bytes == env->bytes );
}

SCENARIO("null and freed communicators", "[courier][p2p]") {
  int x = 0;
  Comm null;
  REQUIRE_FALSE( null );
  REQUIRE_THROWS_AS( null.send( 0, 0, x ), Error );
  REQUIRE( null.native() == MPI_COMM_NULL );

  Comm comm( fake::make() );
  Comm copy = comm;
  comm.free();
  REQUIRE_FALSE( copy );
  REQUIRE_THROWS_AS( copy.rank(), Error );
}
