#include "courier/courier.hpp"
#include "courier/mpi_transport.hpp"
#include "catch2/catch.hpp"

#include <numeric>
#include <string>
#include <vector>

using namespace courier;

namespace {
  struct Vec3 {
    double x, y, z;
  };
}

namespace courier {
  template <>
  struct Datatype<Vec3> {
    static inline MPI_Datatype type = MPI_DATATYPE_NULL;
    static void define( MPI_Datatype& t ) {
      check( MPI_Type_contiguous( 3, MPI_DOUBLE, &t ), "MPI_Type_contiguous" );
    }
  };
}

SCENARIO("World", "[courier][mpi]") {
  if ( world.size() >= 2 ) {
    int myrank = world.rank();
    if ( 0 == myrank ) {
      int msg = 147;
      world.send( 1, 22, msg );
    } else if ( 1 == myrank ) {
      int msg;
      world.recv( 0, 22, msg );
      REQUIRE( msg == 147 );
    }
  }
}

SCENARIO("Comm", "[courier][mpi]") {
  auto comm_opt = world.split( true );
  REQUIRE( comm_opt );
  auto& comm = *comm_opt;
  REQUIRE( comm.size() == world.size() );
  if ( world.size() >= 2 ) {
    int myrank = comm.rank();
    if ( 0 == myrank ) {
      comm.send_object( 1, 22, std::string("hello") );
    } else if ( 1 == myrank ) {
      REQUIRE( *comm.recv_object<std::string>( 0, 22 ) == "hello" );
    }
  }

  SECTION("processes without a color get nothing") {
    auto half = world.split( world.rank() == 0 ? std::optional<unsigned int>(0) : std::nullopt );
    REQUIRE( static_cast<bool>(half) == ( world.rank() == 0 ) );
  }
}

SCENARIO("Datatype", "[courier][mpi]") {
#define TestType(_T_, _MPIT_)                                     \
  REQUIRE( element<_T_>().native() == MPI_##_MPIT_ );             \
  REQUIRE( element<const _T_>().native() == MPI_##_MPIT_ );       \

  TestType(int, INT);
  TestType(char, CHAR);
  TestType(short, SHORT);
  TestType(long, LONG);

  TestType(unsigned char, UNSIGNED_CHAR);
  TestType(unsigned short, UNSIGNED_SHORT);
  TestType(unsigned int, UNSIGNED);
  TestType(unsigned long, UNSIGNED_LONG);

  TestType(float, FLOAT);
  TestType(double, DOUBLE);
  TestType(bool, CXX_BOOL);
#undef TestType

  SECTION("committed user types") {
    commit( Datatype<Vec3>{} );
    REQUIRE( element<Vec3>().native() != MPI_DATATYPE_NULL );
    REQUIRE( element<Vec3>().extent() == sizeof(Vec3) );
    REQUIRE( element<Vec3>().alignment() == alignof(Vec3) );
    Vec3 out[2] = { {1, 2, 3}, {4, 5, 6} };
    Vec3 in[2] {};
    self.sendrecv( 0, 3, out, 0, 3, in );
    REQUIRE( in[1].y == 5 );
    uncommit( Datatype<Vec3>{} );
  }
}

SCENARIO("talking to self", "[courier][mpi]") {
  SECTION("sendrecv of buffers") {
    std::vector<int> a { 1, 2, 3 }, b(3);
    auto s = self.sendrecv( 0, 1, a, 0, 1, b );
    REQUIRE( b == a );
    REQUIRE( s.count( element<int>() ) == 3 );
  }

  SECTION("sendrecv of objects") {
    std::vector<std::string> words { "a", "bb" }, got;
    self.sendrecv( 0, 2, words, 0, 2, got );
    REQUIRE( got == words );
  }

  SECTION("buffered sends") {
    attach_buffer( 1024 );
    double x = 2.5, y = 0.0;
    self.send( 0, 4, x, SendMode::BUF );
    self.recv( 0, 4, y );
    REQUIRE( y == 2.5 );
    detach_buffer();
  }

  SECTION("truncation") {
    std::vector<int> a(4), b(2);
    auto req = self.Isend( 0, 5, a );
    REQUIRE_THROWS_AS( self.recv( 0, 5, b ), BufferSizeMismatch );
    req.wait();
  }

  SECTION("a temporary outlives the Isend call") {
    auto req = self.Isend( 0, 7, std::vector<int>( 1 << 16, 7 ) );
    std::vector<int> in( 1 << 16, 0 );
    self.recv( 0, 7, in );
    req.wait();
    REQUIRE( in.front() == 7 );
    REQUIRE( in.back() == 7 );
  }

  SECTION("engine errors") {
    int x = 0;
    REQUIRE_THROWS_AS( self.send( 7, 0, x ), TransportError );
  }

  SECTION("probing") {
    std::vector<char> msg( 40, 'c' );
    auto req = self.Isend( 0, 6, msg );
    auto env = self.probe( 0, 6 );
    REQUIRE( env.bytes == 40 );
    self.recv( 0, 6, nullptr );
    req.wait();
    REQUIRE_FALSE( self.iprobe( 0, 6 ) );
  }

  SECTION("persistent requests") {
    int x = 0, y = 0;
    auto sreq = self.send_init( 0, 8, x );
    auto rreq = self.recv_init( 0, 8, y );
    for ( int i = 0; i < 3; ++i ) {
      x = i + 10;
      rreq.start();
      sreq.start();
      std::vector<Request> both;
      both.push_back( std::move(rreq) );
      both.push_back( std::move(sreq) );
      waitall(both);
      rreq = std::move( both[0] );
      sreq = std::move( both[1] );
      REQUIRE( y == i + 10 );
    }
    sreq.free();
    rreq.free();
  }
}

SCENARIO("collectives on world", "[courier][mpi][collective]") {
  const int n = world.size();
  const int r = world.rank();

  SECTION("allreduce and scan") {
    int total = 0, prefix = 0;
    world.allreduce( by::SUM, r, total );
    world.scan( by::SUM, r, prefix );
    REQUIRE( total == n * ( n - 1 ) / 2 );
    REQUIRE( prefix == r * ( r + 1 ) / 2 );

    int x = r + 1;
    world.allreduce( by::MAX, IN_PLACE, x );
    REQUIRE( x == n );
  }

  SECTION("gatherv with uneven blocks") {
    std::vector<int> mine( r + 1, r );
    std::vector<int> counts(n);
    std::iota( counts.begin(), counts.end(), 1 );
    std::vector<int> all( n * ( n + 1 ) / 2, -1 );
    world.gatherv( 0, mine, r == 0 ? Payload( buffer(all).vectored(counts) ) : Payload() );
    if ( r == 0 ) {
      REQUIRE( all.back() == n - 1 );
      REQUIRE( all.front() == 0 );
    }
  }

  if ( n >= 4 ) {
    SECTION("scatterv packs the blocks by default") {
      std::vector<int> counts( n, 0 );
      counts[0] = 1; counts[1] = 2; counts[2] = 3; counts[3] = 4;
      std::vector<int> all(10);
      std::iota( all.begin(), all.end(), 0 );
      std::vector<int> mine( counts[r], -1 );
      world.scatterv( 0, r == 0 ? Payload( buffer(all).vectored(counts) ) : Payload(), mine );

      const std::vector<std::vector<int>> expected { {0}, {1, 2}, {3, 4, 5}, {6, 7, 8, 9} };
      if ( r < 4 ) REQUIRE( mine == expected[r] );
      else REQUIRE( mine.empty() );
    }
  }

  SECTION("alltoall") {
    std::vector<int> out( n, r ), in( n, -1 );
    world.alltoall( out, in );
    for ( int i = 0; i < n; ++i ) REQUIRE( in[i] == i );
  }

  SECTION("reduce_scatter_block") {
    std::vector<int> ones( 2 * n, 1 ), mine(2);
    world.reduce_scatter_block( by::SUM, ones, mine );
    REQUIRE( mine == std::vector<int>( 2, n ) );
  }

  SECTION("non-blocking") {
    std::vector<double> a( 3, 1.0 ), b(3);
    auto req = world.Iallreduce( by::SUM, a, b );
    auto bar = world.Ibarrier();
    req.wait();
    bar.wait();
    REQUIRE( b[2] == n );
  }

  SECTION("objects") {
    auto names = world.allgather_object( "rank" + std::to_string(r) );
    REQUIRE( names.size() == static_cast<std::size_t>(n) );
    REQUIRE( names.back() == "rank" + std::to_string( n - 1 ) );

    auto msg = world.broadcast_object( 0, r == 0 ? std::string("from root") : std::string() );
    REQUIRE( msg == "from root" );

    std::vector<std::vector<int>> parcels;
    for ( int i = 0; i < n; ++i ) parcels.push_back( std::vector<int>( i, r ) );
    auto got = world.alltoall_object(parcels);
    for ( int i = 0; i < n; ++i ) REQUIRE( got[i] == std::vector<int>( r, i ) );

    auto sum = world.reduce_object( 0, r, []( int a, int b ) { return a + b; } );
    REQUIRE( static_cast<bool>(sum) == ( r == 0 ) );
    if ( sum ) REQUIRE( *sum == n * ( n - 1 ) / 2 );
  }

  world.barrier();
}

SCENARIO("cartesian topology", "[courier][mpi][cart]") {
  const int n = world.size();

  SECTION("non-periodic") {
    CartComm cart( world, {n}, {false} );
    REQUIRE( cart );
    const auto [src, dest] = cart.shift(0);
    const int r = cart.rank();
    REQUIRE( src == ( r == 0 ? PROC_NULL : r - 1 ) );
    REQUIRE( dest == ( r == n - 1 ? PROC_NULL : r + 1 ) );
    REQUIRE_FALSE( cart.coords2rank({n}) );
    REQUIRE( cart.coords() == std::vector<int>{ r } );

    // exchanges with the boundary are no-ops
    int out = r, in = -1;
    cart.sendrecv( dest, 0, out, src, 0, in );
    REQUIRE( in == ( src == PROC_NULL ? -1 : r - 1 ) );
  }

  SECTION("periodic") {
    CartComm cart( world, {n}, {true} );
    const auto [src, dest] = cart.shift(0);
    REQUIRE( src == ( cart.rank() + n - 1 ) % n );
    REQUIRE( dest == ( cart.rank() + 1 ) % n );
    REQUIRE( *cart.coords2rank({n}) == 0 );
    const auto [coords, dims, periodic] = cart.coords_dims_periodic();
    REQUIRE( dims == std::vector<int>{ n } );
    REQUIRE( periodic[0] );
  }
}

SCENARIO("intercommunicators", "[courier][mpi][inter]") {
  if ( world.size() >= 2 ) {
    const unsigned int color = world.rank() % 2;
    auto local = world.split( color, world.rank() );
    REQUIRE( local );
    InterComm inter( *local, 0, world, color == 0 ? 1 : 0, 99 );
    REQUIRE( inter.is_inter() );
    REQUIRE( inter.remote_size() == world.size() / 2 + ( color == 1 ? world.size() % 2 : 0 ) );

    const bool leader = local->rank() == 0;
    const int root = color == 0 ? ( leader ? ROOT : PROC_NULL ) : 0;
    auto msg = inter.broadcast_object( root, std::string( color == 0 ? "even" : "" ) );
    REQUIRE( msg == "even" );

    REQUIRE_THROWS_AS( inter.allreduce( by::SUM, IN_PLACE, msg.size() ), UnsupportedPayload );
  }
}

SCENARIO("duplicated communicators", "[courier][mpi]") {
  auto key = create_keyval( dup_copy );
  Comm comm = world.dup();
  comm.set_attr( key, 3 );
  Comm again = comm.dup();
  REQUIRE( *again.attr<int>(key) == 3 );
  REQUIRE( again.native() != world.native() );

  int x = world.rank(), sum = 0;
  again.allreduce( by::SUM, x, sum );
  REQUIRE( sum == world.size() * ( world.size() - 1 ) / 2 );

  again.free();
  comm.free();
  free_keyval(key);

  Comm w = world;
  REQUIRE_THROWS_AS( w.free(), Error );
}
