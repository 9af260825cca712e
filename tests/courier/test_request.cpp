#include "courier/request.hpp"
#include "courier/errors.hpp"
#include "fake_transport.hpp"
#include "catch2/catch.hpp"

#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace courier;

namespace {
  int payload_value = 42;

  std::unique_ptr<Message> send_message() {
    auto m = std::make_unique<Message>();
    m->send = Descriptor( &payload_value, 1, element<int>() );
    return m;
  }

  Operation send_op( int dest, int tag ) {
    Operation op;
    op.kind = Kind::SEND;
    op.dest = dest;
    op.sendtag = tag;
    return op;
  }

  Operation recv_op( int source, int tag ) {
    Operation op;
    op.kind = Kind::RECV;
    op.source = source;
    op.recvtag = tag;
    return op;
  }

  std::unique_ptr<Message> recv_message( void* address, int count, Element e ) {
    auto m = std::make_unique<Message>();
    m->recv = Descriptor( address, count, e );
    return m;
  }
}

SCENARIO("the null request", "[courier][request]") {
  Request r;
  REQUIRE( r.state() == Request::State::COMPLETED );
  REQUIRE( r.wait().source == PROC_NULL );
  REQUIRE( r.test() );

  r.free();
  REQUIRE( r.state() == Request::State::FREED );
  REQUIRE_THROWS_AS( r.wait(), InvalidRequestState );
  REQUIRE_THROWS_AS( r.test(), InvalidRequestState );
  REQUIRE_THROWS_AS( r.free(), InvalidRequestState );
}

SCENARIO("a non-blocking send", "[courier][request]") {
  auto t = fake::make();
  auto r = Request::issue( t, send_op( 3, 11 ), send_message() );
  REQUIRE( r.is_active() );
  REQUIRE( t->posts == 1 );
  REQUIRE_THROWS_AS( r.free(), InvalidRequestState );

  auto s = r.wait();
  REQUIRE( r.state() == Request::State::COMPLETED );
  REQUIRE( s.source == 3 );
  REQUIRE( s.tag == 11 );
  REQUIRE( s.bytes == sizeof(int) );

  WHEN("waited on again, the same status comes back without the transport") {
    auto s2 = r.wait();
    REQUIRE( s2.tag == 11 );
  }

  r.free();
  REQUIRE( r.state() == Request::State::FREED );
  REQUIRE( t->live_tickets() == 0 );
  REQUIRE( r.message() == nullptr );
}

SCENARIO("moving a request moves its ownership", "[courier][request]") {
  auto t = fake::make();
  auto a = Request::issue( t, send_op( 0, 1 ), send_message() );
  Request b = std::move(a);
  REQUIRE( b.is_active() );
  REQUIRE_FALSE( a.is_active() );
  b.wait();
  b.free();
  REQUIRE( t->live_tickets() == 0 );
}

SCENARIO("requests destroyed while active", "[courier][request][orphan]") {
  auto t = fake::make();
  const auto before = pending_orphans();
  t->hold = true;
  {
    auto r = Request::issue( t, send_op( 0, 2 ), send_message() );
    REQUIRE( r.is_active() );
  }
  REQUIRE( pending_orphans() == before + 1 );
  REQUIRE( t->live_tickets() == 1 );

  WHEN("the transport still has not finished") {
    impl::reap_orphans();
    REQUIRE( pending_orphans() == before + 1 );
  }

  t->hold = false;
  impl::reap_orphans();
  REQUIRE( pending_orphans() == before );
  REQUIRE( t->live_tickets() == 0 );

  SECTION("move-assigning over an active request orphans it too") {
    t->hold = true;
    auto r = Request::issue( t, send_op( 0, 2 ), send_message() );
    r = Request::completed();
    REQUIRE( pending_orphans() == before + 1 );
    t->hold = false;
    impl::drain_orphans();
    REQUIRE( pending_orphans() == before );
  }
}

SCENARIO("persistent requests", "[courier][request][persistent]") {
  auto t = fake::make();
  auto r = Request::persist( t, send_op( 0, 5 ), send_message() );
  REQUIRE( r.is_persistent() );
  REQUIRE( r.state() == Request::State::COMPLETED );
  REQUIRE( t->prepares == 1 );

  for ( int i = 0; i < 3; ++i ) {
    r.start();
    REQUIRE( r.is_active() );
    REQUIRE_THROWS_AS( r.start(), InvalidRequestState );
    REQUIRE( r.wait().tag == 5 );
  }
  REQUIRE( t->prepares == 1 );
  REQUIRE( t->starts == 3 );
  REQUIRE( t->mailbox.size() == 3 );

  WHEN("rebound to another payload") {
    int other = 7;
    auto m = std::make_unique<Message>();
    m->send = Descriptor( &other, 1, element<int>() );
    r.rebind( std::move(m) );
    REQUIRE( t->prepares == 2 );
    r.start();
    r.wait();
    int got = 0;
    std::memcpy( &got, t->mailbox.back().bytes.data(), sizeof(int) );
    REQUIRE( got == 7 );
  }

  r.free();
  REQUIRE( t->live_tickets() == 0 );
  REQUIRE_THROWS_AS( r.start(), InvalidRequestState );
}

SCENARIO("persistent requests with nothing to move", "[courier][request][persistent]") {
  auto r = Request::persist( nullptr, send_op( PROC_NULL, 5 ), send_message() );
  r.start();
  REQUIRE( r.is_active() );
  auto s = r.wait();
  REQUIRE( s.source == PROC_NULL );
  REQUIRE( s.bytes == 0 );
  r.free();
}

SCENARIO("only persistent requests start", "[courier][request]") {
  auto t = fake::make();
  auto r = Request::issue( t, send_op( 0, 1 ), send_message() );
  REQUIRE_THROWS_AS( r.start(), InvalidRequestState );
  r.wait();
  REQUIRE_THROWS_AS( r.start(), InvalidRequestState );
  REQUIRE_THROWS_AS( r.rebind( send_message() ), InvalidRequestState );
}

SCENARIO("a truncated receive", "[courier][request]") {
  auto t = fake::make();
  t->mailbox.push_back( { 0, 9, std::vector<char>( 2 * sizeof(int) ) } );
  int x = 0;
  auto r = Request::issue( t, recv_op( 0, 9 ), recv_message( &x, 1, element<int>() ) );
  REQUIRE_THROWS_AS( r.wait(), BufferSizeMismatch );
  REQUIRE( r.state() == Request::State::COMPLETED );
  REQUIRE( r.status().truncated() );
}

SCENARIO("cancelling a receive", "[courier][request]") {
  auto t = fake::make();
  double x = 0;
  auto r = Request::issue( t, recv_op( 0, 4 ), recv_message( &x, 1, element<double>() ) );
  REQUIRE_FALSE( r.test() );
  cancel(r);
  REQUIRE( t->cancels == 1 );
  auto s = r.test();
  REQUIRE( s );
  REQUIRE( s->cancelled );
}

SCENARIO("batch completion", "[courier][request][batch]") {
  auto t = fake::make();
  std::vector<Request> reqs;
  reqs.push_back( Request::issue( t, send_op( 1, 1 ), send_message() ) );
  reqs.push_back( Request() );
  reqs.push_back( Request::issue( t, send_op( 2, 2 ), send_message() ) );

  SECTION("waitall") {
    auto ss = waitall(reqs);
    REQUIRE( ss.size() == 3 );
    REQUIRE( ss[0].source == 1 );
    REQUIRE( ss[1].source == PROC_NULL );
    REQUIRE( ss[2].tag == 2 );
    for ( const auto& r : reqs ) REQUIRE_FALSE( r.is_active() );
  }

  SECTION("waitany then waitsome") {
    auto first = waitany(reqs);
    REQUIRE( first );
    REQUIRE( first->first == 0 );
    auto rest = waitsome(reqs);
    REQUIRE( rest.size() == 1 );
    REQUIRE( rest[0].first == 2 );
    REQUIRE_FALSE( waitany(reqs) );
    REQUIRE( waitsome(reqs).empty() );
  }

  SECTION("testall waits for every member") {
    t->hold = true;
    REQUIRE_FALSE( testall(reqs) );
    REQUIRE_FALSE( testany(reqs) );
    REQUIRE( testsome(reqs).empty() );
    t->hold = false;
    auto ss = testall(reqs);
    REQUIRE( ss );
    REQUIRE( ss->size() == 3 );
  }

  SECTION("testsome reports what finished") {
    auto done = testsome(reqs);
    REQUIRE( done.size() == 2 );
    REQUIRE( done[1].second.source == 2 );
  }

  SECTION("one failure does not leave the others active") {
    t->failing_tag = 1;
    REQUIRE_THROWS_AS( waitall(reqs), TransportError );
    for ( const auto& r : reqs ) REQUIRE_FALSE( r.is_active() );
    REQUIRE( reqs[2].status().tag == 2 );
  }

  SECTION("a failure seen by waitany still completes the member") {
    t->failing_tag = 1;
    REQUIRE_THROWS_AS( waitany(reqs), TransportError );
    REQUIRE( reqs[0].state() == Request::State::COMPLETED );
    REQUIRE( reqs[0].status().error == MPI_ERR_OTHER );
    REQUIRE( reqs[2].is_active() );
    auto next = waitany(reqs);
    REQUIRE( next );
    REQUIRE( next->first == 2 );
  }

  SECTION("cancelall") {
    cancelall(reqs);
    REQUIRE( t->cancels == 2 );
    waitall(reqs);
  }

  SECTION("a freed member is refused") {
    reqs[1].free();
    REQUIRE_THROWS_AS( waitall(reqs), InvalidRequestState );
    reqs[0].wait();
    reqs[2].wait();
  }
}

SCENARIO("objects received without blocking", "[courier][request]") {
  auto t = fake::make();
  const std::string text = "a message of unknown length";
  t->mailbox.push_back( { 0, 6, encode(text) } );

  auto m = std::make_unique<Message>();
  m->recv = Descriptor::owning( std::vector<char>(256) );
  ObjectRequest<std::string> req( Request::issue( t, recv_op( 0, 6 ), std::move(m) ) );

  const auto& got = req.wait();
  REQUIRE( got );
  REQUIRE( *got == text );
  REQUIRE( req.request().state() == Request::State::FREED );
  REQUIRE( req.test() );
}
