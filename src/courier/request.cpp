#include "courier/request.hpp"
#include "courier/errors.hpp"
#include "logger/logger.hpp"

#include <exception>
#include <mutex>

#include "fmt/format.h"

namespace courier {
  namespace {
    struct Orphan {
      std::shared_ptr<Transport> transport;
      Ticket ticket {};
      std::unique_ptr<Message> message;
    };

    std::mutex orphans_mutex;
    std::vector<Orphan> orphans;

    void adopt( Orphan o ) {
      std::lock_guard<std::mutex> lock(orphans_mutex);
      orphans.push_back( std::move(o) );
      lgr::file << "request destroyed while active, " << orphans.size() << " orphan(s) pending" << std::endl;
    }

    std::vector<Orphan> take_orphans() {
      std::vector<Orphan> xs;
      std::lock_guard<std::mutex> lock(orphans_mutex);
      xs.swap(orphans);
      return xs;
    }
  }

  std::size_t pending_orphans() {
    std::lock_guard<std::mutex> lock(orphans_mutex);
    return orphans.size();
  }

  namespace impl {
    void reap_orphans() {
      auto xs = take_orphans();
      if ( xs.empty() ) return;

      std::vector<Orphan> alive;
      std::size_t reaped = 0;
      for ( auto& o : xs ) {
        try {
          if ( !o.transport->test(o.ticket) ) {
            alive.push_back( std::move(o) );
            continue;
          }
          o.transport->free(o.ticket);
        } catch ( const Error& e ) {
          lgr::err << "orphaned request failed: " << e.what() << std::endl;
        }
        ++reaped;
      }

      std::lock_guard<std::mutex> lock(orphans_mutex);
      for ( auto& o : alive ) orphans.push_back( std::move(o) );
      if ( reaped ) lgr::file << "reaped " << reaped << " orphan(s), " << orphans.size() << " pending" << std::endl;
    }

    void drain_orphans() {
      auto xs = take_orphans();
      if ( xs.empty() ) return;
      lgr::file << "draining " << xs.size() << " orphan(s)" << std::endl;
      for ( auto& o : xs ) {
        try {
          o.transport->wait(o.ticket);
          o.transport->free(o.ticket);
        } catch ( const Error& e ) {
          lgr::err << "orphaned request failed: " << e.what() << std::endl;
        }
      }
    }
  }
}

namespace courier {
  Request::~Request() {
    if ( _state == State::ACTIVE && _ticket ) {
      adopt( Orphan{ std::move(_transport), std::exchange(_ticket, {}), std::move(_message) } );
      return;
    }
    release();
  }

  Request::Request( Request&& other ) noexcept
    : _transport( std::move(other._transport) ),
      _ticket( std::exchange( other._ticket, {} ) ),
      _message( std::move(other._message) ),
      _op( other._op ),
      _status( other._status ),
      _state( std::exchange( other._state, State::COMPLETED ) ),
      _persistent( std::exchange( other._persistent, false ) ) {}

  Request& Request::operator=( Request&& other ) noexcept {
    if ( this == &other ) return *this;
    if ( _state == State::ACTIVE && _ticket )
      adopt( Orphan{ std::move(_transport), std::exchange(_ticket, {}), std::move(_message) } );
    else
      release();

    _transport = std::move(other._transport);
    _ticket = std::exchange( other._ticket, {} );
    _message = std::move(other._message);
    _op = other._op;
    _status = other._status;
    _state = std::exchange( other._state, State::COMPLETED );
    _persistent = std::exchange( other._persistent, false );
    return *this;
  }

  void Request::release() noexcept {
    if ( _ticket && _transport ) {
      try {
        _transport->free( std::exchange(_ticket, {}) );
      } catch ( const Error& e ) {
        lgr::err << "releasing a request failed: " << e.what() << std::endl;
      }
    }
    _ticket = {};
    _message.reset();
  }

  void Request::bind_operation( Operation op ) {
    if ( _message ) {
      op.send = &_message->send;
      op.recv = &_message->recv;
    }
    _op = op;
  }

  void Request::require_not_freed( const char* what ) const {
    if ( _state == State::FREED )
      throw InvalidRequestState( fmt::format( "{} on a freed request", what ) );
  }

  void Request::complete( const Status& status ) {
    _state = State::COMPLETED;
    _status = status;
    if ( status.truncated() ) {
      lgr::file << "truncated " << name(_op.kind) << " from " << status.source << " with tag " << status.tag << std::endl;
      throw BufferSizeMismatch( fmt::format( "message from {} with tag {} does not fit the receive buffer",
                                             status.source, status.tag ) );
    }
    if ( status.error != MPI_SUCCESS )
      throw TransportError( status.error, fmt::format( "{} completed with an error", name(_op.kind) ) );
  }

  Request Request::issue( std::shared_ptr<Transport> transport, Operation op, std::unique_ptr<Message> message ) {
    impl::reap_orphans();
    Request r;
    r._transport = std::move(transport);
    r._message = message ? std::move(message) : std::make_unique<Message>();
    r.bind_operation(op);
    r._ticket = r._transport->post(r._op);
    r._state = State::ACTIVE;
    return r;
  }

  Request Request::persist( std::shared_ptr<Transport> transport, Operation op, std::unique_ptr<Message> message ) {
    Request r;
    r._persistent = true;
    r._transport = std::move(transport);
    r._message = message ? std::move(message) : std::make_unique<Message>();
    r.bind_operation(op);
    if ( r._transport ) r._ticket = r._transport->prepare(r._op);
    return r;
  }

  Request Request::completed( Status status ) {
    Request r;
    r._status = status;
    return r;
  }

  Status Request::wait() {
    require_not_freed("wait");
    if ( _state == State::COMPLETED ) return _status;
    complete( _ticket ? _transport->wait(_ticket) : Status{} );
    return _status;
  }

  std::optional<Status> Request::test() {
    require_not_freed("test");
    if ( _state == State::COMPLETED ) return _status;
    if ( !_ticket ) {
      complete( Status{} );
      return _status;
    }
    auto s = _transport->test(_ticket);
    if ( !s ) return std::nullopt;
    complete(*s);
    return _status;
  }

  void Request::cancel() {
    require_not_freed("cancel");
    if ( _state == State::ACTIVE && _ticket ) _transport->cancel(_ticket);
  }

  void Request::free() {
    require_not_freed("free");
    if ( _state == State::ACTIVE )
      throw InvalidRequestState( "free on an active request, complete it with wait or test first" );
    _state = State::FREED;
    _message.reset();
    if ( _ticket ) _transport->free( std::exchange(_ticket, {}) );
  }

  void Request::start() {
    if ( !_persistent ) throw InvalidRequestState( "start on a request that is not persistent" );
    require_not_freed("start");
    if ( _state == State::ACTIVE ) throw InvalidRequestState( "start on an active persistent request" );
    impl::reap_orphans();
    if ( _ticket ) _transport->start(_ticket);
    _status = {};
    _state = State::ACTIVE;
  }

  void Request::rebind( std::unique_ptr<Message> message ) {
    if ( !_persistent ) throw InvalidRequestState( "rebind on a request that is not persistent" );
    require_not_freed("rebind");
    if ( _state == State::ACTIVE ) throw InvalidRequestState( "rebind on an active persistent request" );
    if ( _ticket ) _transport->free( std::exchange(_ticket, {}) );
    _message = message ? std::move(message) : std::make_unique<Message>();
    bind_operation(_op);
    if ( _transport ) _ticket = _transport->prepare(_op);
  }
}

namespace courier {
  Status wait( Request& req ) { return req.wait(); }

  std::optional<Status> test( Request& req ) { return req.test(); }

  void cancel( Request& req ) { req.cancel(); }

  void cancelall( std::vector<Request>& reqs ) {
    for ( auto& req : reqs ) req.cancel();
  }

  std::vector<Status> waitall( std::vector<Request>& reqs ) {
    for ( const auto& r : reqs ) r.require_not_freed("waitall");

    std::vector<Ticket> tickets( reqs.size() );
    Transport* engine = nullptr;
    for ( std::size_t i = 0; i < reqs.size(); ++i ) {
      if ( !reqs[i].is_active() || !reqs[i]._ticket ) continue;
      tickets[i] = reqs[i]._ticket;
      if ( !engine ) engine = reqs[i]._transport.get();
    }

    std::vector<Status> done;
    if ( engine ) done = engine->wait_all(tickets);

    // every member transitions before the first failure is raised
    std::exception_ptr failure;
    std::vector<Status> statuses( reqs.size() );
    for ( std::size_t i = 0; i < reqs.size(); ++i ) {
      if ( reqs[i].is_active() ) {
        try {
          reqs[i].complete( tickets[i] ? done[i] : Status{} );
        } catch ( const Error& ) {
          if ( !failure ) failure = std::current_exception();
        }
      }
      statuses[i] = reqs[i].status();
    }
    if ( failure ) std::rethrow_exception(failure);
    return statuses;
  }

  std::optional<std::pair<std::size_t, Status>> waitany( std::vector<Request>& reqs ) {
    for ( const auto& r : reqs ) r.require_not_freed("waitany");

    std::vector<Ticket> tickets( reqs.size() );
    Transport* engine = nullptr;
    for ( std::size_t i = 0; i < reqs.size(); ++i ) {
      if ( !reqs[i].is_active() ) continue;
      if ( !reqs[i]._ticket ) {
        reqs[i].complete( Status{} );
        return std::make_pair( i, reqs[i].status() );
      }
      tickets[i] = reqs[i]._ticket;
      if ( !engine ) engine = reqs[i]._transport.get();
    }
    if ( !engine ) return std::nullopt;

    auto [i, s] = engine->wait_any(tickets);
    if ( i >= reqs.size() ) return std::nullopt;
    reqs[i].complete(s);
    return std::make_pair( i, reqs[i].status() );
  }

  std::vector<std::pair<std::size_t, Status>> waitsome( std::vector<Request>& reqs ) {
    for ( const auto& r : reqs ) r.require_not_freed("waitsome");

    std::vector<std::pair<std::size_t, Status>> done;
    std::vector<Ticket> tickets( reqs.size() );
    Transport* engine = nullptr;
    for ( std::size_t i = 0; i < reqs.size(); ++i ) {
      if ( !reqs[i].is_active() ) continue;
      if ( !reqs[i]._ticket ) {
        reqs[i].complete( Status{} );
        done.emplace_back( i, reqs[i].status() );
        continue;
      }
      tickets[i] = reqs[i]._ticket;
      if ( !engine ) engine = reqs[i]._transport.get();
    }
    if ( !done.empty() || !engine ) return done;

    std::exception_ptr failure;
    for ( const auto& [i, s] : engine->wait_some(tickets) ) {
      try {
        reqs[i].complete(s);
      } catch ( const Error& ) {
        if ( !failure ) failure = std::current_exception();
      }
      done.emplace_back( i, reqs[i].status() );
    }
    if ( failure ) std::rethrow_exception(failure);
    return done;
  }

  std::optional<std::vector<Status>> testall( std::vector<Request>& reqs ) {
    for ( const auto& r : reqs ) r.require_not_freed("testall");

    bool all = true;
    for ( auto& r : reqs )
      if ( r.is_active() && !r.test() ) all = false;
    if ( !all ) return std::nullopt;

    std::vector<Status> statuses;
    statuses.reserve( reqs.size() );
    for ( const auto& r : reqs ) statuses.push_back( r.status() );
    return statuses;
  }

  std::optional<std::pair<std::size_t, Status>> testany( std::vector<Request>& reqs ) {
    for ( const auto& r : reqs ) r.require_not_freed("testany");
    for ( std::size_t i = 0; i < reqs.size(); ++i ) {
      if ( !reqs[i].is_active() ) continue;
      if ( auto s = reqs[i].test() ) return std::make_pair( i, *s );
    }
    return std::nullopt;
  }

  std::vector<std::pair<std::size_t, Status>> testsome( std::vector<Request>& reqs ) {
    for ( const auto& r : reqs ) r.require_not_freed("testsome");
    std::vector<std::pair<std::size_t, Status>> done;
    for ( std::size_t i = 0; i < reqs.size(); ++i ) {
      if ( !reqs[i].is_active() ) continue;
      if ( auto s = reqs[i].test() ) done.emplace_back( i, *s );
    }
    return done;
  }
}
