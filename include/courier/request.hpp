#ifndef _COURIER_REQUEST_HPP_
#define _COURIER_REQUEST_HPP_

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "courier/codec.hpp"
#include "courier/transport.hpp"

namespace courier {
  // Handle to one non-blocking or persistent transfer. It owns the Message the
  // transport reads from or writes into, and keeps it alive until the transport
  // is done with it.
  //
  //   ACTIVE --wait/test--> COMPLETED --free--> FREED
  //   COMPLETED --start--> ACTIVE            ( persistent only )
  //
  // A default constructed request is the null request: COMPLETED with an empty status.
  // Destroying an ACTIVE request hands it to the orphanage instead of releasing it.
  class Request {
  public:
    enum class State : char { ACTIVE = 0, COMPLETED, FREED };

  private:
    std::shared_ptr<Transport> _transport;
    Ticket _ticket {};
    std::unique_ptr<Message> _message;
    Operation _op {};
    Status _status {};
    State _state = State::COMPLETED;
    bool _persistent = false;

    void bind_operation( Operation op );
    // ACTIVE -> COMPLETED. Raises after the transition when the transfer failed
    void complete( const Status& status );
    void release() noexcept;
    void require_not_freed( const char* what ) const;

    friend std::vector<Status> waitall( std::vector<Request>& reqs );
    friend std::optional<std::pair<std::size_t, Status>> waitany( std::vector<Request>& reqs );
    friend std::vector<std::pair<std::size_t, Status>> waitsome( std::vector<Request>& reqs );
    friend std::optional<std::vector<Status>> testall( std::vector<Request>& reqs );
    friend std::optional<std::pair<std::size_t, Status>> testany( std::vector<Request>& reqs );
    friend std::vector<std::pair<std::size_t, Status>> testsome( std::vector<Request>& reqs );

  public:
    Request() = default;
    ~Request();

    Request( const Request& ) = delete;
    Request& operator=( const Request& ) = delete;
    Request( Request&& other ) noexcept;
    Request& operator=( Request&& other ) noexcept;

    // posts op right away. op's descriptors are rebound to message
    static Request issue( std::shared_ptr<Transport> transport, Operation op, std::unique_ptr<Message> message );
    // prepares op inactive. A null transport makes a persistent request with nothing to move
    static Request persist( std::shared_ptr<Transport> transport, Operation op, std::unique_ptr<Message> message );
    static Request completed( Status status = {} );

    inline State state() const noexcept { return _state; }
    inline bool is_active() const noexcept { return _state == State::ACTIVE; }
    inline bool is_persistent() const noexcept { return _persistent; }
    inline const Status& status() const noexcept { return _status; }
    inline const Message* message() const noexcept { return _message.get(); }

    Status wait();
    std::optional<Status> test();
    // advisory, completion must still be observed through wait or test
    void cancel();
    void free();

    void start();
    // replaces the payload of an inactive persistent request
    void rebind( std::unique_ptr<Message> message );
  };

  Status wait( Request& req );
  std::optional<Status> test( Request& req );
  void cancel( Request& req );
  void cancelall( std::vector<Request>& reqs );

  // NOTE the batch calls hand all ACTIVE members to the transport of the first one
  std::vector<Status> waitall( std::vector<Request>& reqs );
  // nullopt when no member is ACTIVE
  std::optional<std::pair<std::size_t, Status>> waitany( std::vector<Request>& reqs );
  std::vector<std::pair<std::size_t, Status>> waitsome( std::vector<Request>& reqs );
  std::optional<std::vector<Status>> testall( std::vector<Request>& reqs );
  std::optional<std::pair<std::size_t, Status>> testany( std::vector<Request>& reqs );
  std::vector<std::pair<std::size_t, Status>> testsome( std::vector<Request>& reqs );

  // number of destroyed-while-active requests not yet completed
  std::size_t pending_orphans();
}

namespace courier::impl {
  // tests every orphan and releases the completed ones
  void reap_orphans();
  // waits for every orphan
  void drain_orphans();
}

namespace courier {
  // a generic receive decoded into a T when it completes
  template < typename T >
  class ObjectRequest {
  private:
    Request _req;
    std::optional<T> _value;
    bool _decoded = false;

    void decode() {
      if ( _decoded ) return;
      _decoded = true;
      const auto& s = _req.status();
      if ( s.source == PROC_NULL || s.cancelled || s.error != MPI_SUCCESS ) return;
      const auto& scratch = _req.message()->recv.scratch();
      _value.emplace( courier::decode<T>( scratch.data(), s.bytes ) );
      _req.free();
    }

  public:
    ObjectRequest() = default;
    explicit ObjectRequest( Request req ) : _req( std::move(req) ) {}

    inline Request& request() noexcept { return _req; }

    // nullopt when the peer was PROC_NULL or the receive was cancelled
    const std::optional<T>& wait() {
      if ( !_decoded ) {
        _req.wait();
        decode();
      }
      return _value;
    }

    bool test() {
      if ( _decoded ) return true;
      if ( !_req.test() ) return false;
      decode();
      return true;
    }

    inline void cancel() { _req.cancel(); }
  };
}

#endif
