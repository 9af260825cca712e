#ifndef _COURIER_TRANSPORT_HPP_
#define _COURIER_TRANSPORT_HPP_

#include <mpi.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "courier/descriptor.hpp"

namespace courier {
  inline constexpr int PROC_NULL = MPI_PROC_NULL;
  inline constexpr int ANY_SOURCE = MPI_ANY_SOURCE;
  inline constexpr int ANY_TAG = MPI_ANY_TAG;
  inline constexpr int ROOT = MPI_ROOT;

  enum class SendMode : char { STD = 0, BUF, SYN, RDY };

  enum class by : char { SUM = 0, PROD, MAX, MIN, LAND, LOR, LXOR, BAND, BOR, BXOR };

  enum class Kind : char {
    SEND = 0, RECV, SENDRECV,
    BARRIER, BCAST,
    GATHER, GATHERV, SCATTER, SCATTERV,
    ALLGATHER, ALLGATHERV, ALLTOALL, ALLTOALLV,
    REDUCE, ALLREDUCE, REDUCE_SCATTER_BLOCK, REDUCE_SCATTER, SCAN, EXSCAN
  };

  const char* name( Kind kind ) noexcept;

  inline constexpr bool is_collective( Kind kind ) noexcept {
    return kind != Kind::SEND && kind != Kind::RECV && kind != Kind::SENDRECV;
  }

  inline constexpr bool is_rooted( Kind kind ) noexcept {
    return kind == Kind::BCAST || kind == Kind::GATHER || kind == Kind::GATHERV ||
      kind == Kind::SCATTER || kind == Kind::SCATTERV || kind == Kind::REDUCE;
  }

  struct Status {
    int source = PROC_NULL;
    int tag = ANY_TAG;
    int error = MPI_SUCCESS;
    std::size_t bytes = 0;
    bool cancelled = false;

    inline int count( const Element& element ) const noexcept {
      return static_cast<int>( bytes / element.extent() );
    }

    inline bool truncated() const noexcept { return error == MPI_ERR_TRUNCATE; }
  };

  // opaque handle to an outstanding operation, owned by the transport that issued it
  struct Ticket {
    void* raw = nullptr;
    explicit operator bool() const noexcept { return raw != nullptr; }
  };

  struct Envelope {
    int source = PROC_NULL;
    int tag = ANY_TAG;
    std::size_t bytes = 0;
    Ticket matched {}; // set by a matched probe, consumed by Transport::receive
  };

  // one transfer as the transport sees it. send and recv point into a Message
  // that must outlive the operation
  struct Operation {
    Kind kind = Kind::SEND;
    const Descriptor* send = nullptr;
    const Descriptor* recv = nullptr;
    int dest = PROC_NULL;
    int source = PROC_NULL;
    int sendtag = 0;
    int recvtag = 0;
    int root = 0;
    by op = by::SUM;
    SendMode mode = SendMode::STD;
  };
}

namespace courier {
  // The message-passing engine, consumed as an opaque capability. Implementations
  // report truncation through Status::error and throw TransportError for every
  // other engine failure.
  class Transport {
  public:
    virtual ~Transport() = default;

    virtual int rank() const = 0;
    virtual int size() const = 0;
    virtual bool is_inter() const { return false; }
    virtual int remote_size() const { return size(); }

    virtual std::shared_ptr<Transport> duplicate() const = 0;
    // returns nullptr for processes that pass no color
    virtual std::shared_ptr<Transport> split( std::optional<int> color, int key ) const = 0;

    virtual Status execute( const Operation& op ) = 0;

    virtual Envelope probe( int source, int tag, bool matched ) = 0;
    virtual std::optional<Envelope> iprobe( int source, int tag ) = 0;
    // receives the message matched by probe( ..., true )
    virtual Status receive( const Descriptor& recv, Envelope& envelope ) = 0;

    virtual Ticket post( const Operation& op ) = 0;
    // persistent operations are prepared inactive and activated by start
    virtual Ticket prepare( const Operation& op ) = 0;
    virtual void start( Ticket ticket ) = 0;

    virtual Status wait( Ticket ticket ) = 0;
    virtual std::optional<Status> test( Ticket ticket ) = 0;
    virtual void cancel( Ticket ticket ) = 0;
    virtual void free( Ticket ticket ) = 0;

    // batch completion. Defaults poll test(), engines override with native calls.
    // A member that fails is reported through its Status, never by throwing
    virtual std::pair<std::size_t, Status> wait_any( const std::vector<Ticket>& tickets );
    virtual std::vector<std::pair<std::size_t, Status>> wait_some( const std::vector<Ticket>& tickets );
    virtual std::vector<Status> wait_all( const std::vector<Ticket>& tickets );
  };
}

#endif
