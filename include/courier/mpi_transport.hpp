#ifndef _COURIER_MPI_TRANSPORT_HPP_
#define _COURIER_MPI_TRANSPORT_HPP_

#include <mpi.h>

#include <memory>
#include <string>

#include "apt/handle.hpp"
#include "courier/transport.hpp"

namespace courier {
  std::string error_string( int code );

  // throws TransportError unless code is MPI_SUCCESS. Only meaningful under MPI_ERRORS_RETURN
  void check( int code, const char* what );

  namespace impl {
    void comm_release( MPI_Comm& comm );
    MPI_Comm comm_null();

    void uncommit_all();
  }

  using CommHandle = apt::Handle<MPI_Comm, impl::comm_release, impl::comm_null>;

  template < bool nonblocking >
  auto pick_send( SendMode mode ) noexcept {
    switch ( mode ) {
    case SendMode::BUF :
      if constexpr ( nonblocking ) return MPI_Ibsend;
      else return MPI_Bsend;
    case SendMode::SYN :
      if constexpr ( nonblocking ) return MPI_Issend;
      else return MPI_Ssend;
    case SendMode::RDY :
      if constexpr ( nonblocking ) return MPI_Irsend;
      else return MPI_Rsend;
    default :
      if constexpr ( nonblocking ) return MPI_Isend;
      else return MPI_Send;
    }
  }

  inline auto pick_send_init( SendMode mode ) noexcept {
    switch ( mode ) {
    case SendMode::BUF : return MPI_Bsend_init;
    case SendMode::SYN : return MPI_Ssend_init;
    case SendMode::RDY : return MPI_Rsend_init;
    default : return MPI_Send_init;
    }
  }

  MPI_Op mpi_op( by op ) noexcept;
}

namespace courier {
  // Transport over an MPI communicator. Tickets box an MPI_Request, matched
  // probes box an MPI_Message.
  class MpiTransport : public Transport {
  private:
    CommHandle _comm;

    int collective( const Operation& op, MPI_Request* req ) const;

  public:
    explicit MpiTransport( CommHandle comm ) : _comm( std::move(comm) ) {}

    static std::shared_ptr<MpiTransport> adopt( MPI_Comm comm );
    static std::shared_ptr<MpiTransport> borrow( MPI_Comm comm );

    inline MPI_Comm native() const noexcept { return _comm.get(); }
    // world and self are borrowed, never freed
    inline bool is_predefined() const noexcept { return _comm.is_borrowed(); }
    // releases the communicator now instead of with the last owner
    inline void release() noexcept { _comm.reset(); }

    int rank() const override;
    int size() const override;
    bool is_inter() const override;
    int remote_size() const override;

    std::shared_ptr<Transport> duplicate() const override;
    std::shared_ptr<Transport> split( std::optional<int> color, int key ) const override;

    Status execute( const Operation& op ) override;

    Envelope probe( int source, int tag, bool matched ) override;
    std::optional<Envelope> iprobe( int source, int tag ) override;
    Status receive( const Descriptor& recv, Envelope& envelope ) override;

    Ticket post( const Operation& op ) override;
    Ticket prepare( const Operation& op ) override;
    void start( Ticket ticket ) override;

    Status wait( Ticket ticket ) override;
    std::optional<Status> test( Ticket ticket ) override;
    void cancel( Ticket ticket ) override;
    void free( Ticket ticket ) override;

    std::pair<std::size_t, Status> wait_any( const std::vector<Ticket>& tickets ) override;
    std::vector<std::pair<std::size_t, Status>> wait_some( const std::vector<Ticket>& tickets ) override;
    std::vector<Status> wait_all( const std::vector<Ticket>& tickets ) override;
  };
}

#endif
