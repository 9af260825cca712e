#ifndef _TEST_FAKE_TRANSPORT_HPP_
#define _TEST_FAKE_TRANSPORT_HPP_

#include "courier/transport.hpp"

#include <deque>
#include <map>
#include <memory>
#include <vector>

namespace fake {
  using namespace courier;

  // Single process engine. Point-to-point traffic loops back through a mailbox,
  // so a send to any rank can be received from that rank. Collectives are recorded
  // and, on a group of one, move their data the way the engine would.
  class FakeTransport : public Transport {
  public:
    struct Mail {
      int source = 0;
      int tag = 0;
      std::vector<char> bytes;
    };

    struct Recorded {
      Kind kind;
      int send_count;
      int recv_count;
      bool send_vector;
      bool recv_vector;
      bool send_in_place;
      bool recv_in_place;
      std::vector<int> send_counts;
      std::vector<int> recv_counts;
      std::vector<int> recv_displs;
    };

  private:
    struct Pending {
      Operation op;
      bool persistent = false;
      bool cancelled = false;
    };

    std::map<void*, std::unique_ptr<Pending>> _pending;
    std::map<void*, std::unique_ptr<Mail>> _matched;

    void deliver( const Operation& op );
    Status take( const Operation& op, Mail mail );
    std::deque<Mail>::iterator find( int source, int tag );
    void record( const Operation& op );
    Status finish( Pending& p );

  public:
    int my_rank = 0;
    int my_size = 1;
    bool inter = false;
    int my_remote_size = 1;

    // while held, test() never completes anything
    bool hold = false;
    // operations with this tag complete with MPI_ERR_OTHER
    int failing_tag = -12345;

    int executes = 0;
    int probes = 0;
    int receives = 0;
    int posts = 0;
    int prepares = 0;
    int starts = 0;
    int cancels = 0;
    int frees = 0;

    std::deque<Mail> mailbox;
    std::vector<Recorded> collectives;

    FakeTransport() = default;
    FakeTransport( int rank, int size ) : my_rank(rank), my_size(size) {}

    // every call that reached the engine
    inline int calls() const noexcept { return executes + probes + receives + posts + prepares; }
    inline std::size_t live_tickets() const noexcept { return _pending.size(); }

    int rank() const override { return my_rank; }
    int size() const override { return my_size; }
    bool is_inter() const override { return inter; }
    int remote_size() const override { return inter ? my_remote_size : my_size; }

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
  };

  inline std::shared_ptr<FakeTransport> make( int rank = 0, int size = 1 ) {
    return std::make_shared<FakeTransport>( rank, size );
  }
}

#endif
