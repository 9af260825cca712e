#ifndef _COURIER_HPP_
#define _COURIER_HPP_

#include <any>
#include <memory>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

#include "courier/attributes.hpp"
#include "courier/collective.hpp"
#include "courier/config.hpp"
#include "courier/p2p.hpp"

namespace courier {
  template < typename E >
  struct CommAccessor {
  private:
    inline const Transport& _transport() const {
      return static_cast<const E&>(*this).transport();
    }
  public:
    int rank() const;
    int size() const;
    bool is_inter() const;
    // the local size on an intracommunicator
    int remote_size() const;
  };
}

namespace courier::impl {
  // shared by all copies of a communicator handle
  struct CommState {
    std::shared_ptr<Transport> transport;
    AttributeTable attributes;

    CommState( std::shared_ptr<Transport> t ) : transport( std::move(t) ) {}
    ~CommState();
  };
}

namespace courier {
  // Copies are handles to one communicator. A default constructed Comm is null.
  struct Comm : public CommAccessor<Comm>,
                public P2P_Comm<Comm>,
                public Collective_Comm<Comm> {
  private:
    std::shared_ptr<impl::CommState> _state;

  public:
    Comm() = default;
    explicit Comm( std::shared_ptr<Transport> transport );
    virtual ~Comm() = default;

    // throws on a null or freed communicator
    Transport& transport() const;
    std::shared_ptr<Transport> shared_transport() const;
    // MPI_COMM_NULL unless the communicator runs on MPI
    MPI_Comm native() const;

    explicit operator bool() const noexcept;

    // attributes follow into the duplicate as their copy functions decide
    Comm dup() const;
    std::optional<Comm> split( std::optional<unsigned int> color, int key ) const;
    std::optional<Comm> split( std::optional<unsigned int> color ) const;
    // deletes the attributes and releases the communicator for every copy of this handle
    void free();

    void set_attr( int keyval, std::any value ) const;
    // nullptr when unset
    const std::any* get_attr( int keyval ) const;
    bool delete_attr( int keyval ) const;

    template < typename T >
    const T* attr( int keyval ) const {
      const auto* a = get_attr(keyval);
      return a ? std::any_cast<T>(a) : nullptr;
    }
  };
}

namespace courier {
  struct CartComm : public Comm {
    CartComm( const Comm& comm, std::vector<int> dims, std::vector<bool> periodic );

    std::vector<int> rank2coords( int rank ) const;

    // coords will be automatically normalized in the case of periodic topology
    std::optional<int> coords2rank( const std::vector<int>& coords ) const;

    inline std::vector<int> coords() const {
      return rank2coords( rank() );
    }

    std::tuple<std::vector<int>, std::vector<int>, std::vector<bool>>
    coords_dims_periodic() const;

    // Sending in the `ith_dim` by `disp`, returns [ src_rank, dest_rank ]. Either is
    // PROC_NULL past a non-periodic boundary, so exchanges with it are no-ops
    std::pair<int, int> shift( int ith_dim, int disp = 1 ) const;
  };
}

namespace courier {
  struct InterComm : public Comm {
    InterComm( const Comm& local_comm, int local_leader, const std::optional<Comm>& peer_comm, int remote_leader, int tag );
  };
}

namespace courier {
  // reads the file named by COURIER_CONFIG when it is set
  void initialize( int argc, char** argv );
  void initialize( int argc, char** argv, const Config& cfg );
  void finalize();

  // buffer space for SendMode::BUF
  void attach_buffer( std::size_t bytes );
  void detach_buffer();

  extern const Comm world;
  extern const Comm self;
}

#endif
