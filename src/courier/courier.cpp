#include "courier/courier.hpp"
#include "courier/errors.hpp"
#include "courier/mpi_transport.hpp"
#include "logger/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "fmt/format.h"

namespace courier {
  template < typename E >
  int CommAccessor<E>::rank() const {
    return _transport().rank();
  }

  template < typename E >
  int CommAccessor<E>::size() const {
    return _transport().size();
  }

  template < typename E >
  bool CommAccessor<E>::is_inter() const {
    return _transport().is_inter();
  }

  template < typename E >
  int CommAccessor<E>::remote_size() const {
    return _transport().remote_size();
  }

  template struct CommAccessor<Comm>;
}

namespace courier::impl {
  CommState::~CommState() {
    try {
      attributes.clear();
    } catch ( const std::exception& e ) {
      lgr::err << "deleting communicator attributes failed: " << e.what() << std::endl;
    }
  }
}

// courier::Comm
namespace courier {
  namespace {
    MPI_Comm mpi_native( const Comm& comm ) {
      MPI_Comm c = comm.native();
      if ( c == MPI_COMM_NULL )
        throw std::invalid_argument( "topology constructors need a communicator that runs on MPI" );
      return c;
    }
  }

  Comm::Comm( std::shared_ptr<Transport> transport ) {
    if ( transport ) _state = std::make_shared<impl::CommState>( std::move(transport) );
  }

  Transport& Comm::transport() const {
    if ( !_state || !_state->transport ) throw Error( "operation on a null or freed communicator" );
    return *_state->transport;
  }

  std::shared_ptr<Transport> Comm::shared_transport() const {
    transport();
    return _state->transport;
  }

  MPI_Comm Comm::native() const {
    if ( !*this ) return MPI_COMM_NULL;
    const auto* m = dynamic_cast<const MpiTransport*>( _state->transport.get() );
    return m ? m->native() : MPI_COMM_NULL;
  }

  Comm::operator bool() const noexcept {
    return _state && _state->transport;
  }

  Comm Comm::dup() const {
    Comm res( transport().duplicate() );
    res._state->attributes = _state->attributes.copy();
    return res;
  }

  std::optional<Comm> Comm::split( std::optional<unsigned int> color, int key ) const {
    std::optional<int> c;
    if ( color ) c.emplace( static_cast<int>(*color) );
    auto t = transport().split( c, key );
    if ( !t ) return std::nullopt;
    return Comm( std::move(t) );
  }

  std::optional<Comm> Comm::split( std::optional<unsigned int> color ) const {
    return split( std::move(color), rank() );
  }

  void Comm::free() {
    auto& t = transport();
    if ( const auto* m = dynamic_cast<const MpiTransport*>(&t); m && m->is_predefined() )
      throw Error( "predefined communicators cannot be freed" );
    _state->attributes.clear();
    if ( auto* m = dynamic_cast<MpiTransport*>(&t) ) m->release();
    _state->transport.reset();
  }

  void Comm::set_attr( int keyval, std::any value ) const {
    if ( !_state ) throw Error( "attribute on a null communicator" );
    _state->attributes.set( keyval, std::move(value) );
  }

  const std::any* Comm::get_attr( int keyval ) const {
    return _state ? _state->attributes.get(keyval) : nullptr;
  }

  bool Comm::delete_attr( int keyval ) const {
    return _state && _state->attributes.erase(keyval);
  }
}

// courier::world, courier::self
namespace courier {
  const Comm world( MpiTransport::borrow(MPI_COMM_WORLD) );
  const Comm self( MpiTransport::borrow(MPI_COMM_SELF) );
}

// courier cartesian
namespace courier {
  namespace {
    std::shared_ptr<Transport> make_cart( const Comm& comm, std::vector<int>& dims, const std::vector<bool>& periodic ) {
      const int ndims = std::min( dims.size(), periodic.size() );

      std::vector<int> periods(ndims);
      for ( int i = 0; i < ndims; ++i )
        periods[i] = static_cast<int>( periodic[i] );

      MPI_Comm comm_cart;
      check( MPI_Cart_create( mpi_native(comm), ndims, dims.data(), periods.data(), true, &comm_cart ), "MPI_Cart_create" );
      // processes left out of the grid get a null communicator
      if ( comm_cart == MPI_COMM_NULL ) return nullptr;
      return MpiTransport::adopt(comm_cart);
    }
  }

  CartComm::CartComm( const Comm& comm, std::vector<int> dims, std::vector<bool> periodic )
    : Comm( make_cart( comm, dims, periodic ) ) {}

  std::vector<int> CartComm::rank2coords( int rank ) const {
    int ndims = 0;
    check( MPI_Cartdim_get( mpi_native(*this), &ndims ), "MPI_Cartdim_get" );
    std::vector<int> coords(ndims);
    check( MPI_Cart_coords( mpi_native(*this), rank, ndims, coords.data() ), "MPI_Cart_coords" );
    return coords;
  }

  std::optional<int> CartComm::coords2rank( const std::vector<int>& coords ) const {
    const auto [c, dims, periodic] = coords_dims_periodic();
    if ( coords.size() != c.size() ) return {};
    for ( std::size_t i = 0; i < c.size(); ++i ) {
      if ( !periodic[i] && ( coords[i] < 0 || coords[i] > dims[i] - 1 ) )
        return {};
    }

    int rank = 0;
    check( MPI_Cart_rank( mpi_native(*this), coords.data(), &rank ), "MPI_Cart_rank" );
    return {rank};
  }

  std::tuple<std::vector<int>, std::vector<int>, std::vector<bool>>
  CartComm::coords_dims_periodic() const {
    int ndims = 0;
    check( MPI_Cartdim_get( mpi_native(*this), &ndims ), "MPI_Cartdim_get" );
    std::vector<int> coords(ndims);
    std::vector<int> dims(ndims);
    std::vector<int> periods(ndims);
    check( MPI_Cart_get( mpi_native(*this), ndims, dims.data(), periods.data(), coords.data() ), "MPI_Cart_get" );

    std::vector<bool> periodic(ndims);
    for ( int i = 0; i < ndims; ++i ) periodic[i] = periods[i];
    return std::make_tuple( coords, dims, periodic );
  }

  std::pair<int, int> CartComm::shift( int ith_dim, int disp ) const {
    int rank_src = PROC_NULL, rank_dest = PROC_NULL;
    check( MPI_Cart_shift( mpi_native(*this), ith_dim, disp, &rank_src, &rank_dest ), "MPI_Cart_shift" );
    return { rank_src, rank_dest };
  }
}

// intercommunicator
namespace courier {
  namespace {
    std::shared_ptr<Transport> make_intercomm( const Comm& local_comm, int local_leader, const std::optional<Comm>& peer_comm,
                                               int remote_leader, int tag ) {
      MPI_Comm pc = MPI_COMM_NULL;
      if ( local_comm.rank() == local_leader ) {
        if ( !peer_comm ) throw std::invalid_argument( "the local leader needs a peer communicator" );
        pc = mpi_native(*peer_comm);
      }

      MPI_Comm comm;
      check( MPI_Intercomm_create( mpi_native(local_comm), local_leader, pc, remote_leader, tag, &comm ),
             "MPI_Intercomm_create" );
      return MpiTransport::adopt(comm);
    }
  }

  InterComm::InterComm( const Comm& local_comm, int local_leader, const std::optional<Comm>& peer_comm, int remote_leader, int tag )
    : Comm( make_intercomm( local_comm, local_leader, peer_comm, remote_leader, tag ) ) {}
}

namespace courier {
  namespace {
    std::vector<char> send_buffer;

    bool mpi_running() {
      int initialized = 0, finalized = 0;
      MPI_Initialized(&initialized);
      MPI_Finalized(&finalized);
      return initialized && !finalized;
    }
  }

  void attach_buffer( std::size_t bytes ) {
    detach_buffer();
    send_buffer.resize( bytes + MPI_BSEND_OVERHEAD );
    check( MPI_Buffer_attach( send_buffer.data(), static_cast<int>( send_buffer.size() ) ), "MPI_Buffer_attach" );
  }

  void detach_buffer() {
    if ( send_buffer.empty() ) return;
    void* addr = nullptr;
    int size = 0;
    // blocks until the buffered sends are out
    check( MPI_Buffer_detach( &addr, &size ), "MPI_Buffer_detach" );
    send_buffer.clear();
    send_buffer.shrink_to_fit();
  }

  void initialize( int argc, char** argv ) {
    Config cfg;
    if ( const char* path = std::getenv("COURIER_CONFIG"); path && *path )
      cfg = Config::load(path);
    initialize( argc, argv, cfg );
  }

  void initialize( int argc, char** argv, const Config& cfg ) {
    configure(cfg);

    int initialized = 0;
    MPI_Initialized(&initialized);
    if ( !initialized && cfg.initialize ) {
      int provided = MPI_THREAD_SINGLE;
      const int required = mpi_thread_level(cfg.thread_level);
      check( MPI_Init_thread( &argc, &argv, required, &provided ), "MPI_Init_thread" );
      if ( provided < required && world.rank() == 0 )
        lgr::out << "courier: MPI provides thread level " << provided << " below the requested " << required << std::endl;
    }
    if ( !mpi_running() ) return;

    if ( cfg.errors == Errors::EXCEPTION ) {
      check( MPI_Comm_set_errhandler( MPI_COMM_WORLD, MPI_ERRORS_RETURN ), "MPI_Comm_set_errhandler" );
      check( MPI_Comm_set_errhandler( MPI_COMM_SELF, MPI_ERRORS_RETURN ), "MPI_Comm_set_errhandler" );
    }

    if ( !cfg.log_file.empty() ) {
      std::filesystem::path file = fmt::format( fmt::runtime(cfg.log_file), fmt::arg( "rank", world.rank() ) );
      if ( file.has_parent_path() ) std::filesystem::create_directories( file.parent_path() );
      lgr::file.set_filename( file.string() );
    }
    lgr::file << "courier initialized on rank " << world.rank() << " of " << world.size() << std::endl;
  }

  void finalize() {
    if ( !mpi_running() ) return;

    impl::drain_orphans();
    detach_buffer();
    impl::uncommit_all();

    lgr::file << "courier finalized" << std::endl;
    lgr::file.close();

    if ( config().finalize ) MPI_Finalize();
  }
}
