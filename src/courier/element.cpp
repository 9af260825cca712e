#include "courier/element.hpp"
#include "courier/mpi_transport.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

namespace courier {
  Element::Element() noexcept : Element( byte_element() ) {}

  namespace {
    std::mutex committed_mutex;
    std::vector<MPI_Datatype*> committed;
  }

  void commit( MPI_Datatype& x ) {
    check( MPI_Type_commit(&x), "MPI_Type_commit" );
    std::lock_guard<std::mutex> lock(committed_mutex);
    committed.push_back(&x);
  }

  void uncommit( MPI_Datatype& x ) {
    {
      std::lock_guard<std::mutex> lock(committed_mutex);
      committed.erase( std::remove( committed.begin(), committed.end(), &x ), committed.end() );
    }
    if ( x != MPI_DATATYPE_NULL ) check( MPI_Type_free(&x), "MPI_Type_free" );
  }

  namespace impl {
    void uncommit_all() {
      std::vector<MPI_Datatype*> xs;
      {
        std::lock_guard<std::mutex> lock(committed_mutex);
        xs.swap(committed);
      }
      for ( auto* x : xs )
        if ( *x != MPI_DATATYPE_NULL ) MPI_Type_free(x);
    }
  }
}
