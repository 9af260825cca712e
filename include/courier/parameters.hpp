#ifndef _COURIER_PARAMETERS_HPP_
#define _COURIER_PARAMETERS_HPP_

#include <optional>
#include <vector>

#include "courier/payload.hpp"
#include "courier/transport.hpp"

namespace courier {
  // the shape of a communicator as one participant of a collective sees it
  struct Layout {
    int size = 1;
    int rank = 0;
    int root = 0;
    bool inter = false;
    int remote_size = 1;

    static Layout of( const Transport& transport, int root = 0 );

    // number of participants a vector argument is sized to
    inline int peers() const noexcept { return inter ? remote_size : size; }

    // on an intercommunicator the root passes ROOT, its group peers pass PROC_NULL
    inline bool is_root() const noexcept { return inter ? root == ROOT : rank == root; }
    inline bool is_idle() const noexcept { return inter && root == PROC_NULL; }
  };

  // per-participant counts and displacements for the vector side(s) of a collective
  struct ParameterSet {
    std::vector<int> send_counts;
    std::vector<int> send_displs;
    std::vector<int> recv_counts;
    std::vector<int> recv_displs;
  };

  // tightly packed layout: displs[i] = counts[0] + ... + counts[i-1]
  std::vector<int> packed_displacements( const std::vector<int>& counts );

  // Validates the buffers of one collective call as seen by this participant and
  // fills the vector arrays it needs. Throws CountMismatch before any transport
  // call. send or recv may be null for a side the caller did not provide. counts
  // only applies to reduce_scatter.
  ParameterSet derive_collective( Kind kind, const Layout& layout, const Buffer* send, const Buffer* recv,
                                  const std::optional<std::vector<int>>& counts = std::nullopt );

  // whether this participant moves data out of, or into, its buffers
  bool sends( Kind kind, const Layout& layout ) noexcept;
  bool receives( Kind kind, const Layout& layout ) noexcept;
}

#endif
