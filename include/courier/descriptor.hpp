#ifndef _COURIER_DESCRIPTOR_HPP_
#define _COURIER_DESCRIPTOR_HPP_

#include <vector>

#include "courier/element.hpp"

namespace courier {
  // Everything a transfer primitive needs for one side of a transfer. It never owns
  // caller buffers. It owns the scratch it was built with ( encoded bytes, derived
  // counts and displacements ), released exactly once with the descriptor.
  // NOTE moving a descriptor keeps every raw pointer valid because std::vector
  // moves keep their storage.
  class Descriptor {
  private:
    void* _address = nullptr;
    int _count = 0;
    Element _element;
    std::vector<int> _counts;
    std::vector<int> _displs;
    std::vector<char> _scratch;
    bool _vector = false;
    bool _in_place = false;

  public:
    Descriptor() = default; // empty transfer of bytes
    Descriptor( void* address, int count, Element element );

    Descriptor( const Descriptor& ) = delete;
    Descriptor& operator=( const Descriptor& ) = delete;
    Descriptor( Descriptor&& ) noexcept = default;
    Descriptor& operator=( Descriptor&& ) noexcept = default;

    static Descriptor empty( Element element );
    static Descriptor in_place( Element element, int count = 0 );
    static Descriptor owning( std::vector<char> bytes );
    // counts and displs must already be sized to the group, see parameters.hpp
    static Descriptor vectored( void* address, int count, Element element,
                                std::vector<int> counts, std::vector<int> displs );

    inline void* address() const noexcept { return _address; }
    inline int count() const noexcept { return _count; }
    inline const Element& element() const noexcept { return _element; }
    inline std::size_t bytes() const noexcept { return static_cast<std::size_t>(_count) * _element.extent(); }

    inline bool is_empty() const noexcept { return _count == 0 && !_vector; }
    inline bool is_vector() const noexcept { return _vector; }
    inline bool is_in_place() const noexcept { return _in_place; }
    inline bool owns_scratch() const noexcept { return !_scratch.empty(); }

    inline const std::vector<int>& counts() const noexcept { return _counts; }
    inline const std::vector<int>& displs() const noexcept { return _displs; }
    inline const int* counts_data() const noexcept { return _vector ? _counts.data() : nullptr; }
    inline const int* displs_data() const noexcept { return _vector ? _displs.data() : nullptr; }

    inline const std::vector<char>& scratch() const noexcept { return _scratch; }

    // copies the described elements into owned scratch, keeping element and count
    void retain();
  };

  // the per-call value a transfer owns. Point-to-point calls use one side
  struct Message {
    Descriptor send;
    Descriptor recv;
  };
}

#endif
