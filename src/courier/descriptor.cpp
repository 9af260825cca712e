#include "courier/descriptor.hpp"
#include "courier/errors.hpp"

#include <limits>

#include "fmt/format.h"

namespace courier {
  Descriptor::Descriptor( void* address, int count, Element element )
    : _address(address), _count(count), _element(element) {
    if ( count < 0 )
      throw CountMismatch( fmt::format("negative element count {}", count) );
    if ( count > 0 && !address )
      throw CountMismatch( fmt::format("null buffer declared with {} elements", count) );
  }

  Descriptor Descriptor::empty( Element element ) {
    return Descriptor( nullptr, 0, element );
  }

  Descriptor Descriptor::in_place( Element element, int count ) {
    Descriptor d;
    d._element = element;
    d._count = count;
    d._in_place = true;
    return d;
  }

  Descriptor Descriptor::owning( std::vector<char> bytes ) {
    if ( bytes.size() > static_cast<std::size_t>( std::numeric_limits<int>::max() ) )
      throw CountMismatch( fmt::format("encoded object of {} bytes exceeds the largest transfer count", bytes.size()) );
    Descriptor d;
    d._scratch = std::move(bytes);
    d._address = d._scratch.empty() ? nullptr : d._scratch.data();
    d._count = static_cast<int>( d._scratch.size() );
    return d;
  }

  Descriptor Descriptor::vectored( void* address, int count, Element element,
                                   std::vector<int> counts, std::vector<int> displs ) {
    Descriptor d( address, count, element );
    d._counts = std::move(counts);
    d._displs = std::move(displs);
    d._vector = true;
    return d;
  }

  void Descriptor::retain() {
    if ( !_address || _count == 0 || owns_scratch() ) return;
    const char* p = static_cast<const char*>(_address);
    _scratch.assign( p, p + bytes() );
    _address = _scratch.data();
  }
}
