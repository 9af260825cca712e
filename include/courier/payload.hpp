#ifndef _COURIER_PAYLOAD_HPP_
#define _COURIER_PAYLOAD_HPP_

#include <array>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

#include "courier/codec.hpp"
#include "courier/element.hpp"

namespace courier {
  struct InPlace {};
  inline constexpr InPlace IN_PLACE {};

  // buffer-like payload. counts/displs describe a per-participant layout and are
  // only read by the vector collectives
  struct Buffer {
    void* address = nullptr;
    int count = 0;
    Element element;
    std::optional<std::vector<int>> counts;
    std::optional<std::vector<int>> displs;
    bool read_only = false;
    bool in_place = false;
    bool temporary = false; // dies with the calling expression

    inline Buffer& vectored( std::vector<int> c, std::optional<std::vector<int>> d = std::nullopt ) & {
      counts.emplace( std::move(c) );
      displs = std::move(d);
      return *this;
    }

    inline Buffer&& vectored( std::vector<int> c, std::optional<std::vector<int>> d = std::nullopt ) && {
      return std::move( vectored( std::move(c), std::move(d) ) );
    }
  };

  template < typename T >
  Buffer buffer( T* p, int count ) {
    Buffer b;
    b.address = const_cast<std::remove_cv_t<T>*>(p);
    b.count = count;
    b.element = element<T>();
    b.read_only = std::is_const_v<T>;
    return b;
  }

  template < typename T >
  inline Buffer buffer( std::vector<T>& v ) { return buffer( v.data(), static_cast<int>(v.size()) ); }

  template < typename T >
  inline Buffer buffer( const std::vector<T>& v ) { return buffer( v.data(), static_cast<int>(v.size()) ); }

  // generic payload: encode is empty for receive-only sinks, decode is empty for read-only sources
  struct Object {
    const char* type_name = "";
    std::function<std::vector<char>()> encode;
    std::function<void(const char*, std::size_t)> decode;
  };

  template < typename T >
  Object object( T& x ) {
    using U = std::remove_cv_t<T>;
    static_assert( is_encodable_v<U>, "courier::Codec is not specialized for this type" );
    Object o;
    o.type_name = typeid(U).name();
    const U* src = &x;
    o.encode = [src]() { return courier::encode(*src); };
    if constexpr ( !std::is_const_v<T> ) {
      U* dest = &x;
      o.decode = [dest]( const char* bytes, std::size_t n ) { *dest = courier::decode<U>( bytes, n ); };
    }
    return o;
  }

  struct Empty {};

  struct Opaque {
    const char* type_name = "";
  };
}

namespace courier::impl {
  template < typename T >
  struct buffer_like : std::false_type {};

  template < typename E, typename A >
  struct buffer_like<std::vector<E, A>> : std::bool_constant<is_datatype_v<E> && !std::is_same_v<E, bool>> {
    using element_type = E;
  };

  template < typename E, std::size_t N >
  struct buffer_like<std::array<E, N>> : std::bool_constant<is_datatype_v<E>> {
    using element_type = E;
  };

  template < typename E, std::size_t N >
  struct buffer_like<E[N]> : std::bool_constant<is_datatype_v<E>> {
    using element_type = E;
  };
}

namespace courier {
  class Payload {
  private:
    std::variant<Empty, Buffer, Object, Opaque> _v;

    template < typename T >
    static constexpr bool is_special_v =
      std::is_same_v<std::decay_t<T>, Payload> || std::is_same_v<std::decay_t<T>, Buffer> ||
      std::is_same_v<std::decay_t<T>, Object> || std::is_same_v<std::decay_t<T>, InPlace> ||
      std::is_same_v<std::decay_t<T>, std::nullptr_t> || std::is_same_v<std::decay_t<T>, Empty>;

  public:
    Payload() = default;
    Payload( std::nullptr_t ) noexcept {}
    Payload( Empty ) noexcept {}
    Payload( InPlace ) {
      Buffer b;
      b.in_place = true;
      _v = std::move(b);
    }
    Payload( Buffer b ) : _v( std::move(b) ) {}
    Payload( Object o ) : _v( std::move(o) ) {}

    // classifies any other value: contiguous datatype elements are buffer-like,
    // encodable values are generic objects, anything else is opaque. Rvalues are read-only
    // temporaries, which a transfer outliving the call has to copy.
    template < typename T, typename = std::enable_if_t<!is_special_v<T>> >
    Payload( T&& x ) {
      using U = std::remove_cv_t<std::remove_reference_t<T>>;
      constexpr bool temporary = !std::is_lvalue_reference_v<T>;
      constexpr bool read_only = std::is_const_v<std::remove_reference_t<T>> || temporary;
      if constexpr ( impl::buffer_like<U>::value ) {
        using E = typename impl::buffer_like<U>::element_type;
        Buffer b;
        b.address = const_cast<E*>( static_cast<const E*>( std::data(x) ) );
        b.count = static_cast<int>( std::size(x) );
        b.element = courier::element<E>();
        b.read_only = read_only;
        b.temporary = temporary;
        _v = std::move(b);
      } else if constexpr ( is_datatype_v<U> && !std::is_pointer_v<U> ) {
        Buffer b;
        b.address = const_cast<U*>( static_cast<const U*>( &x ) );
        b.count = 1;
        b.element = courier::element<U>();
        b.read_only = read_only;
        b.temporary = temporary;
        _v = std::move(b);
      } else if constexpr ( is_encodable_v<U> && !std::is_pointer_v<U> ) {
        if constexpr ( read_only ) _v = courier::object( static_cast<const U&>(x) );
        else _v = courier::object( static_cast<U&>(x) );
      } else {
        _v = Opaque{ typeid(U).name() };
      }
    }

    inline bool is_empty() const noexcept { return std::holds_alternative<Empty>(_v); }
    inline const Buffer* buffer() const noexcept { return std::get_if<Buffer>(&_v); }
    inline const Object* object() const noexcept { return std::get_if<Object>(&_v); }
    inline const Opaque* opaque() const noexcept { return std::get_if<Opaque>(&_v); }

    // element of a buffer-like payload, the byte element otherwise
    inline Element element() const noexcept {
      if ( const auto* b = buffer() ) return b->element;
      return byte_element();
    }
  };
}

#endif
