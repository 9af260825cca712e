#ifndef _COURIER_CODEC_HPP_
#define _COURIER_CODEC_HPP_

#include <array>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "courier/errors.hpp"

// Binary encoding of generic objects. The byte layout is private to courier:
// both ends of a transfer must be built from the same Codec specializations.
namespace courier {
  using length_t = std::uint64_t;

  class Writer {
  private:
    std::vector<char> _bytes;

  public:
    inline void write( const void* p, std::size_t n ) {
      const auto* c = static_cast<const char*>(p);
      _bytes.insert( _bytes.end(), c, c + n );
    }

    inline void write_length( std::size_t n ) {
      length_t len = n;
      write( &len, sizeof(len) );
    }

    inline std::vector<char> release() noexcept { return std::move(_bytes); }
    inline std::size_t size() const noexcept { return _bytes.size(); }
  };

  class Reader {
  private:
    const char* _p;
    std::size_t _left;

  public:
    Reader( const char* p, std::size_t n ) noexcept : _p(p), _left(n) {}

    void read( void* dest, std::size_t n );
    std::size_t read_length();

    inline std::size_t remaining() const noexcept { return _left; }
  };

  // specialize with encode( Writer&, const T& ) and decode( Reader& ) -> T
  template < typename T, typename = void >
  struct Codec {};

  template < typename T, typename = void >
  struct is_encodable : std::false_type {};

  template < typename T >
  struct is_encodable<T, std::void_t<decltype( Codec<T>::decode(std::declval<Reader&>()) )>> : std::true_type {};

  template < typename T >
  inline constexpr bool is_encodable_v = is_encodable<std::remove_cv_t<T>>::value;
}

namespace courier {
  template < typename T >
  struct Codec<T, std::enable_if_t<std::is_trivially_copyable_v<T> && !std::is_pointer_v<T>>> {
    static void encode( Writer& w, const T& x ) { w.write( &x, sizeof(T) ); }
    static T decode( Reader& r ) {
      T x;
      r.read( &x, sizeof(T) );
      return x;
    }
  };

  template <>
  struct Codec<std::string> {
    static void encode( Writer& w, const std::string& s ) {
      w.write_length( s.size() );
      w.write( s.data(), s.size() );
    }
    static std::string decode( Reader& r ) {
      std::string s( r.read_length(), '\0' );
      r.read( s.data(), s.size() );
      return s;
    }
  };

  template < typename T >
  struct Codec<std::vector<T>, std::enable_if_t<is_encodable_v<T>>> {
    static void encode( Writer& w, const std::vector<T>& v ) {
      w.write_length( v.size() );
      if constexpr ( std::is_trivially_copyable_v<T> && !std::is_same_v<T, bool> )
        w.write( v.data(), v.size() * sizeof(T) );
      else
        for ( const auto& x : v ) Codec<T>::encode( w, x );
    }
    static std::vector<T> decode( Reader& r ) {
      const auto n = r.read_length();
      std::vector<T> v;
      if constexpr ( std::is_trivially_copyable_v<T> && !std::is_same_v<T, bool> ) {
        if ( n > r.remaining() / sizeof(T) ) throw CodecError("vector length exceeds the encoded bytes");
        v.resize(n);
        r.read( v.data(), n * sizeof(T) );
      } else {
        if ( n > r.remaining() ) throw CodecError("vector length exceeds the encoded bytes");
        v.reserve(n);
        for ( std::size_t i = 0; i < n; ++i ) v.push_back( Codec<T>::decode(r) );
      }
      return v;
    }
  };

  template < typename T, std::size_t N >
  struct Codec<std::array<T, N>, std::enable_if_t<is_encodable_v<T> && !std::is_trivially_copyable_v<std::array<T, N>>>> {
    static void encode( Writer& w, const std::array<T, N>& a ) {
      for ( const auto& x : a ) Codec<T>::encode( w, x );
    }
    static std::array<T, N> decode( Reader& r ) {
      std::array<T, N> a;
      for ( auto& x : a ) x = Codec<T>::decode(r);
      return a;
    }
  };

  template < typename A, typename B >
  struct Codec<std::pair<A, B>, std::enable_if_t<is_encodable_v<A> && is_encodable_v<B> && !std::is_trivially_copyable_v<std::pair<A, B>>>> {
    static void encode( Writer& w, const std::pair<A, B>& p ) {
      Codec<A>::encode( w, p.first );
      Codec<B>::encode( w, p.second );
    }
    static std::pair<A, B> decode( Reader& r ) {
      auto a = Codec<A>::decode(r);
      auto b = Codec<B>::decode(r);
      return { std::move(a), std::move(b) };
    }
  };

  template < typename... Ts >
  struct Codec<std::tuple<Ts...>, std::enable_if_t<( is_encodable_v<Ts> && ... ) && !std::is_trivially_copyable_v<std::tuple<Ts...>>>> {
    static void encode( Writer& w, const std::tuple<Ts...>& t ) {
      std::apply( [&w]( const auto&... xs ) { ( Codec<std::decay_t<decltype(xs)>>::encode( w, xs ), ... ); }, t );
    }
    static std::tuple<Ts...> decode( Reader& r ) {
      // braced init list guarantees left to right evaluation
      return std::tuple<Ts...>{ Codec<Ts>::decode(r)... };
    }
  };

  template < typename T >
  struct Codec<std::optional<T>, std::enable_if_t<is_encodable_v<T> && !std::is_trivially_copyable_v<std::optional<T>>>> {
    static void encode( Writer& w, const std::optional<T>& x ) {
      const char has = x ? 1 : 0;
      w.write( &has, 1 );
      if ( x ) Codec<T>::encode( w, *x );
    }
    static std::optional<T> decode( Reader& r ) {
      char has = 0;
      r.read( &has, 1 );
      if ( !has ) return std::nullopt;
      return Codec<T>::decode(r);
    }
  };

  template < typename K, typename V >
  struct Codec<std::map<K, V>, std::enable_if_t<is_encodable_v<K> && is_encodable_v<V>>> {
    static void encode( Writer& w, const std::map<K, V>& m ) {
      w.write_length( m.size() );
      for ( const auto& [k, v] : m ) {
        Codec<K>::encode( w, k );
        Codec<V>::encode( w, v );
      }
    }
    static std::map<K, V> decode( Reader& r ) {
      const auto n = r.read_length();
      if ( n > r.remaining() ) throw CodecError("map length exceeds the encoded bytes");
      std::map<K, V> m;
      for ( std::size_t i = 0; i < n; ++i ) {
        auto k = Codec<K>::decode(r);
        m.emplace( std::move(k), Codec<V>::decode(r) );
      }
      return m;
    }
  };
}

namespace courier {
  template < typename T >
  std::vector<char> encode( const T& x ) {
    static_assert( is_encodable_v<T>, "courier::Codec is not specialized for this type" );
    Writer w;
    Codec<std::remove_cv_t<T>>::encode( w, x );
    return w.release();
  }

  // the whole byte range must be consumed
  template < typename T >
  T decode( const char* bytes, std::size_t size ) {
    static_assert( is_encodable_v<T>, "courier::Codec is not specialized for this type" );
    Reader r( bytes, size );
    T x = Codec<T>::decode(r);
    if ( r.remaining() != 0 ) throw CodecError("trailing bytes after decoding");
    return x;
  }

  template < typename T >
  inline T decode( const std::vector<char>& bytes ) {
    return decode<T>( bytes.data(), bytes.size() );
  }
}

#endif
