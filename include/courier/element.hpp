#ifndef _COURIER_ELEMENT_HPP_
#define _COURIER_ELEMENT_HPP_

#include <mpi.h>

#include <cstddef>
#include <type_traits>
#include <typeinfo>

namespace courier {
  // NOTE for custom datatypes, a specialization of Datatype should have
  //   static inline MPI_Datatype type = MPI_DATATYPE_NULL;
  //   static void define(MPI_Datatype&);
  // and be committed once through courier::commit( Datatype<T>{} ) before use.
  template < typename T >
  struct Datatype {};

#define COURIER_BUILTIN_DATATYPE(_TYPE_, _MPI_)                \
  template <>                                                 \
  struct Datatype<_TYPE_> {                                   \
    static inline MPI_Datatype type = _MPI_;                  \
  }

  COURIER_BUILTIN_DATATYPE(bool, MPI_CXX_BOOL);
  COURIER_BUILTIN_DATATYPE(char, MPI_CHAR);
  COURIER_BUILTIN_DATATYPE(signed char, MPI_SIGNED_CHAR);
  COURIER_BUILTIN_DATATYPE(short, MPI_SHORT);
  COURIER_BUILTIN_DATATYPE(int, MPI_INT);
  COURIER_BUILTIN_DATATYPE(long, MPI_LONG);
  COURIER_BUILTIN_DATATYPE(long long, MPI_LONG_LONG_INT);
  COURIER_BUILTIN_DATATYPE(unsigned char, MPI_UNSIGNED_CHAR);
  COURIER_BUILTIN_DATATYPE(unsigned short, MPI_UNSIGNED_SHORT);
  COURIER_BUILTIN_DATATYPE(unsigned int, MPI_UNSIGNED);
  COURIER_BUILTIN_DATATYPE(unsigned long, MPI_UNSIGNED_LONG);
  COURIER_BUILTIN_DATATYPE(unsigned long long, MPI_UNSIGNED_LONG_LONG);
  COURIER_BUILTIN_DATATYPE(float, MPI_FLOAT);
  COURIER_BUILTIN_DATATYPE(double, MPI_DOUBLE);
  COURIER_BUILTIN_DATATYPE(long double, MPI_LONG_DOUBLE);
  COURIER_BUILTIN_DATATYPE(std::byte, MPI_BYTE);

#undef COURIER_BUILTIN_DATATYPE

  template < typename T, typename = void >
  struct is_datatype : std::false_type {};

  template < typename T >
  struct is_datatype<T, std::void_t<decltype(Datatype<std::remove_cv_t<T>>::type)>> : std::true_type {};

  template < typename T >
  inline constexpr bool is_datatype_v = is_datatype<T>::value;
}

namespace courier {
  struct ElementInfo {
    const MPI_Datatype* native; // late bound so that committed custom types are seen
    std::size_t extent;
    std::size_t alignment;
    const char* name;
  };

  // Opaque element descriptor. Copies share one ElementInfo record per type.
  class Element {
  private:
    const ElementInfo* _info;

  public:
    Element() noexcept; // the byte element
    explicit Element( const ElementInfo& info ) noexcept : _info(&info) {}

    inline MPI_Datatype native() const noexcept { return *_info->native; }
    inline std::size_t extent() const noexcept { return _info->extent; }
    inline std::size_t alignment() const noexcept { return _info->alignment; }
    inline const char* name() const noexcept { return _info->name; }

    inline bool operator==( const Element& other ) const noexcept { return _info == other._info; }
    inline bool operator!=( const Element& other ) const noexcept { return _info != other._info; }
  };

  template < typename T >
  Element element() noexcept {
    using U = std::remove_cv_t<T>;
    static_assert( is_datatype_v<U>, "courier::Datatype is not specialized for this type" );
    static const ElementInfo info { &Datatype<U>::type, sizeof(U), alignof(U), typeid(U).name() };
    return Element(info);
  }

  inline Element byte_element() noexcept { return element<std::byte>(); }
}

namespace courier {
  void commit( MPI_Datatype& x );
  void uncommit( MPI_Datatype& x );

  template < typename T >
  void commit( Datatype<T> ) {
    auto& x = Datatype<T>::type;
    Datatype<T>::define(x);
    commit(x);
  }

  template < typename T >
  void uncommit( Datatype<T> ) {
    uncommit( Datatype<T>::type );
  }
}

#endif
