#ifndef _APT_HANDLE_HPP_
#define _APT_HANDLE_HPP_

#include <memory>

namespace apt {
  // Shared ownership of an engine handle such as MPI_Comm. The last owning copy
  // calls Release on the raw value. A borrowed handle ( e.g. MPI_COMM_WORLD ) is
  // never released.
  template < typename RawHdl, void (*Release)(RawHdl&), RawHdl (*Null)() >
  struct Handle {
  private:
    struct Owned {
      RawHdl raw;
      explicit Owned( RawHdl r ) : raw(r) {}
      Owned( const Owned& ) = delete;
      Owned& operator=( const Owned& ) = delete;
      ~Owned() { Release(raw); }
    };

    std::shared_ptr<Owned> _owned;
    RawHdl _borrowed = Null();

  public:
    Handle() = default;
    Handle( const Handle& ) = default;
    Handle( Handle&& ) noexcept = default;
    virtual ~Handle() = default;

    Handle& operator=( const Handle& ) = default;
    Handle& operator=( Handle&& ) noexcept = default;

    static Handle adopt( RawHdl raw ) {
      Handle hdl;
      if ( raw != Null() ) hdl._owned = std::make_shared<Owned>(raw);
      return hdl;
    }

    static Handle borrow( RawHdl raw ) noexcept {
      Handle hdl;
      hdl._borrowed = raw;
      return hdl;
    }

    inline void reset() noexcept {
      _owned.reset();
      _borrowed = Null();
    }

    inline RawHdl get() const noexcept { return _owned ? _owned->raw : _borrowed; }

    operator RawHdl() const noexcept { return get(); }

    explicit operator bool() const noexcept { return get() != Null(); }

    inline bool is_borrowed() const noexcept { return !_owned && _borrowed != Null(); }

    long use_count() const noexcept { return _owned.use_count(); }
  };
}

#endif
