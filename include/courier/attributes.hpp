#ifndef _COURIER_ATTRIBUTES_HPP_
#define _COURIER_ATTRIBUTES_HPP_

#include <any>
#include <functional>
#include <map>
#include <optional>

namespace courier {
  // decides whether, and as what, an attribute follows a communicator into its duplicate
  using CopyFn = std::function<std::optional<std::any>( const std::any& )>;
  using DeleteFn = std::function<void( std::any& )>;

  inline constexpr int KEYVAL_INVALID = -1;

  std::optional<std::any> null_copy( const std::any& value );
  std::optional<std::any> dup_copy( const std::any& value );

  int create_keyval( CopyFn copy = null_copy, DeleteFn del = nullptr );
  // the key stays usable by the attributes already set with it
  void free_keyval( int& keyval );
}

namespace courier {
  // Attribute values of one communicator. The owning communicator drives it
  // explicitly: copy() on dup, clear() on free and on destruction.
  class AttributeTable {
  private:
    std::map<int, std::any> _values;

  public:
    AttributeTable() = default;
    AttributeTable( const AttributeTable& ) = delete;
    AttributeTable& operator=( const AttributeTable& ) = delete;
    AttributeTable( AttributeTable&& ) = default;
    AttributeTable& operator=( AttributeTable&& ) = default;

    // an existing value is deleted first
    void set( int keyval, std::any value );
    const std::any* get( int keyval ) const;
    bool erase( int keyval );

    AttributeTable copy() const;
    void clear();

    inline std::size_t size() const noexcept { return _values.size(); }
  };
}

#endif
