#include "courier/attributes.hpp"

#include <mutex>
#include <stdexcept>

#include "fmt/format.h"

namespace courier {
  namespace {
    struct Keyval {
      CopyFn copy;
      DeleteFn del;
      bool freed = false;
    };

    std::mutex registry_mutex;
    std::map<int, Keyval> registry;
    int next_keyval = 0;

    Keyval lookup( int keyval, bool for_set ) {
      std::lock_guard<std::mutex> lock(registry_mutex);
      auto itr = registry.find(keyval);
      if ( itr == registry.end() || ( for_set && itr->second.freed ) )
        throw std::invalid_argument( fmt::format( "invalid attribute key {}", keyval ) );
      return itr->second;
    }

    void destroy( int keyval, std::any& value ) {
      auto k = lookup( keyval, false );
      if ( k.del ) k.del(value);
    }
  }

  std::optional<std::any> null_copy( const std::any& ) { return std::nullopt; }

  std::optional<std::any> dup_copy( const std::any& value ) { return value; }

  int create_keyval( CopyFn copy, DeleteFn del ) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    const int k = next_keyval++;
    registry[k] = Keyval{ std::move(copy), std::move(del), false };
    return k;
  }

  void free_keyval( int& keyval ) {
    {
      std::lock_guard<std::mutex> lock(registry_mutex);
      auto itr = registry.find(keyval);
      if ( itr == registry.end() || itr->second.freed )
        throw std::invalid_argument( fmt::format( "invalid attribute key {}", keyval ) );
      itr->second.freed = true;
    }
    keyval = KEYVAL_INVALID;
  }
}

namespace courier {
  void AttributeTable::set( int keyval, std::any value ) {
    lookup( keyval, true );
    auto itr = _values.find(keyval);
    if ( itr != _values.end() ) {
      destroy( keyval, itr->second );
      itr->second = std::move(value);
    } else {
      _values.emplace( keyval, std::move(value) );
    }
  }

  const std::any* AttributeTable::get( int keyval ) const {
    auto itr = _values.find(keyval);
    return itr == _values.end() ? nullptr : &(itr->second);
  }

  bool AttributeTable::erase( int keyval ) {
    auto itr = _values.find(keyval);
    if ( itr == _values.end() ) return false;
    auto value = std::move(itr->second);
    _values.erase(itr);
    destroy( keyval, value );
    return true;
  }

  AttributeTable AttributeTable::copy() const {
    AttributeTable res;
    for ( const auto& [k, v] : _values ) {
      auto key = lookup( k, false );
      if ( !key.copy ) continue;
      if ( auto c = key.copy(v) ) res._values.emplace( k, std::move(*c) );
    }
    return res;
  }

  void AttributeTable::clear() {
    auto values = std::move(_values);
    _values.clear();
    for ( auto& [k, v] : values ) destroy( k, v );
  }
}
