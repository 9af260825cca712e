#include "courier/config.hpp"

#include <mpi.h>

#include <cstdint> // for int64_t
#include <memory>
#include <sstream> // for toml parsing error
#include <stdexcept>
#include <type_traits>

#include "fmt/format.h"
#include "toml++/toml.h"

namespace courier {
  namespace {
    class Node_t {
    public:
      Node_t( toml::table&& table ) { m_table.reset( new auto { std::move(table) } ); }
      Node_t( const Node_t& ) = default;
      Node_t( Node_t&& ) = default;

      Node_t operator[]( const std::string& entry ) const {
        Node_t res;
        res.m_table = m_table;
        if ( !m_node ) {
          res.m_node.emplace( (*m_table)[entry] );
        } else {
          res.m_node.emplace( (*m_node)[entry] );
        }
        return res;
      }

      const auto& native() const {
        if ( !m_node ) throw std::runtime_error( "ERROR : the config root holds no value" );
        return *m_node;
      }

    private:
      Node_t() = default;
      using node_view_t = toml::node_view<toml::node>;
      std::shared_ptr<toml::table> m_table;
      std::optional<node_view_t> m_node;
    };

    template < typename T >
    auto get_toml_native_type() {
      if constexpr ( std::is_same_v<T, bool> ) {
        return bool{};
      } else if constexpr ( std::is_floating_point_v<T> ) {
        return double{};
      } else if constexpr ( std::is_integral_v<T> ) {
        return std::int64_t{};
      } else {
        return T{};
      }
    }

    template < typename T >
    using toml_native_t = std::decay_t<decltype(get_toml_native_type<T>())>;

    std::string describe( const toml::parse_error& err ) {
      // error.source().begin is type `source_positon`, which only has overload <<
      // for streams but not direct conversion to string. So use stringstream here.
      std::ostringstream oss;
      oss << "Error parsing ";
      if ( err.source().path ) oss << "file '" << *err.source().path << "'";
      else oss << "config text";
      oss << ":\n" << err.description() << "\n  (" << err.source().begin << ")\n";
      return oss.str();
    }
  }

  ConfFile ConfFile::load( const std::string& file ) {
    ConfFile res;
    try {
      res.m_node = Node_t{ toml::parse_file(file) };
    } catch ( const toml::parse_error& err ) {
      throw std::runtime_error( describe(err) );
    }
    return res;
  }

  ConfFile ConfFile::parse( const std::string& text ) {
    ConfFile res;
    try {
      res.m_node = Node_t{ toml::parse(text) };
    } catch ( const toml::parse_error& err ) {
      throw std::runtime_error( describe(err) );
    }
    return res;
  }

  ConfFile ConfFile::operator[]( const std::string& entry ) const {
    ConfFile res;
    res.m_current_entries = fmt::format( "{}[{}]", m_current_entries, entry );
    res.m_node = std::any_cast<const Node_t&>(m_node)[entry];
    return res;
  }

  template < typename T >
  std::optional<T> ConfFile::optional() const {
    const auto& node = std::any_cast<const Node_t&>(m_node).native();
    if ( !node ) return std::nullopt;
    auto toml_native_val = node.template value<toml_native_t<T>>();
    if ( !toml_native_val ) {
      auto msg = fmt::format( "ERROR : {} in config file has the wrong type", m_current_entries );
      throw std::runtime_error(msg);
    }
    return static_cast<T>(*toml_native_val);
  }

#define INSTANTIATE_AS_TYPE(_TYPE_)                                     \
  template std::optional<_TYPE_> ConfFile::optional<_TYPE_>() const

  INSTANTIATE_AS_TYPE(bool);
  INSTANTIATE_AS_TYPE(int);
  INSTANTIATE_AS_TYPE(long);
  INSTANTIATE_AS_TYPE(double);
  INSTANTIATE_AS_TYPE(std::string);

#undef INSTANTIATE_AS_TYPE
}

namespace courier {
  namespace {
    Config current;

    ThreadLevel parse_thread_level( const std::string& s, const std::string& path ) {
      if ( s == "single" ) return ThreadLevel::SINGLE;
      if ( s == "funneled" ) return ThreadLevel::FUNNELED;
      if ( s == "serialized" ) return ThreadLevel::SERIALIZED;
      if ( s == "multiple" ) return ThreadLevel::MULTIPLE;
      throw std::runtime_error( fmt::format( "ERROR : {} = \"{}\" is not one of single, funneled, serialized, multiple", path, s ) );
    }

    Errors parse_errors( const std::string& s, const std::string& path ) {
      if ( s == "exception" ) return Errors::EXCEPTION;
      if ( s == "fatal" ) return Errors::FATAL;
      throw std::runtime_error( fmt::format( "ERROR : {} = \"{}\" is not one of exception, fatal", path, s ) );
    }
  }

  Config Config::load( const std::string& file ) {
    return from( ConfFile::load(file) );
  }

  Config Config::from( const ConfFile& conf ) {
    Config cfg;
    const auto c = conf["courier"];

    if ( auto v = c["initialize"].optional<bool>() ) cfg.initialize = *v;
    if ( auto v = c["finalize"].optional<bool>() ) cfg.finalize = *v;
    if ( auto v = c["recv_mprobe"].optional<bool>() ) cfg.recv_mprobe = *v;

    const auto level = c["thread_level"];
    if ( auto v = level.optional<std::string>() ) cfg.thread_level = parse_thread_level( *v, level.path() );

    const auto bufsz = c["irecv_bufsz"];
    if ( auto v = bufsz.optional<long>() ) {
      if ( *v < 0 ) throw std::runtime_error( fmt::format( "ERROR : {} must not be negative", bufsz.path() ) );
      cfg.irecv_bufsz = static_cast<std::size_t>(*v);
    }

    const auto errors = c["errors"];
    if ( auto v = errors.optional<std::string>() ) cfg.errors = parse_errors( *v, errors.path() );

    if ( auto v = c["logging"]["file"].optional<std::string>() ) cfg.log_file = *v;
    return cfg;
  }

  const Config& config() noexcept { return current; }

  void configure( Config cfg ) { current = std::move(cfg); }

  int mpi_thread_level( ThreadLevel level ) noexcept {
    switch ( level ) {
    case ThreadLevel::SINGLE : return MPI_THREAD_SINGLE;
    case ThreadLevel::FUNNELED : return MPI_THREAD_FUNNELED;
    case ThreadLevel::SERIALIZED : return MPI_THREAD_SERIALIZED;
    default : return MPI_THREAD_MULTIPLE;
    }
  }
}
