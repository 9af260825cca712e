#ifndef _COURIER_CONFIG_HPP_
#define _COURIER_CONFIG_HPP_

#include <any>
#include <cstddef>
#include <optional>
#include <string>

namespace courier {
  struct ConfFile {
  public:
    static ConfFile load( const std::string& file );
    static ConfFile parse( const std::string& text );

    ConfFile operator[]( const std::string& entry ) const;

    // nullopt for a missing entry, throws for an entry of another type
    template < typename T >
    std::optional<T> optional() const;

    inline const std::string& path() const noexcept { return m_current_entries; }

  private:
    ConfFile() = default;
    std::string m_current_entries = "";
    std::any m_node; // type erasure
    // std::any only stores copyable objects
  };
}

namespace courier {
  enum class ThreadLevel : char { SINGLE = 0, FUNNELED, SERIALIZED, MULTIPLE };

  // what an engine error does: raise TransportError, or abort through MPI
  enum class Errors : char { EXCEPTION = 0, FATAL };

  struct Config {
    bool initialize = true;
    bool finalize = true;
    ThreadLevel thread_level = ThreadLevel::MULTIPLE;
    bool recv_mprobe = true;
    std::size_t irecv_bufsz = 32768;
    Errors errors = Errors::EXCEPTION;
    std::string log_file = "logs/rank{rank}.log"; // empty for no per-rank log

    static Config load( const std::string& file );
    // reads the [courier] table, missing keys keep their defaults
    static Config from( const ConfFile& conf );
  };

  // the configuration in effect, set by initialize()
  const Config& config() noexcept;
  void configure( Config cfg );

  int mpi_thread_level( ThreadLevel level ) noexcept;
}

#endif
