#ifndef _LOGGER_OFSTREAM_HPP_
#define _LOGGER_OFSTREAM_HPP_

#include <fstream>
#include <string>

namespace lgr {
  // A switchable log file. The file is opened on the first write after
  // set_filename, so ranks that never log leave no empty file behind.
  template < typename CharT = char >
  struct ofstream {
  private:
    std::basic_ofstream<CharT> _fout;
    std::string _filename{};
    bool _is_on = true;

    inline bool ready() {
      if ( !_is_on || _filename.empty() ) return false;
      if ( !_fout.is_open() ) _fout.open( _filename.c_str(), std::ios_base::app );
      return _fout.is_open();
    }

  public:
    inline void set_filename( std::string filename ) {
      close();
      _filename = std::move(filename);
    }

    inline const std::string& filename() const noexcept { return _filename; }

    inline void close() {
      if ( _fout.is_open() ) _fout.close();
      _filename = {};
    }

    inline bool is_open() const { return _fout.is_open(); }

    template < typename T >
    ofstream& operator<< ( T&& t ) {
      if ( ready() ) _fout << std::forward<T>(t);
      return *this;
    }

    ofstream& operator<<( std::basic_ostream<CharT>& (*func)( std::basic_ostream<CharT>& ) ) {
      if ( ready() ) _fout << func;
      return *this;
    }

    ofstream& operator<<( std::ios_base& (*func)(std::ios_base&) ) {
      if ( ready() ) _fout << func;
      return *this;
    }

    inline void turn_on() noexcept { _is_on = true; }
    inline void turn_off() noexcept { _is_on = false; }
  };
}

#endif
