#include <mpi.h>

#include "courier/config.hpp"
#include "catch2/catch.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace courier;

SCENARIO("reading config entries", "[courier][config]") {
  auto conf = ConfFile::parse( R"(
title = "run"
[grid]
periodic = true
spacing = 0.5
cells = 64
)" );

  REQUIRE( *conf["title"].optional<std::string>() == "run" );
  REQUIRE( *conf["grid"]["periodic"].optional<bool>() );
  REQUIRE( *conf["grid"]["spacing"].optional<double>() == 0.5 );
  REQUIRE( *conf["grid"]["cells"].optional<int>() == 64 );
  REQUIRE( conf["grid"]["cells"].path() == "[grid][cells]" );

  REQUIRE_FALSE( conf["grid"]["missing"].optional<long>() );
  REQUIRE_FALSE( conf["nowhere"]["missing"].optional<int>() );
  REQUIRE_THROWS_AS( conf["title"].optional<bool>(), std::runtime_error );
}

SCENARIO("malformed config text", "[courier][config]") {
  REQUIRE_THROWS_AS( ConfFile::parse( "[courier\nerrors = " ), std::runtime_error );
}

SCENARIO("library configuration", "[courier][config]") {
  SECTION("defaults") {
    Config cfg = Config::from( ConfFile::parse("") );
    REQUIRE( cfg.initialize );
    REQUIRE( cfg.finalize );
    REQUIRE( cfg.thread_level == ThreadLevel::MULTIPLE );
    REQUIRE( cfg.recv_mprobe );
    REQUIRE( cfg.irecv_bufsz == 32768 );
    REQUIRE( cfg.errors == Errors::EXCEPTION );
    REQUIRE( cfg.log_file == "logs/rank{rank}.log" );
  }

  SECTION("every key") {
    Config cfg = Config::from( ConfFile::parse( R"(
[courier]
initialize = false
finalize = false
thread_level = "funneled"
recv_mprobe = false
irecv_bufsz = 1024
errors = "fatal"
[courier.logging]
file = ""
)" ) );
    REQUIRE_FALSE( cfg.initialize );
    REQUIRE_FALSE( cfg.finalize );
    REQUIRE( cfg.thread_level == ThreadLevel::FUNNELED );
    REQUIRE_FALSE( cfg.recv_mprobe );
    REQUIRE( cfg.irecv_bufsz == 1024 );
    REQUIRE( cfg.errors == Errors::FATAL );
    REQUIRE( cfg.log_file.empty() );
  }

  SECTION("bad values") {
    REQUIRE_THROWS_AS( Config::from( ConfFile::parse( "[courier]\nthread_level = \"many\"" ) ), std::runtime_error );
    REQUIRE_THROWS_AS( Config::from( ConfFile::parse( "[courier]\nerrors = \"ignore\"" ) ), std::runtime_error );
    REQUIRE_THROWS_AS( Config::from( ConfFile::parse( "[courier]\nirecv_bufsz = -1" ) ), std::runtime_error );
    REQUIRE_THROWS_AS( Config::from( ConfFile::parse( "[courier]\nrecv_mprobe = \"yes\"" ) ), std::runtime_error );
  }

  SECTION("from a file") {
    auto path = std::filesystem::temp_directory_path() / "courier_test_config.toml";
    {
      std::ofstream out(path);
      out << "[courier]\nthread_level = \"serialized\"\n";
    }
    auto cfg = Config::load( path.string() );
    REQUIRE( cfg.thread_level == ThreadLevel::SERIALIZED );
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS( Config::load( ( std::filesystem::temp_directory_path() / "courier_no_such_file.toml" ).string() ),
                       std::runtime_error );
  }

  SECTION("thread levels") {
    REQUIRE( mpi_thread_level( ThreadLevel::SINGLE ) == MPI_THREAD_SINGLE );
    REQUIRE( mpi_thread_level( ThreadLevel::MULTIPLE ) == MPI_THREAD_MULTIPLE );
  }
}
