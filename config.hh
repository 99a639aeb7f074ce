// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef CONFIG_HH_INCLUDED
#define CONFIG_HH_INCLUDED

#include <string>
#include <vector>
#include <google/protobuf/text_format.h>
#include "walrestore.pb.h"
#include "ex.hh"
#include "nocopy.hh"
#include "wal_segment.hh"

#define SET_STORABLE( storage, property, value ) \
  storable.mutable_##storage()->set_##property( value )

#define GET_STORABLE( storage, property ) \
  storable.storage().property()

using std::string;

class Config: NoCopy
{
public:
  DEF_EX( Ex, "Configuration exception", std::exception )
  DEF_EX_STR( exCantParse, "Can't parse the configuration file", Ex )
  DEF_EX_STR( exInvalidOption, "Invalid option specified:", Ex )
  DEF_EX_STR( exInvalidConfig, "Invalid configuration:", Ex )

  struct RuntimeConfig
  {
    // The data directory relative destination paths are resolved against
    string pgData;
    // How long to wait before reporting a failure
    unsigned errorDelayMs;

    // Default runtime config
    RuntimeConfig();
  };

  enum OptionType
  {
    Runtime,
    Storable,
    None
  };

  /* Keyword tokens. */
  typedef enum
  {
    oBadOption,

    oWal_max_parallel,
    oWal_segment_size,
    oWal_verify_size,
    oWal_postgres_version,
    oSpool_path,
    oArchive_path,
    oArchive_server_name,
    oArchive_command,
    oArchive_timeout,
    oCluster_streaming_available,
    oCluster_primary,
    oCluster_timeline,

    oRuntime_pgData,
    oRuntime_errorDelayMs
  } OpCodes;

  enum
  {
    MaxParallel = 1024
  };

  static bool parseProto( const string &, google::protobuf::Message * );

  static string toString( google::protobuf::Message const & );

  /// Reads a text-format RestoreConfig from the given file over the current
  /// settings. Throws exCantParse
  void loadFromFile( string const & fileName );

  /// Checks every storable setting and the way they combine. Throws
  /// exInvalidConfig naming the first offending setting
  void validate();

  /// Returns how segment names advance with the configured server
  WalGeometry getGeometry() const;

  // Print configuration to screen
  void show();

  void showHelp( const OptionType );

  OpCodes parseToken( const char *, const OptionType );
  bool parseOrValidate( const string &, const OptionType, bool validate = false );

  Config();

  RuntimeConfig runtime;
  RestoreConfig storable;
private:
  struct Keyword
  {
    string name;
    Config::OpCodes opcode;
    Config::OptionType type;
    string description;
    string defaultValue;
  };

  std::vector< Keyword > keywords;

  void prefillKeywords();
};

#endif
