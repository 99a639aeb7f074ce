// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <strings.h>
#include "config.hh"
#include "debug.hh"
#include "file.hh"
#include "utils.hh"

#define SKIP_ON_VALIDATION \
{ \
  if ( validate ) \
    return true; \
}

// Some configurables could be just a switch
// So we introducing a macros that would indicate
// that this configurable is not a switch
#define REQUIRE_VALUE \
{ \
  if ( !hasValue && !validate ) \
    return false; \
}

#define PARSE_OR_VALIDATE( parse_src, validate_src ) \
  ( !validate && ( parse_src ) ) || ( validate && ( validate_src ) )

namespace {

bool parseUnsigned( string const & value, uint32_t & result )
{
  int n;
  return !value.empty() && isdigit( (unsigned char) value[ 0 ] ) &&
    sscanf( value.c_str(), "%u %n", &result, &n ) == 1 && !value[ n ];
}

// A switch given without a value is turned on
bool parseBool( bool hasValue, string const & value, bool & result )
{
  if ( !hasValue || strcasecmp( value.c_str(), "true" ) == 0 ||
       strcasecmp( value.c_str(), "yes" ) == 0 ||
       strcasecmp( value.c_str(), "on" ) == 0 || value == "1" )
    result = true;
  else
  if ( strcasecmp( value.c_str(), "false" ) == 0 ||
       strcasecmp( value.c_str(), "no" ) == 0 ||
       strcasecmp( value.c_str(), "off" ) == 0 || value == "0" )
    result = false;
  else
    return false;

  return true;
}

char const * boolToString( bool value )
{
  return value ? "true" : "false";
}

}

Config::RuntimeConfig::RuntimeConfig():
  errorDelayMs( 100 )
{
  char const * env = getenv( "PGDATA" );
  if ( env )
    pgData = env;
}

void Config::prefillKeywords()
{
  /* Textual representations of the tokens. */

  Keyword defaultKeywords[] = {
    // Storable options
    {
      "wal.max_parallel",
      Config::oWal_max_parallel,
      Config::Storable,
      "Number of WAL segments to fetch from the archive in parallel.\n"
      "The segments following the requested one are kept in the spool\n"
      "until the server asks for them, so this also bounds the spool size\n"
      "Valid values: 1-1024\n"
      "Default is %s",
      Utils::numberToString( GET_STORABLE( wal, max_parallel ) )
    },
    {
      "wal.segment_size",
      Config::oWal_segment_size,
      Config::Storable,
      "The server's wal_segment_size. Must be a power of two between\n"
      "1MiB and 1GiB\n"
      VALID_SUFFIXES
      "Default is %s",
      Utils::numberToString( GET_STORABLE( wal, segment_size ) )
    },
    {
      "wal.verify_size",
      Config::oWal_verify_size,
      Config::Storable,
      "Treat a retrieved segment which isn't wal.segment_size bytes long\n"
      "as corrupt\n"
      "Default is %s",
      boolToString( GET_STORABLE( wal, verify_size ) )
    },
    {
      "wal.postgres_version",
      Config::oWal_postgres_version,
      Config::Storable,
      "The server's version number, as in server_version_num. Servers\n"
      "before 9.3 (90300) never use the last segment of a log.\n"
      "0 stands for a current server\n"
      "Default is %s",
      Utils::numberToString( GET_STORABLE( wal, postgres_version ) )
    },
    {
      "spool.path",
      Config::oSpool_path,
      Config::Storable,
      "Directory holding prefetched segments and the end-of-wal-stream flag\n"
      "Default is %s",
      GET_STORABLE( spool, path )
    },
    {
      "archive.path",
      Config::oArchive_path,
      Config::Storable,
      "Root of a barman-style archive reachable as a local directory.\n"
      "Files are looked up as <path>/<server_name>/wals/<hash dir>/<name>,\n"
      "optionally compressed with gzip (.gz) or xz (.xz)\n"
      "No default value. Either this or archive.command must be set"
    },
    {
      "archive.server_name",
      Config::oArchive_server_name,
      Config::Storable,
      "Name of the server inside the archive\n"
      "No default value, required with archive.path"
    },
    {
      "archive.command",
      Config::oArchive_command,
      Config::Storable,
      "Command to fetch a file from the archive, for instance\n"
      "barman-cloud-wal-restore <destination> <server>. The file name and\n"
      "the path to store it at get appended. Exit code 1 means the file\n"
      "is not in the archive\n"
      "No default value. Either this or archive.path must be set"
    },
    {
      "archive.timeout",
      Config::oArchive_timeout,
      Config::Storable,
      "Seconds a single fetch from the archive may take\n"
      "Default is %s",
      Utils::numberToString( GET_STORABLE( archive, timeout ) )
    },
    {
      "cluster.streaming_available",
      Config::oCluster_streaming_available,
      Config::Storable,
      "Whether the server can switch to streaming replication once the\n"
      "archive runs dry. Remembering the end of the archived WAL stream\n"
      "only makes sense then\n"
      "Default is %s",
      boolToString( GET_STORABLE( cluster, streaming_available ) )
    },
    {
      "cluster.primary",
      Config::oCluster_primary,
      Config::Storable,
      "Whether this instance is the primary of its cluster\n"
      "Default is %s",
      boolToString( GET_STORABLE( cluster, primary ) )
    },
    {
      "cluster.timeline",
      Config::oCluster_timeline,
      Config::Storable,
      "The cluster's current timeline. Replicas won't fetch history files\n"
      "of later timelines. 0 stands for unknown\n"
      "Default is %s",
      Utils::numberToString( GET_STORABLE( cluster, timeline ) )
    },

    // Runtime options
    {
      "pgdata",
      Config::oRuntime_pgData,
      Config::Runtime,
      "Data directory relative destination paths are resolved against\n"
      "Default is the PGDATA environment variable (%s)",
      runtime.pgData
    },
    {
      "error_delay_ms",
      Config::oRuntime_errorDelayMs,
      Config::Runtime,
      "Milliseconds to wait before reporting a failed restore, so the\n"
      "server doesn't retry in a busy loop\n"
      "Default is %s",
      Utils::numberToString( runtime.errorDelayMs )
    }
  };

  keywords.assign( defaultKeywords, defaultKeywords +
      sizeof( defaultKeywords ) / sizeof( Keyword ) );
}

Config::Config()
{
  prefillKeywords();
  dPrintf( "%s is instantiated and initialized with default values\n",
      __CLASS );
}

Config::OpCodes Config::parseToken( const char * option, const OptionType type )
{
  for ( size_t i = 0; i < keywords.size(); i++ )
  {
    if ( strcasecmp( option, keywords[ i ].name.c_str() ) == 0 )
    {
      if ( keywords[ i ].type != type )
      {
        errorPrintf( "Invalid option type specified for %s\n", option );
        break;
      }

      return keywords[ i ].opcode;
    }
  }

  return Config::oBadOption;
}

bool Config::parseOrValidate( const string & option, const OptionType type,
   bool validate )
{
  string prefix;
  if ( type == Runtime )
    prefix.assign( "runtime" );
  else
  if ( type == Storable )
    prefix.assign( "storable" );

  dPrintf( "%s %s option \"%s\"...\n", ( validate ? "Validating" : "Parsing" ),
      prefix.c_str(), option.c_str() );

  // Values may contain spaces and further '=' signs, commands do
  bool hasValue = false;
  string optionName( option ), optionValue;

  size_t eq = option.find( '=' );
  if ( eq != string::npos )
  {
    optionName = option.substr( 0, eq );
    optionValue = option.substr( eq + 1 );
    dPrintf( "%s option %s: %s\n", prefix.c_str(), optionName.c_str(),
        optionValue.c_str() );
    hasValue = true;
  }
  else
    dPrintf( "%s option %s\n", prefix.c_str(), option.c_str() );

  int opcode = parseToken( optionName.c_str(), type );

  uint32_t uint32Value;
  uint64_t uint64Value;
  bool boolValue;

  switch ( opcode )
  {
    case oWal_max_parallel:
      REQUIRE_VALUE;

      if ( PARSE_OR_VALIDATE(
            !parseUnsigned( optionValue, uint32Value ) || uint32Value < 1 ||
            uint32Value > MaxParallel,
            GET_STORABLE( wal, max_parallel ) < 1 ||
            GET_STORABLE( wal, max_parallel ) > MaxParallel ) )
        return false;

      SKIP_ON_VALIDATION;
      SET_STORABLE( wal, max_parallel, uint32Value );
      dPrintf( "storable[wal][max_parallel] = %u\n",
          GET_STORABLE( wal, max_parallel ) );

      return true;
      /* NOTREACHED */
      break;

    case oWal_segment_size:
      REQUIRE_VALUE;

      if ( PARSE_OR_VALIDATE(
            !Utils::parseSize( optionValue, uint64Value ) ||
            !WalGeometry::isValidSegmentSize( uint64Value ),
            !WalGeometry::isValidSegmentSize( GET_STORABLE( wal, segment_size ) ) ) )
      {
        errorPrintf( "wal.segment_size must be a power of two between 1MiB "
                     "and 1GiB\n" );
        return false;
      }

      SKIP_ON_VALIDATION;
      SET_STORABLE( wal, segment_size, uint64Value );
      dPrintf( "storable[wal][segment_size] = %llu\n",
          (unsigned long long) GET_STORABLE( wal, segment_size ) );

      return true;
      /* NOTREACHED */
      break;

    case oWal_verify_size:
      SKIP_ON_VALIDATION;

      if ( !parseBool( hasValue, optionValue, boolValue ) )
        return false;

      SET_STORABLE( wal, verify_size, boolValue );
      dPrintf( "storable[wal][verify_size] = %d\n",
          GET_STORABLE( wal, verify_size ) );

      return true;
      /* NOTREACHED */
      break;

    case oWal_postgres_version:
      SKIP_ON_VALIDATION;
      REQUIRE_VALUE;

      if ( !parseUnsigned( optionValue, uint32Value ) )
        return false;

      SET_STORABLE( wal, postgres_version, uint32Value );
      dPrintf( "storable[wal][postgres_version] = %u\n",
          GET_STORABLE( wal, postgres_version ) );

      return true;
      /* NOTREACHED */
      break;

    case oSpool_path:
      REQUIRE_VALUE;

      if ( PARSE_OR_VALIDATE( optionValue.empty(),
            GET_STORABLE( spool, path ).empty() ) )
        return false;

      SKIP_ON_VALIDATION;
      SET_STORABLE( spool, path, optionValue );
      dPrintf( "storable[spool][path] = %s\n",
          GET_STORABLE( spool, path ).c_str() );

      return true;
      /* NOTREACHED */
      break;

    case oArchive_path:
      SKIP_ON_VALIDATION;
      REQUIRE_VALUE;

      SET_STORABLE( archive, path, optionValue );
      dPrintf( "storable[archive][path] = %s\n",
          GET_STORABLE( archive, path ).c_str() );

      return true;
      /* NOTREACHED */
      break;

    case oArchive_server_name:
      REQUIRE_VALUE;

      if ( PARSE_OR_VALIDATE(
            optionValue.find( '/' ) != string::npos,
            GET_STORABLE( archive, server_name ).find( '/' ) != string::npos ) )
        return false;

      SKIP_ON_VALIDATION;
      SET_STORABLE( archive, server_name, optionValue );
      dPrintf( "storable[archive][server_name] = %s\n",
          GET_STORABLE( archive, server_name ).c_str() );

      return true;
      /* NOTREACHED */
      break;

    case oArchive_command:
      SKIP_ON_VALIDATION;
      REQUIRE_VALUE;

      SET_STORABLE( archive, command, optionValue );
      dPrintf( "storable[archive][command] = %s\n",
          GET_STORABLE( archive, command ).c_str() );

      return true;
      /* NOTREACHED */
      break;

    case oArchive_timeout:
      REQUIRE_VALUE;

      if ( PARSE_OR_VALIDATE(
            !parseUnsigned( optionValue, uint32Value ) || uint32Value < 1,
            GET_STORABLE( archive, timeout ) < 1 ) )
        return false;

      SKIP_ON_VALIDATION;
      SET_STORABLE( archive, timeout, uint32Value );
      dPrintf( "storable[archive][timeout] = %u\n",
          GET_STORABLE( archive, timeout ) );

      return true;
      /* NOTREACHED */
      break;

    case oCluster_streaming_available:
      SKIP_ON_VALIDATION;

      if ( !parseBool( hasValue, optionValue, boolValue ) )
        return false;

      SET_STORABLE( cluster, streaming_available, boolValue );
      dPrintf( "storable[cluster][streaming_available] = %d\n",
          GET_STORABLE( cluster, streaming_available ) );

      return true;
      /* NOTREACHED */
      break;

    case oCluster_primary:
      SKIP_ON_VALIDATION;

      if ( !parseBool( hasValue, optionValue, boolValue ) )
        return false;

      SET_STORABLE( cluster, primary, boolValue );
      dPrintf( "storable[cluster][primary] = %d\n",
          GET_STORABLE( cluster, primary ) );

      return true;
      /* NOTREACHED */
      break;

    case oCluster_timeline:
      SKIP_ON_VALIDATION;
      REQUIRE_VALUE;

      if ( !parseUnsigned( optionValue, uint32Value ) )
        return false;

      SET_STORABLE( cluster, timeline, uint32Value );
      dPrintf( "storable[cluster][timeline] = %u\n",
          GET_STORABLE( cluster, timeline ) );

      return true;
      /* NOTREACHED */
      break;

    case oRuntime_pgData:
      REQUIRE_VALUE;

      runtime.pgData = optionValue;

      dPrintf( "runtime[pgData] = %s\n", runtime.pgData.c_str() );

      return true;
      /* NOTREACHED */
      break;

    case oRuntime_errorDelayMs:
      REQUIRE_VALUE;

      if ( !parseUnsigned( optionValue, uint32Value ) )
        return false;

      runtime.errorDelayMs = uint32Value;

      dPrintf( "runtime[errorDelayMs] = %u\n", runtime.errorDelayMs );

      return true;
      /* NOTREACHED */
      break;

    case oBadOption:
    default:
      return false;
      /* NOTREACHED */
      break;
  }

  /* NOTREACHED */
  return false;
}

void Config::showHelp( const OptionType type )
{
  fprintf( stderr,
      "SYNOPSIS\n"
      "--------\n"
      "This flag allows user to override %s configuration.\n"
      "\n"
      "OPTIONS\n"
      "-------\n"
      "\n"
      "* help:\n"
      "  Show this message\n"
      "", ( type == Runtime ? "runtime" : ( type == Storable ? "storable" : "" ) ) );

  for ( size_t i = 0; i < keywords.size(); i++ )
  {
    if ( keywords[ i ].type != type )
      continue;

    string description( keywords[ i ].description );

    size_t pos = 0;
    while( ( pos = description.find( "\n", pos ) ) != std::string::npos )
    {
      description.replace( pos, std::string( "\n" ).length(), "\n  " );
      pos += std::string( "\n  ").length();
    }
    description.insert( 0, "  " );

    fprintf( stderr, "\n* %s:\n", keywords[ i ].name.c_str() );
    fprintf( stderr, description.c_str(), keywords[ i ].defaultValue.c_str() );
    fprintf( stderr, "\n" );
  }
}

bool Config::parseProto( const string & str, google::protobuf::Message * mutable_message )
{
  return google::protobuf::TextFormat::ParseFromString( str, mutable_message );
}

string Config::toString( google::protobuf::Message const & message )
{
  std::string str;
  google::protobuf::TextFormat::PrintToString( message, &str );

  return str;
}

void Config::loadFromFile( string const & fileName )
{
  string configData;

  File f( fileName, File::ReadOnly );
  configData.resize( f.size() );
  if ( !configData.empty() )
    f.read( &configData[ 0 ], configData.size() );

  dPrintf( "Loading configuration from %s\n", fileName.c_str() );

  if ( !parseProto( configData, &storable ) )
    throw exCantParse( fileName );

  // Keep the defaults shown by showHelp() in sync with what was loaded
  prefillKeywords();
}

void Config::validate()
{
  const ::google::protobuf::Descriptor * configDescriptor =
    storable.GetDescriptor();
  for ( int i = 0; i < configDescriptor->field_count(); i++ )
  {
    const ::google::protobuf::FieldDescriptor * storage =
      configDescriptor->field( i );

    if ( storage->type() != ::google::protobuf::FieldDescriptor::TYPE_MESSAGE )
      continue;

    const ::google::protobuf::Descriptor * storageDescriptor =
      storage->message_type();

    for ( int j = 0; j < storageDescriptor->field_count(); j++ )
    {
      string option = storage->name() + "." +
        storageDescriptor->field( j )->name();

      if ( !parseOrValidate( option, Storable, true ) )
        throw exInvalidConfig( option );
    }
  }

  bool hasPath = !GET_STORABLE( archive, path ).empty();
  bool hasCommand = !GET_STORABLE( archive, command ).empty();

  if ( hasPath == hasCommand )
    throw exInvalidConfig( "exactly one of archive.path and archive.command "
                           "must be set" );

  if ( hasPath && GET_STORABLE( archive, server_name ).empty() )
    throw exInvalidConfig( "archive.server_name is required with archive.path" );
}

WalGeometry Config::getGeometry() const
{
  return WalGeometry( GET_STORABLE( wal, segment_size ),
                      GET_STORABLE( wal, postgres_version ) );
}

void Config::show()
{
  // Spell out every setting, including the defaults
  RestoreConfig effective;

  effective.mutable_wal()->set_max_parallel( GET_STORABLE( wal, max_parallel ) );
  effective.mutable_wal()->set_segment_size( GET_STORABLE( wal, segment_size ) );
  effective.mutable_wal()->set_verify_size( GET_STORABLE( wal, verify_size ) );
  effective.mutable_wal()->set_postgres_version(
    GET_STORABLE( wal, postgres_version ) );
  effective.mutable_spool()->set_path( GET_STORABLE( spool, path ) );
  effective.mutable_archive()->set_path( GET_STORABLE( archive, path ) );
  effective.mutable_archive()->set_server_name(
    GET_STORABLE( archive, server_name ) );
  effective.mutable_archive()->set_command( GET_STORABLE( archive, command ) );
  effective.mutable_archive()->set_timeout( GET_STORABLE( archive, timeout ) );
  effective.mutable_cluster()->set_streaming_available(
    GET_STORABLE( cluster, streaming_available ) );
  effective.mutable_cluster()->set_primary( GET_STORABLE( cluster, primary ) );
  effective.mutable_cluster()->set_timeline( GET_STORABLE( cluster, timeline ) );

  printf( "%s", toString( effective ).c_str() );
}
