// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <string>
#include <vector>

#include "command_archive.hh"
#include "config.hh"
#include "debug.hh"
#include "end_of_stream.hh"
#include "spool.hh"
#include "sptr.hh"
#include "utils.hh"
#include "version.hh"
#include "wal_archive.hh"
#include "wal_restorer.hh"

using std::vector;

namespace {

sptr< WalArchive > openArchive( Config const & config )
{
  ArchiveConfig const & archive = config.storable.archive();

  if ( !archive.path().empty() )
    return new DirectoryArchive( archive.path(), archive.server_name() );

  return new CommandArchive( archive.command(), archive.timeout() );
}

WalRestorer::Status restore( Config & config, char const * walName,
                             char const * destination )
{
  // Configuration errors are reported by main() like any other
  config.validate();

  WalRestorer::Outcome outcome( WalRestorer::TransientError );

  try
  {
    sptr< WalArchive > archive = openArchive( config );
    Spool spool( config.storable.spool().path() );
    WalRestorer restorer( config, *archive, spool );

    outcome = restorer.restore( walName, destination );
  }
  catch( std::exception & e )
  {
    errorPrintf( "Restoring %s: %s\n", walName, e.what() );
  }

  dPrintf( "%s: %s, served from %s\n", walName,
           WalRestorer::statusToString( outcome.status ),
           WalRestorer::sourceToString( outcome.source ) );

  // The server retries right away. Don't let it spin, unless the failure is
  // the one meant to make it try streaming
  if ( outcome.status != WalRestorer::Success &&
       outcome.source != WalRestorer::FromEndOfStreamFlag )
    Utils::sleepMs( config.runtime.errorDelayMs );

  return outcome.status;
}

void showStatus( Config const & config )
{
  Spool spool( config.storable.spool().path() );
  EndOfStreamFlag flag( spool );

  vector< Spool::Entry > entries = spool.entries();

  printf( "Spool: %s\n", spool.getPath().c_str() );

  for ( size_t x = 0; x < entries.size(); ++x )
  {
    char when[ 64 ];
    struct tm tm;

    if ( !localtime_r( &entries[ x ].arrivalTime, &tm ) ||
         !strftime( when, sizeof( when ), "%Y-%m-%d %H:%M:%S", &tm ) )
      strcpy( when, "?" );

    printf( "%s %zu bytes, spooled %s\n", entries[ x ].name.c_str(),
            entries[ x ].size, when );
  }

  printf( "%zu segments spooled, end of WAL stream flag %s\n", entries.size(),
          flag.isSet() ? "set" : "not set" );
}

}

int main( int argc, char *argv[] )
{
  try
  {
    dPrintf( "walrestore version %s\n", walrestore_version.c_str() );

    bool printHelp = false;
    vector< char const * > args;
    vector< string > storableOptions;
    string configFile;
    Config config;

    for( int x = 1; x < argc; ++x )
    {
      string option;
      Config::OptionType optionType = Config::Runtime;

      if ( strcmp( argv[ x ], "--config" ) == 0 && x + 1 < argc )
      {
        configFile = argv[ x + 1 ];
        ++x;
      }
      else
      if ( strcmp( argv[ x ], "--silent" ) == 0 )
        verboseMode = false;
      else
      if ( strcmp( argv[ x ], "--help" ) == 0 || strcmp( argv[ x ], "-h" ) == 0 )
      {
        printHelp = true;
      }
      else
      if ( ( strcmp( argv[ x ], "-o" ) == 0 || strcmp( argv[ x ], "-O" ) == 0 )
          && x + 1 < argc )
      {
        option = argv[ x + 1 ];
        if ( !option.empty() )
        {
          if ( strcmp( argv[ x ], "-O" ) == 0 )
            optionType = Config::Runtime;
          else
          if ( strcmp( argv[ x ], "-o" ) == 0 )
            optionType = Config::Storable;

          if ( strcmp( option.c_str(), "help" ) == 0 )
          {
            config.showHelp( optionType );
            return EXIT_SUCCESS;
          }
          else
          if ( optionType == Config::Storable )
          {
            // Applied over the configuration file, once it's loaded
            storableOptions.push_back( option );
          }
          else
          if ( !config.parseOrValidate( option, optionType ) )
            goto invalid_option;
        }
        else
        {
invalid_option:
          fprintf( stderr, "Invalid option specified: %s\n",
                   option.c_str() );
          return EXIT_FAILURE;
        }
        ++x;
      }
      else
        args.push_back( argv[ x ] );
    }

    if ( args.size() < 1 || printHelp )
    {
      fprintf( stderr,
"walrestore, a prefetching restore_command for PostgreSQL, version %s\n"
"Comes with no warranty. Licensed under GNU GPLv2 or later + OpenSSL.\n\n"

"Usage: %s [flags] <command> [command args]\n"
"\n"
"  Flags: --config <file> reads the configuration from a text-format\n"
"          RestoreConfig file\n"
"         --silent (default is verbose)\n"
"         --help|-h show this message\n"
"         -O <option[=value]> (overrides runtime configuration,\n"
"          can be specified multiple times,\n"
"          for detailed runtime options overview run with -O help)\n"
"         -o <option[=value]> (overrides the configuration file,\n"
"          can be specified multiple times,\n"
"          for detailed options overview run with -o help)\n"
"\n"
"  Commands:\n"
"    restore <wal file name> <destination> - restores the WAL file to the\n"
"            destination, use as restore_command = '%s restore %%f %%p'.\n"
"            Exits with 0 on success, 1 if the archive doesn't have the\n"
"            file and 2 on other failures\n"
"    status - lists the spooled segments and the end of WAL stream flag\n"
"    purge - empties the spool and clears the end of WAL stream flag\n"
"    config - shows the effective configuration\n"
"", walrestore_version.c_str(), *argv, *argv );
      return EXIT_FAILURE;
    }

    if ( !configFile.empty() )
      config.loadFromFile( configFile );

    for ( size_t x = 0; x < storableOptions.size(); ++x )
    {
      if ( !config.parseOrValidate( storableOptions[ x ], Config::Storable ) )
      {
        fprintf( stderr, "Invalid option specified: %s\n",
                 storableOptions[ x ].c_str() );
        return EXIT_FAILURE;
      }
    }

    if ( strcmp( args[ 0 ], "restore" ) == 0 )
    {
      if ( args.size() != 3 )
      {
        fprintf( stderr, "Usage: %s %s <wal file name> <destination>\n",
                 *argv, args[ 0 ] );
        return EXIT_FAILURE;
      }

      return restore( config, args[ 1 ], args[ 2 ] );
    }
    else
    if ( strcmp( args[ 0 ], "status" ) == 0 )
    {
      if ( args.size() != 1 )
      {
        fprintf( stderr, "Usage: %s %s\n", *argv, args[ 0 ] );
        return EXIT_FAILURE;
      }

      showStatus( config );
    }
    else
    if ( strcmp( args[ 0 ], "purge" ) == 0 )
    {
      if ( args.size() != 1 )
      {
        fprintf( stderr, "Usage: %s %s\n", *argv, args[ 0 ] );
        return EXIT_FAILURE;
      }

      Spool spool( config.storable.spool().path() );
      spool.purge();
      verbosePrintf( "Purged %s\n", spool.getPath().c_str() );
    }
    else
    if ( strcmp( args[ 0 ], "config" ) == 0 )
    {
      if ( args.size() != 1 )
      {
        fprintf( stderr, "Usage: %s %s\n", *argv, args[ 0 ] );
        return EXIT_FAILURE;
      }

      config.validate();
      config.show();
    }
    else
    {
      fprintf( stderr, "Error: unknown command line option: %s\n", args[ 0 ] );
      return EXIT_FAILURE;
    }
  }
  catch( std::exception & e )
  {
    fprintf( stderr, "%s\n", e.what() );
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
