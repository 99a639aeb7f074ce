// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef WAL_RESTORER_HH_INCLUDED__
#define WAL_RESTORER_HH_INCLUDED__

#include <stddef.h>
#include <exception>
#include <string>

#include "config.hh"
#include "end_of_stream.hh"
#include "ex.hh"
#include "last_served.hh"
#include "nocopy.hh"
#include "spool.hh"
#include "wal_archive.hh"

using std::string;

/// Serves a single restore_command request: delivers the requested WAL file
/// to the destination, from the spool if it was fetched ahead, or from the
/// archive otherwise
class WalRestorer: NoCopy
{
public:
  DEF_EX( Ex, "WAL restorer exception", std::exception )
  DEF_EX_STR( exBadWalName, "Invalid WAL file name:", Ex )

  /// Doubles as the process exit code
  enum Status
  {
    Success = 0,
    NotFound = 1,
    TransientError = 2
  };

  enum Source
  {
    FromNowhere,
    /// The destination held the file already
    FromDestination,
    FromSpool,
    FromArchive,
    /// NotFound answered by the end-of-stream flag, the archive wasn't asked
    FromEndOfStreamFlag
  };

  struct Outcome
  {
    Status status;
    Source source;

    Outcome( Status status, Source source = FromNowhere ):
      status( status ), source( source )
    {}
  };

  /// Name of the extended attribute served files are tagged with
  static char const NameAttribute[];

  WalRestorer( Config const &, WalArchive &, Spool & );

  /// Restores the given WAL file to the destination. Relative destinations
  /// are taken relative to the data directory. Local I/O errors are thrown
  Outcome restore( string const & walName, string const & destination );

  /// Joins relative paths with pgData, leaves absolute ones alone
  static string resolveDestination( string const & pgData,
                                    string const & destination );

  /// Returns true if the given file is a regular file which was served as
  /// the given WAL file, and has the expected size unless it is 0
  static bool isServed( string const & fileName, string const & walName,
                        size_t expectedSize );

  /// Tags the file as having been served as the given WAL file. File systems
  /// without extended attributes are silently skipped, the spool's record of
  /// the last served file covers those
  static void markServed( string const & fileName, string const & walName );

  static char const * statusToString( Status );

  static char const * sourceToString( Source );

private:
  /// Fetches files other than segments straight into the destination
  Outcome restoreDirectly( string const & walName,
                           string const & destination );

  /// Returns true if the timeline history file must not be fetched by this
  /// instance
  bool isFutureHistoryFile( string const & walName ) const;

  bool tracksEndOfStream() const;

  /// Tags the destination and records it as the last file served
  void recordServed( string const & walName, string const & destination );

  Config const & config;
  WalArchive & archive;
  Spool & spool;
  EndOfStreamFlag flag;
  LastServed lastServed;
};

#endif
