// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef WAL_ARCHIVE_HH_INCLUDED__
#define WAL_ARCHIVE_HH_INCLUDED__

#include <exception>
#include <string>

#include "ex.hh"
#include "nocopy.hh"

using std::string;

/// A place archived WAL files are fetched from. Implementations must allow
/// several fetches to run at once from different threads
class WalArchive: NoCopy
{
public:
  DEF_EX( Ex, "WAL archive exception", std::exception )
  /// The archive couldn't be asked right now. Worth retrying later
  DEF_EX_STR( exUnavailable, "WAL archive unavailable:", Ex )
  /// The archive has the file, but its contents are unusable
  DEF_EX_STR( exCorrupt, "Corrupt archived WAL file:", Ex )

  enum Outcome
  {
    Retrieved,
    /// The archive confirmed it doesn't have the file
    NotFound,
    /// The archive didn't answer in time
    TimedOut
  };

  /// Fetches the given WAL file, storing its plain contents to
  /// outputFileName. The output file is only meaningful if Retrieved is
  /// returned. Throws exUnavailable or exCorrupt
  virtual Outcome fetch( string const & name,
                         string const & outputFileName ) = 0;

  /// A short description for the logs
  virtual string getDescription() const = 0;

  static char const * outcomeToString( Outcome );

  virtual ~WalArchive();
};

/// An archive laid out the way barman-cloud stores WAL files, reachable as a
/// local directory (a mounted bucket, a shared volume):
/// <root>/<server name>/wals/<hash dir>/<name>[.gz|.xz]
class DirectoryArchive: public WalArchive
{
  string root, serverName;

public:
  DirectoryArchive( string const & root, string const & serverName );

  /// Returns the directory the given file would be stored in
  string getWalDir( string const & name ) const;

  virtual Outcome fetch( string const & name, string const & outputFileName );

  virtual string getDescription() const;
};

#endif
