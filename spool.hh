// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef SPOOL_HH_INCLUDED__
#define SPOOL_HH_INCLUDED__

#include <stddef.h>
#include <time.h>
#include <exception>
#include <string>
#include <vector>

#include "ex.hh"
#include "nocopy.hh"
#include "sptr.hh"
#include "tmp_mgr.hh"
#include "wal_segment.hh"

using std::string;
using std::vector;

/// A local directory holding WAL segments which were fetched ahead of the
/// server asking for them. Each entry is a file named after its segment.
/// Everything is kept on disk, so the state survives from one invocation to
/// the next. Files are only ever made visible by renaming finished temporary
/// files, which live in the tmp/ subdirectory
class Spool: NoCopy
{
  string path;
  TmpMgr tmpMgr;

public:
  DEF_EX( Ex, "Spool exception", std::exception )
  DEF_EX_STR( exBadEntryName, "Not a WAL segment name:", Ex )

  struct Entry
  {
    string name;
    string fileName;
    size_t size;
    time_t arrivalTime;
  };

  /// Opens the spool at the given path, creating it if necessary
  Spool( string const & path );

  string const & getPath() const
  { return path; }

  /// Returns the full path of the entry with the given name
  string getFileName( string const & name ) const;

  /// Creates a temporary file to be filled and then put() or moved over a
  /// file inside the spool. Safe to call from several threads at once
  sptr< TemporaryFile > makeTemporaryFile();

  /// Makes the finished temporary file the entry for the given segment,
  /// replacing any previous one
  void put( string const & name, TemporaryFile & );

  bool has( string const & name ) const;

  /// Moves the entry over the destination file. Returns false if there's no
  /// such entry
  bool take( string const & name, string const & destination );

  /// All the entries, in segment order
  vector< Entry > entries() const;

  /// Removes all entries. Returns the number of entries removed
  unsigned dropEntries();

  /// Removes everything the spool holds: entries, flags, temporary files
  void purge();

  /// Brings the spool left by a previous, possibly killed, process into a
  /// consistent state: removes temporary files and foreign files, and drops
  /// all entries if there are more than maxEntries of them or they don't
  /// follow each other without a gap
  void reconcile( size_t maxEntries, WalGeometry const & );
};

#endif
