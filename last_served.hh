// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef LAST_SERVED_HH_INCLUDED__
#define LAST_SERVED_HH_INCLUDED__

#include <stddef.h>
#include <exception>
#include <string>

#include "ex.hh"
#include "nocopy.hh"
#include "spool.hh"

using std::string;

/// Remembers which file was last delivered where, in a file inside the spool.
/// The destination is identified by its device, inode, size and modification
/// time, so a file put there by anyone else doesn't match
class LastServed: NoCopy
{
  string fileName;
  Spool & spool;

public:
  DEF_EX( Ex, "Last served file record exception", std::exception )
  DEF_EX_STR( exCantStat, "Can't stat served file", Ex )
  DEF_EX_STR( exCantSerialize, "Can't serialize message", Ex )

  static char const FileName[];

  LastServed( Spool & );

  /// Records the given WAL file as delivered to the destination, which must
  /// exist
  void record( string const & walName, string const & destination );

  /// Returns true if the destination is still the very file last delivered
  /// as the given WAL file, and has the expected size unless it is 0
  bool matches( string const & walName, string const & destination,
                size_t expectedSize ) const;
};

#endif
