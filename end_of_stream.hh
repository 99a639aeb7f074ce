// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef END_OF_STREAM_HH_INCLUDED__
#define END_OF_STREAM_HH_INCLUDED__

#include <string>

#include "nocopy.hh"
#include "spool.hh"

/// Remembers that the archive had nothing past some segment the last time it
/// was asked. The next request can then fail immediately, which lets the
/// server switch over to streaming replication without waiting on the
/// archive. Stored as an empty file inside the spool
class EndOfStreamFlag: NoCopy
{
  Spool & spool;
  string fileName;

public:
  static char const FileName[];

  EndOfStreamFlag( Spool & );

  bool isSet() const;

  /// Does nothing if the flag is set already
  void set();

  /// Does nothing if the flag isn't set
  void clear();
};

#endif
