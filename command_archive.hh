// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef COMMAND_ARCHIVE_HH_INCLUDED__
#define COMMAND_ARCHIVE_HH_INCLUDED__

#include <string>

#include "wal_archive.hh"

/// Fetches files by running an external command, such as
/// barman-cloud-wal-restore, with the file name and the output path appended.
/// Exit code 0 means the file was stored, 1 that the archive doesn't have
/// it. Anything else is a failure. A command running longer than the timeout
/// is killed along with everything it has started
class CommandArchive: public WalArchive
{
  string command;
  unsigned timeoutSeconds;

public:
  enum
  {
    PollIntervalMs = 10
  };

  CommandArchive( string const & command, unsigned timeoutSeconds );

  /// Returns the shell command line fetch() runs
  string getCommandLine( string const & name,
                         string const & outputFileName ) const;

  virtual Outcome fetch( string const & name, string const & outputFileName );

  virtual string getDescription() const;
};

#endif
