// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <errno.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "command_archive.hh"
#include "debug.hh"
#include "utils.hh"

CommandArchive::CommandArchive( string const & command,
                                unsigned timeoutSeconds ):
  command( command ), timeoutSeconds( timeoutSeconds )
{
}

string CommandArchive::getCommandLine( string const & name,
                                       string const & outputFileName ) const
{
  return command + " " + Utils::shellQuote( name ) + " " +
         Utils::shellQuote( outputFileName );
}

WalArchive::Outcome CommandArchive::fetch( string const & name,
                                           string const & outputFileName )
{
  string commandLine = getCommandLine( name, outputFileName );

  dPrintf( "Running %s\n", commandLine.c_str() );

  uint64_t deadline = Utils::getMonotonicMs() + uint64_t( timeoutSeconds ) * 1000;

  pid_t pid = fork();

  if ( pid == -1 )
    throw exUnavailable( withErrno( "fork" ) );

  if ( !pid )
  {
    // Child. Its own process group lets a timeout kill the whole pipeline
    setpgid( 0, 0 );
    execl( "/bin/sh", "sh", "-c", commandLine.c_str(), (char *) NULL );
    _exit( 127 );
  }

  // The parent sets the group as well, so a kill right after fork() finds it
  if ( setpgid( pid, pid ) != 0 && errno != EACCES && errno != ESRCH )
    dPrintf( "setpgid(%d) failed: %s\n", (int) pid, strerror( errno ) );

  int status;

  for ( ; ; )
  {
    pid_t result = waitpid( pid, &status, WNOHANG );

    if ( result == pid )
      break;

    if ( result == -1 )
    {
      if ( errno == EINTR )
        continue;
      throw exUnavailable( withErrno( "waitpid" ) );
    }

    if ( Utils::getMonotonicMs() >= deadline )
    {
      if ( kill( -pid, SIGKILL ) != 0 && kill( pid, SIGKILL ) != 0 )
        dPrintf( "kill(%d) failed: %s\n", (int) pid, strerror( errno ) );

      while ( waitpid( pid, &status, 0 ) == -1 && errno == EINTR ) ;

      verbosePrintf( "Fetching %s took longer than %u seconds, killed\n",
                     name.c_str(), timeoutSeconds );
      return TimedOut;
    }

    Utils::sleepMs( PollIntervalMs );
  }

  if ( WIFEXITED( status ) )
  {
    int code = WEXITSTATUS( status );

    if ( code == 0 )
      return Retrieved;

    if ( code == 1 )
      return NotFound;

    throw exUnavailable( commandLine + " exited with code " +
                         Utils::numberToString( code ) );
  }

  if ( WIFSIGNALED( status ) )
    throw exUnavailable( commandLine + " was killed by signal " +
                         Utils::numberToString( WTERMSIG( status ) ) );

  throw exUnavailable( commandLine + " terminated abnormally" );
}

string CommandArchive::getDescription() const
{
  return command;
}
