// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <errno.h>
#include <sys/xattr.h>
#include <time.h>
#include <vector>

#include "debug.hh"
#include "dir.hh"
#include "fetcher.hh"
#include "file.hh"
#include "last_served.hh"
#include "wal_restorer.hh"
#include "wal_segment.hh"

char const WalRestorer::NameAttribute[] = "user.walrestore.name";

WalRestorer::WalRestorer( Config const & config, WalArchive & archive,
                          Spool & spool ):
  config( config ), archive( archive ), spool( spool ), flag( spool ),
  lastServed( spool )
{
}

string WalRestorer::resolveDestination( string const & pgData,
                                        string const & destination )
{
  if ( destination.empty() || destination[ 0 ] == Dir::separator() )
    return destination;

  return Dir::addPath( pgData, destination );
}

bool WalRestorer::isServed( string const & fileName, string const & walName,
                            size_t expectedSize )
{
  size_t size;
  time_t mtime;

  if ( !File::stat( fileName, size, mtime ) )
    return false;

  if ( expectedSize && size != expectedSize )
    return false;

  std::vector< char > value( walName.size() + 1 );
  ssize_t got = getxattr( fileName.c_str(), NameAttribute, value.data(),
                          value.size() );

  // Longer values don't fit and fail with ERANGE
  return got == (ssize_t) walName.size() &&
         walName.compare( 0, walName.size(), value.data(), got ) == 0;
}

void WalRestorer::markServed( string const & fileName, string const & walName )
{
  if ( setxattr( fileName.c_str(), NameAttribute, walName.data(),
                 walName.size(), 0 ) == 0 )
    return;

  if ( errno == ENOTSUP )
    dPrintf( "No extended attributes on %s\n", fileName.c_str() );
  else
    errorPrintf( "Can't tag %s as %s: %s\n", fileName.c_str(),
                 walName.c_str(), strerror( errno ) );
}

void WalRestorer::recordServed( string const & walName,
                                string const & destination )
{
  markServed( destination, walName );
  lastServed.record( walName, destination );
}

char const * WalRestorer::statusToString( Status status )
{
  switch ( status )
  {
    case Success:
      return "success";
    case NotFound:
      return "not found";
    case TransientError:
      return "transient error";
  }

  return "unknown";
}

char const * WalRestorer::sourceToString( Source source )
{
  switch ( source )
  {
    case FromNowhere:
      return "nowhere";
    case FromDestination:
      return "destination";
    case FromSpool:
      return "spool";
    case FromArchive:
      return "archive";
    case FromEndOfStreamFlag:
      return "end-of-stream flag";
  }

  return "unknown";
}

bool WalRestorer::tracksEndOfStream() const
{
  return config.storable.cluster().streaming_available();
}

bool WalRestorer::isFutureHistoryFile( string const & walName ) const
{
  uint32_t fileTimeline;

  if ( !WalFileName::parseHistoryFile( walName, fileTimeline ) )
    return false;

  // The primary may need any history to follow a promotion
  if ( config.storable.cluster().primary() )
    return false;

  uint32_t clusterTimeline = config.storable.cluster().timeline();

  return clusterTimeline && fileTimeline > clusterTimeline;
}

WalRestorer::Outcome WalRestorer::restore( string const & walName,
                                           string const & destinationIn )
{
  if ( walName.empty() || walName == "." || walName == ".." ||
       walName.find( Dir::separator() ) != string::npos )
    throw exBadWalName( walName );

  string destination = resolveDestination( config.runtime.pgData,
                                           destinationIn );

  WalGeometry geometry = config.getGeometry();
  bool isSegment = SegmentName::isSegmentName( walName );

  size_t expectedSize = isSegment && config.storable.wal().verify_size() ?
                          geometry.segmentSize : 0;

  // A repeated request, after the server lost track of the previous answer
  if ( isServed( destination, walName, expectedSize ) ||
       lastServed.matches( walName, destination, expectedSize ) )
  {
    verbosePrintf( "%s is already in place\n", walName.c_str() );
    return Outcome( Success, FromDestination );
  }

  if ( !isSegment )
    return restoreDirectly( walName, destination );

  size_t window = config.storable.wal().max_parallel();

  spool.reconcile( window, geometry );

  if ( spool.take( walName, destination ) )
  {
    recordServed( walName, destination );
    verbosePrintf( "Restored %s from the spool\n", walName.c_str() );
    return Outcome( Success, FromSpool );
  }

  if ( tracksEndOfStream() && flag.isSet() )
  {
    // The previous probe found nothing past the last segment. Let the server
    // try streaming once before the archive gets asked again
    flag.clear();
    verbosePrintf( "End of WAL stream reached, not asking the archive for %s\n",
                   walName.c_str() );
    return Outcome( NotFound, FromEndOfStreamFlag );
  }

  // Anything left can't follow the requested segment without a gap
  unsigned dropped = spool.dropEntries();
  if ( dropped )
    verbosePrintf( "Dropped %u stale segments from the spool\n", dropped );

  Fetcher fetcher( archive, spool, tracksEndOfStream() ? &flag : 0, geometry,
                   config.storable.wal().verify_size() );

  Fetcher::Probe probe;

  try
  {
    probe = fetcher.probe( SegmentName::parse( walName ), window );
  }
  catch( Fetcher::exProbeFailed & e )
  {
    errorPrintf( "%s\n", e.what() );
    return Outcome( TransientError );
  }

  switch ( probe.getStartOutcome() )
  {
    case Fetcher::NotFound:
      verbosePrintf( "%s is not in the archive\n", walName.c_str() );
      return Outcome( NotFound );

    case Fetcher::Retrieved:
      if ( !spool.take( walName, destination ) )
      {
        errorPrintf( "%s vanished from the spool\n", walName.c_str() );
        return Outcome( TransientError );
      }

      recordServed( walName, destination );
      verbosePrintf( "Restored %s from the archive\n", walName.c_str() );
      return Outcome( Success, FromArchive );

    default:
      errorPrintf( "Fetching %s from %s: %s\n", walName.c_str(),
                   archive.getDescription().c_str(),
                   Fetcher::outcomeToString( probe.getStartOutcome() ) );
      return Outcome( TransientError );
  }
}

WalRestorer::Outcome WalRestorer::restoreDirectly( string const & walName,
                                                   string const & destination )
{
  if ( isFutureHistoryFile( walName ) )
  {
    verbosePrintf( "Refusing to restore %s, a history file of a timeline "
                   "after the current %u\n", walName.c_str(),
                   config.storable.cluster().timeline() );
    return Outcome( NotFound );
  }

  sptr< TemporaryFile > file = spool.makeTemporaryFile();
  WalArchive::Outcome fetched;

  try
  {
    fetched = archive.fetch( walName, file->getFileName() );
  }
  catch( WalArchive::Ex & e )
  {
    errorPrintf( "%s\n", e.what() );
    return Outcome( TransientError );
  }

  switch ( fetched )
  {
    case WalArchive::Retrieved:
      file->moveOverTo( destination, true );
      recordServed( walName, destination );
      verbosePrintf( "Restored %s from the archive\n", walName.c_str() );
      return Outcome( Success, FromArchive );

    case WalArchive::NotFound:
      verbosePrintf( "%s is not in the archive\n", walName.c_str() );
      return Outcome( NotFound );

    case WalArchive::TimedOut:
      break;
  }

  errorPrintf( "Fetching %s from %s timed out\n", walName.c_str(),
               archive.getDescription().c_str() );
  return Outcome( TransientError );
}
