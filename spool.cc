// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <algorithm>

#include "debug.hh"
#include "dir.hh"
#include "end_of_stream.hh"
#include "file.hh"
#include "last_served.hh"
#include "spool.hh"

namespace {

bool entryLess( Spool::Entry const & x, Spool::Entry const & y )
{
  return x.name < y.name;
}

}

Spool::Spool( string const & path ): path( path ),
  tmpMgr( Dir::addPath( path, "tmp" ) )
{
}

string Spool::getFileName( string const & name ) const
{
  if ( !SegmentName::isSegmentName( name ) )
    throw exBadEntryName( name );

  return Dir::addPath( path, Dir::getBaseName( name ) );
}

sptr< TemporaryFile > Spool::makeTemporaryFile()
{
  return tmpMgr.makeTemporaryFile();
}

void Spool::put( string const & name, TemporaryFile & file )
{
  file.moveOverTo( getFileName( name ), true );
  dPrintf( "Spooled %s\n", name.c_str() );
}

bool Spool::has( string const & name ) const
{
  size_t size;
  time_t mtime;

  return File::stat( getFileName( name ), size, mtime );
}

bool Spool::take( string const & name, string const & destination )
{
  if ( !has( name ) )
    return false;

  File::rename( getFileName( name ), destination );

  return true;
}

vector< Spool::Entry > Spool::entries() const
{
  vector< Entry > result;

  Dir::Listing lst( path );
  Dir::Entry dirEntry;

  while ( lst.getNext( dirEntry ) )
  {
    if ( dirEntry.isDir() ||
         !SegmentName::isSegmentName( dirEntry.getFileName() ) )
      continue;

    Entry entry;
    entry.name = dirEntry.getFileName();
    entry.fileName = Dir::addPath( path, entry.name );

    if ( !File::stat( entry.fileName, entry.size, entry.arrivalTime ) )
      continue;

    result.push_back( entry );
  }

  std::sort( result.begin(), result.end(), entryLess );

  return result;
}

unsigned Spool::dropEntries()
{
  vector< Entry > all = entries();
  unsigned dropped = 0;

  for ( size_t x = 0; x < all.size(); ++x )
    if ( File::erase( all[ x ].fileName, true ) )
      ++dropped;

  return dropped;
}

void Spool::purge()
{
  tmpMgr.removeLeftovers();

  Dir::Listing lst( path );
  Dir::Entry entry;

  while ( lst.getNext( entry ) )
  {
    if ( entry.isDir() )
      continue;

    File::erase( Dir::addPath( path, entry.getFileName() ), true );
  }
}

void Spool::reconcile( size_t maxEntries, WalGeometry const & geometry )
{
  unsigned leftovers = tmpMgr.removeLeftovers();

  if ( leftovers )
    verbosePrintf( "Removed %u leftover temporary files from the spool\n",
                   leftovers );

  // Anything but segments, the flag and the last served record doesn't
  // belong here
  {
    Dir::Listing lst( path );
    Dir::Entry entry;

    while ( lst.getNext( entry ) )
    {
      if ( entry.isDir() ||
           SegmentName::isSegmentName( entry.getFileName() ) ||
           entry.getFileName() == EndOfStreamFlag::FileName ||
           entry.getFileName() == LastServed::FileName )
        continue;

      verbosePrintf( "Removing foreign file %s from the spool\n",
                     entry.getFileName().c_str() );
      File::erase( Dir::addPath( path, entry.getFileName() ), true );
    }
  }

  vector< Entry > all = entries();

  bool consistent = all.size() <= maxEntries;

  for ( size_t x = 1; consistent && x < all.size(); ++x )
  {
    if ( SegmentName::parse( all[ x ].name ) !=
         SegmentName::parse( all[ x - 1 ].name ).successor( geometry ) )
      consistent = false;
  }

  if ( !consistent )
  {
    unsigned dropped = dropEntries();
    verbosePrintf( "The spool held %zu entries which weren't a contiguous run "
                   "of at most %zu segments, dropped %u\n",
                   all.size(), maxEntries, dropped );
  }
}
