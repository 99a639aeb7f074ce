// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <time.h>
#include <vector>

#include "compression.hh"
#include "debug.hh"
#include "dir.hh"
#include "file.hh"
#include "wal_archive.hh"
#include "wal_segment.hh"

WalArchive::~WalArchive()
{
}

char const * WalArchive::outcomeToString( Outcome outcome )
{
  switch ( outcome )
  {
    case Retrieved:
      return "retrieved";
    case NotFound:
      return "not found";
    case TimedOut:
      return "timed out";
  }

  return "unknown";
}

DirectoryArchive::DirectoryArchive( string const & root,
                                    string const & serverName ):
  root( root ), serverName( serverName )
{
}

string DirectoryArchive::getWalDir( string const & name ) const
{
  string dir = Dir::addPath( Dir::addPath( root, serverName ), "wals" );
  string hashDir = WalFileName::getHashDir( name );

  return hashDir.empty() ? dir : Dir::addPath( dir, hashDir );
}

WalArchive::Outcome DirectoryArchive::fetch( string const & name,
                                             string const & outputFileName )
{
  string dir = getWalDir( name );

  // Plain files first, then every compression we know of
  std::vector< string > suffixes( 1 );
  std::vector< const_sptr< Compression::CompressionMethod > > const & methods =
    Compression::CompressionMethod::getAll();
  for ( size_t x = 0; x < methods.size(); ++x )
    suffixes.push_back( methods[ x ]->getFileSuffix() );

  for ( size_t x = 0; x < suffixes.size(); ++x )
  {
    string fileName = Dir::addPath( dir, name + suffixes[ x ] );
    size_t size;
    time_t mtime;

    try
    {
      if ( !File::stat( fileName, size, mtime ) )
        continue;

      dPrintf( "Found %s (%zu bytes)\n", fileName.c_str(), size );

      if ( suffixes[ x ].empty() )
        File::copy( fileName, outputFileName );
      else
      {
        sptr< Compression::EnDecoder > decoder =
          Compression::CompressionMethod::findBySuffix( fileName )->createDecoder();
        Compression::processFile( *decoder, fileName, outputFileName );
      }
    }
    catch( Compression::exCorruptData & e )
    {
      throw exCorrupt( fileName + ": " + e.what() );
    }
    catch( Compression::Ex & e )
    {
      throw exUnavailable( e.what() );
    }
    catch( File::Ex & e )
    {
      throw exUnavailable( e.what() );
    }

    return Retrieved;
  }

  return NotFound;
}

string DirectoryArchive::getDescription() const
{
  return Dir::addPath( root, serverName );
}
