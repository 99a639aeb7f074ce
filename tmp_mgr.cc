// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include "tmp_mgr.hh"

#include <stdlib.h>
#include <unistd.h>
#include "debug.hh"
#include "dir.hh"
#include "file.hh"

TemporaryFile::TemporaryFile( string const & fileName ): fileName( fileName )
{
}

void TemporaryFile::moveOverTo( string const & destinationFileName,
                                bool mayOverwrite )
{
  if ( !mayOverwrite && File::exists( destinationFileName ) )
    throw TmpMgr::exWontOverwrite( destinationFileName );

  File::rename( fileName, destinationFileName );
  fileName.clear();
}

TemporaryFile::~TemporaryFile()
{
  if ( !fileName.empty() )
  {
    try
    {
      File::erase( fileName, true );
    }
    catch( File::exCantErase & e )
    {
      errorPrintf( "%s\n", e.what() );
    }
  }
}

string const & TemporaryFile::getFileName() const
{
  return fileName;
}

TmpMgr::TmpMgr( string const & path ): path( path )
{
  if ( !Dir::exists( path ) )
    Dir::createRecursively( path );
}

sptr< TemporaryFile > TmpMgr::makeTemporaryFile()
{
  string name( Dir::addPath( path, "XXXXXX") );

  int fd = mkstemp( &name[ 0 ] );

  if ( fd == -1 || close( fd ) != 0 )
    throw exCantCreate( withErrno( path ) );

  return new TemporaryFile( name );
}

unsigned TmpMgr::removeLeftovers()
{
  unsigned removed = 0;

  Dir::Listing lst( path );
  Dir::Entry entry;

  while ( lst.getNext( entry ) )
  {
    if ( entry.isDir() )
      continue;

    dPrintf( "Removing leftover temporary file %s\n",
             entry.getFileName().c_str() );
    if ( File::erase( Dir::addPath( path, entry.getFileName() ), true ) )
      ++removed;
  }

  return removed;
}

TmpMgr::~TmpMgr()
{
  try
  {
    Dir::remove( path );
  }
  catch( Dir::exCantRemove & )
  {
    // Still in use by someone else or not empty, which is fine
  }
}
