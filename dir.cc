// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <errno.h>
#include <fcntl.h>
#include <libgen.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "dir.hh"

namespace Dir {
bool exists( string const & name )
{
  struct stat buf;

  return stat( name.c_str(), &buf ) == 0 && S_ISDIR( buf.st_mode );
}

void create( string const & name )
{
  if ( mkdir( name.c_str(), 0700 ) != 0 )
    throw exCantCreate( withErrno( name ) );
}

void createRecursively( string const & name )
{
  if ( name.empty() || exists( name ) )
    return;

  string parent = getDirName( name );
  if ( parent != name )
    createRecursively( parent );

  // Someone else might have created it in the meantime
  if ( mkdir( name.c_str(), 0700 ) != 0 && errno != EEXIST )
    throw exCantCreate( withErrno( name ) );
}

void remove( string const & name )
{
  if ( rmdir( name.c_str() ) != 0 )
    throw exCantRemove( withErrno( name ) );
}

string addPath( string const & first, string const & second )
{
  if ( first.empty() )
    return second;

  if ( second.empty() )
    return first;

  if ( first[ first.size() - 1 ] == separator() )
    return first + second;
  else
    return first + separator() + second;
}

string getDirName( string const & path )
{
  char const * c = path.c_str();
  std::vector< char > copy( c, c + path.size() + 1 );

  return dirname( copy.data() );
}

string getBaseName( string const & path )
{
  string::size_type end = path.find_last_not_of( separator() );

  if ( end == string::npos )
    return path.empty() ? path : string( 1, separator() );

  string::size_type begin = path.rfind( separator(), end );

  return path.substr( begin == string::npos ? 0 : begin + 1,
                      begin == string::npos ? end + 1 : end - begin );
}

Listing::Listing( string const & dirName ): dirName( dirName )
{
  dir = opendir( dirName.c_str() );

  if ( !dir )
    throw exCantList( withErrno( dirName ) );
}

Listing::~Listing()
{
  closedir( dir );
}

bool Listing::getNext( Entry & result )
{
  struct stat entryStats;

  for ( ; ; )
  {
    errno = 0;
    dirent * entry = readdir( dir );

    if ( !entry )
    {
      if ( errno )
        throw exCantList( withErrno( dirName ) );
      return false;
    }

    if ( fstatat( dirfd( dir ), entry->d_name, &entryStats,
                  AT_SYMLINK_NOFOLLOW ) != 0 )
    {
      // Entries may vanish while we're listing
      if ( errno == ENOENT )
        continue;
      throw exCantList( withErrno( dirName ) );
    }

    bool isDir = S_ISDIR( entryStats.st_mode );

    if ( isDir &&
         ( entry->d_name[ 0 ] == '.' &&
           ( !entry->d_name[ 1 ] || entry->d_name[ 1 ] == '.' ) ) )
    {
      // Skip the . or .. entries
      continue;
    }

    result = Entry( entry->d_name, isDir );
    return true;
  }
}

}
