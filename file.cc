// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <sys/sendfile.h>
#include <sys/types.h>
#include <fcntl.h>

#include "file.hh"

enum
{
  // We employ a writing buffer to considerably speed up file operations when
  // they consists of many small writes. The default size for the buffer is 64k
  WriteBufferSize = 65536,
  CopyBufferSize = 65536
};

bool File::exists( std::string const & filename ) throw()
{
  struct stat buf;

  // EOVERFLOW rationale: if the file is too large, it still does exist
  return ::stat( filename.c_str(), &buf ) == 0 || errno == EOVERFLOW;
}

bool File::stat( std::string const & filename, size_t & size,
                 time_t & modificationTime ) throw( exCantStat )
{
  struct stat buf;

  if ( ::stat( filename.c_str(), &buf ) != 0 )
  {
    if ( errno == ENOENT || errno == ENOTDIR )
      return false;
    throw exCantStat( withErrno( filename ) );
  }

  if ( !S_ISREG( buf.st_mode ) )
    return false;

  size = buf.st_size;
  modificationTime = buf.st_mtime;

  return true;
}

bool File::erase( std::string const & filename, bool missingOk )
  throw( exCantErase )
{
  if ( unlink( filename.c_str() ) != 0 )
  {
    if ( missingOk && errno == ENOENT )
      return false;
    throw exCantErase( withErrno( filename ) );
  }

  return true;
}

void File::rename( std::string const & from,
                   std::string const & to ) throw( exCantRename )
{
  if ( ::rename( from.c_str(), to.c_str() ) == 0 )
    return;

  if ( errno != EXDEV )
    throw exCantRename( withErrno( from + " to " + to ) );

  copyAcrossDevices( from, to );
}

void File::copyAcrossDevices( std::string const & from,
                              std::string const & to ) throw( exCantRename )
{
  // The copy is made under a temporary name in the destination directory and
  // renamed over the destination, so nobody ever sees a partial file there
  string tmpName( to + ".XXXXXX" );

  int read_fd = ::open( from.c_str(), O_RDONLY );
  if ( read_fd == -1 )
    throw exCantRename( withErrno( from ) );

  struct stat stat_buf;
  int write_fd = -1;

  if ( fstat( read_fd, &stat_buf ) != 0 ||
       ( write_fd = mkstemp( &tmpName[ 0 ] ) ) == -1 )
  {
    string error( withErrno( from + " to " + to ) );
    ::close( read_fd );
    throw exCantRename( error );
  }

  off_t offset = 0;
  bool ok = true;

  while ( ok && offset < stat_buf.st_size )
    if ( sendfile( write_fd, read_fd, &offset, stat_buf.st_size - offset ) <= 0 )
      ok = false;

  string error( ok ? string() : withErrno( from + " to " + to ) );

  ::close( read_fd );

  if ( ::close( write_fd ) != 0 && ok )
  {
    ok = false;
    error = withErrno( tmpName );
  }

  if ( ok && ::rename( tmpName.c_str(), to.c_str() ) != 0 )
  {
    ok = false;
    error = withErrno( tmpName + " to " + to );
  }

  if ( !ok )
  {
    unlink( tmpName.c_str() );
    throw exCantRename( error );
  }

  File::erase( from );
}

void File::copy( std::string const & from, std::string const & to )
{
  File in( from, ReadOnly );
  File out( to, WriteOnly );

  char buf[ CopyBufferSize ];

  while ( size_t got = in.readSome( buf, sizeof( buf ) ) )
    out.write( buf, got );

  out.close();
}

void File::open( char const * filename, OpenMode mode ) throw( exCantOpen )
{
  char const * m = ( mode == WriteOnly ? "wb" : "rb" );

  f = fopen( filename, m );

  if ( !f )
    throw exCantOpen( std::string( filename ) + ": " + strerror( errno ) );
}

File::File( std::string const & filename, OpenMode mode )
  throw( exCantOpen ): writeBuffer( 0 ), fileName( filename )
{
  open( filename.c_str(), mode );
}

void File::read( void * buf, size_t size ) throw( exReadError, exWriteError )
{
  if ( !size )
    return;

  if ( writeBuffer )
    flushWriteBuffer();

  size_t result = fread( buf, size, 1, f );

  if ( result != 1 )
  {
    if ( !ferror( f ) )
      throw exShortRead( fileName );
    else
      throw exReadError( withErrno( fileName ) );
  }
}

size_t File::readSome( void * buf, size_t size )
  throw( exReadError, exWriteError )
{
  if ( writeBuffer )
    flushWriteBuffer();

  size_t result = fread( buf, 1, size, f );

  if ( result < size && ferror( f ) )
    throw exReadError( withErrno( fileName ) );

  return result;
}

void File::write( void const * buf, size_t size ) throw( exWriteError )
{
  if ( !size )
    return;

  if ( size >= WriteBufferSize )
  {
    // If the write is large, there's not much point in buffering
    flushWriteBuffer();

    size_t result = fwrite( buf, size, 1, f );

    if ( result != 1 )
      throw exWriteError( withErrno( fileName ) );

    return;
  }

  if ( !writeBuffer )
  {
    // Allocate the writing buffer since we don't have any yet
    writeBuffer = new char[ WriteBufferSize ];
    writeBufferLeft = WriteBufferSize;
  }

  size_t toAdd = size < writeBufferLeft ? size : writeBufferLeft;

  memcpy( writeBuffer + ( WriteBufferSize - writeBufferLeft ),
          buf, toAdd );

  size -= toAdd;
  writeBufferLeft -= toAdd;

  if ( !writeBufferLeft ) // Out of buffer? Flush it
  {
    flushWriteBuffer();

    if ( size ) // Something's still left? Add to buffer
    {
      memcpy( writeBuffer, (char const *)buf + toAdd, size );
      writeBufferLeft -= size;
    }
  }
}

size_t File::size() throw( exSeekError, exWriteError )
{
  flushWriteBuffer();

  struct stat buf;

  if ( fstat( fileno( f ), &buf ) != 0 )
    throw exSeekError( withErrno( fileName ) );

  return buf.st_size;
}

void File::close() throw( exWriteError )
{
  releaseWriteBuffer();

  FILE * c = f;
  f = 0;

  if ( fclose( c ) != 0 )
    throw exWriteError( withErrno( fileName ) );
}

File::~File() throw()
{
  if ( f )
  {
    try
    {
      releaseWriteBuffer();
    }
    catch( exWriteError & )
    {
      // The owner didn't call close(), so it isn't interested in the outcome
    }
    fclose( f );
  }
  else
    delete [] writeBuffer;
}

void File::flushWriteBuffer() throw( exWriteError )
{
  if ( writeBuffer && writeBufferLeft != WriteBufferSize )
  {
    size_t result = fwrite( writeBuffer, WriteBufferSize - writeBufferLeft, 1, f );

    if ( result != 1 )
      throw exWriteError( withErrno( fileName ) );

    writeBufferLeft = WriteBufferSize;
  }
}

void File::releaseWriteBuffer() throw( exWriteError )
{
  if ( !writeBuffer )
    return;

  char * buffer = writeBuffer;

  try
  {
    flushWriteBuffer();
  }
  catch( exWriteError & )
  {
    writeBuffer = 0;
    delete [] buffer;
    throw;
  }

  writeBuffer = 0;
  delete [] buffer;
}
