// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef FILE_HH_INCLUDED__
#define FILE_HH_INCLUDED__

#include <stddef.h>
#include <time.h>
#include <cstdio>
#include <exception>
#include <string>

#include "ex.hh"
#include "nocopy.hh"

using std::string;

/// A simple wrapper over FILE * operations with added write-buffering
class File: NoCopy
{
  FILE * f;
  char * writeBuffer;
  size_t writeBufferLeft;
  string fileName;

public:
  DEF_EX( Ex, "File exception", std::exception )
  DEF_EX_STR( exCantOpen, "Can't open", Ex )
  DEF_EX_STR( exReadError, "Error reading from file", Ex )
  DEF_EX_STR( exShortRead, "Short read from the file", Ex )
  DEF_EX_STR( exWriteError, "Error writing to the file", Ex )
  DEF_EX_STR( exSeekError, "File seek error", Ex )
  DEF_EX_STR( exCantErase, "Can't erase file", Ex )
  DEF_EX_STR( exCantRename, "Can't rename file", Ex )
  DEF_EX_STR( exCantStat, "Can't stat file", Ex )

  enum OpenMode
  {
    ReadOnly,
    WriteOnly
  };

  File( std::string const & filename, OpenMode )
    throw( exCantOpen );

  /// Reads the number of bytes to the buffer, throws an error if it
  /// failed to fill the whole buffer (short read, i/o error etc)
  void read( void * buf, size_t size ) throw( exReadError, exWriteError );

  /// Attempts reading at most 'size' bytes. Returns the number of bytes it
  /// managed to read, 0 meaning the end of file. Throws on i/o errors
  size_t readSome( void * buf, size_t size ) throw( exReadError, exWriteError );

  /// Writes the number of bytes from the buffer, throws an error if it
  /// failed to write the whole buffer (short write, i/o error etc).
  /// This function employs write buffering, and as such, writes may not
  /// end up on disk immediately, or a short write may occur later
  /// than it really did
  void write( void const * buf, size_t size ) throw( exWriteError );

  void write( std::string const & data ) throw( exWriteError )
  { write( data.data(), data.size() ); }

  /// Returns file size
  size_t size() throw( exSeekError, exWriteError );

  /// Flushes all buffers and closes the file, reporting any delayed write
  /// error. No further operations are valid
  void close() throw( exWriteError );

  /// Checks if the file exists or not
  static bool exists( std::string const & filename ) throw();

  /// Returns true if the given file exists and is a regular file. Fills in
  /// its size and modification time
  static bool stat( std::string const & filename, size_t & size,
                    time_t & modificationTime ) throw( exCantStat );

  /// Erases the given file. If missingOk is true, a nonexistent file is not
  /// considered an error. Returns true if the file was there
  static bool erase( std::string const &, bool missingOk = false )
    throw( exCantErase );

  /// Renames the given file. If the destination is on another file system,
  /// the data is copied to a temporary file next to it first, so the
  /// destination is still replaced atomically
  static void rename( std::string const & from,
                      std::string const & to ) throw( exCantRename );

  /// Copies the contents of one file over another one
  static void copy( std::string const & from, std::string const & to );

  ~File() throw();

private:

  void open( char const * filename, OpenMode ) throw( exCantOpen );
  void flushWriteBuffer() throw( exWriteError );
  void releaseWriteBuffer() throw( exWriteError );
  static void copyAcrossDevices( std::string const & from,
                                 std::string const & to ) throw( exCantRename );
};

#endif
