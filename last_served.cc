// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "debug.hh"
#include "dir.hh"
#include "file.hh"
#include "last_served.hh"
#include "walrestore.pb.h"

char const LastServed::FileName[] = "last-served";

LastServed::LastServed( Spool & spool ):
  fileName( Dir::addPath( spool.getPath(), FileName ) ), spool( spool )
{
}

void LastServed::record( string const & walName, string const & destination )
{
  struct stat st;

  if ( ::stat( destination.c_str(), &st ) != 0 )
    throw exCantStat( withErrno( destination ) );

  ServedFile served;
  served.set_name( walName );
  served.set_destination( destination );
  served.set_size( st.st_size );
  served.set_mtime( st.st_mtime );
  served.set_device( st.st_dev );
  served.set_inode( st.st_ino );

  string data;
  if ( !served.SerializeToString( &data ) )
    throw exCantSerialize( served.GetTypeName() );

  sptr< TemporaryFile > tmp = spool.makeTemporaryFile();

  File f( tmp->getFileName(), File::WriteOnly );
  f.write( data );
  f.close();

  tmp->moveOverTo( fileName, true );
}

bool LastServed::matches( string const & walName, string const & destination,
                          size_t expectedSize ) const
{
  if ( !File::exists( fileName ) )
    return false;

  string data;

  {
    File f( fileName, File::ReadOnly );
    data.resize( f.size() );
    if ( !data.empty() )
      f.read( &data[ 0 ], data.size() );
  }

  ServedFile served;

  if ( !served.ParseFromString( data ) )
  {
    dPrintf( "Ignoring an unreadable %s\n", fileName.c_str() );
    return false;
  }

  if ( served.name() != walName || served.destination() != destination )
    return false;

  struct stat st;

  if ( ::stat( destination.c_str(), &st ) != 0 )
  {
    if ( errno == ENOENT )
      return false;
    throw exCantStat( withErrno( destination ) );
  }

  return S_ISREG( st.st_mode ) &&
         ( !expectedSize || (size_t) st.st_size == expectedSize ) &&
         served.size() == (uint64_t) st.st_size &&
         served.mtime() == (int64_t) st.st_mtime &&
         served.device() == (uint64_t) st.st_dev &&
         served.inode() == (uint64_t) st.st_ino;
}
