// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include "debug.hh"
#include "dir.hh"
#include "end_of_stream.hh"
#include "file.hh"

char const EndOfStreamFlag::FileName[] = "end-of-wal-stream";

EndOfStreamFlag::EndOfStreamFlag( Spool & spool ): spool( spool ),
  fileName( Dir::addPath( spool.getPath(), FileName ) )
{
}

bool EndOfStreamFlag::isSet() const
{
  return File::exists( fileName );
}

void EndOfStreamFlag::set()
{
  if ( isSet() )
    return;

  spool.makeTemporaryFile()->moveOverTo( fileName, true );
  dPrintf( "End of WAL stream flag set\n" );
}

void EndOfStreamFlag::clear()
{
  if ( File::erase( fileName, true ) )
    dPrintf( "End of WAL stream flag cleared\n" );
}
