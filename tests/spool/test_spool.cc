// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdio.h>
#include <stdlib.h>
#include <string>
#include "../../check.hh"
#include "../../end_of_stream.hh"
#include "../../spool.hh"
#include "../scratch_dir.hh"

WalGeometry geometry;

std::string segment( uint32_t log, uint32_t seg )
{
  return SegmentName( 1, log, seg ).toString();
}

void spoolSegment( Spool & spool, std::string const & name )
{
  sptr< TemporaryFile > file = spool.makeTemporaryFile();
  writeFile( file->getFileName(), "contents of " + name );
  spool.put( name, *file );
}

void testPutTake()
{
  ScratchDir scratch;
  Spool spool( scratch / "spool" );

  CHECK( Dir::exists( scratch / "spool/tmp" ), "no temporary directory" );
  CHECK( spool.entries().empty(), "new spool is not empty" );
  CHECK( !spool.has( segment( 0, 1 ) ), "phantom entry" );

  // Out of order on purpose
  spoolSegment( spool, segment( 0, 2 ) );
  spoolSegment( spool, segment( 0, 1 ) );

  vector< Spool::Entry > entries = spool.entries();
  CHECK( entries.size() == 2, "%zu entries", entries.size() );
  CHECK( entries[ 0 ].name == segment( 0, 1 ), "entries not in order" );
  CHECK( entries[ 1 ].name == segment( 0, 2 ), "entries not in order" );
  CHECK( entries[ 0 ].size == ( "contents of " + segment( 0, 1 ) ).size(),
         "wrong size %zu", entries[ 0 ].size );
  CHECK( entries[ 0 ].fileName == spool.getFileName( segment( 0, 1 ) ),
         "wrong file name %s", entries[ 0 ].fileName.c_str() );

  // Nothing is left in tmp/ once a file is put
  {
    Dir::Listing lst( scratch / "spool/tmp" );
    Dir::Entry entry;
    CHECK( !lst.getNext( entry ), "temporary file left behind" );
  }

  std::string destination = scratch / "RECOVERYXLOG";

  CHECK( !spool.take( segment( 0, 3 ), destination ), "took a missing entry" );
  CHECK( !File::exists( destination ), "destination created for nothing" );

  writeFile( destination, "stale" );
  CHECK( spool.take( segment( 0, 1 ), destination ), "take failed" );
  CHECK( readFile( destination ) == "contents of " + segment( 0, 1 ),
         "destination not replaced" );
  CHECK( !spool.has( segment( 0, 1 ) ), "entry still there after take" );
  CHECK( spool.has( segment( 0, 2 ) ), "other entry gone" );

  // Replacing an entry is fine
  spoolSegment( spool, segment( 0, 2 ) );
  CHECK( spool.entries().size() == 1, "entry duplicated" );

  bool thrown = false;
  try
  {
    spool.getFileName( "00000001.history" );
  }
  catch( Spool::exBadEntryName & )
  {
    thrown = true;
  }
  CHECK( thrown, "history files can't be spooled" );

  // Entries are stored under upper case names only
  thrown = false;
  try
  {
    spool.getFileName( "00000001000000000000000a" );
  }
  catch( Spool::exBadEntryName & )
  {
    thrown = true;
  }
  CHECK( thrown, "lower case entry name accepted" );

  printf( "Put/take test passed\n" );
}

void testFlag()
{
  ScratchDir scratch;
  Spool spool( scratch / "spool" );
  EndOfStreamFlag flag( spool );

  CHECK( !flag.isSet(), "flag set initially" );
  flag.clear();
  CHECK( !flag.isSet(), "clearing an unset flag set it" );

  flag.set();
  CHECK( flag.isSet(), "flag not set" );
  CHECK( File::exists( scratch / "spool/end-of-wal-stream" ),
         "flag file missing" );
  flag.set();
  CHECK( flag.isSet(), "setting twice unset the flag" );

  // Another instance sees the same state
  {
    EndOfStreamFlag other( spool );
    CHECK( other.isSet(), "flag not persisted" );
  }

  // The flag is not an entry
  CHECK( spool.entries().empty(), "flag listed as an entry" );
  CHECK( spool.dropEntries() == 0, "flag dropped as an entry" );
  CHECK( flag.isSet(), "flag lost when dropping entries" );

  flag.clear();
  CHECK( !flag.isSet(), "flag not cleared" );

  printf( "Flag test passed\n" );
}

void testReconcile()
{
  ScratchDir scratch;

  // A contiguous run, a leftover from a killed fetch, some junk, the flag
  {
    Spool spool( scratch / "spool" );
    spoolSegment( spool, segment( 0, 0xFE ) );
    spoolSegment( spool, segment( 0, 0xFF ) );
    spoolSegment( spool, segment( 1, 0 ) );
    EndOfStreamFlag( spool ).set();

    writeFile( scratch / "spool/tmp/a1b2c3", "half written" );
    writeFile( scratch / "spool/junk", "junk" );
    writeFile( scratch / "spool/last-served", "record" );
  }

  {
    Spool spool( scratch / "spool" );
    spool.reconcile( 3, geometry );

    CHECK( !File::exists( scratch / "spool/tmp/a1b2c3" ), "leftover kept" );
    CHECK( !File::exists( scratch / "spool/junk" ), "junk kept" );
    CHECK( File::exists( scratch / "spool/last-served" ), "record removed" );
    CHECK( spool.entries().size() == 3, "contiguous entries dropped, %zu left",
           spool.entries().size() );
    CHECK( EndOfStreamFlag( spool ).isSet(), "flag lost" );

    // The window shrank
    spool.reconcile( 2, geometry );
    CHECK( spool.entries().empty(), "too many entries kept" );
    CHECK( EndOfStreamFlag( spool ).isSet(), "flag lost when dropping entries" );
  }

  // A gap
  {
    Spool spool( scratch / "spool" );
    spoolSegment( spool, segment( 0, 1 ) );
    spoolSegment( spool, segment( 0, 3 ) );
    spool.reconcile( 3, geometry );
    CHECK( spool.entries().empty(), "gapped entries kept" );
  }

  // Same numbers on different timelines don't follow each other
  {
    Spool spool( scratch / "spool" );
    spoolSegment( spool, SegmentName( 1, 0, 5 ).toString() );
    spoolSegment( spool, SegmentName( 2, 0, 6 ).toString() );
    spool.reconcile( 3, geometry );
    CHECK( spool.entries().empty(), "entries across timelines kept" );
  }

  // A single entry is always contiguous
  {
    Spool spool( scratch / "spool" );
    spoolSegment( spool, segment( 4, 4 ) );
    spool.reconcile( 1, geometry );
    CHECK( spool.entries().size() == 1, "single entry dropped" );
  }

  printf( "Reconcile test passed\n" );
}

void testPurge()
{
  ScratchDir scratch;
  Spool spool( scratch / "spool" );

  spoolSegment( spool, segment( 0, 1 ) );
  EndOfStreamFlag flag( spool );
  flag.set();
  writeFile( scratch / "spool/tmp/leftover", "x" );

  spool.purge();

  CHECK( spool.entries().empty(), "entries survived purge" );
  CHECK( !flag.isSet(), "flag survived purge" );
  CHECK( !File::exists( scratch / "spool/tmp/leftover" ),
         "leftover survived purge" );

  printf( "Purge test passed\n" );
}

int main()
{
  testPutTake();
  testFlag();
  testReconcile();
  testPurge();

  return 0;
}
