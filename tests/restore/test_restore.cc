// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdio.h>
#include <stdlib.h>
#include <sys/xattr.h>
#include <string>
#include <vector>
#include "../../check.hh"
#include "../../compression.hh"
#include "../../config.hh"
#include "../../debug.hh"
#include "../../end_of_stream.hh"
#include "../../last_served.hh"
#include "../../spool.hh"
#include "../../wal_archive.hh"
#include "../../wal_restorer.hh"
#include "../scratch_dir.hh"

using std::string;
using std::vector;

/// A standby's data directory, its spool and a directory archive, all in a
/// scratch directory. Segments are 1MiB
class Standby
{
public:
  ScratchDir scratch;
  Config config;
  DirectoryArchive archive;
  Spool spool;
  WalRestorer restorer;

  Standby( unsigned window ):
    archive( scratch / "archive", "pg" ),
    spool( scratch / "spool" ),
    restorer( config, archive, spool )
  {
    config.storable.mutable_wal()->set_max_parallel( window );
    config.storable.mutable_wal()->set_segment_size( WalGeometry::MinSegmentSize );
    config.storable.mutable_spool()->set_path( spool.getPath() );
    config.storable.mutable_archive()->set_path( scratch / "archive" );
    config.storable.mutable_archive()->set_server_name( "pg" );
    config.runtime.pgData = scratch / "pgdata";
    config.validate();

    Dir::createRecursively( scratch / "pgdata/pg_wal" );
    Dir::createRecursively( scratch / "archive/pg/wals" );
  }

  static string contentsOf( SegmentName const & name )
  {
    string data( WalGeometry::MinSegmentSize, 0 );
    string header = "segment " + name.toString();
    data.replace( 0, header.size(), header );
    return data;
  }

  /// Stores the segment in the archive, compressed with the given method
  /// unless it's NULL
  void archiveSegment( SegmentName const & name,
                       Compression::CompressionMethod const * method = 0 )
  {
    string dir = archive.getWalDir( name.toString() );
    Dir::createRecursively( dir );

    string fileName = Dir::addPath( dir, name.toString() );

    if ( !method )
    {
      writeFile( fileName, contentsOf( name ) );
      return;
    }

    writeFile( scratch / "plain", contentsOf( name ) );
    Compression::processFile( *method->createEncoder(), scratch / "plain",
                              fileName + method->getFileSuffix() );
  }

  /// Stores a file other than a segment in the archive
  void archiveFile( string const & name, string const & data )
  {
    string dir = archive.getWalDir( name );
    Dir::createRecursively( dir );
    writeFile( Dir::addPath( dir, name ), data );
  }

  WalRestorer::Outcome restore( string const & name )
  {
    return restorer.restore( name, "pg_wal/RECOVERYXLOG" );
  }

  WalRestorer::Outcome restore( SegmentName const & name )
  {
    return restore( name.toString() );
  }

  string restored()
  {
    return readFile( scratch / "pgdata/pg_wal/RECOVERYXLOG" );
  }

  vector< string > spooled()
  {
    vector< Spool::Entry > entries = spool.entries();
    vector< string > result;
    for ( size_t x = 0; x < entries.size(); ++x )
      result.push_back( entries[ x ].name );
    return result;
  }

  bool spoolHolds( SegmentName const & a )
  {
    vector< string > s = spooled();
    return s.size() == 1 && s[ 0 ] == a.toString();
  }

  bool spoolHolds( SegmentName const & a, SegmentName const & b )
  {
    vector< string > s = spooled();
    return s.size() == 2 && s[ 0 ] == a.toString() && s[ 1 ] == b.toString();
  }

  bool flagIsSet()
  {
    return EndOfStreamFlag( spool ).isSet();
  }
};

SegmentName F( uint32_t x )
{
  return SegmentName( 1, 0, x );
}

void testScenario()
{
  Standby standby( 3 );

  for ( uint32_t x = 1; x <= 5; ++x )
    standby.archiveSegment( F( x ) );

  WalRestorer::Outcome outcome = standby.restore( F( 1 ) );
  CHECK( outcome.status == WalRestorer::Success, "F1 not restored" );
  CHECK( outcome.source == WalRestorer::FromArchive, "F1 from %s",
         WalRestorer::sourceToString( outcome.source ) );
  CHECK( standby.restored() == Standby::contentsOf( F( 1 ) ), "F1 contents" );
  CHECK( standby.spoolHolds( F( 2 ), F( 3 ) ), "spool after F1" );
  CHECK( !standby.flagIsSet(), "flag set after F1" );

  outcome = standby.restore( F( 2 ) );
  CHECK( outcome.status == WalRestorer::Success, "F2 not restored" );
  CHECK( outcome.source == WalRestorer::FromSpool, "F2 from %s",
         WalRestorer::sourceToString( outcome.source ) );
  CHECK( standby.restored() == Standby::contentsOf( F( 2 ) ), "F2 contents" );
  CHECK( standby.spoolHolds( F( 3 ) ), "spool after F2" );
  CHECK( !standby.flagIsSet(), "flag set after F2" );

  // F3 got skipped by the server, F6 isn't archived yet
  outcome = standby.restore( F( 4 ) );
  CHECK( outcome.status == WalRestorer::Success, "F4 not restored" );
  CHECK( outcome.source == WalRestorer::FromArchive, "F4 from %s",
         WalRestorer::sourceToString( outcome.source ) );
  CHECK( standby.restored() == Standby::contentsOf( F( 4 ) ), "F4 contents" );
  CHECK( standby.spoolHolds( F( 5 ) ), "spool after F4" );
  CHECK( standby.flagIsSet(), "flag not set after F4" );

  outcome = standby.restore( F( 6 ) );
  CHECK( outcome.status == WalRestorer::NotFound, "F6 found" );
  CHECK( outcome.source == WalRestorer::FromEndOfStreamFlag,
         "archive asked for F6" );
  CHECK( standby.spoolHolds( F( 5 ) ), "spool changed by F6" );
  CHECK( !standby.flagIsSet(), "flag still set after F6" );

  standby.archiveSegment( F( 6 ) );

  outcome = standby.restore( F( 6 ) );
  CHECK( outcome.status == WalRestorer::Success, "F6 not restored" );
  CHECK( outcome.source == WalRestorer::FromArchive, "F6 from %s",
         WalRestorer::sourceToString( outcome.source ) );
  CHECK( standby.restored() == Standby::contentsOf( F( 6 ) ), "F6 contents" );
  CHECK( standby.flagIsSet(), "flag not set after the second F6" );
  CHECK( standby.spooled().empty(), "spool not empty after F6" );

  printf( "Scenario test passed\n" );
}

void testIdempotence()
{
  Standby standby( 3 );

  for ( uint32_t x = 1; x <= 5; ++x )
    standby.archiveSegment( F( x ) );

  CHECK( standby.restore( F( 1 ) ).status == WalRestorer::Success, "F1" );

  // The server asks again, having lost track of the first answer
  WalRestorer::Outcome outcome = standby.restore( F( 1 ) );
  CHECK( outcome.status == WalRestorer::Success, "second F1 failed" );
  CHECK( standby.restored() == Standby::contentsOf( F( 1 ) ), "F1 contents" );

  CHECK( outcome.source == WalRestorer::FromDestination, "F1 from %s",
         WalRestorer::sourceToString( outcome.source ) );
  // Nothing else changed
  CHECK( standby.spoolHolds( F( 2 ), F( 3 ) ), "spool changed" );

  // The destination holding another segment is no answer
  outcome = standby.restore( F( 2 ) );
  CHECK( outcome.status == WalRestorer::Success &&
         outcome.source != WalRestorer::FromDestination, "F2 not restored" );
  CHECK( standby.restored() == Standby::contentsOf( F( 2 ) ), "F2 contents" );

  // Neither is an untagged file
  string untagged = standby.scratch / "pgdata/pg_wal/untagged";
  writeFile( untagged, Standby::contentsOf( F( 3 ) ) );
  CHECK( !WalRestorer::isServed( untagged, F( 3 ).toString(), 0 ),
         "untagged file trusted" );

  printf( "Idempotence test passed\n" );
}

void testIdempotenceWithoutAttributes()
{
  Standby standby( 3 );
  string destination = standby.scratch / "pgdata/pg_wal/RECOVERYXLOG";

  standby.archiveSegment( F( 4 ) );
  standby.archiveSegment( F( 5 ) );

  WalRestorer::Outcome outcome = standby.restore( F( 4 ) );
  CHECK( outcome.status == WalRestorer::Success &&
         outcome.source == WalRestorer::FromArchive, "F4" );
  CHECK( standby.flagIsSet(), "flag not set after F4" );

  // As if the file system had no extended attributes
  removexattr( destination.c_str(), WalRestorer::NameAttribute );
  CHECK( !WalRestorer::isServed( destination, F( 4 ).toString(), 0 ),
         "attribute not removed" );

  outcome = standby.restore( F( 4 ) );
  CHECK( outcome.status == WalRestorer::Success, "repeated F4 failed: %s",
         WalRestorer::statusToString( outcome.status ) );
  CHECK( outcome.source == WalRestorer::FromDestination, "F4 from %s",
         WalRestorer::sourceToString( outcome.source ) );
  CHECK( standby.restored() == Standby::contentsOf( F( 4 ) ), "F4 contents" );
  CHECK( standby.flagIsSet(), "flag consumed by a repeated request" );
  CHECK( standby.spoolHolds( F( 5 ) ), "spool changed by a repeated request" );

  // The record survives reconciliation
  CHECK( standby.restore( F( 5 ) ).source == WalRestorer::FromSpool, "F5" );
  removexattr( destination.c_str(), WalRestorer::NameAttribute );
  CHECK( File::exists( Dir::addPath( standby.spool.getPath(),
                                     LastServed::FileName ) ),
         "no record of F5" );
  CHECK( standby.restore( F( 5 ) ).source == WalRestorer::FromDestination,
         "repeated F5 not answered from the destination" );

  // Only the very file delivered is vouched for
  CHECK( standby.restorer.restore( F( 5 ).toString(), "pg_wal/OTHER" ).status !=
         WalRestorer::Success, "F5 vouched for at another destination" );

  // A copy with the same contents is another file. The original is kept
  // around so its inode can't be reused
  File::rename( destination, standby.scratch / "previous" );
  writeFile( destination, Standby::contentsOf( F( 5 ) ) );
  CHECK( !LastServed( standby.spool ).matches( F( 5 ).toString(), destination,
                                               WalGeometry::MinSegmentSize ),
         "replaced destination vouched for" );

  printf( "Idempotence without attributes test passed\n" );
}

void testCompressed()
{
  Standby standby( 3 );

  standby.archiveSegment( F( 1 ),
    Compression::CompressionMethod::findCompression( "gzip" ).get() );
  standby.archiveSegment( F( 2 ),
    Compression::CompressionMethod::findCompression( "xz" ).get() );
  standby.archiveSegment( F( 3 ) );

  CHECK( standby.restore( F( 1 ) ).status == WalRestorer::Success,
         "gzipped F1 not restored" );
  CHECK( standby.restored() == Standby::contentsOf( F( 1 ) ), "F1 contents" );

  CHECK( standby.restore( F( 2 ) ).source == WalRestorer::FromSpool,
         "xz F2 not spooled" );
  CHECK( standby.restored() == Standby::contentsOf( F( 2 ) ), "F2 contents" );

  CHECK( standby.restore( F( 3 ) ).source == WalRestorer::FromSpool,
         "F3 not spooled" );
  CHECK( standby.restored() == Standby::contentsOf( F( 3 ) ), "F3 contents" );

  printf( "Compressed test passed\n" );
}

void testCorruptObjects()
{
  Standby standby( 3 );

  standby.archiveSegment( F( 1 ) );
  standby.archiveFile( F( 2 ).toString() + ".gz", "this is not gzip" );
  standby.archiveSegment( F( 3 ) );

  // A broken segment in the window spoils the whole probe
  WalRestorer::Outcome outcome = standby.restore( F( 1 ) );
  CHECK( outcome.status == WalRestorer::TransientError, "corrupt F2 ignored" );
  CHECK( standby.spooled().empty(), "spooled from a failed probe" );
  CHECK( !standby.flagIsSet(), "flag set by a corrupt object" );
  CHECK( !File::exists( standby.scratch / "pgdata/pg_wal/RECOVERYXLOG" ),
         "destination written" );

  // So does a segment of the wrong size
  Standby truncated( 1 );
  truncated.archiveFile( F( 1 ).toString(), "short" );
  outcome = truncated.restore( F( 1 ) );
  CHECK( outcome.status == WalRestorer::TransientError, "short F1 accepted" );
  CHECK( !truncated.flagIsSet(), "flag set by a short segment" );

  truncated.config.storable.mutable_wal()->set_verify_size( false );
  CHECK( truncated.restore( F( 1 ) ).status == WalRestorer::Success,
         "short F1 refused without verification" );
  CHECK( truncated.restored() == "short", "short F1 contents" );

  printf( "Corrupt objects test passed\n" );
}

void testCrashRecovery()
{
  Standby standby( 3 );

  for ( uint32_t x = 1; x <= 3; ++x )
    standby.archiveSegment( F( x ) );

  // Killed after F2 and F3 got spooled, before the flag could be updated,
  // with an unfinished temporary file
  {
    Spool spool( standby.spool.getPath() );
    sptr< TemporaryFile > f2 = spool.makeTemporaryFile();
    writeFile( f2->getFileName(), Standby::contentsOf( F( 2 ) ) );
    spool.put( F( 2 ).toString(), *f2 );
    sptr< TemporaryFile > f3 = spool.makeTemporaryFile();
    writeFile( f3->getFileName(), Standby::contentsOf( F( 3 ) ) );
    spool.put( F( 3 ).toString(), *f3 );
    writeFile( Dir::addPath( spool.getPath(), "tmp/leftover" ), "partial" );
  }

  WalRestorer::Outcome outcome = standby.restore( F( 2 ) );
  CHECK( outcome.source == WalRestorer::FromSpool, "F2 from %s",
         WalRestorer::sourceToString( outcome.source ) );
  CHECK( standby.restored() == Standby::contentsOf( F( 2 ) ), "F2 contents" );
  CHECK( standby.spoolHolds( F( 3 ) ), "spool after F2" );
  CHECK( !File::exists( Dir::addPath( standby.spool.getPath(), "tmp/leftover" ) ),
         "leftover kept" );

  // A gap can't be trusted. The server has consumed F2 already
  File::erase( standby.scratch / "pgdata/pg_wal/RECOVERYXLOG" );
  standby.spool.dropEntries();
  standby.archiveSegment( F( 4 ) );
  {
    sptr< TemporaryFile > f = standby.spool.makeTemporaryFile();
    writeFile( f->getFileName(), "not F2" );
    standby.spool.put( F( 2 ).toString(), *f );
    f = standby.spool.makeTemporaryFile();
    writeFile( f->getFileName(), "not F4" );
    standby.spool.put( F( 4 ).toString(), *f );
  }

  outcome = standby.restore( F( 2 ) );
  CHECK( outcome.status == WalRestorer::Success, "F2 not restored" );
  CHECK( outcome.source == WalRestorer::FromArchive, "gapped spool trusted" );
  CHECK( standby.restored() == Standby::contentsOf( F( 2 ) ), "F2 contents" );
  CHECK( standby.spoolHolds( F( 3 ), F( 4 ) ), "spool after F2" );
  CHECK( readFile( standby.spool.getFileName( F( 4 ).toString() ) ) ==
         Standby::contentsOf( F( 4 ) ), "bogus F4 kept" );

  printf( "Crash recovery test passed\n" );
}

void testLogBoundary()
{
  Standby standby( 3 );

  // 1MiB segments wrap into the next log after 0xFFF
  SegmentName last( 1, 0, 0xFFF ), first( 1, 1, 0 ), second( 1, 1, 1 );
  standby.archiveSegment( last );
  standby.archiveSegment( first );
  standby.archiveSegment( second );

  CHECK( standby.restore( last ).status == WalRestorer::Success, "last" );
  CHECK( standby.spoolHolds( first, second ), "next log not prefetched" );
  CHECK( standby.restore( first ).source == WalRestorer::FromSpool, "first" );

  printf( "Log boundary test passed\n" );
}

void testOtherFiles()
{
  Standby standby( 3 );

  standby.archiveFile( "00000002.history", "1\t0/3000000\tno recovery target\n" );
  standby.archiveFile( "000000010000000000000002.partial", "partial" );
  standby.archiveFile( "000000010000000000000002.00000028.backup", "label" );

  // History, partial and backup files bypass the spool and the flag
  EndOfStreamFlag( standby.spool ).set();

  WalRestorer::Outcome outcome = standby.restore( "00000002.history" );
  CHECK( outcome.status == WalRestorer::Success &&
         outcome.source == WalRestorer::FromArchive, "history not restored" );
  CHECK( standby.restored() == "1\t0/3000000\tno recovery target\n",
         "history contents" );
  CHECK( standby.flagIsSet(), "flag touched by a history file" );

  CHECK( standby.restore( "000000010000000000000002.partial" ).status ==
         WalRestorer::Success, "partial not restored" );
  CHECK( standby.restored() == "partial", "partial contents" );

  CHECK( standby.restore( "000000010000000000000002.00000028.backup" ).status ==
         WalRestorer::Success, "backup label not restored" );

  CHECK( standby.restore( "00000003.history" ).status == WalRestorer::NotFound,
         "missing history found" );
  CHECK( standby.flagIsSet(), "flag touched by a missing history file" );
  CHECK( standby.spooled().empty(), "history files spooled" );

  // Replicas don't follow timelines the cluster isn't on yet
  standby.config.storable.mutable_cluster()->set_timeline( 1 );
  outcome = standby.restore( "00000002.history" );
  CHECK( outcome.status == WalRestorer::NotFound, "future history restored" );

  standby.config.storable.mutable_cluster()->set_primary( true );
  CHECK( standby.restore( "00000002.history" ).status == WalRestorer::Success,
         "primary refused a history file" );

  standby.config.storable.mutable_cluster()->set_primary( false );
  standby.config.storable.mutable_cluster()->set_timeline( 2 );
  CHECK( standby.restore( "00000002.history" ).status == WalRestorer::Success,
         "current history refused" );

  printf( "Other files test passed\n" );
}

void testWithoutStreaming()
{
  Standby standby( 2 );
  standby.config.storable.mutable_cluster()->set_streaming_available( false );

  standby.archiveSegment( F( 1 ) );

  CHECK( standby.restore( F( 1 ) ).status == WalRestorer::Success, "F1" );
  CHECK( !standby.flagIsSet(), "flag set without streaming" );

  WalRestorer::Outcome outcome = standby.restore( F( 2 ) );
  CHECK( outcome.status == WalRestorer::NotFound &&
         outcome.source == WalRestorer::FromNowhere, "F2" );
  CHECK( !standby.flagIsSet(), "flag set without streaming" );

  // A stale flag is ignored
  EndOfStreamFlag( standby.spool ).set();
  standby.archiveSegment( F( 2 ) );
  CHECK( standby.restore( F( 2 ) ).status == WalRestorer::Success,
         "stale flag obeyed" );

  printf( "Without streaming test passed\n" );
}

void testDestinations()
{
  CHECK( WalRestorer::resolveDestination( "/pgdata", "pg_wal/RECOVERYXLOG" ) ==
         "/pgdata/pg_wal/RECOVERYXLOG", "relative destination" );
  CHECK( WalRestorer::resolveDestination( "/pgdata", "/other/RECOVERYXLOG" ) ==
         "/other/RECOVERYXLOG", "absolute destination" );

  Standby standby( 1 );
  standby.archiveSegment( F( 1 ) );

  string absolute = standby.scratch / "elsewhere";
  CHECK( standby.restorer.restore( F( 1 ).toString(), absolute ).status ==
         WalRestorer::Success, "absolute destination" );
  CHECK( readFile( absolute ) == Standby::contentsOf( F( 1 ) ), "contents" );

  char const * bad[] = { "", "..", "../../etc/passwd", "pg_wal/000000010000000000000001" };
  for ( size_t x = 0; x < sizeof( bad ) / sizeof( *bad ); ++x )
  {
    bool thrown = false;
    try
    {
      standby.restore( bad[ x ] );
    }
    catch( WalRestorer::exBadWalName & )
    {
      thrown = true;
    }
    CHECK( thrown, "\"%s\" accepted", bad[ x ] );
  }

  printf( "Destinations test passed\n" );
}

int main()
{
  verboseMode = false;

  testScenario();
  testIdempotence();
  testIdempotenceWithoutAttributes();
  testCompressed();
  testCorruptObjects();
  testCrashRecovery();
  testLogBoundary();
  testOtherFiles();
  testWithoutStreaming();
  testDestinations();

  return 0;
}
