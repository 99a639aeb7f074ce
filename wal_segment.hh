// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef WAL_SEGMENT_HH_INCLUDED__
#define WAL_SEGMENT_HH_INCLUDED__

#include <stdint.h>
#include <exception>
#include <string>
#include <vector>

#include "ex.hh"

using std::string;
using std::vector;

/// Describes how segment numbers wrap into log numbers. This depends on the
/// server's wal_segment_size and, for very old servers, on its version
struct WalGeometry
{
  enum
  {
    DefaultSegmentSize = 16 * 1024 * 1024,
    MinSegmentSize = 1024 * 1024,
    MaxSegmentSize = 1024 * 1024 * 1024,
    // Servers before 9.3 never used the last segment of each log
    FirstVersionUsingLastSegment = 90300
  };

  uint64_t segmentSize;
  /// Server version number as in server_version_num. 0 means a current one
  unsigned postgresVersion;

  WalGeometry(): segmentSize( DefaultSegmentSize ), postgresVersion( 0 )
  {}

  WalGeometry( uint64_t segmentSize, unsigned postgresVersion ):
    segmentSize( segmentSize ), postgresVersion( postgresVersion )
  {}

  /// Highest segment number within one log
  uint32_t getSegmentsPerLog() const;

  bool skipsLastSegment() const
  { return postgresVersion && postgresVersion < FirstVersionUsingLastSegment; }

  /// Returns true if the segment size is one the server could be built with:
  /// a power of two between 1MiB and 1GiB
  static bool isValidSegmentSize( uint64_t );
};

/// The name of a WAL segment file: TTTTTTTTLLLLLLLLSSSSSSSS, that is the
/// timeline, the log number and the segment number, eight hex digits each.
/// Names sort in log order within one timeline
class SegmentName
{
  uint32_t timeline, log, segment;

public:
  DEF_EX( Ex, "WAL name exception", std::exception )
  DEF_EX_STR( exBadName, "Invalid WAL segment name:", Ex )

  enum
  {
    NameLength = 24
  };

  SegmentName(): timeline( 0 ), log( 0 ), segment( 0 )
  {}

  SegmentName( uint32_t timeline, uint32_t log, uint32_t segment ):
    timeline( timeline ), log( log ), segment( segment )
  {}

  /// Parses the given name, which may also be a full path. Throws exBadName
  static SegmentName parse( string const & );

  /// Same as parse(), but returns false instead of throwing
  static bool tryParse( string const &, SegmentName & );

  /// Returns true if the base name of the given path is a WAL segment name
  static bool isSegmentName( string const & );

  uint32_t getTimeline() const
  { return timeline; }

  uint32_t getLog() const
  { return log; }

  uint32_t getSegment() const
  { return segment; }

  /// Returns the canonical (upper case) name
  string toString() const;

  /// The next segment in the log. Never crosses to another timeline
  SegmentName successor( WalGeometry const & ) const;

  /// Returns 'count' consecutive names starting with this one
  vector< SegmentName > getWindow( size_t count, WalGeometry const & ) const;

  bool operator < ( SegmentName const & other ) const;

  bool operator == ( SegmentName const & other ) const
  {
    return timeline == other.timeline && log == other.log &&
           segment == other.segment;
  }

  bool operator != ( SegmentName const & other ) const
  { return !operator == ( other ); }
};

/// Other kinds of files PostgreSQL asks for through restore_command
namespace WalFileName {

/// Returns true and the timeline if the base name is TTTTTTTT.history
bool parseHistoryFile( string const &, uint32_t & timeline );

/// Returns the directory the file is stored under in a barman-style archive:
/// the timeline and log part of the name for segments, backup labels and
/// partial segments, and an empty string for everything else
string getHashDir( string const & name );

}

#endif
