// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef FETCHER_HH_INCLUDED__
#define FETCHER_HH_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <exception>
#include <string>
#include <vector>

#include "end_of_stream.hh"
#include "ex.hh"
#include "mt.hh"
#include "nocopy.hh"
#include "spool.hh"
#include "sptr.hh"
#include "tmp_mgr.hh"
#include "wal_archive.hh"
#include "wal_segment.hh"

using std::string;
using std::vector;

/// Fetches a window of consecutive segments from the archive in parallel and
/// keeps the ones which can be used later in the spool
class Fetcher: NoCopy
{
public:
  DEF_EX( Ex, "Fetcher exception", std::exception )
  DEF_EX_STR( exProbeFailed, "Fetching WAL from the archive failed:", Ex )

  enum Outcome
  {
    Retrieved,
    NotFound,
    TimedOut,
    /// The archive failed, or returned something unusable
    Failed
  };

  struct Result
  {
    SegmentName name;
    Outcome outcome;
    string error;
    /// The fetched file, if Retrieved
    sptr< TemporaryFile > file;

    Result(): outcome( Failed )
    {}
  };

  struct Probe
  {
    /// In segment order, starting with the requested one
    vector< Result > results;
    /// Index of the first result which wasn't retrieved, or results.size()
    /// if all were
    size_t boundary;
    uint64_t elapsedMs;

    Probe(): boundary( 0 ), elapsedMs( 0 )
    {}

    bool hasBoundary() const
    { return boundary < results.size(); }

    /// Outcome for the segment the probe started with
    Outcome getStartOutcome() const
    { return results.front().outcome; }
  };

  /// The flag is not touched if it's NULL. Retrieved segments are checked to
  /// be exactly the segment size long if verifySize is true
  Fetcher( WalArchive &, Spool &, EndOfStreamFlag * flag,
           WalGeometry const &, bool verifySize );

  /// Fetches 'window' segments starting with 'start' using that many threads.
  /// Every retrieved segment before the first missing one is put into the
  /// spool, in order. The flag gets set if the probe stopped on a segment
  /// the archive doesn't have, and cleared if everything was retrieved. A
  /// failed fetch before the first miss throws exProbeFailed, in which case
  /// neither the spool nor the flag are changed
  Probe probe( SegmentName const & start, size_t window );

  static char const * outcomeToString( Outcome );

private:
  class Worker: public Thread
  {
    Fetcher & fetcher;
  public:
    Worker( Fetcher & );
  protected:
    virtual void * threadFunction() throw();
  };

  friend class Worker;

  /// Fetches a single segment into the result
  void fetchOne( Result & );

  /// Runs fetchOne() for each job on the given number of threads
  void runJobs( size_t threads );

  WalArchive & archive;
  Spool & spool;
  EndOfStreamFlag * flag;
  WalGeometry geometry;
  bool verifySize;

  Mutex jobsMutex;
  vector< Result > * jobs;
  size_t nextJob;
};

#endif
