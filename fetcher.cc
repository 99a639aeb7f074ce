// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <time.h>

#include "check.hh"
#include "debug.hh"
#include "fetcher.hh"
#include "file.hh"
#include "utils.hh"

Fetcher::Fetcher( WalArchive & archive, Spool & spool, EndOfStreamFlag * flag,
                  WalGeometry const & geometry, bool verifySize ):
  archive( archive ), spool( spool ), flag( flag ), geometry( geometry ),
  verifySize( verifySize ), jobs( 0 ), nextJob( 0 )
{
}

char const * Fetcher::outcomeToString( Outcome outcome )
{
  switch ( outcome )
  {
    case Retrieved:
      return "retrieved";
    case NotFound:
      return "not found";
    case TimedOut:
      return "timed out";
    case Failed:
      return "failed";
  }

  return "unknown";
}

Fetcher::Worker::Worker( Fetcher & fetcher ): fetcher( fetcher )
{
}

void * Fetcher::Worker::threadFunction() throw()
{
  for ( ; ; )
  {
    Result * job;

    {
      Lock _( fetcher.jobsMutex );
      if ( fetcher.nextJob >= fetcher.jobs->size() )
        break;
      job = &( *fetcher.jobs )[ fetcher.nextJob++ ];
    }

    fetcher.fetchOne( *job );
  }

  return NULL;
}

void Fetcher::fetchOne( Result & result )
{
  string name = result.name.toString();

  try
  {
    sptr< TemporaryFile > file = spool.makeTemporaryFile();

    switch ( archive.fetch( name, file->getFileName() ) )
    {
      case WalArchive::Retrieved:
        if ( verifySize )
        {
          size_t size;
          time_t mtime;

          if ( !File::stat( file->getFileName(), size, mtime ) )
            throw WalArchive::exCorrupt( name + " was not stored" );

          if ( size != geometry.segmentSize )
            throw WalArchive::exCorrupt( name + " is " +
              Utils::numberToString( size ) + " bytes long instead of " +
              Utils::numberToString( geometry.segmentSize ) );
        }

        result.file = file;
        result.outcome = Retrieved;
        break;

      case WalArchive::NotFound:
        result.outcome = NotFound;
        break;

      case WalArchive::TimedOut:
        result.outcome = TimedOut;
        break;
    }
  }
  catch( std::exception & e )
  {
    // Reported by probe() once all the workers are done
    result.outcome = Failed;
    result.error = e.what();
  }

  dPrintf( "%s: %s\n", name.c_str(), outcomeToString( result.outcome ) );
}

void Fetcher::runJobs( size_t threads )
{
  vector< sptr< Worker > > workers;

  for ( size_t x = 0; x < threads; ++x )
  {
    sptr< Worker > worker( new Worker( *this ) );

    try
    {
      worker->start();
    }
    catch( Thread::exCantStart & e )
    {
      // The running workers take over the remaining jobs
      if ( workers.empty() )
        throw;
      errorPrintf( "%s, continuing with %zu threads\n", e.what(),
                   workers.size() );
      break;
    }

    workers.push_back( worker );
  }

  for ( size_t x = 0; x < workers.size(); ++x )
    workers[ x ]->join();
}

Fetcher::Probe Fetcher::probe( SegmentName const & start, size_t window )
{
  CHECK( window > 0, "empty probe window" );

  uint64_t startedAt = Utils::getMonotonicMs();

  Probe probe;

  vector< SegmentName > names = start.getWindow( window, geometry );
  probe.results.resize( names.size() );
  for ( size_t x = 0; x < names.size(); ++x )
    probe.results[ x ].name = names[ x ];

  {
    Lock _( jobsMutex );
    jobs = &probe.results;
    nextJob = 0;
  }

  runJobs( names.size() );

  {
    Lock _( jobsMutex );
    jobs = 0;
  }

  probe.elapsedMs = Utils::getMonotonicMs() - startedAt;

  // Only the first segment which wasn't retrieved matters. Whatever follows
  // it can't be kept without leaving a gap
  probe.boundary = probe.results.size();
  size_t hits = 0;

  for ( size_t x = 0; x < probe.results.size(); ++x )
  {
    Result const & result = probe.results[ x ];

    if ( result.outcome == Retrieved )
    {
      ++hits;
      continue;
    }

    if ( probe.boundary == probe.results.size() )
    {
      if ( result.outcome == Failed )
        throw exProbeFailed( result.error );

      probe.boundary = x;
    }
  }

  for ( size_t x = 0; x < probe.results.size(); ++x )
  {
    if ( x < probe.boundary )
      spool.put( probe.results[ x ].name.toString(), *probe.results[ x ].file );
    else
      probe.results[ x ].file.reset();
  }

  if ( flag )
  {
    if ( !probe.hasBoundary() )
      flag->clear();
    else
    if ( probe.results[ probe.boundary ].outcome == NotFound )
    {
      flag->set();
      verbosePrintf( "%s is not in the archive yet, end of WAL stream "
                     "reached\n",
                     probe.results[ probe.boundary ].name.toString().c_str() );
    }
  }

  verbosePrintf( "Fetched %s: window %zu, %zu retrieved, %zu kept, "
                 "stopped at %s, %llu ms\n", start.toString().c_str(),
                 probe.results.size(), hits, probe.boundary,
                 probe.hasBoundary() ?
                   probe.results[ probe.boundary ].name.toString().c_str() :
                   "none",
                 (unsigned long long) probe.elapsedMs );

  return probe;
}
