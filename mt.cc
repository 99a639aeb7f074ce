// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include "mt.hh"

#include <string.h>
#include "check.hh"

Mutex::Mutex()
{
  pthread_mutex_init( &mutex, 0 );
}

void Mutex::lock()
{
  pthread_mutex_lock( &mutex );
}

void Mutex::unlock()
{
  pthread_mutex_unlock( &mutex );
}

Mutex::~Mutex()
{
  pthread_mutex_destroy( &mutex );
}

void * Thread::__thread_routine( void * param )
{
  return ( (Thread *)param ) -> threadFunction();
}

void Thread::start()
{
  CHECK( !started, "thread started twice" );

  int res = pthread_create( &thread, 0, &__thread_routine, this );
  if ( res != 0 )
    throw exCantStart( strerror( res ) );

  started = true;
}

void * Thread::join()
{
  CHECK( started, "joining a thread which was never started" );

  void * ret;
  CHECK( pthread_join( thread, &ret ) == 0, "pthread_join() failed" );
  started = false;

  return ret;
}
