// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef MT_HH_INCLUDED__
#define MT_HH_INCLUDED__

#include <pthread.h>
#include <stddef.h>
#include <exception>

#include "ex.hh"
#include "nocopy.hh"

/// Multithreading

class Mutex: NoCopy
{
  pthread_mutex_t mutex;

public:

  Mutex();

  /// Please consider using the Lock class instead
  void lock();

  void unlock();

  ~Mutex();
};

class Lock: NoCopy
{
  Mutex * m;

public:

  Lock( Mutex & mutex ): m( &mutex ) { m->lock(); }

  ~Lock()
  { m->unlock(); }
};

/// A joinable thread. start() must be paired with join() before the object
/// is destroyed
class Thread: NoCopy
{
public:
  DEF_EX( Ex, "Thread exception", std::exception )
  DEF_EX_STR( exCantStart, "Can't start a thread:", Ex )

  Thread(): started( false ) {}

  void start();
  void * join();

  bool isStarted() const
  { return started; }

  virtual ~Thread() {}

protected:
  /// This is the function that is meant to work in a separate thread
  virtual void * threadFunction() throw()=0;

private:
  pthread_t thread;
  bool started;
  static void * __thread_routine( void * );
};

#endif
