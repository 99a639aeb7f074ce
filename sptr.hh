// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef SPTR_HH_INCLUDED__
#define SPTR_HH_INCLUDED__

#include <stddef.h>

/// A generic non-intrusive reference-counting smart pointer. The counter is
/// updated atomically, so copies of the same pointer may be made and dropped
/// from different threads. The pointee itself is not protected in any way
template< class T >
class sptr_base
{
  template< class TT > friend class sptr_base;

  T * p;
  unsigned * count;

  void increment()
  {
    if ( count )
      __sync_add_and_fetch( count, 1 );
  }

public:

  sptr_base(): p( 0 ), count( 0 ) {}

  sptr_base( T * p_ ): p( p_ ), count( p_ ? new unsigned( 1 ) : 0 )
  {}

  sptr_base( sptr_base< T > const & other ): p( other.p ), count( other.count )
  { increment(); }

  /// Allows holding a derived object through a pointer to its base
  template< class TT >
  sptr_base( sptr_base< TT > const & other ): p( other.p ), count( other.count )
  { increment(); }

  /// Drops the reference, deleting the object if it was the last one
  void reset()
  {
    if ( count )
    {
      if ( !__sync_sub_and_fetch( count, 1 ) )
      {
        delete count;
        delete p;
      }
      count = 0;
      p = 0;
    }
  }

  sptr_base & operator = ( sptr_base< T > const & other )
  {
    if ( &other != this )
    {
      reset();
      p = other.p;
      count = other.count;
      increment();
    }
    return *this;
  }

  /// Returns true if this pointer is the only one owning the object
  bool unique() const
  { return count && *count == 1; }

  bool operator ! () const
  { return !p; }

  T & operator * () const
  { return *p; }

  T * operator -> () const
  { return p; }

  T * get() const
  { return p; }

  ~sptr_base()
  { reset(); }
};

template< class T >
class sptr: public sptr_base< T >
{
public:

  sptr() {}

  sptr( T * p ): sptr_base< T >( p ) {}

  template< class TT >
  sptr( TT * p ): sptr_base< T >( static_cast< T * >( p ) ) {}

  template< class TT >
  sptr( sptr< TT > const & other ): sptr_base< T >( other ) {}
};

/// A pointer to a const object. Can be obtained from a non-const sptr
template< class T >
class const_sptr: public sptr_base< T const >
{
public:

  const_sptr() {}

  const_sptr( T const * p ): sptr_base< T const >( p ) {}

  template< class TT >
  const_sptr( TT const * p ): sptr_base< T const >( static_cast< T const * >( p ) ) {}

  template< class TT >
  const_sptr( sptr< TT > const & other ): sptr_base< T const >( other ) {}

  template< class TT >
  const_sptr( const_sptr< TT > const & other ): sptr_base< T const >( other ) {}
};

#endif
