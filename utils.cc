// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#include "utils.hh"

namespace Utils {

unsigned int getScale( string const & suffixIn )
{
  string suffix( suffixIn );

  for ( string::iterator c = suffix.begin(); c != suffix.end(); ++c )
    *c = tolower( *c );

  if ( suffix == "b" )
    return 1;
  else
  if ( suffix == "kib" )
    return 1024;
  else
  if ( suffix == "mib" )
    return 1024 * 1024;
  else
  if ( suffix == "gib" )
    return 1024 * 1024 * 1024;
  else
  if ( suffix == "kb" )
    return 1000;
  else
  if ( suffix == "mb" )
    return 1000 * 1000;
  else
  if ( suffix == "gb" )
    return 1000 * 1000 * 1000;

  return 0;
}

bool parseSize( string const & value, uint64_t & result )
{
  unsigned long long number;
  char suffix[ 16 ];
  int n = 0;

  if ( sscanf( value.c_str(), "%llu %n", &number, &n ) == 1 && !value[ n ] )
  {
    result = number;
    return true;
  }

  if ( sscanf( value.c_str(), "%llu %15s %n", &number, suffix, &n ) == 2 &&
       !value[ n ] )
  {
    unsigned int scale = getScale( suffix );
    if ( !scale )
      return false;

    result = number * scale;
    return true;
  }

  return false;
}

string shellQuote( string const & in )
{
  string result( "'" );

  for ( string::const_iterator c = in.begin(); c != in.end(); ++c )
  {
    if ( *c == '\'' )
      result += "'\\''";
    else
      result += *c;
  }

  result += '\'';

  return result;
}

uint64_t getMonotonicMs()
{
  struct timespec ts;
  clock_gettime( CLOCK_MONOTONIC, &ts );

  return uint64_t( ts.tv_sec ) * 1000 + ts.tv_nsec / 1000000;
}

void sleepMs( unsigned ms )
{
  struct timespec ts;
  ts.tv_sec = ms / 1000;
  ts.tv_nsec = ( ms % 1000 ) * 1000000L;

  while ( nanosleep( &ts, &ts ) != 0 && errno == EINTR ) ;
}

}
