// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdio.h>

#include "dir.hh"
#include "wal_segment.hh"

namespace {

bool isHexDigit( char c )
{
  // The server always names files in upper case
  return ( c >= '0' && c <= '9' ) || ( c >= 'A' && c <= 'F' );
}

bool isHex( string const & s, size_t offset, size_t count )
{
  if ( s.size() < offset + count )
    return false;

  for ( size_t x = offset; x < offset + count; ++x )
    if ( !isHexDigit( s[ x ] ) )
      return false;

  return true;
}

uint32_t parseHex32( string const & s, size_t offset )
{
  uint32_t result = 0;

  for ( size_t x = offset; x < offset + 8; ++x )
  {
    char c = s[ x ];
    result <<= 4;
    if ( c >= '0' && c <= '9' )
      result |= c - '0';
    else
      result |= c - 'A' + 10;
  }

  return result;
}

}

uint32_t WalGeometry::getSegmentsPerLog() const
{
  // The segment part of the name is eight hex digits, but only
  // 4GB / segmentSize of them are ever used
  return uint32_t( 0xFFFFFFFFull / segmentSize );
}

bool WalGeometry::isValidSegmentSize( uint64_t size )
{
  return size >= MinSegmentSize && size <= MaxSegmentSize &&
         ( size & ( size - 1 ) ) == 0;
}

bool SegmentName::tryParse( string const & path, SegmentName & result )
{
  string name = Dir::getBaseName( path );

  if ( name.size() != NameLength || !isHex( name, 0, NameLength ) )
    return false;

  result = SegmentName( parseHex32( name, 0 ), parseHex32( name, 8 ),
                        parseHex32( name, 16 ) );
  return true;
}

SegmentName SegmentName::parse( string const & path )
{
  SegmentName result;

  if ( !tryParse( path, result ) )
    throw exBadName( path );

  return result;
}

bool SegmentName::isSegmentName( string const & path )
{
  SegmentName unused;
  return tryParse( path, unused );
}

string SegmentName::toString() const
{
  char buf[ NameLength + 1 ];
  snprintf( buf, sizeof( buf ), "%08X%08X%08X", timeline, log, segment );

  return buf;
}

SegmentName SegmentName::successor( WalGeometry const & geometry ) const
{
  SegmentName next( *this );
  uint32_t segmentsPerLog = geometry.getSegmentsPerLog();

  ++next.segment;

  if ( next.segment > segmentsPerLog ||
       ( geometry.skipsLastSegment() && next.segment == segmentsPerLog ) )
  {
    ++next.log;
    next.segment = 0;
  }

  return next;
}

vector< SegmentName > SegmentName::getWindow( size_t count,
                                              WalGeometry const & geometry ) const
{
  vector< SegmentName > result;
  result.reserve( count );

  SegmentName current( *this );

  while ( result.size() < count )
  {
    result.push_back( current );
    current = current.successor( geometry );
  }

  return result;
}

bool SegmentName::operator < ( SegmentName const & other ) const
{
  if ( timeline != other.timeline )
    return timeline < other.timeline;

  if ( log != other.log )
    return log < other.log;

  return segment < other.segment;
}

namespace WalFileName {

bool parseHistoryFile( string const & path, uint32_t & timeline )
{
  string name = Dir::getBaseName( path );

  if ( name.size() != 16 || name.compare( 8, 8, ".history" ) != 0 ||
       !isHex( name, 0, 8 ) )
    return false;

  timeline = parseHex32( name, 0 );
  return true;
}

string getHashDir( string const & path )
{
  string name = Dir::getBaseName( path );

  // Segments, XXX.partial and XXX.YYYYYYYY.backup all start with a segment
  // name
  if ( isHex( name, 0, SegmentName::NameLength ) &&
       ( name.size() == SegmentName::NameLength ||
         name[ SegmentName::NameLength ] == '.' ) )
    return name.substr( 0, 16 );

  return string();
}

}
