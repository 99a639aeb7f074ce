// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef UTILS_HH_INCLUDED
#define UTILS_HH_INCLUDED

#include <stdint.h>
#include <sstream>
#include <string>

#define VALID_SUFFIXES "Valid suffixes:\n" \
"|--------|----------------|----------|\n" \
"| suffix | multiplier     | name     |\n" \
"|--------|----------------|----------|\n" \
"| B      | 1              | byte     |\n" \
"| KiB    | 1024           | kibibyte |\n" \
"| MiB    | 1024*1024      | mebibyte |\n" \
"| GiB    | 1024*1024*1024 | gibibyte |\n" \
"| KB     | 1000           | kilobyte |\n" \
"| MB     | 1000*1000      | megabyte |\n" \
"| GB     | 1000*1000*1000 | gigabyte |\n" \
"|--------|----------------|----------|\n"

namespace Utils {
using std::string;

/// Returns the multiplier for the given size suffix (see VALID_SUFFIXES), or
/// 0 if the suffix is not known. Case-insensitive
unsigned int getScale( string const & suffix );

/// Parses a size such as "16777216", "16MiB" or "16 MiB". Returns false if
/// the value is malformed
bool parseSize( string const & value, uint64_t & result );

/// Quotes the given string so /bin/sh would pass it as a single argument
string shellQuote( string const & );

/// Milliseconds elapsed on a monotonic clock. Only differences make sense
uint64_t getMonotonicMs();

/// Sleeps for the given number of milliseconds, resuming after signals
void sleepMs( unsigned ms );

template <typename T>
string numberToString( T pNumber )
{
  std::ostringstream oOStrStream;
  oOStrStream << pNumber;
  return oOStrStream.str();
}

}

#endif
