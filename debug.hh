// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef DEBUG_HH_INCLUDED
#define DEBUG_HH_INCLUDED

#include <stdio.h>
#include <string.h>
#include <typeinfo>

// Macros we use to output diagnostics. Everything goes to stderr: PostgreSQL
// collects the restore_command's stderr into the server log

#define __CLASS typeid( *this ).name()

#ifndef NDEBUG

#define __FILE_BASE (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define dPrintf( ... ) ({ fprintf( stderr, "[DEBUG] at %s( %s:%d ): ", __func__,\
      __FILE_BASE, __LINE__ );\
    fprintf( stderr, __VA_ARGS__ ); })

#else

#define dPrintf( ... )

#endif

extern bool verboseMode;

/// Informational messages, silenced with --silent
#define verbosePrintf( ... ) ({ if ( verboseMode ) \
                                  { fprintf( stderr, "walrestore: " ); \
                                    fprintf( stderr, __VA_ARGS__ ); } })

/// Errors and warnings, never silenced
#define errorPrintf( ... ) ({ fprintf( stderr, "walrestore: " ); \
                              fprintf( stderr, __VA_ARGS__ ); })

#endif
