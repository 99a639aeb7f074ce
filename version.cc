// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include "version.hh"
#ifndef WALRESTORE_VERSION
std::string walrestore_version( "1.0" );
#else
std::string walrestore_version( WALRESTORE_VERSION );
#endif
