// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef VERSION_HH_INCLUDED__
#define VERSION_HH_INCLUDED__

#include <string>

extern std::string walrestore_version;

#endif
