// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_FS_H
#define RUMBLE_FS_H

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

namespace fs = boost::filesystem;

#endif // RUMBLE_FS_H
