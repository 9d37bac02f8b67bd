// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_UTILTIME_H
#define RUMBLE_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime - Current UNIX time in seconds, or the mock time when set
 *
 * Round window bounds and join times are always taken from here so that
 * tests can pin them with SetMockTime().
 */
int64_t GetTime();

/** For testing. Set e.g. with the setmocktime rpc, or -mocktime argument */
void SetMockTime(int64_t nMockTimeIn);

int64_t GetMockTime();

std::string FormatISO8601DateTime(int64_t nTime);

#endif // RUMBLE_UTILTIME_H
