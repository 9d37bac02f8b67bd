// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_SYNC_H
#define RUMBLE_SYNC_H

#include <mutex>
#include <type_traits>

/** Wrapped mutex: supports recursive locking, but no waiting */
typedef std::recursive_mutex RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef std::mutex Mutex;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) std::lock_guard<std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // RUMBLE_SYNC_H
