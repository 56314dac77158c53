// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Arena developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ARENA_SYNC_H
#define ARENA_SYNC_H

#include <mutex>

////////////////////////////////////////////////
//                                            //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                            //
////////////////////////////////////////////////

/*
RecursiveMutex mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);
 */

/**
 * Template mixin exposing the lock, unlock and try_lock subset of a standard
 * mutex, so that LOCK takes Mutex and RecursiveMutex alike.
 */
template <typename PARENT>
class AnnotatedMixin : public PARENT
{
public:
    void lock()
    {
        PARENT::lock();
    }

    void unlock()
    {
        PARENT::unlock();
    }

    bool try_lock()
    {
        return PARENT::try_lock();
    }
};

/** Wrapped mutex: supports recursive locking, but no waiting */
typedef AnnotatedMixin<std::recursive_mutex> RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef AnnotatedMixin<std::mutex> Mutex;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) std::unique_lock<typename std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // ARENA_SYNC_H
