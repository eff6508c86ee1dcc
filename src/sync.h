// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_SYNC_H
#define SCVERIFY_SYNC_H

#include <mutex>
#include <thread>

////////////////////////////////////////////////
//                                            //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                            //
////////////////////////////////////////////////

/*
CCriticalSection mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);

WAIT_LOCK(mutex, name);
    std::unique_lock<std::mutex> name(mutex);
 */

/** Wrapped mutex: supports recursive locking, but no waiting */
typedef std::recursive_mutex CCriticalSection;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef std::mutex CWaitableCriticalSection;

/** Wrapper around std::unique_lock<CCriticalSection> */
template <typename Mutex>
class CMutexLock
{
private:
    std::unique_lock<Mutex> lock;

public:
    CMutexLock(Mutex& mutexIn, const char* pszName, const char* pszFile, int nLine)
        : lock(mutexIn)
    {
    }
};

typedef CMutexLock<CCriticalSection> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs, #cs, __FILE__, __LINE__)

#define WAIT_LOCK(cs, name) std::unique_lock<CWaitableCriticalSection> name(cs)

#endif // SCVERIFY_SYNC_H
