// ResourceLimitManager.cpp --- 
// 
// Filename: ResourceLimitManager.cpp
// Author: FOPDR developers
// Created: Fri Jul 17 01:59:27 2026 (-0400)
// 
// 
// Copyright (c) 2026, The FOPDR developers
// Copyright (c) 2013, Abhishek Udupa, University of Pennsylvania
// All rights reserved.
// 
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. All advertising materials mentioning features or use of this software
//    must display the following acknowledgement:
//    This product includes software developed by The University of Pennsylvania
// 4. Neither the name of the University of Pennsylvania nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.
// 
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDER ''AS IS'' AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
// 
// 

// Code:

#include <string.h>
#include <errno.h>
#include <time.h>
#include <signal.h>
#include <sys/time.h>
#include <sys/resource.h>

#include "ResourceLimitManager.hpp"

// Z3 seems to use some RT signals. We play it safe and use the
// signal from the high end
#define TIMER_SIG_NUM (SIGRTMAX - 1)

namespace FOPDR {

    const u64 ResourceLimitManager::MemLimitDefault = UINT64_MAX;
    const u64 ResourceLimitManager::CPULimitDefault = UINT64_MAX;
    // Default to 500 ms = 500000000 ns.
    const u64 ResourceLimitManager::TimerIntervalDefault = 500000000;

    u64 ResourceLimitManager::MemLimit = ResourceLimitManager::MemLimitDefault;
    u64 ResourceLimitManager::CPULimit = ResourceLimitManager::CPULimitDefault;
    u64 ResourceLimitManager::TimerInterval = ResourceLimitManager::TimerIntervalDefault;
    bool ResourceLimitManager::TimerHandlerInstalled = false;
    bool ResourceLimitManager::TimerCreated = false;
    timer_t ResourceLimitManager::TimerID = (timer_t)0;
    struct sigaction ResourceLimitManager::OldAction;

    volatile sig_atomic_t ResourceLimitManager::TimeOut = 0;
    volatile sig_atomic_t ResourceLimitManager::MemOut = 0;

    vector<function<void(bool)>> ResourceLimitManager::OnLimitHandlers;

    static inline double CPUSecondsOf(const struct rusage& Usage)
    {
        double UCPUTime = (double)((Usage.ru_utime.tv_sec * (u64)1000000) +
                                   Usage.ru_utime.tv_usec) / 1000000.0;
        double SCPUTime = (double)((Usage.ru_stime.tv_sec * (u64)1000000) +
                                   Usage.ru_stime.tv_usec) / 1000000.0;
        return UCPUTime + SCPUTime;
    }

    void ResourceLimitManager::TimerHandler(int SigNum, siginfo_t* SigInfo, void* Context)
    {
        // Already timed out or memed out?
        if (TimeOut || MemOut) {
            return;
        }

        struct rusage CurUsage;
        getrusage(RUSAGE_SELF, &CurUsage);
        if ((u64)CurUsage.ru_maxrss * 1024 >= MemLimit) {
            MemOut = 1;
        }
        if ((u64)CPUSecondsOf(CurUsage) >= CPULimit) {
            TimeOut = 1;
        }

        // Call any other registered handlers
        if ((OldAction.sa_flags & SA_SIGINFO) != 0 && OldAction.sa_sigaction != nullptr) {
            OldAction.sa_sigaction(SigNum, SigInfo, Context);
        } else if (OldAction.sa_handler != nullptr &&
                   OldAction.sa_handler != SIG_DFL &&
                   OldAction.sa_handler != SIG_IGN) {
            OldAction.sa_handler(SigNum);
        }

        if (TimeOut || MemOut) {
            for (auto const& Handler : OnLimitHandlers) {
                Handler(TimeOut != 0);
            }
        }
    }

    void ResourceLimitManager::RegisterTimerHandler()
    {
        if (TimerHandlerInstalled) {
            return;
        }
        memset(&OldAction, 0, sizeof(OldAction));
        sigemptyset(&OldAction.sa_mask);

        struct sigaction NewAction;
        memset(&NewAction, 0, sizeof(NewAction));
        NewAction.sa_sigaction = ResourceLimitManager::TimerHandler;
        sigemptyset(&NewAction.sa_mask);
        NewAction.sa_flags = SA_SIGINFO;

        sigaction(TIMER_SIG_NUM, &NewAction, &OldAction);
        TimerHandlerInstalled = true;

        if (TimerCreated) {
            return;
        }
        struct sigevent SigEvent;
        memset(&SigEvent, 0, sizeof(SigEvent));
        SigEvent.sigev_notify = SIGEV_SIGNAL;
        SigEvent.sigev_signo = TIMER_SIG_NUM;
        SigEvent.sigev_value.sival_ptr = nullptr;
        if (timer_create(CLOCK_PROCESS_CPUTIME_ID, &SigEvent, &TimerID) != 0) {
            throw FOPDRError((string)"Could not create resource limit timer: " +
                             strerror(errno));
        }
        TimerCreated = true;
    }

    void ResourceLimitManager::UnregisterTimerHandler()
    {
        if (!TimerHandlerInstalled) {
            return;
        }

        if (TimerCreated) {
            timer_delete(TimerID);
            TimerCreated = false;
        }

        sigaction(TIMER_SIG_NUM, &OldAction, NULL);
        TimerHandlerInstalled = false;
    }

    ResourceLimitManager::ResourceLimitManager()
    {
        // Nothing here
    }

    void ResourceLimitManager::SetHardMemoryCeiling(u64 CeilingInBytes)
    {
        struct rlimit Limit;
        Limit.rlim_cur = (rlim_t)CeilingInBytes;
        Limit.rlim_max = (rlim_t)CeilingInBytes;
        if (setrlimit(RLIMIT_AS, &Limit) != 0) {
            throw FOPDRError((string)"Could not set memory ceiling of " +
                             to_string(CeilingInBytes) + " bytes: " + strerror(errno));
        }
    }

    void ResourceLimitManager::SetMemLimit(u64 MemLimit)
    {
        ResourceLimitManager::MemLimit = MemLimit;
    }

    void ResourceLimitManager::SetCPULimit(u64 CPULimit)
    {
        ResourceLimitManager::CPULimit = CPULimit;
    }

    void ResourceLimitManager::QueryStart()
    {
        TimeOut = MemOut = 0;

        // install handlers IF resource limits are specified
        if (MemLimit != UINT64_MAX ||
            CPULimit != UINT64_MAX) {

            RegisterTimerHandler();
            struct itimerspec FreqSpec;
            FreqSpec.it_value.tv_sec = TimerInterval / 1000000000;
            FreqSpec.it_value.tv_nsec = TimerInterval % 1000000000;
            FreqSpec.it_interval = FreqSpec.it_value;
            timer_settime(TimerID, 0, &FreqSpec, NULL);
        }
    }

    void ResourceLimitManager::QueryEnd()
    {
        if (TimerCreated) {
            // Just disarm the timer
            struct itimerspec FreqSpec;
            memset(&FreqSpec, 0, sizeof(FreqSpec));
            timer_settime(TimerID, 0, &FreqSpec, NULL);
        }
        UnregisterTimerHandler();
        TimeOut = MemOut = 0;
    }

    bool ResourceLimitManager::CheckTimeOut()
    {
        return (TimeOut != 0);
    }

    bool ResourceLimitManager::CheckMemOut()
    {
        return (MemOut != 0);
    }

    void ResourceLimitManager::AddOnLimitHandler(const function<void(bool)>& Handler)
    {
        OnLimitHandlers.push_back(Handler);
    }

    void ResourceLimitManager::ClearOnLimitHandlers()
    {
        OnLimitHandlers.clear();
    }

    void ResourceLimitManager::GetUsage(double& TotalTime, double& PeakMem)
    {
        struct rusage CurUsage;
        getrusage(RUSAGE_SELF, &CurUsage);
        TotalTime = CPUSecondsOf(CurUsage);
        PeakMem = (double)CurUsage.ru_maxrss / 1024.0;
    }

} /* End namespace FOPDR */

//
// ResourceLimitManager.cpp ends here
