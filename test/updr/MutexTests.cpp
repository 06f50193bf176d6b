// MutexTests.cpp --- 
// 
// Filename: MutexTests.cpp
// Author: FOPDR developers
// Created: Sat Sep 26 10:33:19 2026 (-0400)
// 
// 
// Copyright (c) 2026, The FOPDR developers
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
//    This product includes software developed by the FOPDR developers
// 4. Neither the name of the FOPDR developers nor the
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

#include "../../src/updr/Frames.hpp"
#include "../common/TestUtils.hpp"

using namespace FOPDR;
using namespace UPDR;
using Translate::Trace;

static inline void CheckFramesMonotone(const Frames& TheFrames)
{
    for (u32 i = 0; i + 1 < TheFrames.GetNumFrames(); ++i) {
        Model::ExpSetT Lower(TheFrames.GetFrame(i).begin(), TheFrames.GetFrame(i).end());
        for (auto const& Predicate : TheFrames.GetFrame(i + 1)) {
            FOPDR_TEST_CHECK(Lower.find(Predicate) != Lower.end(),
                             Predicate << " is in frame " << (i + 1)
                             << " but not in frame " << i);
        }
    }
}

static inline void RunAndCheck(const string& Description, const UPDROptionsT& Options)
{
    cout << "Proving mutual exclusion of the lock server, " << Description << endl;

    auto Prog = Test::ReadLockServer();
    Translate::SolverSession Session(Prog);
    Frames TheFrames(Prog, Session, Options);
    auto Result = TheFrames.Search();
    cout << Result << endl;

    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Proved,
                     "expected proved, got " << SearchStatusToString(Result.Status)
                     << ": " << Result.Message);
    FOPDR_TEST_CHECK(Result.FixpointFrame >= 1, "fixpoint at frame 0");
    FOPDR_TEST_CHECK(Result.NumFrames == TheFrames.GetNumFrames(), "frame count not reported");
    FOPDR_TEST_CHECK(TheFrames.GetNumDistinctPredicates() == TheFrames.GetPredicateLog().size(),
                     "predicate log and counter disagree");
    FOPDR_TEST_CHECK(TheFrames.GetNumLearnedStates() >= TheFrames.GetNumDistinctPredicates(),
                     "fewer learned states than distinct predicates");
    CheckFramesMonotone(TheFrames);

    // Re-check with a solver that took no part in the search
    Translate::SolverSession CheckSession(Prog);
    Translate::Verifier Checker(CheckSession);
    auto Failures = Checker.CheckInductiveInvariant(Result.Invariant, TheFrames.GetSafety());
    FOPDR_TEST_CHECK(Failures.size() == 0,
                     "invariant does not check: " << (Failures.size() > 0 ?
                                                      Failures[0].ToString() : ""));

    // A predicate of frame i holds in every state reachable in at most
    // i steps, and the invariant holds at any depth
    Translate::BoundedChecker BMC(CheckSession);
    for (u32 i = 0; i < TheFrames.GetNumFrames(); ++i) {
        for (auto const& Predicate : TheFrames.GetFrame(i)) {
            Trace Cex;
            FOPDR_TEST_CHECK(!BMC.CheckBMC(Predicate, i, Cex),
                             "predicate " << Predicate << " of frame " << i
                             << " is violated:" << endl << Cex);
        }
    }
    for (auto const& Predicate : Result.Invariant) {
        Trace Cex;
        FOPDR_TEST_CHECK(!BMC.CheckBMC(Predicate, 4, Cex),
                         "invariant predicate " << Predicate << " is violated:" << endl << Cex);
    }
}

int main()
{
    UPDROptionsT Options;
    RunAndCheck("default options", Options);

    Options = UPDROptionsT();
    Options.UseUnsatCores = false;
    RunAndCheck("without unsat cores", Options);

    Options = UPDROptionsT();
    Options.SimplifyDiagram = false;
    RunAndCheck("without diagram simplification", Options);

    Options = UPDROptionsT();
    Options.ObligationOrder = ObligationOrderT::DeclaredOrder;
    Options.SafetyName = "mutex";
    RunAndCheck("safety properties in declared order", Options);

    Options = UPDROptionsT();
    Options.PushFrameZero = PushFrameZeroT::Never;
    RunAndCheck("never pushing out of frame 0", Options);

    Options = UPDROptionsT();
    Options.PushFrameZero = PushFrameZeroT::Always;
    Options.BlockMayCexs = true;
    RunAndCheck("blocking may counterexamples", Options);

    Options = UPDROptionsT();
    Options.SmokeTest = true;
    Options.AssertInductiveTrace = true;
    RunAndCheck("with smoke tests and trace checks", Options);

    cout << "All mutual exclusion tests passed" << endl;
    return 0;
}

//
// MutexTests.cpp ends here
