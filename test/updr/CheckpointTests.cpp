// CheckpointTests.cpp --- 
// 
// Filename: CheckpointTests.cpp
// Author: FOPDR developers
// Created: Mon Sep 21 17:43:26 2026 (-0400)
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

#include <cstdio>
#include <sstream>

#include "../../src/updr/Checkpoint.hpp"
#include "../../src/updr/Frames.hpp"
#include "../common/TestUtils.hpp"

using namespace FOPDR;
using namespace UPDR;
using Translate::Trace;

static const string CheckpointFileName = "fopdr_checkpoint_test.ckpt";

static inline void CheckSamePredicates(const ExpVecT& Expected, const ExpVecT& Actual,
                                       const string& What)
{
    FOPDR_TEST_CHECK(Expected.size() == Actual.size(),
                     What << " has " << Actual.size() << " predicates, expected "
                     << Expected.size());
    for (u32 i = 0; i < Expected.size(); ++i) {
        FOPDR_TEST_CHECK(Expected[i]->Equals(*Actual[i]),
                         What << " differs: " << Actual[i] << " instead of " << Expected[i]);
    }
}

// The frames of a finished search with pending obligations added: a
// must chain of three and a may root
static inline SearchState MakeSearchState(const Model::ProgramRef& Prog,
                                          Translate::SolverSession& Session)
{
    Frames TheFrames(Prog, Session);
    auto Result = TheFrames.Search();
    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Proved, "lock server not proved");
    auto Retval = TheFrames.GetSearchState();

    Translate::BoundedChecker BMC(Session);
    Trace Run;
    FOPDR_TEST_CHECK(BMC.CheckBMC(Model::ReadFormula("(forall ((n node)) (not (grant_msg n)))"),
                                  2, Run),
                     "no grant message within 2 steps");
    auto Diag = Diagram::FromTrace(*Prog, Run, 2, true);
    Diag.SetEnabled(0, false);
    FOPDR_TEST_CHECK(Retval.Frames.size() >= 3, "proof with fewer than three frames");
    Retval.Obligations.push_back(Obligation(2, Diag, "", -1, false));
    Retval.Obligations.push_back(Obligation(1, Diag, "recv_lock", 0, false));
    Retval.Obligations.push_back(Obligation(0, Diag, Translate::StutterTransitionName, 1, false));
    Retval.Obligations.push_back(Obligation(1, Diag, "", -1, true));
    return Retval;
}

static inline void TestStreamRoundTrip()
{
    cout << "Testing checkpoints through a stream" << endl;

    auto Prog = Test::ReadLockServer();
    Translate::SolverSession Session(Prog);
    auto State = MakeSearchState(Prog, Session);

    ostringstream Out;
    Checkpoint::Save(State, *Prog, Out);
    cout << Out.str() << endl;

    istringstream In(Out.str());
    auto Loaded = Checkpoint::Load(In, Prog);

    FOPDR_TEST_CHECK(Loaded.Frames.size() == State.Frames.size(), "frame count differs");
    for (u32 i = 0; i < State.Frames.size(); ++i) {
        CheckSamePredicates(State.Frames[i], Loaded.Frames[i], "frame " + to_string(i));
    }
    CheckSamePredicates(State.PredicateLog, Loaded.PredicateLog, "predicate log");
    FOPDR_TEST_CHECK(Loaded.NumLearnedStates == State.NumLearnedStates &&
                     Loaded.NumDistinctPredicates == State.NumDistinctPredicates &&
                     Loaded.NumIterations == State.NumIterations,
                     "counters differ");

    FOPDR_TEST_CHECK(Loaded.Obligations.size() == State.Obligations.size(), "obligations lost");
    for (u32 i = 0; i < State.Obligations.size(); ++i) {
        auto const& Expected = State.Obligations[i];
        auto const& Actual = Loaded.Obligations[i];
        FOPDR_TEST_CHECK(Actual.FrameIndex == Expected.FrameIndex &&
                         Actual.Parent == Expected.Parent &&
                         Actual.May == Expected.May &&
                         Actual.TransitionName == Expected.TransitionName,
                         "obligation " << i << " differs");
        FOPDR_TEST_CHECK(Actual.Diag.GetVars().size() == Expected.Diag.GetVars().size(),
                         "diagram variables differ");
        FOPDR_TEST_CHECK(Actual.Diag.GetNumConjuncts() == Expected.Diag.GetNumConjuncts(),
                         "diagram conjuncts differ");
        for (u32 j = 0; j < Expected.Diag.GetNumConjuncts(); ++j) {
            auto const& ExpectedConjunct = Expected.Diag.GetConjuncts()[j];
            auto const& ActualConjunct = Actual.Diag.GetConjuncts()[j];
            FOPDR_TEST_CHECK(ActualConjunct.Kind == ExpectedConjunct.Kind &&
                             ActualConjunct.Enabled == ExpectedConjunct.Enabled &&
                             ActualConjunct.Formula->Equals(*ExpectedConjunct.Formula),
                             "conjunct " << j << " of obligation " << i << " differs");
        }
    }
    FOPDR_TEST_CHECK(!Loaded.Obligations[0].Diag.IsEnabled(0), "disabled conjunct enabled");
}

static inline void TestResume()
{
    cout << "Testing an interrupted and resumed search" << endl;

    auto Prog = Test::ReadLockServer();
    std::remove(CheckpointFileName.c_str());

    UPDROptionsT Options;
    Options.MaxIterations = 1;
    Options.CheckpointFile = CheckpointFileName;
    {
        Translate::SolverSession Session(Prog);
        Frames TheFrames(Prog, Session, Options);
        auto Result = TheFrames.Search();
        cout << Result << endl;
        FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Interrupted,
                         "expected the iteration limit to stop the search, got "
                         << SearchStatusToString(Result.Status));
    }

    auto State = Checkpoint::LoadFromFile(CheckpointFileName, Prog);
    FOPDR_TEST_CHECK(State.NumIterations == 1, "checkpoint not written after the iteration");

    Translate::SolverSession Session(Prog);
    Frames TheFrames(Prog, Session);
    TheFrames.Restore(State);
    FOPDR_TEST_CHECK(TheFrames.GetNumFrames() == State.Frames.size(), "frames not restored");
    auto Result = TheFrames.Search();
    cout << Result << endl;
    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Proved,
                     "resumed search did not prove mutex: " << Result.Message);

    Translate::Verifier Checker(Session);
    FOPDR_TEST_CHECK(Checker.CheckInductiveInvariant(Result.Invariant,
                                                     TheFrames.GetSafety()).size() == 0,
                     "resumed search found a wrong invariant");
    std::remove(CheckpointFileName.c_str());
}

static inline void CheckProvedAndSound(Frames& TheFrames, Translate::SolverSession& Session,
                                       const string& What)
{
    auto Result = TheFrames.Search();
    cout << Result << endl;
    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Proved,
                     What << " did not prove mutex: " << Result.Message);
    Translate::Verifier Checker(Session);
    FOPDR_TEST_CHECK(Checker.CheckInductiveInvariant(Result.Invariant,
                                                     TheFrames.GetSafety()).size() == 0,
                     What << " found a wrong invariant");
}

static inline void TestInterruptBetweenIterations()
{
    cout << "Testing interrupts between iterations" << endl;

    auto Prog = Test::ReadLockServer();
    Translate::SolverSession Session(Prog);
    UPDROptionsT Options;
    Options.MaxIterations = 1;
    Frames Limited(Prog, Session, Options);
    auto Result = Limited.Search();
    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Interrupted,
                     "expected the iteration limit to stop the search");

    // No check is running, so the solver is not interrupted
    Limited.Interrupt();
    FOPDR_TEST_CHECK(Session.GetTP()->IsInterrupted(), "interrupt not recorded");
    FOPDR_TEST_CHECK(!Session.GetTP()->IsCanceled(), "idle solver was canceled");
    Result = Limited.Search();
    cout << Result << endl;
    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Interrupted, "interrupt ignored");
    FOPDR_TEST_CHECK(!Session.GetTP()->IsInterrupted(), "interrupt not cleared");
    auto State = Limited.GetSearchState();
    FOPDR_TEST_CHECK(State.NumIterations == 1, "an interrupted search ran an iteration");

    // The same session carries on
    Frames Resumed(Prog, Session);
    Resumed.Restore(State);
    Resumed.Interrupt();
    Result = Resumed.Search();
    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Interrupted, "second interrupt ignored");
    CheckProvedAndSound(Resumed, Session, "search resumed after interrupts");
}

static inline void TestInterruptBeforeSearch()
{
    cout << "Testing an interrupt before the first query" << endl;

    auto Prog = Test::ReadLockServer();
    std::remove(CheckpointFileName.c_str());
    Translate::SolverSession Session(Prog);
    UPDROptionsT Options;
    Options.CheckpointFile = CheckpointFileName;
    Frames TheFrames(Prog, Session, Options);
    TheFrames.Interrupt();
    auto Result = TheFrames.Search();
    cout << Result << endl;
    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Interrupted, "interrupt ignored");
    FOPDR_TEST_CHECK(TheFrames.GetNumFrames() == 0, "frames made after the interrupt");
    FOPDR_TEST_EXPECT_THROW(CheckpointError,
                            Checkpoint::LoadFromFile(CheckpointFileName, Prog),
                            "checkpoint written without frames");

    CheckProvedAndSound(TheFrames, Session, "search restarted after an interrupt");
    std::remove(CheckpointFileName.c_str());
}

static inline void TestBadCheckpoints()
{
    cout << "Testing rejected checkpoints" << endl;

    auto Prog = Test::ReadLockServer();
    Translate::SolverSession Session(Prog);
    auto State = MakeSearchState(Prog, Session);
    ostringstream Out;
    Checkpoint::Save(State, *Prog, Out);
    auto Text = Out.str();

    auto VersionText = Text;
    auto VersionPos = VersionText.find("(version 1)");
    FOPDR_TEST_CHECK(VersionPos != string::npos, "no version in the checkpoint");
    VersionText.replace(VersionPos, 11, "(version 7)");
    istringstream VersionIn(VersionText);
    FOPDR_TEST_EXPECT_THROW(CheckpointError, Checkpoint::Load(VersionIn, Prog),
                            "unknown version accepted");

    istringstream OtherIn(Text);
    auto Other = Test::ReadUnguardedLock();
    FOPDR_TEST_EXPECT_THROW(CheckpointError, Checkpoint::Load(OtherIn, Other),
                            "checkpoint of another program accepted");

    istringstream GarbageIn("(fopdr-checkpoint (version 1) (frame");
    FOPDR_TEST_EXPECT_THROW(CheckpointError, Checkpoint::Load(GarbageIn, Prog),
                            "truncated checkpoint accepted");

    istringstream WrongHeaderIn("(something-else (version 1))");
    FOPDR_TEST_EXPECT_THROW(CheckpointError, Checkpoint::Load(WrongHeaderIn, Prog),
                            "checkpoint with a wrong header accepted");

    SearchState Grown;
    Grown.Frames.resize(2);
    Grown.Frames[1].push_back(Model::ReadFormula("(forall ((n node)) (not (holds_lock n)))"));
    ostringstream GrownOut;
    Checkpoint::Save(Grown, *Prog, GrownOut);
    istringstream GrownIn(GrownOut.str());
    FOPDR_TEST_EXPECT_THROW(CheckpointError, Checkpoint::Load(GrownIn, Prog),
                            "frames that are not monotone accepted");

    SearchState Unknown;
    Unknown.Frames.resize(2);
    Unknown.Frames[0].push_back(Model::ReadFormula("(forall ((n node)) (no_such_relation n))"));
    ostringstream UnknownOut;
    Checkpoint::Save(Unknown, *Prog, UnknownOut);
    istringstream UnknownIn(UnknownOut.str());
    FOPDR_TEST_EXPECT_THROW(CheckpointError, Checkpoint::Load(UnknownIn, Prog),
                            "predicate over an unknown relation accepted");

    auto Skipping = State;
    Skipping.Obligations[2].FrameIndex = 1;
    ostringstream SkippingOut;
    Checkpoint::Save(Skipping, *Prog, SkippingOut);
    istringstream SkippingIn(SkippingOut.str());
    FOPDR_TEST_EXPECT_THROW(CheckpointError, Checkpoint::Load(SkippingIn, Prog),
                            "predecessor beside its parent's frame accepted");

    auto Mixed = State;
    Mixed.Obligations[2].May = true;
    ostringstream MixedOut;
    Checkpoint::Save(Mixed, *Prog, MixedOut);
    istringstream MixedIn(MixedOut.str());
    FOPDR_TEST_EXPECT_THROW(CheckpointError, Checkpoint::Load(MixedIn, Prog),
                            "may obligation under a must obligation accepted");

    FOPDR_TEST_EXPECT_THROW(CheckpointError,
                            Checkpoint::LoadFromFile("no_such_dir/none.ckpt", Prog),
                            "missing checkpoint file accepted");
}

int main()
{
    TestStreamRoundTrip();
    TestResume();
    TestInterruptBetweenIterations();
    TestInterruptBeforeSearch();
    TestBadCheckpoints();
    cout << "All checkpoint tests passed" << endl;
    return 0;
}

//
// CheckpointTests.cpp ends here
