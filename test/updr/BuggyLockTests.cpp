// BuggyLockTests.cpp --- 
// 
// Filename: BuggyLockTests.cpp
// Author: FOPDR developers
// Created: Sat Sep 19 05:41:25 2026 (-0400)
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

static inline void CheckCounterexample(const UPDROptionsT& Options)
{
    auto Prog = Test::ReadUnguardedLock();
    Translate::SolverSession Session(Prog);
    Frames TheFrames(Prog, Session, Options);
    auto Result = TheFrames.Search();
    cout << Result << endl;

    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Disproved,
                     "expected disproved, got " << SearchStatusToString(Result.Status)
                     << ": " << Result.Message);
    FOPDR_TEST_CHECK(Result.ConcreteCounterexample, "no concrete counterexample");

    auto const& Cex = Result.Counterexample;
    u32 Last = Cex.GetNumStates() - 1;
    FOPDR_TEST_CHECK(Cex.GetNumStates() >= 2, "counterexample has no steps");
    FOPDR_TEST_CHECK(Cex.GetTransitions().size() == Last, "steps and states disagree");
    FOPDR_TEST_CHECK(Test::GetHolders(Cex, 0).size() == 0, "lock held in the initial state");
    FOPDR_TEST_CHECK(Test::GetHolders(Cex, Last).size() >= 2,
                     "final state does not violate mutex:" << endl << Cex);
    for (auto const& TransitionName : Cex.GetTransitions()) {
        FOPDR_TEST_CHECK(TransitionName != Translate::StutterTransitionName,
                         "stutter step left in the counterexample");
    }

    // The trace replays in the program
    Translate::SolverSession ReplaySession(Prog);
    Translate::BoundedChecker BMC(ReplaySession);
    Model::ExpVecT StepConstraints(Cex.GetNumStates(), Model::ExpT::NullPtr);
    StepConstraints[Last] = Model::MkNot(Prog->GetSafetyFormula());
    Trace Replayed;
    FOPDR_TEST_CHECK(BMC.CheckTrace(StepConstraints, Cex.GetTransitions(), Replayed),
                     "counterexample transitions do not replay");
}

// Without concretization the search reports its chain of diagrams
static inline void CheckAbstractCounterexample()
{
    cout << "Testing the unguarded lock without concretization" << endl;

    auto Prog = Test::ReadUnguardedLock();
    Translate::SolverSession Session(Prog);
    UPDROptionsT Options;
    Options.ConcretizeCounterexample = false;
    Frames TheFrames(Prog, Session, Options);
    auto Result = TheFrames.Search();
    cout << Result << endl;

    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Disproved,
                     "expected disproved, got " << SearchStatusToString(Result.Status));
    FOPDR_TEST_CHECK(!Result.ConcreteCounterexample, "counterexample was concretized");
    FOPDR_TEST_CHECK(Result.Counterexample.GetNumStates() == 0, "concrete trace reported");

    auto const& Chain = Result.AbstractChain;
    auto const& Steps = Result.AbstractTransitions;
    FOPDR_TEST_CHECK(Chain.size() >= 2, "abstract chain has no steps");
    FOPDR_TEST_CHECK(Chain.size() == Steps.size() + 1, "states and steps of the chain disagree");
    for (auto const& Step : Steps) {
        FOPDR_TEST_CHECK(Prog->LookupTransition(Step) != Model::TransitionRef::NullPtr,
                         "unknown transition " << Step << " in the chain");
    }
    FOPDR_TEST_CHECK(Result.ToString().find("Abstract counterexample") != string::npos,
                     "chain not printed");
    auto Tree = Result.ToPropertyTree();
    FOPDR_TEST_CHECK(Tree.count("abstract-counterexample") == 1, "chain missing from JSON");
    FOPDR_TEST_CHECK(Tree.get_child("abstract-counterexample.states").size() == Chain.size(),
                     "wrong number of states in JSON");

    // Each state of the chain is reachable through the steps named
    Model::ExpVecT StepConstraints;
    for (auto const& State : Chain) {
        StepConstraints.push_back(Model::ReadFormula(State));
    }
    Translate::BoundedChecker BMC(Session);
    Trace Replayed;
    FOPDR_TEST_CHECK(BMC.CheckTrace(StepConstraints, Steps, Replayed),
                     "abstract chain does not replay");
    FOPDR_TEST_CHECK(Test::GetHolders(Replayed, Replayed.GetNumStates() - 1).size() >= 2,
                     "last state of the chain is safe");
}

static inline void CheckInitialViolation()
{
    cout << "Testing a program whose initial states are unsafe" << endl;

    auto Prog = Model::ReadProgramFromString(
        "(sort node)\n"
        "(relation holds_lock (node) mutable)\n"
        "(init (forall ((n node)) (holds_lock n)))\n"
        "(transition idle () (mods) true)\n"
        "(safety nobody_holds (forall ((n node)) (not (holds_lock n))))\n",
        "everybody_holds");
    Translate::SolverSession Session(Prog);
    Frames TheFrames(Prog, Session);
    auto Result = TheFrames.Search();
    cout << Result << endl;

    FOPDR_TEST_CHECK(Result.Status == SearchStatusT::Disproved, "unsafe initial states proved");
    FOPDR_TEST_CHECK(Result.ConcreteCounterexample, "no concrete counterexample");
    FOPDR_TEST_CHECK(Result.Counterexample.GetNumStates() == 1,
                     "counterexample for an initial violation has steps");
    FOPDR_TEST_CHECK(Test::GetHolders(Result.Counterexample, 0).size() > 0,
                     "initial state in the counterexample is safe");
}

int main()
{
    cout << "Testing the unguarded lock with default options" << endl;
    CheckCounterexample(UPDROptionsT());

    cout << "Testing the unguarded lock with declared obligation order" << endl;
    UPDROptionsT Options;
    Options.ObligationOrder = ObligationOrderT::DeclaredOrder;
    CheckCounterexample(Options);

    cout << "Testing the unguarded lock without unsat cores" << endl;
    Options = UPDROptionsT();
    Options.UseUnsatCores = false;
    Options.SimplifyDiagram = false;
    CheckCounterexample(Options);

    CheckAbstractCounterexample();
    CheckInitialViolation();

    cout << "All counterexample tests passed" << endl;
    return 0;
}

//
// BuggyLockTests.cpp ends here
