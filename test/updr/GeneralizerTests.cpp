// GeneralizerTests.cpp --- 
// 
// Filename: GeneralizerTests.cpp
// Author: FOPDR developers
// Created: Wed Sep 23 23:28:00 2026 (-0400)
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

#include "../../src/translate/BoundedChecker.hpp"
#include "../../src/translate/Verifier.hpp"
#include "../../src/updr/Generalizer.hpp"
#include "../common/TestUtils.hpp"

using namespace FOPDR;
using namespace UPDR;
using Translate::Trace;
using Model::ReadFormula;

// A state with two lock holders
static inline Diagram MakeBadDiagram(const Model::ProgramRef& Prog,
                                     Translate::SolverSession& Session)
{
    Translate::Verifier Checker(Session);
    Trace Cex;
    FOPDR_TEST_CHECK(!Checker.CheckImplication(Model::MkTrue(), Prog->GetSafetyFormula(), Cex),
                     "mutex is valid");
    FOPDR_TEST_CHECK(Test::GetHolders(Cex, 0).size() >= 2, "state does not violate mutex");
    return Diagram::FromTrace(*Prog, Cex, 0, true);
}

static inline void TestPredecessors()
{
    cout << "Testing predecessor queries" << endl;

    auto Prog = Test::ReadLockServer();
    Translate::SolverSession Session(Prog);
    Generalizer Gen(Session, true);
    auto Bad = MakeBadDiagram(Prog, Session);

    string TransitionName;
    Trace Predecessor;
    FOPDR_TEST_CHECK(!Gen.HasPredecessor(Prog->GetInitFormula(), Bad, "bad state", &TransitionName,
                                         &Predecessor, nullptr),
                     "bad state has a predecessor among initial states");

    FOPDR_TEST_CHECK(Gen.HasPredecessor(Model::MkTrue(), Bad, "bad state", &TransitionName,
                                        &Predecessor, nullptr),
                     "bad state has no predecessor in an unconstrained frame");
    FOPDR_TEST_CHECK(TransitionName == Translate::StutterTransitionName,
                     "stuttering was not tried first, got " << TransitionName);

    // One holder, reached from a state without holders by a grant
    Translate::BoundedChecker BMC(Session);
    auto NobodyHolds = ReadFormula("(forall ((n node)) (not (holds_lock n)))");
    Trace Run;
    FOPDR_TEST_CHECK(BMC.CheckBMC(NobodyHolds, 3, Run), "the lock cannot be acquired in 3 steps");
    auto Holding = Diagram::FromTrace(*Prog, Run, 3, true);

    FOPDR_TEST_CHECK(Gen.HasPredecessor(NobodyHolds, Holding, "holding state", &TransitionName,
                                        &Predecessor, nullptr),
                     "holding state has no predecessor without holders");
    cout << "Predecessor via " << TransitionName << ":" << endl << Predecessor << endl;
    FOPDR_TEST_CHECK(TransitionName == "recv_grant", "expected recv_grant, got " << TransitionName);
    FOPDR_TEST_CHECK(Predecessor.GetNumStates() == 2, "predecessor is not a step");
    FOPDR_TEST_CHECK(Test::GetHolders(Predecessor, 0).size() == 0,
                     "predecessor violates the frame");
    FOPDR_TEST_CHECK(Predecessor.GetTransitions()[0] == "recv_grant",
                     "predecessor step does not name its transition");
}

static inline void TestGeneralization(bool UseUnsatCores)
{
    cout << "Testing generalization " << (UseUnsatCores ? "with" : "without")
         << " unsat cores" << endl;

    auto Prog = Test::ReadLockServer();
    Translate::SolverSession Session(Prog);
    Translate::Verifier Checker(Session);
    Generalizer Gen(Session, UseUnsatCores);
    FOPDR_TEST_CHECK(Gen.GetUseUnsatCores() == UseUnsatCores, "strategy not recorded");

    auto Bad = MakeBadDiagram(Prog, Session);
    auto Init = Prog->GetInitFormula();
    auto General = Gen.Generalize(Bad, Init, "bad state");
    auto Predicate = General.ToPredicate();
    cout << "Generalized " << Bad.GetNumEnabled() << " conjuncts to "
         << General.GetNumEnabled() << ": " << Predicate << endl;

    FOPDR_TEST_CHECK(General.GetNumConjuncts() == Bad.GetNumConjuncts(),
                     "generalization changed the conjunct list");
    FOPDR_TEST_CHECK(General.GetNumEnabled() > 0 && General.GetNumEnabled() <= Bad.GetNumEnabled(),
                     "wrong number of enabled conjuncts");
    for (u32 i = 0; i < General.GetNumConjuncts(); ++i) {
        FOPDR_TEST_CHECK(!General.IsEnabled(i) || Bad.IsEnabled(i),
                         "generalization enabled conjunct " << i);
    }

    FOPDR_TEST_CHECK(!Gen.HasPredecessor(Init, General, "generalized", nullptr, nullptr, nullptr),
                     "generalized diagram has a predecessor");

    Trace Cex;
    FOPDR_TEST_CHECK(Checker.CheckInitiation(Predicate, Cex),
                     "learned predicate excludes an initial state:" << endl << Cex);
    FOPDR_TEST_CHECK(Checker.CheckImplication(Bad.ToFormula(), Model::MkNot(Predicate), Cex),
                     "learned predicate does not exclude the bad state");

    // No single remaining conjunct can be dropped
    for (u32 i = 0; i < General.GetNumConjuncts(); ++i) {
        if (!General.IsEnabled(i)) {
            continue;
        }
        auto Smaller = General;
        Smaller.SetEnabled(i, false);
        FOPDR_TEST_CHECK(Gen.HasPredecessor(Init, Smaller, "smaller", nullptr, nullptr, nullptr),
                         "conjunct " << General.GetConjunct(i) << " could still be dropped");
    }

    auto const& Stats = Gen.GetStats();
    FOPDR_TEST_CHECK(Stats.NumGeneralizations == 1, "generalization not counted");
    FOPDR_TEST_CHECK(Stats.NumLiteralsIn == Bad.GetNumEnabled() &&
                     Stats.NumLiteralsOut == General.GetNumEnabled(),
                     "literal counts not recorded");
    if (!UseUnsatCores) {
        FOPDR_TEST_CHECK(Stats.NumCoreDrops == 0, "cores used when disabled");
    }
}

int main()
{
    TestPredecessors();
    TestGeneralization(true);
    TestGeneralization(false);
    cout << "All generalizer tests passed" << endl;
    return 0;
}

//
// GeneralizerTests.cpp ends here
