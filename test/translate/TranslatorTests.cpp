// TranslatorTests.cpp --- 
// 
// Filename: TranslatorTests.cpp
// Author: FOPDR developers
// Created: Wed Sep 16 22:40:07 2026 (-0400)
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
#include "../common/TestUtils.hpp"

using namespace FOPDR;
using namespace Translate;
using Model::ReadFormula;

// A token passed along an immutable successor function
static const string TokenRingText =
    "(sort node)\n"
    "(constant origin node immutable)\n"
    "(function next (node) node immutable)\n"
    "(relation token (node) mutable)\n"
    "(init (forall ((n node)) (<=> (token n) (= n origin))))\n"
    "(transition pass ((n node)) (mods token)\n"
    "  (and (token n) (forall ((x node)) (<=> (new (token x)) (= x (next n))))))\n"
    "(safety some_token (exists ((n node)) (token n)))\n";

static inline void TestKeyNames()
{
    cout << "Testing state key names" << endl;

    auto Prog = Model::ReadProgramFromString(TokenRingText, "token_ring");
    auto const& Token = *Prog->LookupSymbol("token");
    auto const& Origin = *Prog->LookupSymbol("origin");

    auto Keys = MakeStepKeys(3);
    FOPDR_TEST_CHECK(Keys.size() == 3 && Keys[0] == "s0" && Keys[2] == "s2",
                     "unexpected step keys");

    SolverSession Session(Prog, TP::TPOptionsT(), "p_");
    auto const& Step = Session.GetTranslator(MakeStepKeys(2));
    cout << "token at keys 0 and 1: " << Step.GetZ3Name(Token, 0) << ", "
         << Step.GetZ3Name(Token, 1) << endl;

    FOPDR_TEST_CHECK(Step.GetZ3Name(Token, 0) == "p_s0_token", "wrong mutable symbol name");
    FOPDR_TEST_CHECK(Step.GetZ3Name(Token, 0) != Step.GetZ3Name(Token, 1),
                     "mutable symbol shared between keys");
    FOPDR_TEST_CHECK(Step.GetZ3Name(Origin, 0) == Step.GetZ3Name(Origin, 1),
                     "immutable symbol differs between keys");

    auto const& Shifted = Session.GetTranslator({ "s1", "s2" });
    FOPDR_TEST_CHECK(Shifted.GetZ3Name(Token, 0) == Step.GetZ3Name(Token, 1),
                     "names do not follow the keys");
    FOPDR_TEST_CHECK(&Session.GetTranslator(MakeStepKeys(2)) == &Step,
                     "translators are not cached per key list");
}

static inline void TestKeyIsolation()
{
    cout << "Testing isolation between keys in the solver" << endl;

    auto Prog = Model::ReadProgramFromString(TokenRingText, "token_ring");
    SolverSession Session(Prog);
    auto const& Prover = Session.GetTP();
    auto const& Step = Session.GetTranslator(MakeStepKeys(2));
    auto HasToken = ReadFormula("(token origin)");
    auto NextIsOrigin = ReadFormula("(= (next origin) origin)");

    {
        QueryScope Scope(Session, Step);
        Prover->Assert(Step.Translate(HasToken, 0));
        Prover->Assert(Step.Translate(Model::MkNot(HasToken), 1));
        FOPDR_TEST_CHECK(Prover->CheckSat("mutable at two keys") == TP::TPResult::SATISFIABLE,
                         "a mutable relation at two keys is not independent");
    }
    {
        QueryScope Scope(Session, Step);
        Prover->Assert(Step.Translate(NextIsOrigin, 0));
        Prover->Assert(Step.Translate(Model::MkNot(NextIsOrigin), 1));
        FOPDR_TEST_CHECK(Prover->CheckSat("immutable at two keys") ==
                         TP::TPResult::UNSATISFIABLE,
                         "an immutable function differs between keys");
    }
    {
        // The new state of a formula at key 0 is key 1
        QueryScope Scope(Session, Step);
        Prover->Assert(Step.Translate(Model::MkNew(HasToken), 0));
        Prover->Assert(Step.Translate(Model::MkNot(HasToken), 1));
        FOPDR_TEST_CHECK(Prover->CheckSat("new against key 1") == TP::TPResult::UNSATISFIABLE,
                         "new does not refer to the next key");
    }
    FOPDR_TEST_EXPECT_THROW(InternalError, Step.Translate(HasToken, 2),
                            "key index out of range accepted");
}

static inline void TestBoundedChecks()
{
    cout << "Testing bounded checks on the token ring" << endl;
    auto Ring = Model::ReadProgramFromString(TokenRingText, "token_ring");
    SolverSession RingSession(Ring);
    BoundedChecker RingBMC(RingSession);
    for (u32 Depth = 0; Depth <= 3; ++Depth) {
        Trace Cex;
        FOPDR_TEST_CHECK(!RingBMC.CheckBMC(Ring->GetSafetyFormula(), Depth, Cex),
                         "token lost at depth " << Depth << ":\n" << Cex);
    }

    cout << "Testing bounded checks on the unguarded lock" << endl;
    auto Prog = Test::ReadUnguardedLock();
    SolverSession Session(Prog);
    BoundedChecker BMC(Session);
    auto Safety = Prog->GetSafetyFormula();

    Trace Cex;
    FOPDR_TEST_CHECK(!BMC.CheckBMC(Safety, 1, Cex), "mutex violated within one step");
    FOPDR_TEST_CHECK(BMC.CheckBMC(Safety, 2, Cex), "mutex not violated within two steps");
    cout << "Counterexample:" << endl << Cex << endl;

    FOPDR_TEST_CHECK(Cex.GetNumStates() == 3, "expected 3 states");
    FOPDR_TEST_CHECK(Test::GetHolders(Cex, 0).size() == 0, "lock held initially");
    FOPDR_TEST_CHECK(Test::GetHolders(Cex, 2).size() >= 2, "final state does not violate mutex");
    FOPDR_TEST_CHECK(Cex.GetTransitions().size() == 2 && Cex.GetTransitions()[0] == "grab" &&
                     Cex.GetTransitions()[1] == "grab",
                     "expected two grab steps");

    cout << "Testing fixed transition sequences" << endl;
    Trace Fixed;
    vector<string> GrabThenStutter = { "grab", StutterTransitionName };
    vector<string> ReleaseOnly = { "release" };
    FOPDR_TEST_CHECK(BMC.CheckTrace(Model::ExpVecT(3, Model::ExpT::NullPtr),
                                    GrabThenStutter, Fixed),
                     "grab then stutter is not feasible");
    FOPDR_TEST_CHECK(Fixed.GetTransitions()[1] == StutterTransitionName,
                     "stutter step not reported");
    FOPDR_TEST_CHECK(Test::GetHolders(Fixed, 1) == Test::GetHolders(Fixed, 2),
                     "stutter step changed the state");
    FOPDR_TEST_CHECK(!BMC.CheckTrace(Model::ExpVecT(2, Model::ExpT::NullPtr), ReleaseOnly,
                                     Fixed),
                     "release is enabled in the initial state");
}

static inline void TestMinimalModels()
{
    cout << "Testing universe minimization of counterexamples" << endl;

    auto Prog = Test::ReadUnguardedLock();
    SolverSession Session(Prog);
    BoundedChecker BMC(Session);
    auto Safety = Prog->GetSafetyFormula();

    Trace Cex;
    FOPDR_TEST_CHECK(BMC.CheckBMC(Safety, 2, Cex), "mutex not violated within two steps");
    cout << "Counterexample:" << endl << Cex << endl;
    FOPDR_TEST_CHECK(Cex.GetUniverse("node").size() == 2,
                     "two grabs need exactly two nodes, got " << Cex.GetUniverse("node").size());

    // At least three nodes, so no smaller universe exists
    Model::ExpVecT Constraints(2, Model::ExpT::NullPtr);
    Constraints[0] = ReadFormula("(exists ((a node) (b node) (c node)) "
                                 "(and (!= a b) (!= b c) (!= a c)))");
    vector<string> GrabOnce = { "grab" };
    FOPDR_TEST_CHECK(BMC.CheckTrace(Constraints, GrabOnce, Cex), "a single grab is infeasible");
    FOPDR_TEST_CHECK(Cex.GetUniverse("node").size() == 3,
                     "expected three nodes, got " << Cex.GetUniverse("node").size());
    FOPDR_TEST_CHECK(Test::GetHolders(Cex, 1).size() == 1, "a grab did not take the lock");

    TP::TPOptionsT Options;
    Options.MinimizeModels = false;
    SolverSession PlainSession(Prog, Options);
    BoundedChecker PlainBMC(PlainSession);
    Trace PlainCex;
    FOPDR_TEST_CHECK(PlainBMC.CheckBMC(Safety, 2, PlainCex),
                     "mutex not violated without minimization");
    FOPDR_TEST_CHECK(PlainCex.GetUniverse("node").size() >= 2 &&
                     Test::GetHolders(PlainCex, 2).size() >= 2,
                     "unminimized counterexample does not violate mutex");
}

int main()
{
    TestKeyNames();
    TestKeyIsolation();
    TestBoundedChecks();
    TestMinimalModels();
    cout << "All translator tests passed" << endl;
    return 0;
}

//
// TranslatorTests.cpp ends here
