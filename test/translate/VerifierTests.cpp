// VerifierTests.cpp --- 
// 
// Filename: VerifierTests.cpp
// Author: FOPDR developers
// Created: Fri Sep 18 15:49:42 2026 (-0400)
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

#include "../../src/translate/Verifier.hpp"
#include "../common/TestUtils.hpp"

using namespace FOPDR;
using namespace Translate;
using Model::ReadFormula;

static inline void TestLockServerInvariants()
{
    cout << "Verifying the invariants of the lock server" << endl;

    auto Prog = Test::ReadLockServer();
    SolverSession Session(Prog);
    Verifier Checker(Session);

    auto Failures = Checker.VerifyInvariants();
    for (auto const& Failure : Failures) {
        cout << Failure.ToString() << endl;
    }
    FOPDR_TEST_CHECK(Failures.size() == 0, "the lock server invariants are not inductive");

    auto Theorems = Checker.VerifyTheorems();
    FOPDR_TEST_CHECK(Theorems.size() == 0, "a valid theorem was rejected");

    Model::ExpVecT Predicates;
    for (auto const& Invariant : Prog->GetInvariants()) {
        Predicates.push_back(Invariant.Formula);
    }
    FOPDR_TEST_CHECK(Checker.CheckInductiveInvariant(Predicates, Prog->GetSafetyFormula())
                     .size() == 0,
                     "the conjunction of the invariants is not an inductive invariant");
}

static inline void TestFailures()
{
    cout << "Checking properties that do not hold" << endl;

    auto Prog = Test::ReadLockServer();
    SolverSession Session(Prog);
    Verifier Checker(Session);
    Trace Cex;

    FOPDR_TEST_CHECK(!Checker.CheckInitiation(ReadFormula("(not server_holds_lock)"), Cex),
                     "initiation of a false property succeeded");
    FOPDR_TEST_CHECK(Cex.Evaluate("server_holds_lock", { }, 0) == "true",
                     "initiation counterexample is not an initial state");

    // Mutex alone is not inductive: a grant can arrive while a node holds
    auto Mutex = Prog->GetSafetyFormula();
    auto const& RecvGrant = *Prog->LookupTransition("recv_grant");
    FOPDR_TEST_CHECK(!Checker.CheckConsecution(Mutex, Mutex, RecvGrant, Cex),
                     "mutex alone is inductive over recv_grant");
    cout << "Consecution counterexample:" << endl << Cex << endl;
    FOPDR_TEST_CHECK(Cex.GetNumStates() == 2, "consecution counterexample is not a step");
    FOPDR_TEST_CHECK(Test::GetHolders(Cex, 1).size() >= 2,
                     "consecution counterexample does not violate mutex");
    FOPDR_TEST_CHECK(Cex.GetTransitions().size() == 1 && Cex.GetTransitions()[0] == "recv_grant",
                     "consecution counterexample does not name its transition");

    auto const& SendLock = *Prog->LookupTransition("send_lock");
    FOPDR_TEST_CHECK(Checker.CheckConsecution(Mutex, Mutex, SendLock, Cex),
                     "send_lock breaks mutex");

    FOPDR_TEST_CHECK(Checker.CheckImplication(ReadFormula("(forall ((n node)) (not (holds_lock n)))"),
                                              Mutex, Cex),
                     "no holders does not imply mutex");
    FOPDR_TEST_CHECK(!Checker.CheckImplication(Model::MkTrue(), Mutex, Cex),
                     "mutex is valid");

    auto Failures = Checker.CheckInductiveInvariant({ Mutex }, Mutex);
    FOPDR_TEST_CHECK(Failures.size() > 0, "mutex alone passed as an inductive invariant");
    for (auto const& Failure : Failures) {
        FOPDR_TEST_CHECK(Failure.Kind == CheckKindT::Consecution,
                         "unexpected failure: " << Failure.ToString());
    }
}

// The lock server with one extra invariant that only recv_grant breaks
static inline Model::ProgramRef ReadLockServerWithNoHolder()
{
    ifstream In((string)FOPDR_BENCHMARK_DIR + "/lockserv.fop");
    FOPDR_TEST_CHECK(In.good(), "cannot open lockserv.fop");
    ostringstream Text;
    Text << In.rdbuf()
         << "(invariant no_holder (forall ((n node)) (not (holds_lock n))))" << endl;
    return Model::ReadProgramFromString(Text.str(), "lockserv_no_holder");
}

static inline void TestVerifyFilters()
{
    cout << "Verifying selected invariants and transitions" << endl;

    auto Prog = ReadLockServerWithNoHolder();
    SolverSession Session(Prog);
    Verifier Checker(Session);

    auto Failures = Checker.VerifyInvariants();
    FOPDR_TEST_CHECK(Failures.size() == 1, "expected one failure, got " << Failures.size());
    FOPDR_TEST_CHECK(Failures[0].Kind == CheckKindT::Consecution &&
                     Failures[0].Property == "no_holder" &&
                     Failures[0].Transition == "recv_grant",
                     "unexpected failure: " << Failures[0].ToString());

    set<string> UniqueGrant = { "unique_grant" };
    FOPDR_TEST_CHECK(Checker.VerifyInvariants(UniqueGrant).size() == 0,
                     "unique_grant alone failed");

    set<string> NoHolder = { "no_holder" };
    set<string> RecvGrant = { "recv_grant" };
    set<string> OtherTransitions = { "send_lock", "unlock", "recv_unlock" };
    FOPDR_TEST_CHECK(Checker.VerifyInvariants(NoHolder).size() == 1,
                     "no_holder passed on its own");
    FOPDR_TEST_CHECK(Checker.VerifyInvariants(NoHolder, OtherTransitions).size() == 0,
                     "no_holder failed on transitions that keep it");
    Failures = Checker.VerifyInvariants(set<string>(), RecvGrant);
    FOPDR_TEST_CHECK(Failures.size() == 1 && Failures[0].Transition == "recv_grant",
                     "recv_grant alone did not break no_holder");
    cout << Failures[0].ToString() << endl;
    FOPDR_TEST_CHECK(Failures[0].Counterexample.GetTransitions().size() == 1 &&
                     Test::GetHolders(Failures[0].Counterexample, 1).size() >= 1,
                     "counterexample does not grant the lock");

    set<string> Unknown = { "no_such_invariant" };
    FOPDR_TEST_EXPECT_THROW(FOPDRError, Checker.VerifyInvariants(Unknown),
                            "unknown invariant accepted");
    FOPDR_TEST_EXPECT_THROW(FOPDRError, Checker.VerifyInvariants(set<string>(), Unknown),
                            "unknown transition accepted");
}

int main()
{
    TestLockServerInvariants();
    TestFailures();
    TestVerifyFilters();
    cout << "All verifier tests passed" << endl;
    return 0;
}

//
// VerifierTests.cpp ends here
