// ProgramTests.cpp --- 
// 
// Filename: ProgramTests.cpp
// Author: FOPDR developers
// Created: Mon Sep 14 08:36:08 2026 (-0400)
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

#include "../common/TestUtils.hpp"

using namespace FOPDR;
using namespace Model;

// A small program with every kind of symbol, built through the API
static inline ProgramRef BuildRingProgram()
{
    SmartPtr<Program> Prog = new Program();
    Prog->AddSort("node");
    Prog->AddSort("id");
    Prog->AddFunction("idn", { "node" }, "id", false);
    Prog->AddRelation("le", { "id", "id" }, false);
    Prog->AddConstant("leader_candidate", "node", true);
    Prog->AddRelation("leader", { "node" }, true);
    Prog->AddRelation("has_leader", { }, true,
                      ReadFormula("(exists ((n node)) (leader n))"));

    Prog->AddAxiom("le_refl", ReadFormula("(forall ((x id)) (le x x))"));
    Prog->AddAxiom("idn_injective",
                   ReadFormula("(forall ((a node) (b node)) (=> (= (idn a) (idn b)) (= a b)))"));
    Prog->AddInit("", ReadFormula("(forall ((n node)) (not (leader n)))"));
    Prog->AddTransition("elect", { VarDeclT("n", "node") }, { "leader", "leader_candidate" },
                        ReadFormula((string)"(and (= (new leader_candidate) n) " +
                                    "(forall ((x node)) (<=> (new (leader x)) " +
                                    "(or (leader x) (= x n)))))"));
    Prog->AddInvariant("one_leader",
                       ReadFormula((string)"(forall ((a node) (b node)) " +
                                   "(=> (and (leader a) (leader b)) (= a b)))"), true);
    Prog->AddTheorem("le_refl_again", ReadFormula("(forall ((x id)) (le x x))"), false);
    Prog->Validate();
    return Prog;
}

static inline void TestRoundTrip(const ProgramRef& Prog, const string& Name)
{
    cout << "Round trip of " << Name << endl;

    ostringstream sstr;
    WriteProgram(sstr, *Prog);
    auto Text = sstr.str();
    auto Reread = ReadProgramFromString(Text, Name + " (printed)");

    FOPDR_TEST_CHECK(Reread->ToString(1) == Text, "printed program reads back differently:\n" <<
                     Reread->ToString(1));
    FOPDR_TEST_CHECK(Reread->GetFingerprint() == Prog->GetFingerprint(),
                     "fingerprint changed across a round trip");
    FOPDR_TEST_CHECK(Reread->GetTransitions().size() == Prog->GetTransitions().size(),
                     "transitions lost");
    FOPDR_TEST_CHECK(Reread->GetInvariants().size() == Prog->GetInvariants().size(),
                     "invariants lost");
}

static inline void TestLookups()
{
    cout << "Testing lookups on the lock server" << endl;

    auto Prog = Test::ReadLockServer();
    FOPDR_TEST_CHECK(Prog->IsValidated(), "program read from a file is not validated");
    FOPDR_TEST_CHECK(Prog->LookupSort("node") != SortRef::NullPtr, "sort node missing");
    FOPDR_TEST_CHECK(Prog->LookupSort("client") == SortRef::NullPtr, "unexpected sort");

    auto const& Holds = Prog->LookupSymbol("holds_lock");
    FOPDR_TEST_CHECK(Holds != SymbolRef::NullPtr && Holds->IsRelation() &&
                     Holds->IsMutable() && Holds->GetArity() == 1,
                     "holds_lock declared wrongly");
    FOPDR_TEST_CHECK(Prog->LookupTransition("recv_grant") != TransitionRef::NullPtr,
                     "transition recv_grant missing");
    FOPDR_TEST_CHECK(Prog->GetSafeties().size() == 1, "expected a single safety property");
    FOPDR_TEST_CHECK(Prog->GetInvariants().size() == 7, "expected 7 invariants");

    FOPDR_TEST_EXPECT_THROW(FOPDRError, Prog->GetSafetyFormula("no_such_property"),
                            "a missing property was accepted");
    FOPDR_TEST_CHECK(Prog->GetSafetyFormula("mutex")->Equals(*Prog->GetSafetyFormula()),
                     "named and unnamed safety formulas differ");
}

static inline void ExpectInvalid(const string& Text, const string& What)
{
    cout << "Expecting rejection: " << What << endl;
    FOPDR_TEST_EXPECT_THROW(FOPDRError, ReadProgramFromString(Text, What),
                            "invalid program accepted: " << What);
}

static inline void TestValidationErrors()
{
    const string Header = (string)"(sort node)\n" +
        "(relation r (node) mutable)\n" +
        "(constant c node immutable)\n";

    ExpectInvalid(Header + "(init (r d))", "unknown constant");
    ExpectInvalid(Header + "(init (r c c))", "wrong arity");
    ExpectInvalid(Header + "(init (new (r c)))", "new in an init");
    ExpectInvalid(Header + "(axiom (r c))", "mutable symbol in an axiom");
    ExpectInvalid(Header + "(transition t () (mods c) (= (new c) c))",
                  "immutable symbol modified");
    ExpectInvalid(Header + "(transition t ((c node)) (mods r) (r c))",
                  "parameter hiding a symbol");
    ExpectInvalid(Header + "(safety (= c true))", "sort mismatch");
    ExpectInvalid(Header + "(relation r (node) mutable)", "duplicate symbol");
    ExpectInvalid(Header + "(invariant a (r c)) (invariant a (r c))", "duplicate name");
    ExpectInvalid(Header + "(frobnicate)", "unknown keyword");
    ExpectInvalid(Header + "(relation s (missing) mutable)", "unknown sort");
}

int main()
{
    TestRoundTrip(BuildRingProgram(), "ring");
    TestRoundTrip(Test::ReadLockServer(), "lockserv");
    TestRoundTrip(Test::ReadUnguardedLock(), "unguarded_lock");
    TestLookups();
    TestValidationErrors();
    cout << "All program tests passed" << endl;
    return 0;
}

//
// ProgramTests.cpp ends here
