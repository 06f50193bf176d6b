// DiagramTests.cpp --- 
// 
// Filename: DiagramTests.cpp
// Author: FOPDR developers
// Created: Mon Sep 21 07:18:13 2026 (-0400)
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
#include "../../src/updr/Diagram.hpp"
#include "../common/TestUtils.hpp"

using namespace FOPDR;
using namespace UPDR;
using Translate::Trace;
using Model::ReadFormula;

static const string TokenRingText =
    "(sort node)\n"
    "(constant origin node immutable)\n"
    "(function next (node) node immutable)\n"
    "(relation token (node) mutable)\n"
    "(init (forall ((n node)) (<=> (token n) (= n origin))))\n"
    "(transition pass ((n node)) (mods token)\n"
    "  (and (token n) (forall ((x node)) (<=> (new (token x)) (= x (next n))))))\n"
    "(safety some_token (exists ((n node)) (token n)))\n";

static inline void CheckEquivalent(Translate::Verifier& Checker, const Model::ExpT& First,
                                   const Model::ExpT& Second, const string& What)
{
    Trace Cex;
    FOPDR_TEST_CHECK(Checker.CheckImplication(First, Second, Cex) &&
                     Checker.CheckImplication(Second, First, Cex),
                     What << " are not equivalent:" << endl << First << endl << Second);
}

static inline void TestLiteralNegation()
{
    cout << "Testing literal negation" << endl;
    auto R = ReadFormula("(r x)");
    FOPDR_TEST_CHECK(NegateLiteral(R)->Equals(*Model::MkNot(R)), "wrong negation of an atom");
    FOPDR_TEST_CHECK(NegateLiteral(Model::MkNot(R)) == R, "double negation kept");
    FOPDR_TEST_CHECK(NegateLiteral(ReadFormula("(= x y)"))->Equals(*ReadFormula("(!= x y)")),
                     "wrong negation of an equation");
    FOPDR_TEST_CHECK(NegateLiteral(ReadFormula("(!= x y)"))->Equals(*ReadFormula("(= x y)")),
                     "wrong negation of a disequation");
    FOPDR_TEST_CHECK(NegateLiteral(Model::MkTrue())->Equals(*Model::MkFalse()),
                     "wrong negation of true");
}

static inline void TestLockServerDiagram()
{
    cout << "Testing the diagram of a lock server state" << endl;

    auto Prog = Test::ReadLockServer();
    Translate::SolverSession Session(Prog);
    Translate::BoundedChecker BMC(Session);
    Translate::Verifier Checker(Session);

    // A state in which some node holds the lock
    auto NobodyHolds = ReadFormula("(forall ((n node)) (not (holds_lock n)))");
    Trace Run;
    FOPDR_TEST_CHECK(BMC.CheckBMC(NobodyHolds, 3, Run), "the lock cannot be acquired in 3 steps");
    auto Diag = Diagram::FromTrace(*Prog, Run, 3, true);
    cout << "Diagram:" << endl << Diag << endl;

    u32 NumVars = (u32)Run.GetUniverse("node").size();
    FOPDR_TEST_CHECK(Diag.GetVars().size() == NumVars, "one variable per element expected");
    u32 NumDistinct = 0;
    u32 NumRelation = 0;
    for (auto const& Conjunct : Diag.GetConjuncts()) {
        if (Conjunct.Kind == ConjunctKindT::Distinct) {
            ++NumDistinct;
        } else if (Conjunct.Kind == ConjunctKindT::Relation) {
            ++NumRelation;
        }
    }
    FOPDR_TEST_CHECK(NumDistinct == NumVars * (NumVars - 1) / 2, "wrong number of disequalities");
    // Four unary relations and one nullary one
    FOPDR_TEST_CHECK(NumRelation == 4 * NumVars + 1, "wrong number of relation literals");

    Trace Cex;
    FOPDR_TEST_CHECK(!Checker.CheckImplication(Diag.ToFormula(), Model::MkFalse(), Cex),
                     "diagram is unsatisfiable");
    FOPDR_TEST_CHECK(Checker.CheckImplication(Diag.ToFormula(), Model::MkNot(NobodyHolds), Cex),
                     "diagram does not fix the lock holder");
    FOPDR_TEST_CHECK(Checker.CheckImplication(Prog->GetInitFormula(), Diag.ToPredicate(), Cex),
                     "diagram of a non-initial state matches an initial state");
    CheckEquivalent(Checker, Diag.ToPredicate(), Model::MkNot(Diag.ToFormula()),
                    "predicate and negated diagram");

    // Dropping conjuncts weakens the diagram
    auto Weaker = Diag;
    u32 Dropped = 0;
    for (u32 i = 0; i < Weaker.GetNumConjuncts(); i += 2) {
        Weaker.SetEnabled(i, false);
        ++Dropped;
    }
    FOPDR_TEST_CHECK(Weaker.GetNumEnabled() == Diag.GetNumEnabled() - Dropped,
                     "wrong number of enabled conjuncts");
    FOPDR_TEST_CHECK(Checker.CheckImplication(Diag.ToFormula(), Weaker.ToFormula(), Cex),
                     "dropping conjuncts strengthened the diagram");
    FOPDR_TEST_CHECK(Weaker.ToString(1).find("[off]") != string::npos,
                     "disabled conjuncts not shown");
    FOPDR_TEST_CHECK(Weaker.ToString(0).find("[off]") == string::npos,
                     "disabled conjuncts shown at verbosity 0");
    Weaker.EnableAll();
    FOPDR_TEST_CHECK(Weaker.GetNumEnabled() == Diag.GetNumConjuncts(), "EnableAll failed");
    FOPDR_TEST_EXPECT_THROW(InternalError, Weaker.SetEnabled(Weaker.GetNumConjuncts(), false),
                            "out of range conjunct accepted");
}

static inline void TestConstantSimplification()
{
    cout << "Testing diagrams with constants" << endl;

    auto Prog = Model::ReadProgramFromString(TokenRingText, "token_ring");
    Translate::SolverSession Session(Prog);
    Translate::BoundedChecker BMC(Session);
    Translate::Verifier Checker(Session);

    // Two passes of the token
    Trace Run;
    vector<string> Steps = { "pass", "pass" };
    FOPDR_TEST_CHECK(BMC.CheckTrace(Model::ExpVecT(3, Model::ExpT::NullPtr), Steps, Run),
                     "token cannot be passed twice");

    auto Plain = Diagram::FromTrace(*Prog, Run, 2, false);
    auto Simple = Diagram::FromTrace(*Prog, Run, 2, true);
    cout << "Plain diagram:" << endl << Plain << endl
         << "Simplified diagram:" << endl << Simple << endl;

    FOPDR_TEST_CHECK(Simple.GetVars().size() + 1 == Plain.GetVars().size(),
                     "the variable of origin was not eliminated");
    for (auto const& Conjunct : Simple.GetConjuncts()) {
        FOPDR_TEST_CHECK(Conjunct.Kind != ConjunctKindT::Constant,
                         "constant equation left: " << Conjunct.Formula);
    }
    bool HasFunction = false;
    for (auto const& Conjunct : Plain.GetConjuncts()) {
        HasFunction = HasFunction || Conjunct.Kind == ConjunctKindT::Function;
    }
    FOPDR_TEST_CHECK(HasFunction, "function interpretation missing from the diagram");
    CheckEquivalent(Checker, Plain.ToFormula(), Simple.ToFormula(),
                    "plain and simplified diagrams");
}

int main()
{
    TestLiteralNegation();
    TestLockServerDiagram();
    TestConstantSimplification();
    cout << "All diagram tests passed" << endl;
    return 0;
}

//
// DiagramTests.cpp ends here
