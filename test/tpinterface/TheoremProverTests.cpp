// TheoremProverTests.cpp --- 
// 
// Filename: TheoremProverTests.cpp
// Author: FOPDR developers
// Created: Thu Oct 15 11:02:37 2026 (-0400)
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

#include "../../src/translate/StateTranslator.hpp"
#include "../common/TestUtils.hpp"

using namespace FOPDR;
using namespace TP;
using Translate::MkZ3And;
using Translate::MkZ3Or;

static inline Z3Expr MkNot(const Z3Expr& Expr)
{
    auto const& Ctx = Expr.GetCtx();
    return Z3Expr(Ctx, Z3_mk_not(*Ctx, Expr));
}

static inline void TestPrinting()
{
    cout << "Testing printing of solver objects" << endl;

    Z3TPRef Prover = new Z3TheoremProver();
    auto const& Ctx = Prover->GetCtx();
    auto Flag = Prover->MakeIndicator("flag");
    Z3Sort BoolSort(Ctx, Z3_mk_bool_sort(*Ctx));

    cout << "indicator: " << Flag.ToString() << ", sort: " << BoolSort.ToString() << endl;
    FOPDR_TEST_CHECK(Flag.ToString().find("flag") != string::npos, "indicator name not printed");
    FOPDR_TEST_CHECK(BoolSort.ToString() == "Bool", "wrong sort name");
    FOPDR_TEST_CHECK(Flag.ToString() == Flag.ToString(0), "default verbosity differs");
}

// Pigeons into holes, one fewer hole than pigeons
static inline void AssertPigeonhole(const Z3TPRef& Prover, u32 NumPigeons)
{
    u32 NumHoles = NumPigeons - 1;
    vector<vector<Z3Expr>> InHole(NumPigeons);
    for (u32 p = 0; p < NumPigeons; ++p) {
        for (u32 h = 0; h < NumHoles; ++h) {
            InHole[p].push_back(Prover->MakeIndicator("in_hole"));
        }
        Prover->Assert(MkZ3Or(Prover->GetCtx(), InHole[p]));
    }
    for (u32 h = 0; h < NumHoles; ++h) {
        for (u32 p = 0; p < NumPigeons; ++p) {
            for (u32 q = p + 1; q < NumPigeons; ++q) {
                vector<Z3Expr> Both = { InHole[p][h], InHole[q][h] };
                Prover->Assert(MkNot(MkZ3And(Prover->GetCtx(), Both)));
            }
        }
    }
}

static inline void TestRetriesExhausted()
{
    cout << "Testing unknown verdicts and retries" << endl;

    TPOptionsT Options;
    Options.TimeoutMillis = 1;
    Options.QueryRetries = 1;
    Z3TPRef Prover = new Z3TheoremProver(Options);
    const string Description = "pigeonhole with ten pigeons";

    bool Threw = false;
    {
        ScopedQuery Query(Prover);
        AssertPigeonhole(Prover, 10);
        try {
            Prover->CheckSat(Description);
        } catch (const QueryInconclusiveError& Ex) {
            cout << "Got expected error: " << Ex.what() << endl;
            Threw = true;
            FOPDR_TEST_CHECK(Ex.GetQueryDescription() == Description,
                             "wrong query description: " << Ex.GetQueryDescription());
            FOPDR_TEST_CHECK(!Ex.WasInterrupted(), "a timeout reported as an interrupt");
            FOPDR_TEST_CHECK(Ex.GetReason() != "", "no reason given");
        }
    }
    FOPDR_TEST_CHECK(Threw, "pigeonhole solved within two milliseconds");

    auto const& Stats = Prover->GetStats();
    cout << "queries: " << Stats.NumQueries << ", unknown: " << Stats.NumUnknown
         << ", retries: " << Stats.NumRetries << endl;
    FOPDR_TEST_CHECK(Stats.NumRetries == 1, "expected exactly one retry");
    FOPDR_TEST_CHECK(Stats.NumUnknown == 2, "expected two unknown verdicts");
    FOPDR_TEST_CHECK(Prover->GetNumScopes() == 0, "query scope left behind");
    FOPDR_TEST_CHECK(!Prover->IsCanceled() && !Prover->IsInterrupted(),
                     "a timeout left the prover interrupted");
}

static inline void TestInterruptBetweenChecks()
{
    cout << "Testing an interrupt between checks" << endl;

    Z3TPRef Prover = new Z3TheoremProver();
    auto Flag = Prover->MakeIndicator("flag");

    Prover->Interrupt();
    FOPDR_TEST_CHECK(Prover->IsInterrupted(), "interrupt not recorded");
    {
        ScopedQuery Query(Prover);
        Prover->Assert(Flag);
        bool Threw = false;
        try {
            Prover->CheckSat("flag after an interrupt");
        } catch (const QueryInconclusiveError& Ex) {
            cout << "Got expected error: " << Ex.what() << endl;
            Threw = true;
            FOPDR_TEST_CHECK(Ex.WasInterrupted(), "interrupt not reported");
        }
        FOPDR_TEST_CHECK(Threw, "check ran despite the interrupt");
    }
    FOPDR_TEST_CHECK(!Prover->IsCanceled(), "an idle context was canceled");

    Prover->ClearInterrupt();
    FOPDR_TEST_CHECK(!Prover->IsInterrupted(), "interrupt not cleared");
    ScopedQuery Query(Prover);
    Prover->Assert(Flag);
    FOPDR_TEST_CHECK(Prover->CheckSat("flag after clearing") == TPResult::SATISFIABLE,
                     "flag alone is not satisfiable");
    FOPDR_TEST_CHECK(Prover->GetModel().EvaluateBool(Flag), "model does not set the flag");
}

int main()
{
    TestPrinting();
    TestRetriesExhausted();
    TestInterruptBetweenChecks();
    cout << "All theorem prover tests passed" << endl;
    return 0;
}

//
// TheoremProverTests.cpp ends here
