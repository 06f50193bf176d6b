// BoundedChecker.cpp --- 
// 
// Filename: BoundedChecker.cpp
// Author: FOPDR developers
// Created: Mon Aug 10 20:34:17 2026 (-0400)
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

#include "../utils/LogManager.hpp"

#include "BoundedChecker.hpp"

namespace FOPDR {
    namespace Translate {

        using Model::ExpT;
        using Model::ExpVecT;
        using TP::TPResult;

        BoundedChecker::BoundedChecker(SolverSession& Session)
            : Session(Session)
        {
            // Nothing here
        }

        BoundedChecker::~BoundedChecker()
        {
            // Nothing here
        }

        bool BoundedChecker::CheckTrace(const ExpVecT& StepConstraints,
                                        const vector<string>& TransitionNames,
                                        Trace& Result, const string& QueryDescription)
        {
            const u32 NumStates = (u32)StepConstraints.size();
            if (NumStates == 0 || TransitionNames.size() + 1 != NumStates) {
                FOPDR_INTERNAL_ERROR((string)"Trace query with " + to_string(NumStates) +
                                     " states and " + to_string(TransitionNames.size()) +
                                     " transitions");
            }

            auto const& Prog = Session.GetProgram();
            auto const& Prover = Session.GetTP();
            auto const& Trans = Session.GetTranslator(MakeStepKeys(NumStates));
            auto const& Ctx = Prover->GetCtx();
            QueryScope Scope(Session, Trans);

            Prover->Assert(Trans.Translate(Prog->GetInitFormula(), 0));
            for (u32 i = 0; i < NumStates; ++i) {
                if (StepConstraints[i] != ExpT::NullPtr) {
                    Prover->Assert(Trans.Translate(StepConstraints[i], i));
                }
            }

            // One selector per step and transition, so that the
            // transitions taken can be read back from the model
            vector<vector<pair<string, Z3Expr>>> Selectors(NumStates - 1);
            for (u32 i = 0; i + 1 < NumStates; ++i) {
                auto const& Wanted = TransitionNames[i];
                if (Wanted == StutterTransitionName) {
                    Prover->Assert(Trans.FrameCondition(set<string>(), i));
                    Selectors[i].push_back(make_pair(StutterTransitionName, Z3Expr()));
                    continue;
                }
                if (Wanted != "") {
                    auto const& Transition = Prog->LookupTransition(Wanted);
                    if (Transition == Model::TransitionRef::NullPtr) {
                        FOPDR_INTERNAL_ERROR((string)"Unknown transition \"" + Wanted +
                                             "\" in trace query");
                    }
                    Prover->Assert(Trans.TranslateTransition(*Transition, i));
                    Selectors[i].push_back(make_pair(Wanted, Z3Expr()));
                    continue;
                }

                vector<Z3Expr> Choices;
                for (auto const& Transition : Prog->GetTransitions()) {
                    auto Selector = Prover->MakeIndicator("step" + to_string(i) + "_" +
                                                          Transition->GetName());
                    Prover->Assert(MkZ3Implies(Ctx, Selector,
                                               Trans.TranslateTransition(*Transition, i)));
                    Selectors[i].push_back(make_pair(Transition->GetName(), Selector));
                    Choices.push_back(Selector);
                }
                auto Selector = Prover->MakeIndicator("step" + to_string(i) + "_stutter");
                Prover->Assert(MkZ3Implies(Ctx, Selector,
                                           Trans.FrameCondition(set<string>(), i)));
                Selectors[i].push_back(make_pair(StutterTransitionName, Selector));
                Choices.push_back(Selector);
                Prover->Assert(MkZ3Or(Ctx, Choices));
            }

            auto Description = QueryDescription + " over " + to_string(NumStates) + " states";
            auto Res = Prover->CheckSat(Description);
            if (Res == TPResult::UNSATISFIABLE) {
                return false;
            }

            auto TheModel = Session.GetMinimalModel(Trans, vector<Z3Expr>(), Description);
            Result = Trans.ReadModel(TheModel);
            for (u32 i = 0; i + 1 < NumStates; ++i) {
                for (auto const& Choice : Selectors[i]) {
                    if (Choice.second.IsNull() || TheModel.EvaluateBool(Choice.second)) {
                        Result.SetTransition(i, Choice.first);
                        break;
                    }
                }
            }

            FOPDR_LOG_FULL("BoundedChecker.Traces",
                           Out_ << "Trace found for " << QueryDescription << ":" << endl
                                << Result << endl;
                           );
            return true;
        }

        bool BoundedChecker::CheckBMC(const ExpT& Property, u32 Depth, Trace& Result)
        {
            // Stutter steps make "exactly Depth steps" cover "at most"
            ExpVecT StepConstraints(Depth + 1, ExpT::NullPtr);
            StepConstraints[Depth] = Model::MkNot(Property);
            vector<string> TransitionNames(Depth, "");
            return CheckTrace(StepConstraints, TransitionNames, Result,
                              "bounded check of " + Property->ToString() + " at depth " +
                              to_string(Depth));
        }

    } /* end namespace Translate */
} /* end namespace FOPDR */

//
// BoundedChecker.cpp ends here
