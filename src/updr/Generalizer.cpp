// Generalizer.cpp --- 
// 
// Filename: Generalizer.cpp
// Author: FOPDR developers
// Created: Fri Sep 04 04:55:40 2026 (-0400)
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
#include "../translate/BoundedChecker.hpp"

#include "Generalizer.hpp"

namespace FOPDR {
    namespace UPDR {

        using Translate::Z3Expr;
        using Translate::VarScopeT;
        using TP::TPResult;

        Generalizer::Generalizer(Translate::SolverSession& Session, bool UseUnsatCores)
            : Session(Session), UseUnsatCores(UseUnsatCores)
        {
            // Nothing here
        }

        Generalizer::~Generalizer()
        {
            // Nothing here
        }

        bool Generalizer::HasPredecessor(const ExpT& FrameFormula, const Diagram& Diag,
                                         const string& Context, string* TransitionName,
                                         Translate::Trace* Predecessor, set<u32>* Core)
        {
            auto const& Prog = Session.GetProgram();
            auto const& Prover = Session.GetTP();
            auto const& Trans = Session.GetTranslator(Translate::MakeStepKeys(2));
            auto const& Ctx = Prover->GetCtx();

            // Stutter first, then the transitions in declaration order
            vector<Model::TransitionRef> Candidates;
            Candidates.push_back(Model::TransitionRef::NullPtr);
            Candidates.insert(Candidates.end(), Prog->GetTransitions().begin(),
                              Prog->GetTransitions().end());

            for (auto const& Candidate : Candidates) {
                auto const& CandidateName = (Candidate == Model::TransitionRef::NullPtr ?
                                             Translate::StutterTransitionName :
                                             Candidate->GetName());
                Translate::QueryScope Scope(Session, Trans);

                Prover->Assert(Trans.Translate(FrameFormula, 0));
                if (Candidate == Model::TransitionRef::NullPtr) {
                    Prover->Assert(Trans.FrameCondition(set<string>(), 0));
                } else {
                    Prover->Assert(Trans.TranslateTransition(*Candidate, 0));
                }

                // The diagram variables become constants of the new state,
                // and every conjunct is tracked by an indicator
                VarScopeT Skolems;
                for (auto const& Var : Diag.GetVars()) {
                    Skolems[Var.Name] = Trans.MakeFreshConstant(Var.Name, Var.Sort);
                }
                vector<Z3Expr> Assumptions;
                vector<u32> AssumptionIndices;
                for (u32 i = 0; i < Diag.GetNumConjuncts(); ++i) {
                    if (!Diag.IsEnabled(i)) {
                        continue;
                    }
                    auto Indicator = Prover->MakeIndicator("conj" + to_string(i));
                    Prover->Assert(Translate::MkZ3Implies(Ctx, Indicator,
                                                          Trans.Translate(Diag.GetConjunct(i),
                                                                          1, Skolems)));
                    Assumptions.push_back(Indicator);
                    AssumptionIndices.push_back(i);
                }

                ++Stats.NumPredecessorQueries;
                auto Description = "predecessor of " + Context + " via " + CandidateName;
                auto Res = Prover->CheckSatWithAssumptions(Assumptions, Description);
                if (Res == TPResult::SATISFIABLE) {
                    if (TransitionName != nullptr) {
                        *TransitionName = CandidateName;
                    }
                    if (Predecessor != nullptr) {
                        *Predecessor = Trans.ReadModel(Session.GetMinimalModel(Trans, Assumptions,
                                                                               Description));
                        Predecessor->SetTransition(0, CandidateName);
                    }
                    return true;
                }

                if (Core != nullptr) {
                    for (auto const& CoreExpr : Prover->GetUnsatCore()) {
                        for (u32 j = 0; j < Assumptions.size(); ++j) {
                            if (Assumptions[j] == CoreExpr) {
                                Core->insert(AssumptionIndices[j]);
                                break;
                            }
                        }
                    }
                }
            }
            return false;
        }

        Diagram Generalizer::Generalize(const Diagram& Diag, const ExpT& FrameFormula,
                                        const string& Context)
        {
            Diagram Retval = Diag;
            ++Stats.NumGeneralizations;
            Stats.NumLiteralsIn += Retval.GetNumEnabled();

            if (UseUnsatCores) {
                // Iterate until the union of the cores is everything left
                while (true) {
                    set<u32> Core;
                    if (HasPredecessor(FrameFormula, Retval, Context, nullptr, nullptr, &Core)) {
                        FOPDR_INTERNAL_ERROR((string)"Generalizing " + Context +
                                             ", which has a predecessor:\n" +
                                             Retval.ToString());
                    }
                    u32 NumDropped = 0;
                    for (u32 i = 0; i < Retval.GetNumConjuncts(); ++i) {
                        if (Retval.IsEnabled(i) && Core.find(i) == Core.end()) {
                            Retval.SetEnabled(i, false);
                            ++NumDropped;
                        }
                    }
                    Stats.NumCoreDrops += NumDropped;

                    FOPDR_LOG_SHORT("Generalizer.Detailed",
                                    Out_ << "Unsat cores of " << Context << " cover "
                                         << Core.size() << " conjuncts, dropped "
                                         << NumDropped << endl;
                                    );
                    if (NumDropped == 0) {
                        break;
                    }
                }
            }

            for (u32 i = 0; i < Retval.GetNumConjuncts(); ++i) {
                if (!Retval.IsEnabled(i)) {
                    continue;
                }
                Retval.SetEnabled(i, false);
                set<u32> Core;
                auto CorePtr = (UseUnsatCores ? &Core : nullptr);
                if (HasPredecessor(FrameFormula, Retval, Context, nullptr, nullptr, CorePtr)) {
                    Retval.SetEnabled(i, true);
                    continue;
                }
                ++Stats.NumBruteForceDrops;

                FOPDR_LOG_SHORT("Generalizer.Detailed",
                                Out_ << "Dropped " << Retval.GetConjunct(i) << " from "
                                     << Context << endl;
                                );

                // Later conjuncts outside the core can go at once
                if (UseUnsatCores) {
                    for (u32 j = i + 1; j < Retval.GetNumConjuncts(); ++j) {
                        if (Retval.IsEnabled(j) && Core.find(j) == Core.end()) {
                            Retval.SetEnabled(j, false);
                            ++Stats.NumCoreDrops;
                        }
                    }
                }
            }

            Stats.NumLiteralsOut += Retval.GetNumEnabled();
            FOPDR_LOG_FULL("Generalizer.Detailed",
                           Out_ << "Generalized " << Context << " from "
                                << Diag.GetNumEnabled() << " to "
                                << Retval.GetNumEnabled() << " conjuncts:" << endl
                                << Retval.ToPredicate() << endl;
                           );
            return Retval;
        }

        bool Generalizer::GetUseUnsatCores() const
        {
            return UseUnsatCores;
        }

        const GeneralizerStatsT& Generalizer::GetStats() const
        {
            return Stats;
        }

    } /* end namespace UPDR */
} /* end namespace FOPDR */

//
// Generalizer.cpp ends here
