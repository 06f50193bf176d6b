// Verifier.cpp --- 
// 
// Filename: Verifier.cpp
// Author: FOPDR developers
// Created: Sat Aug 22 09:14:01 2026 (-0400)
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

#include "Verifier.hpp"

namespace FOPDR {
    namespace Translate {

        using Model::ExpT;
        using Model::ExpVecT;
        using TP::TPResult;

        string CheckKindToString(CheckKindT Kind)
        {
            switch (Kind) {
            case CheckKindT::Initiation:
                return "initiation";
            case CheckKindT::Consecution:
                return "consecution";
            case CheckKindT::Safety:
                return "safety";
            case CheckKindT::Theorem:
                return "theorem";
            }
            return "unknown";
        }

        string VerificationFailureT::ToString() const
        {
            ostringstream sstr;
            sstr << CheckKindToString(Kind) << " check failed for " << Property;
            if (Transition != "") {
                sstr << " over transition " << Transition;
            }
            sstr << ", counterexample:" << endl << Counterexample.ToString();
            return sstr.str();
        }

        Verifier::Verifier(SolverSession& Session)
            : Session(Session)
        {
            // Nothing here
        }

        Verifier::~Verifier()
        {
            // Nothing here
        }

        bool Verifier::CheckUnsat(const Translator& Trans, const vector<Z3Expr>& Assertions,
                                  const string& QueryDescription, Trace& Cex)
        {
            auto const& Prover = Session.GetTP();
            QueryScope Scope(Session, Trans);
            for (auto const& Assertion : Assertions) {
                Prover->Assert(Assertion);
            }
            auto Res = Prover->CheckSat(QueryDescription);
            if (Res == TPResult::UNSATISFIABLE) {
                return true;
            }
            Cex = Trans.ReadModel(Session.GetMinimalModel(Trans, vector<Z3Expr>(),
                                                          QueryDescription));
            return false;
        }

        bool Verifier::CheckInitiation(const ExpT& Property, Trace& Cex)
        {
            auto const& Trans = Session.GetTranslator(MakeStepKeys(1));
            auto const& Prog = Session.GetProgram();
            vector<Z3Expr> Assertions = {
                Trans.Translate(Prog->GetInitFormula()),
                Trans.Translate(Model::MkNot(Property))
            };
            return CheckUnsat(Trans, Assertions, "initiation of " + Property->ToString(), Cex);
        }

        bool Verifier::CheckConsecution(const ExpT& Assumption, const ExpT& Property,
                                        const Model::TransitionDecl& Transition, Trace& Cex)
        {
            auto const& Trans = Session.GetTranslator(MakeStepKeys(2));
            vector<Z3Expr> Assertions = {
                Trans.Translate(Assumption, 0),
                Trans.TranslateTransition(Transition, 0),
                Trans.Translate(Model::MkNot(Property), 1)
            };
            if (CheckUnsat(Trans, Assertions, "consecution of " + Property->ToString() +
                           " over " + Transition.GetName(), Cex)) {
                return true;
            }
            Cex.SetTransition(0, Transition.GetName());
            return false;
        }

        bool Verifier::CheckImplication(const ExpT& Antecedent, const ExpT& Consequent,
                                        Trace& Cex)
        {
            auto const& Trans = Session.GetTranslator(MakeStepKeys(1));
            vector<Z3Expr> Assertions = {
                Trans.Translate(Antecedent),
                Trans.Translate(Model::MkNot(Consequent))
            };
            return CheckUnsat(Trans, Assertions, "implication " + Antecedent->ToString() +
                              " => " + Consequent->ToString(), Cex);
        }

        bool Verifier::CheckTheorem(const Model::TheoremDecl& Theorem, Trace& Cex)
        {
            auto const& Trans = Session.GetTranslator(MakeStepKeys(Theorem.IsTwoState ? 2 : 1));
            vector<Z3Expr> Assertions = { Trans.Translate(Model::MkNot(Theorem.Formula)) };
            return CheckUnsat(Trans, Assertions, "theorem " + Theorem.Name, Cex);
        }

        vector<VerificationFailureT>
        Verifier::VerifyInvariants(const set<string>& OnlyInvariants,
                                   const set<string>& OnlyTransitions)
        {
            vector<VerificationFailureT> Retval;
            auto const& Prog = Session.GetProgram();

            ExpVecT AllInvariants;
            set<string> InvariantNames;
            for (auto const& Invariant : Prog->GetInvariants()) {
                AllInvariants.push_back(Invariant.Formula);
                InvariantNames.insert(Invariant.Name);
            }
            auto Assumption = Model::MkAnd(AllInvariants);

            for (auto const& Name : OnlyInvariants) {
                if (InvariantNames.find(Name) == InvariantNames.end()) {
                    throw FOPDRError((string)"No invariant named \"" + Name + "\" to check");
                }
            }
            for (auto const& Name : OnlyTransitions) {
                if (Prog->LookupTransition(Name) == Model::TransitionRef::NullPtr) {
                    throw FOPDRError((string)"No transition named \"" + Name + "\" to check");
                }
            }

            u32 NumChecked = 0;
            for (auto const& Invariant : Prog->GetInvariants()) {
                if (OnlyInvariants.size() > 0 &&
                    OnlyInvariants.find(Invariant.Name) == OnlyInvariants.end()) {
                    continue;
                }
                ++NumChecked;
                Trace Cex;
                if (!CheckInitiation(Invariant.Formula, Cex)) {
                    Retval.push_back(VerificationFailureT(CheckKindT::Initiation, Invariant.Name,
                                                          "", Cex));
                }
                for (auto const& Transition : Prog->GetTransitions()) {
                    if (OnlyTransitions.size() > 0 &&
                        OnlyTransitions.find(Transition->GetName()) == OnlyTransitions.end()) {
                        continue;
                    }
                    if (!CheckConsecution(Assumption, Invariant.Formula, *Transition, Cex)) {
                        Retval.push_back(VerificationFailureT(CheckKindT::Consecution,
                                                              Invariant.Name,
                                                              Transition->GetName(), Cex));
                    }
                }
            }

            FOPDR_LOG_MIN_SHORT(Out_ << "Checked " << NumChecked
                                     << " invariants, " << Retval.size() << " failures"
                                     << endl;
                                );
            return Retval;
        }

        vector<VerificationFailureT> Verifier::VerifyTheorems()
        {
            vector<VerificationFailureT> Retval;
            for (auto const& Theorem : Session.GetProgram()->GetTheorems()) {
                Trace Cex;
                if (!CheckTheorem(Theorem, Cex)) {
                    Retval.push_back(VerificationFailureT(CheckKindT::Theorem, Theorem.Name,
                                                          "", Cex));
                }
            }
            return Retval;
        }

        vector<VerificationFailureT>
        Verifier::CheckInductiveInvariant(const ExpVecT& Predicates, const ExpT& Safety)
        {
            vector<VerificationFailureT> Retval;
            auto const& Prog = Session.GetProgram();
            auto Invariant = Model::MkAnd(Predicates);
            auto InvariantName = Invariant->ToString();
            Trace Cex;

            if (!CheckInitiation(Invariant, Cex)) {
                Retval.push_back(VerificationFailureT(CheckKindT::Initiation, InvariantName,
                                                      "", Cex));
            }
            for (auto const& Transition : Prog->GetTransitions()) {
                if (!CheckConsecution(Invariant, Invariant, *Transition, Cex)) {
                    Retval.push_back(VerificationFailureT(CheckKindT::Consecution, InvariantName,
                                                          Transition->GetName(), Cex));
                }
            }
            if (!CheckImplication(Invariant, Safety, Cex)) {
                Retval.push_back(VerificationFailureT(CheckKindT::Safety, Safety->ToString(),
                                                      "", Cex));
            }
            return Retval;
        }

    } /* end namespace Translate */
} /* end namespace FOPDR */

//
// Verifier.cpp ends here
