// Verifier.hpp --- 
// 
// Filename: Verifier.hpp
// Author: FOPDR developers
// Created: Fri Aug 21 23:34:12 2026 (-0400)
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

#if !defined FOPDR_TRANSLATE_VERIFIER_HPP_
#define FOPDR_TRANSLATE_VERIFIER_HPP_

#include "StateTranslator.hpp"

namespace FOPDR {
    namespace Translate {

        enum class CheckKindT {
            Initiation, Consecution, Safety, Theorem
        };

        extern string CheckKindToString(CheckKindT Kind);

        class VerificationFailureT
        {
        public:
            CheckKindT Kind;
            string Property;
            // Only for consecution failures
            string Transition;
            Trace Counterexample;

            inline VerificationFailureT() : Kind(CheckKindT::Initiation) {}
            inline VerificationFailureT(CheckKindT Kind, const string& Property,
                                        const string& Transition, const Trace& Counterexample)
                : Kind(Kind), Property(Property), Transition(Transition),
                  Counterexample(Counterexample) {}

            string ToString() const;
        };

        // One query per check, each in its own scope. The Check*
        // methods return true when the check holds and otherwise fill
        // Cex with the offending state (or pair of states).
        class Verifier
        {
        private:
            SolverSession& Session;

            bool CheckUnsat(const Translator& Trans, const vector<Z3Expr>& Assertions,
                            const string& QueryDescription, Trace& Cex);

        public:
            Verifier(SolverSession& Session);
            ~Verifier();

            bool CheckInitiation(const Model::ExpT& Property, Trace& Cex);
            bool CheckConsecution(const Model::ExpT& Assumption, const Model::ExpT& Property,
                                  const Model::TransitionDecl& Transition, Trace& Cex);
            // Single state validity of Antecedent => Consequent
            bool CheckImplication(const Model::ExpT& Antecedent,
                                  const Model::ExpT& Consequent, Trace& Cex);
            bool CheckTheorem(const Model::TheoremDecl& Theorem, Trace& Cex);

            // Initiation of every invariant, and consecution of every
            // invariant over every transition assuming all of them.
            // Non-empty OnlyInvariants or OnlyTransitions restrict the
            // checks to the named ones; unknown names are an error.
            vector<VerificationFailureT>
            VerifyInvariants(const set<string>& OnlyInvariants = set<string>(),
                             const set<string>& OnlyTransitions = set<string>());
            vector<VerificationFailureT> VerifyTheorems();
            // Is the conjunction of Predicates an inductive invariant
            // that implies Safety?
            vector<VerificationFailureT> CheckInductiveInvariant(const Model::ExpVecT& Predicates,
                                                                 const Model::ExpT& Safety);
        };

    } /* end namespace Translate */
} /* end namespace FOPDR */

#endif /* FOPDR_TRANSLATE_VERIFIER_HPP_ */

//
// Verifier.hpp ends here
