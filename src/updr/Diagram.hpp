// Diagram.hpp --- 
// 
// Filename: Diagram.hpp
// Author: FOPDR developers
// Created: Sun Aug 30 09:34:09 2026 (-0400)
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

#if !defined FOPDR_UPDR_DIAGRAM_HPP_
#define FOPDR_UPDR_DIAGRAM_HPP_

#include "../model/Program.hpp"
#include "../translate/Trace.hpp"

namespace FOPDR {
    namespace UPDR {

        using Model::ExpT;
        using Model::ExpVecT;
        using Model::VarDeclT;
        using Model::VarDeclVecT;

        enum class ConjunctKindT {
            Distinct, Relation, Constant, Function
        };

        extern string ConjunctKindToString(ConjunctKindT Kind);

        class DiagramConjunctT
        {
        public:
            ExpT Formula;
            ConjunctKindT Kind;
            bool Enabled;

            inline DiagramConjunctT()
                : Kind(ConjunctKindT::Distinct), Enabled(true) {}
            inline DiagramConjunctT(const ExpT& Formula, ConjunctKindT Kind, bool Enabled = true)
                : Formula(Formula), Kind(Kind), Enabled(Enabled) {}
        };

        // The symbolic fingerprint of one state of a model: one variable
        // per universe element, and a conjunction of literals over the
        // variables. Conjuncts can be switched off one by one while
        // generalizing; only the enabled ones take part in the formula.
        class Diagram : public Stringifiable
        {
        private:
            VarDeclVecT Vars;
            vector<DiagramConjunctT> Conjuncts;

        public:
            Diagram();
            Diagram(const VarDeclVecT& Vars, const vector<DiagramConjunctT>& Conjuncts);
            virtual ~Diagram();

            // Builds the diagram of state StateIndex of TheTrace.
            // Derived relations are left out. With Simplify, variables
            // equal to a constant are replaced by the constant.
            static Diagram FromTrace(const Model::Program& Prog, const Translate::Trace& TheTrace,
                                     u32 StateIndex, bool Simplify);

            // Replaces every variable equal to a constant by that
            // constant and drops the equations that became trivial
            void SimplifyConstants();

            const VarDeclVecT& GetVars() const;
            const vector<DiagramConjunctT>& GetConjuncts() const;
            u32 GetNumConjuncts() const;
            u32 GetNumEnabled() const;
            bool IsEnabled(u32 Index) const;
            void SetEnabled(u32 Index, bool Enabled);
            void EnableAll();
            const ExpT& GetConjunct(u32 Index) const;

            // Variables referenced by enabled conjuncts, in binder order
            VarDeclVecT GetUsedVars() const;
            // Conjunction of the enabled conjuncts, variables free
            ExpT GetMatrix() const;
            // exists V. (and enabled conjuncts)
            ExpT ToFormula() const;
            // forall V. (or negated enabled conjuncts): the negation of
            // ToFormula(), as a clause
            ExpT ToPredicate() const;

            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;
        };

        // Negation pushing through not, = and !=
        extern ExpT NegateLiteral(const ExpT& Literal);

    } /* end namespace UPDR */
} /* end namespace FOPDR */

#endif /* FOPDR_UPDR_DIAGRAM_HPP_ */

//
// Diagram.hpp ends here
