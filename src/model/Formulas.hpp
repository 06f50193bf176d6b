// Formulas.hpp --- 
// 
// Filename: Formulas.hpp
// Author: FOPDR developers
// Created: Mon Jul 27 12:33:56 2026 (-0400)
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

#if !defined FOPDR_MODEL_FORMULAS_HPP_
#define FOPDR_MODEL_FORMULAS_HPP_

#include <map>
#include <set>
#include <unordered_set>
#include <unordered_map>

#include "../common/FOPDRFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"

namespace FOPDR {
    namespace Model {

        enum class ExprKind {
            Bool, Id, App,
            Not, And, Or, Implies, Iff,
            Eq, Neq, Ite,
            Forall, Exists,
            New
        };

        extern string ExprKindToString(ExprKind Kind);

        // A variable bound by a quantifier or a transition parameter list
        class VarDeclT
        {
        public:
            string Name;
            string Sort;

            inline VarDeclT() {}
            inline VarDeclT(const string& Name, const string& Sort)
                : Name(Name), Sort(Sort) {}

            inline bool operator == (const VarDeclT& Other) const
            {
                return (Name == Other.Name && Sort == Other.Sort);
            }

            inline bool operator != (const VarDeclT& Other) const
            {
                return !(*this == Other);
            }
        };

        typedef vector<VarDeclT> VarDeclVecT;

        // Immutable formula/term node. Symbols and bound variables are
        // referred to by name; resolution against a Program happens in
        // Program::CheckFormula and in the translator.
        class ExprNode : public RefCountable, public Stringifiable
        {
        private:
            ExprKind Kind;
            bool BoolValue;
            string Name;
            ExpVecT Children;
            VarDeclVecT Bound;
            mutable u64 HashCode;
            mutable bool HashValid;

            void ComputeHash() const;

        public:
            ExprNode(ExprKind Kind, bool BoolValue, const string& Name,
                     const ExpVecT& Children, const VarDeclVecT& Bound);
            virtual ~ExprNode();

            inline ExprKind GetKind() const { return Kind; }
            inline bool Is(ExprKind K) const { return Kind == K; }
            inline bool GetBoolValue() const { return BoolValue; }
            inline const string& GetName() const { return Name; }
            inline const ExpVecT& GetChildren() const { return Children; }
            inline const ExpT& GetChild(u32 Index) const { return Children[Index]; }
            inline u32 GetNumChildren() const { return (u32)Children.size(); }
            inline const VarDeclVecT& GetBound() const { return Bound; }
            // body of a quantifier
            inline const ExpT& GetBody() const { return Children[0]; }

            bool Equals(const ExprNode& Other) const;
            u64 Hash() const;

            // Prints in the s-expression interchange syntax
            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;
        };

        class ExprPtrHasher
        {
        public:
            inline u64 operator () (const ExpT& Exp) const
            {
                return Exp->Hash();
            }
        };

        class ExprPtrEquals
        {
        public:
            inline bool operator () (const ExpT& Exp1, const ExpT& Exp2) const
            {
                return (Exp1 == Exp2 || Exp1->Equals(*Exp2));
            }
        };

        typedef unordered_set<ExpT, ExprPtrHasher, ExprPtrEquals> ExpSetT;
        template <typename V>
        using ExpMapT = unordered_map<ExpT, V, ExprPtrHasher, ExprPtrEquals>;

        // Constructors
        extern ExpT MkTrue();
        extern ExpT MkFalse();
        extern ExpT MkBool(bool Value);
        extern ExpT MkId(const string& Name);
        // Zero argument applications are represented as identifiers
        extern ExpT MkApp(const string& Name, const ExpVecT& Args);
        extern ExpT MkNot(const ExpT& Exp);
        extern ExpT MkAnd(const ExpVecT& Conjuncts);
        extern ExpT MkAnd(const ExpT& Exp1, const ExpT& Exp2);
        extern ExpT MkOr(const ExpVecT& Disjuncts);
        extern ExpT MkOr(const ExpT& Exp1, const ExpT& Exp2);
        extern ExpT MkImplies(const ExpT& Antecedent, const ExpT& Consequent);
        extern ExpT MkIff(const ExpT& Exp1, const ExpT& Exp2);
        extern ExpT MkEq(const ExpT& Exp1, const ExpT& Exp2);
        extern ExpT MkNeq(const ExpT& Exp1, const ExpT& Exp2);
        extern ExpT MkIte(const ExpT& Cond, const ExpT& Then, const ExpT& Else);
        // Quantifiers with an empty binder return the body
        extern ExpT MkForall(const VarDeclVecT& Bound, const ExpT& Body);
        extern ExpT MkExists(const VarDeclVecT& Bound, const ExpT& Body);
        extern ExpT MkNew(const ExpT& Exp);

        // Utilities

        // Replaces free occurrences of identifiers, respecting binders
        extern ExpT Substitute(const ExpT& Exp, const map<string, ExpT>& Subst);
        // Names of identifiers and applications occurring free in Exp
        extern void GatherFreeNames(const ExpT& Exp, set<string>& Names);
        // Deepest nesting of New in Exp (0 for single state formulas)
        extern u32 GetNewDepth(const ExpT& Exp);
        // Flattens nested conjunctions
        extern void GatherConjuncts(const ExpT& Exp, ExpVecT& Conjuncts);

    } /* end namespace Model */
} /* end namespace FOPDR */

#endif /* FOPDR_MODEL_FORMULAS_HPP_ */

//
// Formulas.hpp ends here
