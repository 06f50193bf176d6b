// Formulas.cpp --- 
// 
// Filename: Formulas.cpp
// Author: FOPDR developers
// Created: Sat Jul 25 20:49:23 2026 (-0400)
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

#include <algorithm>
#include <boost/functional/hash.hpp>

#include "Formulas.hpp"

namespace FOPDR {
    namespace Model {

        string ExprKindToString(ExprKind Kind)
        {
            switch (Kind) {
            case ExprKind::Bool:
                return "Bool";
            case ExprKind::Id:
                return "Id";
            case ExprKind::App:
                return "App";
            case ExprKind::Not:
                return "not";
            case ExprKind::And:
                return "and";
            case ExprKind::Or:
                return "or";
            case ExprKind::Implies:
                return "=>";
            case ExprKind::Iff:
                return "<=>";
            case ExprKind::Eq:
                return "=";
            case ExprKind::Neq:
                return "!=";
            case ExprKind::Ite:
                return "ite";
            case ExprKind::Forall:
                return "forall";
            case ExprKind::Exists:
                return "exists";
            case ExprKind::New:
                return "new";
            }
            return "unknown";
        }

        ExprNode::ExprNode(ExprKind Kind, bool BoolValue, const string& Name,
                           const ExpVecT& Children, const VarDeclVecT& Bound)
            : Kind(Kind), BoolValue(BoolValue), Name(Name),
              Children(Children), Bound(Bound), HashCode(0), HashValid(false)
        {
            for (auto const& Child : Children) {
                if (Child == ExpT::NullPtr) {
                    FOPDR_INTERNAL_ERROR((string)"Null child in " + ExprKindToString(Kind) +
                                         " node");
                }
            }
        }

        ExprNode::~ExprNode()
        {
            // Nothing here
        }

        void ExprNode::ComputeHash() const
        {
            size_t Seed = 0;
            boost::hash_combine(Seed, (u32)Kind);
            switch (Kind) {
            case ExprKind::Bool:
                boost::hash_combine(Seed, BoolValue);
                break;
            case ExprKind::Id:
            case ExprKind::App:
                boost::hash_combine(Seed, Name);
                break;
            case ExprKind::Forall:
            case ExprKind::Exists:
                for (auto const& Var : Bound) {
                    boost::hash_combine(Seed, Var.Name);
                    boost::hash_combine(Seed, Var.Sort);
                }
                break;
            case ExprKind::Not:
            case ExprKind::And:
            case ExprKind::Or:
            case ExprKind::Implies:
            case ExprKind::Iff:
            case ExprKind::Eq:
            case ExprKind::Neq:
            case ExprKind::Ite:
            case ExprKind::New:
                break;
            }
            for (auto const& Child : Children) {
                boost::hash_combine(Seed, Child->Hash());
            }
            HashCode = Seed;
            HashValid = true;
        }

        u64 ExprNode::Hash() const
        {
            if (!HashValid) {
                ComputeHash();
            }
            return HashCode;
        }

        bool ExprNode::Equals(const ExprNode& Other) const
        {
            if (&Other == this) {
                return true;
            }
            if (Kind != Other.Kind || Hash() != Other.Hash()) {
                return false;
            }
            if (BoolValue != Other.BoolValue || Name != Other.Name ||
                Bound != Other.Bound || Children.size() != Other.Children.size()) {
                return false;
            }
            for (u32 i = 0; i < Children.size(); ++i) {
                if (!Children[i]->Equals(*(Other.Children[i]))) {
                    return false;
                }
            }
            return true;
        }

        string ExprNode::ToString(u32 Verbosity) const
        {
            ostringstream sstr;
            switch (Kind) {
            case ExprKind::Bool:
                sstr << (BoolValue ? "true" : "false");
                break;

            case ExprKind::Id:
                sstr << Name;
                break;

            case ExprKind::App:
                sstr << "(" << Name;
                for (auto const& Child : Children) {
                    sstr << " " << Child->ToString(Verbosity);
                }
                sstr << ")";
                break;

            case ExprKind::Forall:
            case ExprKind::Exists: {
                sstr << "(" << ExprKindToString(Kind) << " (";
                bool First = true;
                for (auto const& Var : Bound) {
                    if (!First) {
                        sstr << " ";
                    }
                    First = false;
                    sstr << "(" << Var.Name << " " << Var.Sort << ")";
                }
                sstr << ") " << GetBody()->ToString(Verbosity) << ")";
                break;
            }

            case ExprKind::Not:
            case ExprKind::And:
            case ExprKind::Or:
            case ExprKind::Implies:
            case ExprKind::Iff:
            case ExprKind::Eq:
            case ExprKind::Neq:
            case ExprKind::Ite:
            case ExprKind::New:
                sstr << "(" << ExprKindToString(Kind);
                for (auto const& Child : Children) {
                    sstr << " " << Child->ToString(Verbosity);
                }
                sstr << ")";
                break;
            }
            return sstr.str();
        }

        static inline ExpT MkNode(ExprKind Kind, const ExpVecT& Children)
        {
            return new ExprNode(Kind, false, "", Children, VarDeclVecT());
        }

        ExpT MkTrue()
        {
            static ExpT TrueExp = new ExprNode(ExprKind::Bool, true, "",
                                               ExpVecT(), VarDeclVecT());
            return TrueExp;
        }

        ExpT MkFalse()
        {
            static ExpT FalseExp = new ExprNode(ExprKind::Bool, false, "",
                                                ExpVecT(), VarDeclVecT());
            return FalseExp;
        }

        ExpT MkBool(bool Value)
        {
            return (Value ? MkTrue() : MkFalse());
        }

        ExpT MkId(const string& Name)
        {
            return new ExprNode(ExprKind::Id, false, Name, ExpVecT(), VarDeclVecT());
        }

        ExpT MkApp(const string& Name, const ExpVecT& Args)
        {
            if (Args.size() == 0) {
                return MkId(Name);
            }
            return new ExprNode(ExprKind::App, false, Name, Args, VarDeclVecT());
        }

        ExpT MkNot(const ExpT& Exp)
        {
            return MkNode(ExprKind::Not, { Exp });
        }

        ExpT MkAnd(const ExpVecT& Conjuncts)
        {
            if (Conjuncts.size() == 0) {
                return MkTrue();
            }
            if (Conjuncts.size() == 1) {
                return Conjuncts[0];
            }
            return MkNode(ExprKind::And, Conjuncts);
        }

        ExpT MkAnd(const ExpT& Exp1, const ExpT& Exp2)
        {
            return MkAnd(ExpVecT({ Exp1, Exp2 }));
        }

        ExpT MkOr(const ExpVecT& Disjuncts)
        {
            if (Disjuncts.size() == 0) {
                return MkFalse();
            }
            if (Disjuncts.size() == 1) {
                return Disjuncts[0];
            }
            return MkNode(ExprKind::Or, Disjuncts);
        }

        ExpT MkOr(const ExpT& Exp1, const ExpT& Exp2)
        {
            return MkOr(ExpVecT({ Exp1, Exp2 }));
        }

        ExpT MkImplies(const ExpT& Antecedent, const ExpT& Consequent)
        {
            return MkNode(ExprKind::Implies, { Antecedent, Consequent });
        }

        ExpT MkIff(const ExpT& Exp1, const ExpT& Exp2)
        {
            return MkNode(ExprKind::Iff, { Exp1, Exp2 });
        }

        ExpT MkEq(const ExpT& Exp1, const ExpT& Exp2)
        {
            return MkNode(ExprKind::Eq, { Exp1, Exp2 });
        }

        ExpT MkNeq(const ExpT& Exp1, const ExpT& Exp2)
        {
            return MkNode(ExprKind::Neq, { Exp1, Exp2 });
        }

        ExpT MkIte(const ExpT& Cond, const ExpT& Then, const ExpT& Else)
        {
            return MkNode(ExprKind::Ite, { Cond, Then, Else });
        }

        ExpT MkForall(const VarDeclVecT& Bound, const ExpT& Body)
        {
            if (Bound.size() == 0) {
                return Body;
            }
            return new ExprNode(ExprKind::Forall, false, "", { Body }, Bound);
        }

        ExpT MkExists(const VarDeclVecT& Bound, const ExpT& Body)
        {
            if (Bound.size() == 0) {
                return Body;
            }
            return new ExprNode(ExprKind::Exists, false, "", { Body }, Bound);
        }

        ExpT MkNew(const ExpT& Exp)
        {
            return MkNode(ExprKind::New, { Exp });
        }

        static ExpT Rebuild(const ExpT& Exp, const ExpVecT& NewChildren)
        {
            return new ExprNode(Exp->GetKind(), Exp->GetBoolValue(), Exp->GetName(),
                                NewChildren, Exp->GetBound());
        }

        ExpT Substitute(const ExpT& Exp, const map<string, ExpT>& Subst)
        {
            if (Subst.size() == 0) {
                return Exp;
            }

            switch (Exp->GetKind()) {
            case ExprKind::Bool:
                return Exp;

            case ExprKind::Id: {
                auto it = Subst.find(Exp->GetName());
                if (it != Subst.end()) {
                    return it->second;
                }
                return Exp;
            }

            case ExprKind::Forall:
            case ExprKind::Exists: {
                // Bound names hide the substitution below this binder
                auto InnerSubst = Subst;
                for (auto const& Var : Exp->GetBound()) {
                    InnerSubst.erase(Var.Name);
                }
                auto NewBody = Substitute(Exp->GetBody(), InnerSubst);
                if (NewBody == Exp->GetBody()) {
                    return Exp;
                }
                return Rebuild(Exp, { NewBody });
            }

            case ExprKind::App:
            case ExprKind::Not:
            case ExprKind::And:
            case ExprKind::Or:
            case ExprKind::Implies:
            case ExprKind::Iff:
            case ExprKind::Eq:
            case ExprKind::Neq:
            case ExprKind::Ite:
            case ExprKind::New: {
                bool Changed = false;
                ExpVecT NewChildren;
                for (auto const& Child : Exp->GetChildren()) {
                    auto NewChild = Substitute(Child, Subst);
                    Changed = Changed || (NewChild != Child);
                    NewChildren.push_back(NewChild);
                }
                if (!Changed) {
                    return Exp;
                }
                return Rebuild(Exp, NewChildren);
            }
            }
            FOPDR_INTERNAL_ERROR("Unhandled expression kind in Substitute");
        }

        static void GatherFreeNames(const ExpT& Exp, set<string>& Names,
                                    const set<string>& BoundNames)
        {
            switch (Exp->GetKind()) {
            case ExprKind::Bool:
                return;

            case ExprKind::Id:
                if (BoundNames.find(Exp->GetName()) == BoundNames.end()) {
                    Names.insert(Exp->GetName());
                }
                return;

            case ExprKind::App:
                Names.insert(Exp->GetName());
                for (auto const& Child : Exp->GetChildren()) {
                    GatherFreeNames(Child, Names, BoundNames);
                }
                return;

            case ExprKind::Forall:
            case ExprKind::Exists: {
                auto InnerBound = BoundNames;
                for (auto const& Var : Exp->GetBound()) {
                    InnerBound.insert(Var.Name);
                }
                GatherFreeNames(Exp->GetBody(), Names, InnerBound);
                return;
            }

            case ExprKind::Not:
            case ExprKind::And:
            case ExprKind::Or:
            case ExprKind::Implies:
            case ExprKind::Iff:
            case ExprKind::Eq:
            case ExprKind::Neq:
            case ExprKind::Ite:
            case ExprKind::New:
                for (auto const& Child : Exp->GetChildren()) {
                    GatherFreeNames(Child, Names, BoundNames);
                }
                return;
            }
        }

        void GatherFreeNames(const ExpT& Exp, set<string>& Names)
        {
            GatherFreeNames(Exp, Names, set<string>());
        }

        u32 GetNewDepth(const ExpT& Exp)
        {
            u32 Retval = 0;
            for (auto const& Child : Exp->GetChildren()) {
                Retval = max(Retval, GetNewDepth(Child));
            }
            if (Exp->Is(ExprKind::New)) {
                ++Retval;
            }
            return Retval;
        }

        void GatherConjuncts(const ExpT& Exp, ExpVecT& Conjuncts)
        {
            if (Exp->Is(ExprKind::And)) {
                for (auto const& Child : Exp->GetChildren()) {
                    GatherConjuncts(Child, Conjuncts);
                }
            } else if (Exp->Is(ExprKind::Bool) && Exp->GetBoolValue()) {
                return;
            } else {
                Conjuncts.push_back(Exp);
            }
        }

    } /* end namespace Model */
} /* end namespace FOPDR */

//
// Formulas.cpp ends here
