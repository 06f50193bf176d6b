// Program.cpp --- 
// 
// Filename: Program.cpp
// Author: FOPDR developers
// Created: Wed Jul 29 02:21:06 2026 (-0400)
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

#include <boost/functional/hash.hpp>
#include <boost/algorithm/string/join.hpp>

#include "Program.hpp"

namespace FOPDR {
    namespace Model {

        const string BoolSortName = "bool";

        SortDecl::SortDecl(const string& Name)
            : Name(Name)
        {
            // Nothing here
        }

        SortDecl::~SortDecl()
        {
            // Nothing here
        }

        SymbolDecl::SymbolDecl(const string& Name, SymbolKindT Kind,
                               const vector<string>& ArgSorts, const string& ResultSort,
                               bool Mutable, const ExpT& Definition)
            : Name(Name), Kind(Kind), ArgSorts(ArgSorts), ResultSort(ResultSort),
              Mutable(Mutable), Definition(Definition)
        {
            // Nothing here
        }

        SymbolDecl::~SymbolDecl()
        {
            // Nothing here
        }

        string SymbolDecl::ToString(u32 Verbosity) const
        {
            ostringstream sstr;
            string MutString = (Mutable ? "mutable" : "immutable");
            string ArgString = (string)"(" + boost::algorithm::join(ArgSorts, " ") + ")";

            switch (Kind) {
            case SymbolKindT::Relation:
                sstr << "(relation " << Name << " " << ArgString << " " << MutString;
                if (IsDerived()) {
                    sstr << " (derived " << Definition->ToString() << ")";
                }
                sstr << ")";
                break;
            case SymbolKindT::Constant:
                sstr << "(constant " << Name << " " << ResultSort << " " << MutString << ")";
                break;
            case SymbolKindT::Function:
                sstr << "(function " << Name << " " << ArgString << " "
                     << ResultSort << " " << MutString << ")";
                break;
            }
            return sstr.str();
        }

        TransitionDecl::TransitionDecl(const string& Name, const VarDeclVecT& Params,
                                       const set<string>& Mods, const ExpT& Body)
            : Name(Name), Params(Params), Mods(Mods), Body(Body)
        {
            // Nothing here
        }

        TransitionDecl::~TransitionDecl()
        {
            // Nothing here
        }

        string TransitionDecl::ToString(u32 Verbosity) const
        {
            ostringstream sstr;
            sstr << "(transition " << Name << " (";
            bool First = true;
            for (auto const& Param : Params) {
                if (!First) {
                    sstr << " ";
                }
                First = false;
                sstr << "(" << Param.Name << " " << Param.Sort << ")";
            }
            sstr << ") (mods";
            for (auto const& Mod : Mods) {
                sstr << " " << Mod;
            }
            sstr << ")";
            if (Verbosity > 0) {
                sstr << endl << "    ";
            } else {
                sstr << " ";
            }
            sstr << Body->ToString() << ")";
            return sstr.str();
        }

        Program::Program()
            : Validated(false)
        {
            // Nothing here
        }

        Program::~Program()
        {
            // Nothing here
        }

        void Program::CheckSymbolName(const string& Name) const
        {
            if (Name == "" || Name == BoolSortName || Name == "true" || Name == "false") {
                throw FOPDRError((string)"Invalid symbol name \"" + Name + "\"");
            }
            if (SymbolMap.find(Name) != SymbolMap.end()) {
                throw FOPDRError((string)"Symbol \"" + Name + "\" declared more than once");
            }
        }

        void Program::CheckFormulaName(const string& Name)
        {
            if (Name == "") {
                return;
            }
            if (FormulaNames.find(Name) != FormulaNames.end()) {
                throw FOPDRError((string)"Name \"" + Name + "\" is used by more than one " +
                                 "axiom, init, invariant or theorem");
            }
            FormulaNames.insert(Name);
        }

        void Program::CheckSortName(const string& Name, const string& Where) const
        {
            if (Name == BoolSortName) {
                return;
            }
            if (SortMap.find(Name) == SortMap.end()) {
                throw FOPDRError((string)"Unknown sort \"" + Name + "\" in " + Where);
            }
        }

        void Program::AddSort(const string& Name)
        {
            if (Name == "" || Name == BoolSortName) {
                throw FOPDRError((string)"Invalid sort name \"" + Name + "\"");
            }
            if (SortMap.find(Name) != SortMap.end()) {
                throw FOPDRError((string)"Sort \"" + Name + "\" declared more than once");
            }
            SortRef Sort = new SortDecl(Name);
            Sorts.push_back(Sort);
            SortMap[Name] = Sort;
            Validated = false;
        }

        void Program::AddRelation(const string& Name, const vector<string>& ArgSorts,
                                  bool Mutable, const ExpT& Definition)
        {
            CheckSymbolName(Name);
            SymbolRef Symbol = new SymbolDecl(Name, SymbolKindT::Relation, ArgSorts,
                                              BoolSortName, Mutable, Definition);
            Symbols.push_back(Symbol);
            SymbolMap[Name] = Symbol;
            Validated = false;
        }

        void Program::AddConstant(const string& Name, const string& Sort, bool Mutable)
        {
            CheckSymbolName(Name);
            SymbolRef Symbol = new SymbolDecl(Name, SymbolKindT::Constant, vector<string>(),
                                              Sort, Mutable, ExpT::NullPtr);
            Symbols.push_back(Symbol);
            SymbolMap[Name] = Symbol;
            Validated = false;
        }

        void Program::AddFunction(const string& Name, const vector<string>& ArgSorts,
                                  const string& ResultSort, bool Mutable)
        {
            CheckSymbolName(Name);
            if (ArgSorts.size() == 0) {
                throw FOPDRError((string)"Function \"" + Name + "\" has no arguments, " +
                                 "declare it as a constant instead");
            }
            SymbolRef Symbol = new SymbolDecl(Name, SymbolKindT::Function, ArgSorts,
                                              ResultSort, Mutable, ExpT::NullPtr);
            Symbols.push_back(Symbol);
            SymbolMap[Name] = Symbol;
            Validated = false;
        }

        void Program::AddAxiom(const string& Name, const ExpT& Formula)
        {
            CheckFormulaName(Name);
            Axioms.push_back(NamedFormulaT(Name, Formula));
            Validated = false;
        }

        void Program::AddInit(const string& Name, const ExpT& Formula)
        {
            CheckFormulaName(Name);
            Inits.push_back(NamedFormulaT(Name, Formula));
            Validated = false;
        }

        void Program::AddTransition(const string& Name, const VarDeclVecT& Params,
                                    const set<string>& Mods, const ExpT& Body)
        {
            if (Name == "") {
                throw FOPDRError("Transitions must be named");
            }
            if (TransitionMap.find(Name) != TransitionMap.end()) {
                throw FOPDRError((string)"Transition \"" + Name + "\" declared more than once");
            }
            TransitionRef Transition = new TransitionDecl(Name, Params, Mods, Body);
            Transitions.push_back(Transition);
            TransitionMap[Name] = Transition;
            Validated = false;
        }

        void Program::AddInvariant(const string& Name, const ExpT& Formula, bool IsSafety)
        {
            CheckFormulaName(Name);
            Invariants.push_back(InvariantDecl(Name, Formula, IsSafety));
            Validated = false;
        }

        void Program::AddTheorem(const string& Name, const ExpT& Formula, bool IsTwoState)
        {
            CheckFormulaName(Name);
            Theorems.push_back(TheoremDecl(Name, Formula, IsTwoState));
            Validated = false;
        }

        string Program::InferSort(const ExpT& Exp, FormulaContextT Context,
                                  map<string, string>& Scope, bool UnderNew) const
        {
            auto ExpectBool = [&] (const ExpT& Child) -> void
                {
                    auto ChildSort = InferSort(Child, Context, Scope, UnderNew);
                    if (ChildSort != BoolSortName) {
                        throw FOPDRError((string)"Expected a formula, but \"" +
                                         Child->ToString() + "\" has sort " + ChildSort);
                    }
                };

            switch (Exp->GetKind()) {
            case ExprKind::Bool:
                return BoolSortName;

            case ExprKind::Id: {
                auto ScopeIt = Scope.find(Exp->GetName());
                if (ScopeIt != Scope.end()) {
                    return ScopeIt->second;
                }
                auto const& Symbol = LookupSymbol(Exp->GetName());
                if (Symbol == SymbolRef::NullPtr) {
                    throw FOPDRError((string)"Unknown identifier \"" + Exp->GetName() + "\"");
                }
                if (Symbol->GetArity() != 0) {
                    throw FOPDRError((string)"Symbol \"" + Exp->GetName() + "\" expects " +
                                     to_string(Symbol->GetArity()) + " arguments, but is " +
                                     "used without any");
                }
                if (Context == FormulaContextT::ImmutableOnly && Symbol->IsMutable()) {
                    throw FOPDRError((string)"Mutable symbol \"" + Exp->GetName() + "\" " +
                                     "cannot be referenced here");
                }
                return Symbol->GetResultSort();
            }

            case ExprKind::App: {
                if (Scope.find(Exp->GetName()) != Scope.end()) {
                    throw FOPDRError((string)"Bound variable \"" + Exp->GetName() + "\" " +
                                     "cannot be applied to arguments");
                }
                auto const& Symbol = LookupSymbol(Exp->GetName());
                if (Symbol == SymbolRef::NullPtr) {
                    throw FOPDRError((string)"Unknown relation or function \"" +
                                     Exp->GetName() + "\"");
                }
                if (Symbol->GetArity() != Exp->GetNumChildren()) {
                    throw FOPDRError((string)"Symbol \"" + Exp->GetName() + "\" expects " +
                                     to_string(Symbol->GetArity()) + " arguments, but got " +
                                     to_string(Exp->GetNumChildren()) + " in \"" +
                                     Exp->ToString() + "\"");
                }
                if (Context == FormulaContextT::ImmutableOnly && Symbol->IsMutable()) {
                    throw FOPDRError((string)"Mutable symbol \"" + Exp->GetName() + "\" " +
                                     "cannot be referenced here");
                }
                for (u32 i = 0; i < Exp->GetNumChildren(); ++i) {
                    auto ArgSort = InferSort(Exp->GetChild(i), Context, Scope, UnderNew);
                    if (ArgSort != Symbol->GetArgSorts()[i]) {
                        throw FOPDRError((string)"Argument " + to_string(i + 1) + " of \"" +
                                         Exp->ToString() + "\" has sort " + ArgSort +
                                         ", expected " + Symbol->GetArgSorts()[i]);
                    }
                }
                return Symbol->GetResultSort();
            }

            case ExprKind::Not:
            case ExprKind::And:
            case ExprKind::Or:
            case ExprKind::Implies:
            case ExprKind::Iff:
                for (auto const& Child : Exp->GetChildren()) {
                    ExpectBool(Child);
                }
                return BoolSortName;

            case ExprKind::Eq:
            case ExprKind::Neq: {
                auto LHSSort = InferSort(Exp->GetChild(0), Context, Scope, UnderNew);
                auto RHSSort = InferSort(Exp->GetChild(1), Context, Scope, UnderNew);
                if (LHSSort != RHSSort) {
                    throw FOPDRError((string)"Sides of \"" + Exp->ToString() + "\" have " +
                                     "different sorts " + LHSSort + " and " + RHSSort);
                }
                return BoolSortName;
            }

            case ExprKind::Ite: {
                ExpectBool(Exp->GetChild(0));
                auto ThenSort = InferSort(Exp->GetChild(1), Context, Scope, UnderNew);
                auto ElseSort = InferSort(Exp->GetChild(2), Context, Scope, UnderNew);
                if (ThenSort != ElseSort) {
                    throw FOPDRError((string)"Branches of \"" + Exp->ToString() + "\" have " +
                                     "different sorts " + ThenSort + " and " + ElseSort);
                }
                return ThenSort;
            }

            case ExprKind::Forall:
            case ExprKind::Exists: {
                auto InnerScope = Scope;
                set<string> SeenNames;
                for (auto const& Var : Exp->GetBound()) {
                    if (Var.Sort == BoolSortName) {
                        throw FOPDRError((string)"Cannot quantify over formulas, in \"" +
                                         Exp->ToString() + "\"");
                    }
                    CheckSortName(Var.Sort, (string)"binder of \"" + Exp->ToString() + "\"");
                    if (SymbolMap.find(Var.Name) != SymbolMap.end()) {
                        throw FOPDRError((string)"Bound variable \"" + Var.Name +
                                         "\" hides the declared symbol of the same name");
                    }
                    if (!SeenNames.insert(Var.Name).second) {
                        throw FOPDRError((string)"Variable \"" + Var.Name + "\" is bound " +
                                         "twice by the same quantifier");
                    }
                    InnerScope[Var.Name] = Var.Sort;
                }
                auto BodySort = InferSort(Exp->GetBody(), Context, InnerScope, UnderNew);
                if (BodySort != BoolSortName) {
                    throw FOPDRError((string)"Body of quantifier \"" + Exp->ToString() +
                                     "\" is not a formula");
                }
                return BoolSortName;
            }

            case ExprKind::New:
                if (Context != FormulaContextT::TwoState) {
                    throw FOPDRError((string)"\"new\" is not allowed in \"" +
                                     Exp->ToString() + "\"; only transitions and two state " +
                                     "theorems may refer to the next state");
                }
                if (UnderNew) {
                    throw FOPDRError((string)"Nested \"new\" in \"" + Exp->ToString() + "\"");
                }
                return InferSort(Exp->GetChild(0), Context, Scope, true);
            }

            FOPDR_INTERNAL_ERROR("Unhandled expression kind in InferSort");
        }

        void Program::CheckFormula(const ExpT& Exp, FormulaContextT Context) const
        {
            map<string, string> Scope;
            auto Sort = InferSort(Exp, Context, Scope, false);
            if (Sort != BoolSortName) {
                throw FOPDRError((string)"\"" + Exp->ToString() + "\" is a term of sort " +
                                 Sort + ", not a formula");
            }
        }

        void Program::Validate()
        {
            for (auto const& Symbol : Symbols) {
                auto Where = (string)"declaration of \"" + Symbol->GetName() + "\"";
                for (auto const& ArgSort : Symbol->GetArgSorts()) {
                    if (ArgSort == BoolSortName) {
                        throw FOPDRError((string)"Arguments cannot be formulas, in " + Where);
                    }
                    CheckSortName(ArgSort, Where);
                }
                if (!Symbol->IsRelation() && Symbol->GetResultSort() == BoolSortName) {
                    throw FOPDRError((string)"Use a relation instead of a boolean valued " +
                                     "symbol, in " + Where);
                }
                CheckSortName(Symbol->GetResultSort(), Where);
                if (Symbol->IsDerived()) {
                    try {
                        CheckFormula(Symbol->GetDefinition(),
                                     Symbol->IsMutable() ? FormulaContextT::SingleState :
                                     FormulaContextT::ImmutableOnly);
                    } catch (const FOPDRError& Ex) {
                        throw FOPDRError((string)"In definition of derived relation \"" +
                                         Symbol->GetName() + "\": " + Ex.what());
                    }
                }
            }

            for (auto const& Axiom : Axioms) {
                try {
                    CheckFormula(Axiom.Formula, FormulaContextT::ImmutableOnly);
                } catch (const FOPDRError& Ex) {
                    throw FOPDRError((string)"In axiom " + Axiom.Name + ": " + Ex.what());
                }
            }

            for (auto const& Init : Inits) {
                try {
                    CheckFormula(Init.Formula, FormulaContextT::SingleState);
                } catch (const FOPDRError& Ex) {
                    throw FOPDRError((string)"In init " + Init.Name + ": " + Ex.what());
                }
            }

            for (auto const& Transition : Transitions) {
                auto Where = (string)"transition \"" + Transition->GetName() + "\"";
                map<string, string> Scope;
                for (auto const& Param : Transition->GetParams()) {
                    if (Param.Sort == BoolSortName) {
                        throw FOPDRError((string)"Parameters cannot be formulas, in " + Where);
                    }
                    CheckSortName(Param.Sort, Where);
                    if (SymbolMap.find(Param.Name) != SymbolMap.end()) {
                        throw FOPDRError((string)"Parameter \"" + Param.Name + "\" of " +
                                         Where + " hides the declared symbol of the same name");
                    }
                    if (Scope.find(Param.Name) != Scope.end()) {
                        throw FOPDRError((string)"Parameter \"" + Param.Name + "\" of " +
                                         Where + " declared more than once");
                    }
                    Scope[Param.Name] = Param.Sort;
                }
                for (auto const& Mod : Transition->GetMods()) {
                    auto const& Symbol = LookupSymbol(Mod);
                    if (Symbol == SymbolRef::NullPtr) {
                        throw FOPDRError((string)"Unknown symbol \"" + Mod + "\" in the " +
                                         "modifies clause of " + Where);
                    }
                    if (!Symbol->IsMutable()) {
                        throw FOPDRError((string)"Immutable symbol \"" + Mod + "\" in the " +
                                         "modifies clause of " + Where);
                    }
                    if (Symbol->IsDerived()) {
                        throw FOPDRError((string)"Derived relation \"" + Mod + "\" in the " +
                                         "modifies clause of " + Where);
                    }
                }
                try {
                    auto Sort = InferSort(Transition->GetBody(), FormulaContextT::TwoState,
                                          Scope, false);
                    if (Sort != BoolSortName) {
                        throw FOPDRError("Body is not a formula");
                    }
                } catch (const FOPDRError& Ex) {
                    throw FOPDRError((string)"In " + Where + ": " + Ex.what());
                }
            }

            for (auto const& Invariant : Invariants) {
                try {
                    CheckFormula(Invariant.Formula, FormulaContextT::SingleState);
                } catch (const FOPDRError& Ex) {
                    throw FOPDRError((string)"In invariant " + Invariant.Name + ": " + Ex.what());
                }
            }

            for (auto const& Theorem : Theorems) {
                try {
                    CheckFormula(Theorem.Formula, Theorem.IsTwoState ?
                                 FormulaContextT::TwoState : FormulaContextT::SingleState);
                } catch (const FOPDRError& Ex) {
                    throw FOPDRError((string)"In theorem " + Theorem.Name + ": " + Ex.what());
                }
            }

            Validated = true;
        }

        const SortRef& Program::LookupSort(const string& Name) const
        {
            auto it = SortMap.find(Name);
            if (it == SortMap.end()) {
                return SortRef::NullPtr;
            }
            return it->second;
        }

        const SymbolRef& Program::LookupSymbol(const string& Name) const
        {
            auto it = SymbolMap.find(Name);
            if (it == SymbolMap.end()) {
                return SymbolRef::NullPtr;
            }
            return it->second;
        }

        const TransitionRef& Program::LookupTransition(const string& Name) const
        {
            auto it = TransitionMap.find(Name);
            if (it == TransitionMap.end()) {
                return TransitionRef::NullPtr;
            }
            return it->second;
        }

        vector<InvariantDecl> Program::GetSafeties() const
        {
            vector<InvariantDecl> Retval;
            for (auto const& Invariant : Invariants) {
                if (Invariant.IsSafety) {
                    Retval.push_back(Invariant);
                }
            }
            return Retval;
        }

        ExpT Program::GetSafetyFormula(const string& OnlyName) const
        {
            ExpVecT Conjuncts;
            for (auto const& Invariant : Invariants) {
                if (OnlyName != "") {
                    if (Invariant.Name == OnlyName) {
                        Conjuncts.push_back(Invariant.Formula);
                    }
                } else if (Invariant.IsSafety) {
                    Conjuncts.push_back(Invariant.Formula);
                }
            }
            if (Conjuncts.size() == 0) {
                if (OnlyName != "") {
                    throw FOPDRError((string)"No invariant named \"" + OnlyName + "\"");
                }
                throw FOPDRError("The program declares no safety properties");
            }
            return MkAnd(Conjuncts);
        }

        ExpT Program::GetInitFormula() const
        {
            ExpVecT Conjuncts;
            for (auto const& Init : Inits) {
                Conjuncts.push_back(Init.Formula);
            }
            return MkAnd(Conjuncts);
        }

        u64 Program::GetFingerprint() const
        {
            size_t Seed = 0;
            boost::hash_combine(Seed, ToString());
            return (u64)Seed;
        }

        static inline void PrintNamedFormula(ostream& Out, const string& Keyword,
                                             const NamedFormulaT& Named)
        {
            Out << "(" << Keyword << " ";
            if (Named.Name != "") {
                Out << Named.Name << " ";
            }
            Out << Named.Formula->ToString() << ")" << endl;
        }

        string Program::ToString(u32 Verbosity) const
        {
            ostringstream sstr;
            for (auto const& Sort : Sorts) {
                sstr << "(sort " << Sort->GetName() << ")" << endl;
            }
            for (auto const& Symbol : Symbols) {
                sstr << Symbol->ToString() << endl;
            }
            for (auto const& Axiom : Axioms) {
                PrintNamedFormula(sstr, "axiom", Axiom);
            }
            for (auto const& Init : Inits) {
                PrintNamedFormula(sstr, "init", Init);
            }
            for (auto const& Transition : Transitions) {
                sstr << Transition->ToString(Verbosity) << endl;
            }
            for (auto const& Invariant : Invariants) {
                PrintNamedFormula(sstr, Invariant.IsSafety ? "safety" : "invariant", Invariant);
            }
            for (auto const& Theorem : Theorems) {
                PrintNamedFormula(sstr, Theorem.IsTwoState ? "twostate-theorem" : "theorem",
                                  Theorem);
            }
            return sstr.str();
        }

    } /* end namespace Model */
} /* end namespace FOPDR */

//
// Program.cpp ends here
