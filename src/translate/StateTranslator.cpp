// StateTranslator.cpp --- 
// 
// Filename: StateTranslator.cpp
// Author: FOPDR developers
// Created: Sun Aug 16 01:27:34 2026 (-0400)
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

#include <functional>

#include "../utils/LogManager.hpp"

#include "StateTranslator.hpp"

namespace FOPDR {
    namespace Translate {

        using Model::ExprKind;
        using Model::ExpT;
        using Model::SymbolDecl;
        using Model::SymbolKindT;
        using Model::SymbolRef;
        using Model::BoolSortName;
        using TP::TPResult;

        const string StutterTransitionName = "<stutter>";

        static inline vector<Z3_ast> ToASTs(const vector<Z3Expr>& Exprs)
        {
            vector<Z3_ast> Retval;
            for (auto const& Expr : Exprs) {
                Retval.push_back(Expr);
            }
            return Retval;
        }

        Z3Expr MkZ3And(const TP::Z3Ctx& Ctx, const vector<Z3Expr>& Conjuncts)
        {
            if (Conjuncts.size() == 0) {
                return Z3Expr(Ctx, Z3_mk_true(*Ctx));
            }
            if (Conjuncts.size() == 1) {
                return Conjuncts[0];
            }
            auto ASTs = ToASTs(Conjuncts);
            return Z3Expr(Ctx, Z3_mk_and(*Ctx, (u32)ASTs.size(), ASTs.data()));
        }

        Z3Expr MkZ3Or(const TP::Z3Ctx& Ctx, const vector<Z3Expr>& Disjuncts)
        {
            if (Disjuncts.size() == 0) {
                return Z3Expr(Ctx, Z3_mk_false(*Ctx));
            }
            if (Disjuncts.size() == 1) {
                return Disjuncts[0];
            }
            auto ASTs = ToASTs(Disjuncts);
            return Z3Expr(Ctx, Z3_mk_or(*Ctx, (u32)ASTs.size(), ASTs.data()));
        }

        // Universal or existential closure over the given constants
        static inline Z3Expr MkZ3Quantifier(const TP::Z3Ctx& Ctx, bool Universal,
                                            const vector<Z3Expr>& BoundConsts,
                                            const Z3Expr& Body)
        {
            if (BoundConsts.size() == 0) {
                return Body;
            }
            vector<Z3_app> Apps;
            for (auto const& Const : BoundConsts) {
                Apps.push_back(Z3_to_app(*Ctx, Const));
            }
            if (Universal) {
                return Z3Expr(Ctx, Z3_mk_forall_const(*Ctx, 0, (u32)Apps.size(), Apps.data(),
                                                      0, nullptr, Body));
            } else {
                return Z3Expr(Ctx, Z3_mk_exists_const(*Ctx, 0, (u32)Apps.size(), Apps.data(),
                                                      0, nullptr, Body));
            }
        }

        Z3Expr MkZ3Implies(const TP::Z3Ctx& Ctx, const Z3Expr& Antecedent, const Z3Expr& Consequent)
        {
            return Z3Expr(Ctx, Z3_mk_implies(*Ctx, Antecedent, Consequent));
        }

        vector<string> MakeStepKeys(u32 NumStates)
        {
            vector<string> Retval;
            for (u32 i = 0; i < NumStates; ++i) {
                Retval.push_back("s" + to_string(i));
            }
            return Retval;
        }

        Translator::Translator(const Model::ProgramRef& Prog, const TP::Z3Ctx& Ctx,
                               const vector<string>& Keys, const string& KeyPrefix)
            : Prog(Prog), Ctx(Ctx), Keys(Keys), KeyPrefix(KeyPrefix)
        {
            if (Keys.size() == 0) {
                FOPDR_INTERNAL_ERROR("Translator created without any keys");
            }
        }

        Translator::~Translator()
        {
            // Nothing here
        }

        const vector<string>& Translator::GetKeys() const
        {
            return Keys;
        }

        u32 Translator::GetNumKeys() const
        {
            return (u32)Keys.size();
        }

        const Model::ProgramRef& Translator::GetProgram() const
        {
            return Prog;
        }

        const TP::Z3Ctx& Translator::GetCtx() const
        {
            return Ctx;
        }

        void Translator::CheckKeyIndex(u32 KeyIndex) const
        {
            if (KeyIndex >= Keys.size()) {
                FOPDR_INTERNAL_ERROR((string)"State index " + to_string(KeyIndex) +
                                     " requested from a translator with " +
                                     to_string(Keys.size()) + " keys");
            }
        }

        const Z3Sort& Translator::GetSort(const string& SortName) const
        {
            auto it = SortMap.find(SortName);
            if (it != SortMap.end()) {
                return it->second;
            }

            Z3Sort Sort;
            if (SortName == BoolSortName) {
                Sort = Z3Sort(Ctx, Z3_mk_bool_sort(*Ctx));
            } else {
                if (Prog->LookupSort(SortName) == Model::SortRef::NullPtr) {
                    FOPDR_INTERNAL_ERROR((string)"Unknown sort \"" + SortName + "\" in translation");
                }
                Sort = Z3Sort(Ctx, Z3_mk_uninterpreted_sort(*Ctx, Z3_mk_string_symbol(*Ctx,
                                                                                      SortName.c_str())));
            }
            return (SortMap[SortName] = Sort);
        }

        string Translator::GetZ3Name(const SymbolDecl& Symbol, u32 KeyIndex) const
        {
            if (!Symbol.IsMutable()) {
                return Symbol.GetName();
            }
            CheckKeyIndex(KeyIndex);
            return KeyPrefix + Keys[KeyIndex] + "_" + Symbol.GetName();
        }

        const Z3FuncDecl& Translator::GetDecl(const SymbolDecl& Symbol, u32 KeyIndex) const
        {
            // Immutable symbols are cached once, under index 0
            auto CacheIndex = (Symbol.IsMutable() ? KeyIndex : 0);
            auto CacheKey = make_pair(Symbol.GetName(), CacheIndex);
            auto it = DeclMap.find(CacheKey);
            if (it != DeclMap.end()) {
                return it->second;
            }

            auto Name = GetZ3Name(Symbol, KeyIndex);
            vector<Z3_sort> Domain;
            for (auto const& ArgSort : Symbol.GetArgSorts()) {
                Domain.push_back(GetSort(ArgSort));
            }
            Z3_sort Range = GetSort(Symbol.GetResultSort());
            auto Decl = Z3_mk_func_decl(*Ctx, Z3_mk_string_symbol(*Ctx, Name.c_str()),
                                        (u32)Domain.size(), Domain.data(), Range);
            return (DeclMap[CacheKey] = Z3FuncDecl(Ctx, Decl));
        }

        Z3Expr Translator::MakeFreshConstant(const string& Name, const string& SortName) const
        {
            return Z3Expr(Ctx, Z3_mk_fresh_const(*Ctx, Name.c_str(), GetSort(SortName)));
        }

        Z3Expr Translator::MakeCardinalityBound(const string& SortName, u32 Size) const
        {
            auto Element = MakeFreshConstant("elem", SortName);
            vector<Z3Expr> Choices;
            for (u32 i = 0; i < Size; ++i) {
                auto Witness = MakeFreshConstant(SortName + "_" + to_string(i), SortName);
                Choices.push_back(Z3Expr(Ctx, Z3_mk_eq(*Ctx, Element, Witness)));
            }
            return MkZ3Quantifier(Ctx, true, { Element }, MkZ3Or(Ctx, Choices));
        }

        Z3Expr Translator::LowerQuantifier(const ExpT& Exp, u32 KeyIndex,
                                           const VarScopeT& Scope) const
        {
            VarScopeT InnerScope = Scope;
            vector<Z3Expr> BoundConsts;
            for (auto const& Var : Exp->GetBound()) {
                auto Const = MakeFreshConstant(Var.Name, Var.Sort);
                BoundConsts.push_back(Const);
                InnerScope[Var.Name] = Const;
            }
            auto Body = Lower(Exp->GetBody(), KeyIndex, InnerScope);
            return MkZ3Quantifier(Ctx, Exp->Is(ExprKind::Forall), BoundConsts, Body);
        }

        Z3Expr Translator::Lower(const ExpT& Exp, u32 KeyIndex, const VarScopeT& Scope) const
        {
            vector<Z3Expr> LChildren;
            auto LowerChildren = [&] () -> void
                {
                    for (auto const& Child : Exp->GetChildren()) {
                        LChildren.push_back(Lower(Child, KeyIndex, Scope));
                    }
                };

            switch (Exp->GetKind()) {
            case ExprKind::Bool:
                return Z3Expr(Ctx, Exp->GetBoolValue() ? Z3_mk_true(*Ctx) : Z3_mk_false(*Ctx));

            case ExprKind::Id: {
                auto it = Scope.find(Exp->GetName());
                if (it != Scope.end()) {
                    return it->second;
                }
                auto const& Symbol = Prog->LookupSymbol(Exp->GetName());
                if (Symbol == SymbolRef::NullPtr) {
                    FOPDR_INTERNAL_ERROR((string)"Unresolved identifier \"" + Exp->GetName() +
                                         "\" in translation");
                }
                return GetDecl(*Symbol, KeyIndex).Apply(vector<Z3Expr>());
            }

            case ExprKind::App: {
                auto const& Symbol = Prog->LookupSymbol(Exp->GetName());
                if (Symbol == SymbolRef::NullPtr || Symbol->GetArity() != Exp->GetNumChildren()) {
                    FOPDR_INTERNAL_ERROR((string)"Unresolved application \"" + Exp->ToString() +
                                         "\" in translation");
                }
                LowerChildren();
                return GetDecl(*Symbol, KeyIndex).Apply(LChildren);
            }

            case ExprKind::Not:
                LowerChildren();
                return Z3Expr(Ctx, Z3_mk_not(*Ctx, LChildren[0]));

            case ExprKind::And:
                LowerChildren();
                return MkZ3And(Ctx, LChildren);

            case ExprKind::Or:
                LowerChildren();
                return MkZ3Or(Ctx, LChildren);

            case ExprKind::Implies:
                LowerChildren();
                return Z3Expr(Ctx, Z3_mk_implies(*Ctx, LChildren[0], LChildren[1]));

            case ExprKind::Iff:
                LowerChildren();
                return Z3Expr(Ctx, Z3_mk_iff(*Ctx, LChildren[0], LChildren[1]));

            case ExprKind::Eq:
                LowerChildren();
                return Z3Expr(Ctx, Z3_mk_eq(*Ctx, LChildren[0], LChildren[1]));

            case ExprKind::Neq:
                LowerChildren();
                return Z3Expr(Ctx, Z3_mk_not(*Ctx, Z3_mk_eq(*Ctx, LChildren[0], LChildren[1])));

            case ExprKind::Ite:
                LowerChildren();
                return Z3Expr(Ctx, Z3_mk_ite(*Ctx, LChildren[0], LChildren[1], LChildren[2]));

            case ExprKind::Forall:
            case ExprKind::Exists:
                return LowerQuantifier(Exp, KeyIndex, Scope);

            case ExprKind::New:
                CheckKeyIndex(KeyIndex + 1);
                return Lower(Exp->GetChild(0), KeyIndex + 1, Scope);
            }

            FOPDR_INTERNAL_ERROR("Unhandled expression kind in translation");
        }

        Z3Expr Translator::Translate(const ExpT& Exp, u32 KeyIndex) const
        {
            return Translate(Exp, KeyIndex, VarScopeT());
        }

        Z3Expr Translator::Translate(const ExpT& Exp, u32 KeyIndex,
                                     const VarScopeT& FreeVars) const
        {
            CheckKeyIndex(KeyIndex);
            auto Retval = Lower(Exp, KeyIndex, FreeVars);

            FOPDR_LOG_FULL("Translator.Lowered",
                           Out_ << "Formula: " << Exp << endl
                                << "At key: " << Keys[KeyIndex] << endl
                                << "Lowered: " << Retval << endl;
                           );
            return Retval;
        }

        Z3Expr Translator::FrameCondition(const set<string>& Mods, u32 OldIndex) const
        {
            CheckKeyIndex(OldIndex + 1);
            vector<Z3Expr> Conjuncts;

            for (auto const& Symbol : Prog->GetSymbols()) {
                if (!Symbol->IsMutable() || Symbol->IsDerived() ||
                    Mods.find(Symbol->GetName()) != Mods.end()) {
                    continue;
                }
                vector<Z3Expr> Args;
                for (u32 i = 0; i < Symbol->GetArity(); ++i) {
                    Args.push_back(MakeFreshConstant("x", Symbol->GetArgSorts()[i]));
                }
                auto OldApp = GetDecl(*Symbol, OldIndex).Apply(Args);
                auto NewApp = GetDecl(*Symbol, OldIndex + 1).Apply(Args);
                Z3Expr Eq(Ctx, Z3_mk_eq(*Ctx, OldApp, NewApp));
                Conjuncts.push_back(MkZ3Quantifier(Ctx, true, Args, Eq));
            }
            return MkZ3And(Ctx, Conjuncts);
        }

        Z3Expr Translator::TranslateTransition(const Model::TransitionDecl& Transition,
                                               u32 OldIndex) const
        {
            CheckKeyIndex(OldIndex + 1);
            VarScopeT Scope;
            vector<Z3Expr> ParamConsts;
            for (auto const& Param : Transition.GetParams()) {
                auto Const = MakeFreshConstant(Param.Name, Param.Sort);
                ParamConsts.push_back(Const);
                Scope[Param.Name] = Const;
            }
            auto Body = Lower(Transition.GetBody(), OldIndex, Scope);
            auto Frame = FrameCondition(Transition.GetMods(), OldIndex);
            auto Retval = MkZ3Quantifier(Ctx, false, ParamConsts, MkZ3And(Ctx, { Body, Frame }));

            FOPDR_LOG_FULL("Translator.Lowered",
                           Out_ << "Transition: " << Transition.GetName() << endl
                                << "From key: " << Keys[OldIndex] << endl
                                << "Lowered: " << Retval << endl;
                           );
            return Retval;
        }

        Z3Expr Translator::TranslateAnyTransition(u32 OldIndex, bool AllowStutter) const
        {
            vector<Z3Expr> Disjuncts;
            for (auto const& Transition : Prog->GetTransitions()) {
                Disjuncts.push_back(TranslateTransition(*Transition, OldIndex));
            }
            if (AllowStutter) {
                Disjuncts.push_back(FrameCondition(set<string>(), OldIndex));
            }
            return MkZ3Or(Ctx, Disjuncts);
        }

        vector<Z3Expr> Translator::TranslateAxioms() const
        {
            vector<Z3Expr> Retval;
            for (auto const& Axiom : Prog->GetAxioms()) {
                Retval.push_back(Translate(Axiom.Formula, 0));
            }
            for (auto const& Symbol : Prog->GetSymbols()) {
                if (Symbol->IsDerived() && !Symbol->IsMutable()) {
                    Retval.push_back(Translate(Symbol->GetDefinition(), 0));
                }
            }
            return Retval;
        }

        vector<Z3Expr> Translator::TranslateDerivedDefinitions(u32 KeyIndex) const
        {
            vector<Z3Expr> Retval;
            for (auto const& Symbol : Prog->GetSymbols()) {
                if (Symbol->IsDerived() && Symbol->IsMutable()) {
                    Retval.push_back(Translate(Symbol->GetDefinition(), KeyIndex));
                }
            }
            return Retval;
        }

        static inline i32 FindElement(const vector<Z3Expr>& Universe, const Z3Expr& Value)
        {
            for (u32 i = 0; i < Universe.size(); ++i) {
                if (Universe[i] == Value) {
                    return (i32)i;
                }
            }
            return -1;
        }

        // Calls Callback on every tuple over the given domains
        static void ForEachTuple(const vector<const vector<Z3Expr>*>& Domains,
                                 const function<void(const vector<u32>&)>& Callback)
        {
            for (auto Domain : Domains) {
                if (Domain->size() == 0) {
                    return;
                }
            }
            vector<u32> Indices(Domains.size(), 0);
            while (true) {
                Callback(Indices);
                i32 Pos = (i32)Indices.size() - 1;
                while (Pos >= 0) {
                    if (++Indices[Pos] < Domains[Pos]->size()) {
                        break;
                    }
                    Indices[Pos] = 0;
                    --Pos;
                }
                if (Pos < 0) {
                    return;
                }
            }
        }

        map<string, vector<Z3Expr>> Translator::GetClosedUniverses(const Z3Model& TheModel) const
        {
            map<string, vector<Z3Expr>> Universes;
            for (auto const& Sort : Prog->GetSorts()) {
                Universes[Sort->GetName()] = TheModel.GetUniverse(GetSort(Sort->GetName()));
            }

            // Constants and function values may denote elements the
            // model did not list; add them until nothing changes
            bool Changed = true;
            while (Changed) {
                Changed = false;
                for (auto const& Symbol : Prog->GetSymbols()) {
                    if (Symbol->IsRelation()) {
                        continue;
                    }
                    const u32 NumKeys = (Symbol->IsMutable() ? (u32)Keys.size() : 1);
                    auto& ResultUniverse = Universes[Symbol->GetResultSort()];
                    for (u32 KeyIndex = 0; KeyIndex < NumKeys; ++KeyIndex) {
                        auto const& Decl = GetDecl(*Symbol, KeyIndex);
                        vector<const vector<Z3Expr>*> Domains;
                        for (auto const& ArgSort : Symbol->GetArgSorts()) {
                            Domains.push_back(&(Universes[ArgSort]));
                        }
                        vector<Z3Expr> NewElements;
                        ForEachTuple(Domains, [&] (const vector<u32>& Indices) -> void
                                     {
                                         vector<Z3Expr> Args;
                                         for (u32 i = 0; i < Indices.size(); ++i) {
                                             Args.push_back((*Domains[i])[Indices[i]]);
                                         }
                                         auto Value = TheModel.Evaluate(Decl.Apply(Args));
                                         if (FindElement(ResultUniverse, Value) < 0 &&
                                             FindElement(NewElements, Value) < 0) {
                                             NewElements.push_back(Value);
                                         }
                                     });
                        if (NewElements.size() > 0) {
                            ResultUniverse.insert(ResultUniverse.end(), NewElements.begin(),
                                                  NewElements.end());
                            Changed = true;
                        }
                    }
                }
            }
            return Universes;
        }

        Trace Translator::ReadModel(const Z3Model& TheModel) const
        {
            Trace Retval;
            auto Universes = GetClosedUniverses(TheModel);

            map<string, vector<string>> ElementNames;
            for (auto const& Sort : Prog->GetSorts()) {
                auto const& SortName = Sort->GetName();
                vector<string> Names;
                for (u32 i = 0; i < Universes[SortName].size(); ++i) {
                    Names.push_back(SortName + to_string(i));
                }
                ElementNames[SortName] = Names;
                Retval.AddUniverse(SortName, Names);
            }

            auto ReadSymbol = [&] (const SymbolDecl& Symbol, u32 KeyIndex) -> InterpretationT
                {
                    InterpretationT Interp(Symbol.GetName(), Symbol.GetKind());
                    auto const& Decl = GetDecl(Symbol, KeyIndex);
                    vector<const vector<Z3Expr>*> Domains;
                    for (auto const& ArgSort : Symbol.GetArgSorts()) {
                        Domains.push_back(&(Universes[ArgSort]));
                    }

                    ForEachTuple(Domains, [&] (const vector<u32>& Indices) -> void
                                 {
                                     vector<Z3Expr> Args;
                                     TupleT ArgNames;
                                     for (u32 i = 0; i < Indices.size(); ++i) {
                                         Args.push_back((*Domains[i])[Indices[i]]);
                                         ArgNames.push_back(ElementNames[Symbol.GetArgSorts()[i]]
                                                            [Indices[i]]);
                                     }
                                     auto App = Decl.Apply(Args);
                                     string Value;
                                     if (Symbol.IsRelation()) {
                                         Value = (TheModel.EvaluateBool(App) ? "true" : "false");
                                     } else {
                                         auto const& ResultSort = Symbol.GetResultSort();
                                         auto Index = FindElement(Universes[ResultSort],
                                                                  TheModel.Evaluate(App));
                                         if (Index < 0) {
                                             FOPDR_INTERNAL_ERROR((string)"Value of " +
                                                                  App.ToString() + " is not " +
                                                                  "in the universe of " +
                                                                  ResultSort);
                                         }
                                         Value = ElementNames[ResultSort][Index];
                                     }
                                     Interp.Entries.push_back(make_pair(ArgNames, Value));
                                 });
                    return Interp;
                };

            for (auto const& Symbol : Prog->GetSymbols()) {
                if (!Symbol->IsMutable()) {
                    Retval.AddImmutable(ReadSymbol(*Symbol, 0));
                }
            }
            for (u32 KeyIndex = 0; KeyIndex < Keys.size(); ++KeyIndex) {
                auto StateIndex = Retval.AddState();
                for (auto const& Symbol : Prog->GetSymbols()) {
                    if (Symbol->IsMutable()) {
                        Retval.AddMutable(StateIndex, ReadSymbol(*Symbol, KeyIndex));
                    }
                }
            }
            return Retval;
        }

        SolverSession::SolverSession(const Model::ProgramRef& Prog,
                                     const TP::TPOptionsT& Options,
                                     const string& KeyPrefix)
            : Prog(Prog), Prover(new TP::Z3TheoremProver(Options)), KeyPrefix(KeyPrefix)
        {
            if (!Prog->IsValidated()) {
                FOPDR_INTERNAL_ERROR("Solver session created for a program that was not validated");
            }
            // Axioms only mention immutable symbols, so they hold at the
            // base level for every query
            auto const& Trans = GetTranslator(MakeStepKeys(1));
            for (auto const& Axiom : Trans.TranslateAxioms()) {
                Prover->Assert(Axiom);
            }
        }

        SolverSession::~SolverSession()
        {
            // Nothing here
        }

        const Translator& SolverSession::GetTranslator(const vector<string>& Keys)
        {
            auto it = Translators.find(Keys);
            if (it != Translators.end()) {
                return *(it->second);
            }
            TranslatorRef Trans = new Translator(Prog, Prover->GetCtx(), Keys, KeyPrefix);
            Translators[Keys] = Trans;
            return *Trans;
        }

        TP::Z3Model SolverSession::GetMinimalModel(const Translator& Trans,
                                                   const vector<Z3Expr>& Assumptions,
                                                   const string& QueryDescription)
        {
            Z3Model Current = Prover->GetModel();
            if (!Prover->GetOptions().MinimizeModels) {
                return Current;
            }

            TP::ScopedQuery Bounds(Prover);
            for (auto const& Sort : Prog->GetSorts()) {
                auto const& SortName = Sort->GetName();
                const u32 Size = (u32)Current.GetUniverse(Trans.GetSort(SortName)).size();
                if (Size == 0) {
                    continue;
                }

                u32 Bound = Size;
                for (u32 Smaller = 1; Smaller < Size; ++Smaller) {
                    TP::ScopedQuery Trial(Prover);
                    Prover->Assert(Trans.MakeCardinalityBound(SortName, Smaller));
                    auto Description = QueryDescription + ", at most " + to_string(Smaller) +
                        " elements of sort " + SortName;
                    TPResult Res = TPResult::UNKNOWN;
                    try {
                        Res = Prover->CheckSatWithAssumptions(Assumptions, Description);
                    } catch (const TP::QueryInconclusiveError& Ex) {
                        if (Ex.WasInterrupted()) {
                            throw;
                        }
                        // Keep the larger universe
                        FOPDR_LOG_SHORT("TheoremProver.Queries",
                                        Out_ << "Not minimizing sort " << SortName << ": "
                                             << Ex.what() << endl;
                                        );
                        break;
                    }
                    if (Res == TPResult::SATISFIABLE) {
                        Current = Prover->GetModel();
                        Bound = Smaller;
                        break;
                    }
                }

                FOPDR_LOG_SHORT("TheoremProver.Queries",
                                Out_ << "Universe of sort " << SortName << " in the model of "
                                     << QueryDescription << ": " << Bound << " of " << Size
                                     << " elements" << endl;
                                );
                Prover->Assert(Trans.MakeCardinalityBound(SortName, Bound));
            }
            return Current;
        }

        const TP::Z3TPRef& SolverSession::GetTP() const
        {
            return Prover;
        }

        const Model::ProgramRef& SolverSession::GetProgram() const
        {
            return Prog;
        }

        const string& SolverSession::GetKeyPrefix() const
        {
            return KeyPrefix;
        }

        u64 SolverSession::GetNumQueries() const
        {
            return Prover->GetStats().NumQueries;
        }

        u32 SolverSession::GetNumTranslators() const
        {
            return (u32)Translators.size();
        }

        QueryScope::QueryScope(SolverSession& Session, const Translator& Trans)
            : Scope(Session.GetTP())
        {
            for (u32 KeyIndex = 0; KeyIndex < Trans.GetNumKeys(); ++KeyIndex) {
                for (auto const& Definition : Trans.TranslateDerivedDefinitions(KeyIndex)) {
                    Session.GetTP()->Assert(Definition);
                }
            }
        }

        QueryScope::~QueryScope()
        {
            // Nothing here
        }

    } /* end namespace Translate */
} /* end namespace FOPDR */

//
// StateTranslator.cpp ends here
