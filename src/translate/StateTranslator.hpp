// StateTranslator.hpp --- 
// 
// Filename: StateTranslator.hpp
// Author: FOPDR developers
// Created: Sun Aug 16 15:06:34 2026 (-0400)
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

#if !defined FOPDR_TRANSLATE_STATE_TRANSLATOR_HPP_
#define FOPDR_TRANSLATE_STATE_TRANSLATOR_HPP_

#include <map>

#include "../model/Program.hpp"
#include "../tpinterface/TheoremProver.hpp"

#include "Trace.hpp"

namespace FOPDR {
    namespace Translate {

        using TP::Z3Expr;
        using TP::Z3Sort;
        using TP::Z3FuncDecl;
        using TP::Z3Model;

        typedef map<string, Z3Expr> VarScopeT;

        // Name recorded in traces for a step that changes nothing
        extern const string StutterTransitionName;

        // The empty conjunction is true, the empty disjunction false
        extern Z3Expr MkZ3And(const TP::Z3Ctx& Ctx, const vector<Z3Expr>& Conjuncts);
        extern Z3Expr MkZ3Or(const TP::Z3Ctx& Ctx, const vector<Z3Expr>& Disjuncts);
        extern Z3Expr MkZ3Implies(const TP::Z3Ctx& Ctx, const Z3Expr& Antecedent,
                                  const Z3Expr& Consequent);

        // Keys "s0" .. "s<NumStates - 1>", used for every query over
        // consecutive states (one state, one step, or an unrolling)
        extern vector<string> MakeStepKeys(u32 NumStates);

        // Lowers formulas over the program vocabulary into Z3 terms for
        // an ordered list of epoch keys. State index 0 is the first key
        // and every "new" advances one key. Immutable symbols and sorts
        // are the same Z3 objects for every key; a mutable symbol S at
        // key K is the Z3 symbol "<prefix>K_S".
        class Translator : public RefCountable
        {
        private:
            Model::ProgramRef Prog;
            TP::Z3Ctx Ctx;
            vector<string> Keys;
            string KeyPrefix;

            mutable map<string, Z3Sort> SortMap;
            mutable map<pair<string, u32>, Z3FuncDecl> DeclMap;

            Z3Expr Lower(const Model::ExpT& Exp, u32 KeyIndex, const VarScopeT& Scope) const;
            Z3Expr LowerQuantifier(const Model::ExpT& Exp, u32 KeyIndex,
                                   const VarScopeT& Scope) const;
            void CheckKeyIndex(u32 KeyIndex) const;

        public:
            Translator(const Model::ProgramRef& Prog, const TP::Z3Ctx& Ctx,
                       const vector<string>& Keys, const string& KeyPrefix);
            virtual ~Translator();

            const vector<string>& GetKeys() const;
            u32 GetNumKeys() const;
            const Model::ProgramRef& GetProgram() const;
            const TP::Z3Ctx& GetCtx() const;

            const Z3Sort& GetSort(const string& SortName) const;
            string GetZ3Name(const Model::SymbolDecl& Symbol, u32 KeyIndex) const;
            const Z3FuncDecl& GetDecl(const Model::SymbolDecl& Symbol, u32 KeyIndex) const;

            // A fresh Z3 constant of the given sort, used to skolemize
            // existentially bound variables
            Z3Expr MakeFreshConstant(const string& Name, const string& SortName) const;
            // Sort has at most Size elements
            Z3Expr MakeCardinalityBound(const string& SortName, u32 Size) const;

            Z3Expr Translate(const Model::ExpT& Exp, u32 KeyIndex = 0) const;
            // Free variables in Exp are taken from FreeVars
            Z3Expr Translate(const Model::ExpT& Exp, u32 KeyIndex,
                             const VarScopeT& FreeVars) const;

            // Mutable symbols not in Mods keep their value from key
            // OldIndex to OldIndex + 1
            Z3Expr FrameCondition(const set<string>& Mods, u32 OldIndex) const;
            // The transition relation between OldIndex and OldIndex + 1,
            // frame condition included
            Z3Expr TranslateTransition(const Model::TransitionDecl& Transition,
                                       u32 OldIndex = 0) const;
            // Disjunction of all transitions, plus stuttering if asked
            Z3Expr TranslateAnyTransition(u32 OldIndex, bool AllowStutter) const;

            // Axioms over immutable symbols, including definitions of
            // immutable derived relations
            vector<Z3Expr> TranslateAxioms() const;
            // Definitions of mutable derived relations at one key
            vector<Z3Expr> TranslateDerivedDefinitions(u32 KeyIndex) const;

            // Reads the universes and the interpretation of every symbol
            // at every key into a trace
            Trace ReadModel(const Z3Model& TheModel) const;
            // Elements of each sort as named in traces read from Model,
            // closed under the constants and functions of every key
            map<string, vector<Z3Expr>> GetClosedUniverses(const Z3Model& TheModel) const;
        };

        typedef CSmartPtr<Translator> TranslatorRef;

        // Owns the theorem prover and the translators. One translator
        // is made for each combination of keys and cached.
        class SolverSession
        {
        private:
            Model::ProgramRef Prog;
            TP::Z3TPRef Prover;
            string KeyPrefix;
            map<vector<string>, TranslatorRef> Translators;

        public:
            SolverSession(const Model::ProgramRef& Prog,
                          const TP::TPOptionsT& Options = TP::TPOptionsT(),
                          const string& KeyPrefix = "");
            SolverSession(const SolverSession& Other) = delete;
            SolverSession& operator = (const SolverSession& Other) = delete;
            ~SolverSession();

            const Translator& GetTranslator(const vector<string>& Keys);
            // Model of the last satisfiable query, which was checked
            // under Assumptions. With MinimizeModels set, the universe of
            // each sort is in turn made as small as the query allows,
            // keeping the bounds found for the sorts before it.
            TP::Z3Model GetMinimalModel(const Translator& Trans,
                                        const vector<Z3Expr>& Assumptions,
                                        const string& QueryDescription);
            const TP::Z3TPRef& GetTP() const;
            const Model::ProgramRef& GetProgram() const;
            const string& GetKeyPrefix() const;
            u64 GetNumQueries() const;
            u32 GetNumTranslators() const;
        };

        // RAII bracket for one query over the keys of a translator.
        // Pushes a solver scope and asserts the derived relation
        // definitions for every key; everything is popped on exit.
        class QueryScope
        {
        private:
            TP::ScopedQuery Scope;

        public:
            QueryScope(SolverSession& Session, const Translator& Trans);
            QueryScope(const QueryScope& Other) = delete;
            ~QueryScope();
        };

    } /* end namespace Translate */
} /* end namespace FOPDR */

#endif /* FOPDR_TRANSLATE_STATE_TRANSLATOR_HPP_ */

//
// StateTranslator.hpp ends here
