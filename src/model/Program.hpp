// Program.hpp --- 
// 
// Filename: Program.hpp
// Author: FOPDR developers
// Created: Sat Aug 01 13:23:41 2026 (-0400)
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

#if !defined FOPDR_MODEL_PROGRAM_HPP_
#define FOPDR_MODEL_PROGRAM_HPP_

#include <map>
#include <set>

#include "Formulas.hpp"

namespace FOPDR {
    namespace Model {

        // Name of the sort of formulas. Cannot be declared by programs.
        extern const string BoolSortName;

        class SortDecl : public RefCountable
        {
        private:
            string Name;

        public:
            SortDecl(const string& Name);
            virtual ~SortDecl();

            inline const string& GetName() const { return Name; }
        };

        enum class SymbolKindT {
            Relation, Constant, Function
        };

        class SymbolDecl : public RefCountable, public Stringifiable
        {
        private:
            string Name;
            SymbolKindT Kind;
            vector<string> ArgSorts;
            string ResultSort;
            bool Mutable;
            // Defining axiom of a derived relation, null otherwise
            ExpT Definition;

        public:
            SymbolDecl(const string& Name, SymbolKindT Kind,
                       const vector<string>& ArgSorts, const string& ResultSort,
                       bool Mutable, const ExpT& Definition);
            virtual ~SymbolDecl();

            inline const string& GetName() const { return Name; }
            inline SymbolKindT GetKind() const { return Kind; }
            inline bool IsRelation() const { return Kind == SymbolKindT::Relation; }
            inline bool IsConstant() const { return Kind == SymbolKindT::Constant; }
            inline bool IsFunction() const { return Kind == SymbolKindT::Function; }
            inline const vector<string>& GetArgSorts() const { return ArgSorts; }
            inline u32 GetArity() const { return (u32)ArgSorts.size(); }
            inline const string& GetResultSort() const { return ResultSort; }
            inline bool IsMutable() const { return Mutable; }
            inline bool IsDerived() const { return Definition != ExpT::NullPtr; }
            inline const ExpT& GetDefinition() const { return Definition; }

            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;
        };

        class TransitionDecl : public RefCountable, public Stringifiable
        {
        private:
            string Name;
            VarDeclVecT Params;
            set<string> Mods;
            ExpT Body;

        public:
            TransitionDecl(const string& Name, const VarDeclVecT& Params,
                           const set<string>& Mods, const ExpT& Body);
            virtual ~TransitionDecl();

            inline const string& GetName() const { return Name; }
            inline const VarDeclVecT& GetParams() const { return Params; }
            inline const set<string>& GetMods() const { return Mods; }
            inline bool Modifies(const string& SymbolName) const
            {
                return (Mods.find(SymbolName) != Mods.end());
            }
            inline const ExpT& GetBody() const { return Body; }

            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;
        };

        class NamedFormulaT
        {
        public:
            string Name;
            ExpT Formula;

            inline NamedFormulaT() {}
            inline NamedFormulaT(const string& Name, const ExpT& Formula)
                : Name(Name), Formula(Formula) {}
        };

        class InvariantDecl : public NamedFormulaT
        {
        public:
            bool IsSafety;

            inline InvariantDecl() : IsSafety(false) {}
            inline InvariantDecl(const string& Name, const ExpT& Formula, bool IsSafety)
                : NamedFormulaT(Name, Formula), IsSafety(IsSafety) {}
        };

        class TheoremDecl : public NamedFormulaT
        {
        public:
            bool IsTwoState;

            inline TheoremDecl() : IsTwoState(false) {}
            inline TheoremDecl(const string& Name, const ExpT& Formula, bool IsTwoState)
                : NamedFormulaT(Name, Formula), IsTwoState(IsTwoState) {}
        };

        // Where a formula occurs, which decides what it may reference
        enum class FormulaContextT {
            SingleState,
            TwoState,
            ImmutableOnly
        };

        // The program model: vocabulary and formulas. Built once, by the
        // reader or through the Add* methods, validated, and thereafter
        // only read. Components receive it as a const reference.
        class Program : public RefCountable, public Stringifiable
        {
        private:
            vector<SortRef> Sorts;
            vector<SymbolRef> Symbols;
            vector<TransitionRef> Transitions;
            vector<NamedFormulaT> Axioms;
            vector<NamedFormulaT> Inits;
            vector<InvariantDecl> Invariants;
            vector<TheoremDecl> Theorems;

            map<string, SortRef> SortMap;
            map<string, SymbolRef> SymbolMap;
            map<string, TransitionRef> TransitionMap;
            set<string> FormulaNames;
            bool Validated;

            void CheckSymbolName(const string& Name) const;
            void CheckFormulaName(const string& Name);
            string InferSort(const ExpT& Exp, FormulaContextT Context,
                             map<string, string>& Scope, bool UnderNew) const;
            void CheckSortName(const string& Name, const string& Where) const;

        public:
            Program();
            virtual ~Program();

            void AddSort(const string& Name);
            void AddRelation(const string& Name, const vector<string>& ArgSorts,
                             bool Mutable, const ExpT& Definition = ExpT::NullPtr);
            void AddConstant(const string& Name, const string& Sort, bool Mutable);
            void AddFunction(const string& Name, const vector<string>& ArgSorts,
                             const string& ResultSort, bool Mutable);
            void AddAxiom(const string& Name, const ExpT& Formula);
            void AddInit(const string& Name, const ExpT& Formula);
            void AddTransition(const string& Name, const VarDeclVecT& Params,
                               const set<string>& Mods, const ExpT& Body);
            void AddInvariant(const string& Name, const ExpT& Formula, bool IsSafety);
            void AddTheorem(const string& Name, const ExpT& Formula, bool IsTwoState);

            // Throws FOPDRError describing the first violation found
            void Validate();
            inline bool IsValidated() const { return Validated; }

            // Checks a formula against this vocabulary, throws FOPDRError
            void CheckFormula(const ExpT& Exp, FormulaContextT Context) const;

            const SortRef& LookupSort(const string& Name) const;
            const SymbolRef& LookupSymbol(const string& Name) const;
            const TransitionRef& LookupTransition(const string& Name) const;

            inline const vector<SortRef>& GetSorts() const { return Sorts; }
            inline const vector<SymbolRef>& GetSymbols() const { return Symbols; }
            inline const vector<TransitionRef>& GetTransitions() const { return Transitions; }
            inline const vector<NamedFormulaT>& GetAxioms() const { return Axioms; }
            inline const vector<NamedFormulaT>& GetInits() const { return Inits; }
            inline const vector<InvariantDecl>& GetInvariants() const { return Invariants; }
            inline const vector<TheoremDecl>& GetTheorems() const { return Theorems; }

            vector<InvariantDecl> GetSafeties() const;
            // Conjunction of the safety invariants, optionally only the
            // one with the given name
            ExpT GetSafetyFormula(const string& OnlyName = "") const;
            ExpT GetInitFormula() const;

            // Hash of the printed program; identifies a program across runs
            u64 GetFingerprint() const;

            // Prints the program in the s-expression interchange syntax
            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;
        };

        typedef CSmartPtr<Program> ProgramRef;

    } /* end namespace Model */
} /* end namespace FOPDR */

#endif /* FOPDR_MODEL_PROGRAM_HPP_ */

//
// Program.hpp ends here
