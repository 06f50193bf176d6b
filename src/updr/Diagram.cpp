// Diagram.cpp --- 
// 
// Filename: Diagram.cpp
// Author: FOPDR developers
// Created: Thu Aug 27 20:28:27 2026 (-0400)
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

#include "Diagram.hpp"

namespace FOPDR {
    namespace UPDR {

        using Model::ExprKind;
        using Model::SymbolRef;
        using Translate::InterpretationT;

        string ConjunctKindToString(ConjunctKindT Kind)
        {
            switch (Kind) {
            case ConjunctKindT::Distinct:
                return "distinct";
            case ConjunctKindT::Relation:
                return "relation";
            case ConjunctKindT::Constant:
                return "constant";
            case ConjunctKindT::Function:
                return "function";
            }
            return "unknown";
        }

        ExpT NegateLiteral(const ExpT& Literal)
        {
            switch (Literal->GetKind()) {
            case ExprKind::Not:
                return Literal->GetChild(0);
            case ExprKind::Eq:
                return Model::MkNeq(Literal->GetChild(0), Literal->GetChild(1));
            case ExprKind::Neq:
                return Model::MkEq(Literal->GetChild(0), Literal->GetChild(1));
            case ExprKind::Bool:
                return Model::MkBool(!Literal->GetBoolValue());
            default:
                return Model::MkNot(Literal);
            }
        }

        Diagram::Diagram()
        {
            // Nothing here
        }

        Diagram::Diagram(const VarDeclVecT& Vars, const vector<DiagramConjunctT>& Conjuncts)
            : Vars(Vars), Conjuncts(Conjuncts)
        {
            // Nothing here
        }

        Diagram::~Diagram()
        {
            // Nothing here
        }

        // Variable names must not capture symbols of the program
        static inline string MakeVarName(const Model::Program& Prog, const string& SortName,
                                         u32 Index)
        {
            string Retval = "V_" + SortName + "_" + to_string(Index);
            while (Prog.LookupSymbol(Retval) != SymbolRef::NullPtr ||
                   Prog.LookupSort(Retval) != Model::SortRef::NullPtr) {
                Retval += "_";
            }
            return Retval;
        }

        Diagram Diagram::FromTrace(const Model::Program& Prog, const Translate::Trace& TheTrace,
                                   u32 StateIndex, bool Simplify)
        {
            VarDeclVecT Vars;
            vector<DiagramConjunctT> Conjuncts;
            // element name -> variable
            map<string, ExpT> ElementVars;

            for (auto const& Universe : TheTrace.GetUniverses()) {
                auto const& SortName = Universe.first;
                auto const& Elements = Universe.second;
                vector<ExpT> SortVars;
                for (u32 i = 0; i < Elements.size(); ++i) {
                    auto VarName = MakeVarName(Prog, SortName, i);
                    Vars.push_back(VarDeclT(VarName, SortName));
                    auto VarExp = Model::MkId(VarName);
                    ElementVars[Elements[i]] = VarExp;
                    SortVars.push_back(VarExp);
                }
                for (u32 i = 0; i < SortVars.size(); ++i) {
                    for (u32 j = i + 1; j < SortVars.size(); ++j) {
                        Conjuncts.push_back(DiagramConjunctT(Model::MkNeq(SortVars[i], SortVars[j]),
                                                             ConjunctKindT::Distinct));
                    }
                }
            }

            auto VarOf = [&] (const string& Element) -> const ExpT&
                {
                    auto it = ElementVars.find(Element);
                    if (it == ElementVars.end()) {
                        FOPDR_INTERNAL_ERROR((string)"Element " + Element +
                                             " is not in any universe of the trace");
                    }
                    return it->second;
                };

            auto AddInterpretation = [&] (const InterpretationT& Interp) -> void
                {
                    auto const& Symbol = Prog.LookupSymbol(Interp.Symbol);
                    if (Symbol == SymbolRef::NullPtr) {
                        FOPDR_INTERNAL_ERROR((string)"Trace interprets unknown symbol " +
                                             Interp.Symbol);
                    }
                    if (Symbol->IsDerived()) {
                        return;
                    }
                    for (auto const& Entry : Interp.Entries) {
                        ExpVecT Args;
                        for (auto const& Element : Entry.first) {
                            Args.push_back(VarOf(Element));
                        }
                        auto App = Model::MkApp(Interp.Symbol, Args);
                        switch (Symbol->GetKind()) {
                        case Model::SymbolKindT::Relation:
                            Conjuncts.push_back(DiagramConjunctT(Entry.second == "true" ?
                                                                 App : Model::MkNot(App),
                                                                 ConjunctKindT::Relation));
                            break;
                        case Model::SymbolKindT::Constant:
                            Conjuncts.push_back(DiagramConjunctT(Model::MkEq(App,
                                                                             VarOf(Entry.second)),
                                                                 ConjunctKindT::Constant));
                            break;
                        case Model::SymbolKindT::Function:
                            Conjuncts.push_back(DiagramConjunctT(Model::MkEq(App,
                                                                             VarOf(Entry.second)),
                                                                 ConjunctKindT::Function));
                            break;
                        }
                    }
                };

            for (auto const& Interp : TheTrace.GetImmutable()) {
                AddInterpretation(Interp);
            }
            for (auto const& Interp : TheTrace.GetState(StateIndex)) {
                AddInterpretation(Interp);
            }

            Diagram Retval(Vars, Conjuncts);
            if (Simplify) {
                Retval.SimplifyConstants();
            }

            FOPDR_LOG_FULL("Diagram.Extraction",
                           Out_ << "Diagram of state " << StateIndex << ":" << endl
                                << Retval.ToString() << endl;
                           );
            return Retval;
        }

        void Diagram::SimplifyConstants()
        {
            map<string, ExpT> Subst;
            for (auto const& Conjunct : Conjuncts) {
                if (Conjunct.Kind != ConjunctKindT::Constant || !Conjunct.Enabled) {
                    continue;
                }
                auto const& Constant = Conjunct.Formula->GetChild(0);
                auto const& VarName = Conjunct.Formula->GetChild(1)->GetName();
                if (Subst.find(VarName) == Subst.end()) {
                    Subst[VarName] = Constant;
                }
            }
            if (Subst.size() == 0) {
                return;
            }

            vector<DiagramConjunctT> NewConjuncts;
            for (auto const& Conjunct : Conjuncts) {
                auto NewFormula = Model::Substitute(Conjunct.Formula, Subst);
                if (NewFormula->Is(ExprKind::Eq) &&
                    NewFormula->GetChild(0)->Equals(*(NewFormula->GetChild(1)))) {
                    continue;
                }
                NewConjuncts.push_back(DiagramConjunctT(NewFormula, Conjunct.Kind,
                                                        Conjunct.Enabled));
            }

            VarDeclVecT NewVars;
            for (auto const& Var : Vars) {
                if (Subst.find(Var.Name) == Subst.end()) {
                    NewVars.push_back(Var);
                }
            }
            Vars = NewVars;
            Conjuncts = NewConjuncts;
        }

        const VarDeclVecT& Diagram::GetVars() const
        {
            return Vars;
        }

        const vector<DiagramConjunctT>& Diagram::GetConjuncts() const
        {
            return Conjuncts;
        }

        u32 Diagram::GetNumConjuncts() const
        {
            return (u32)Conjuncts.size();
        }

        u32 Diagram::GetNumEnabled() const
        {
            u32 Retval = 0;
            for (auto const& Conjunct : Conjuncts) {
                if (Conjunct.Enabled) {
                    ++Retval;
                }
            }
            return Retval;
        }

        bool Diagram::IsEnabled(u32 Index) const
        {
            return Conjuncts[Index].Enabled;
        }

        void Diagram::SetEnabled(u32 Index, bool Enabled)
        {
            if (Index >= Conjuncts.size()) {
                FOPDR_INTERNAL_ERROR((string)"Conjunct index " + to_string(Index) +
                                     " out of range in diagram with " +
                                     to_string(Conjuncts.size()) + " conjuncts");
            }
            Conjuncts[Index].Enabled = Enabled;
        }

        void Diagram::EnableAll()
        {
            for (auto& Conjunct : Conjuncts) {
                Conjunct.Enabled = true;
            }
        }

        const ExpT& Diagram::GetConjunct(u32 Index) const
        {
            return Conjuncts[Index].Formula;
        }

        VarDeclVecT Diagram::GetUsedVars() const
        {
            set<string> Names;
            for (auto const& Conjunct : Conjuncts) {
                if (Conjunct.Enabled) {
                    Model::GatherFreeNames(Conjunct.Formula, Names);
                }
            }
            VarDeclVecT Retval;
            for (auto const& Var : Vars) {
                if (Names.find(Var.Name) != Names.end()) {
                    Retval.push_back(Var);
                }
            }
            return Retval;
        }

        ExpT Diagram::GetMatrix() const
        {
            ExpVecT Enabled;
            for (auto const& Conjunct : Conjuncts) {
                if (Conjunct.Enabled) {
                    Enabled.push_back(Conjunct.Formula);
                }
            }
            return Model::MkAnd(Enabled);
        }

        ExpT Diagram::ToFormula() const
        {
            return Model::MkExists(GetUsedVars(), GetMatrix());
        }

        ExpT Diagram::ToPredicate() const
        {
            ExpVecT Disjuncts;
            for (auto const& Conjunct : Conjuncts) {
                if (Conjunct.Enabled) {
                    Disjuncts.push_back(NegateLiteral(Conjunct.Formula));
                }
            }
            return Model::MkForall(GetUsedVars(), Model::MkOr(Disjuncts));
        }

        string Diagram::ToString(u32 Verbosity) const
        {
            ostringstream sstr;
            sstr << "exists";
            for (auto const& Var : Vars) {
                sstr << " " << Var.Name << ":" << Var.Sort;
            }
            sstr << "." << endl;
            for (u32 i = 0; i < Conjuncts.size(); ++i) {
                if (!Conjuncts[i].Enabled && Verbosity == 0) {
                    continue;
                }
                sstr << "    " << (Conjuncts[i].Enabled ? "" : "[off] ")
                     << Conjuncts[i].Formula->ToString() << endl;
            }
            return sstr.str();
        }

    } /* end namespace UPDR */
} /* end namespace FOPDR */

//
// Diagram.cpp ends here
