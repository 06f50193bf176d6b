// Trace.cpp --- 
// 
// Filename: Trace.cpp
// Author: FOPDR developers
// Created: Tue Aug 18 03:22:22 2026 (-0400)
// 
// 
// Copyright (c) 2026, The FOPDR developers
// Copyright (c) 2013, Abhishek Udupa, University of Pennsylvania
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
//    This product includes software developed by The University of Pennsylvania
// 4. Neither the name of the University of Pennsylvania nor the
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

#include <boost/algorithm/string/join.hpp>

#include "Trace.hpp"

namespace FOPDR {
    namespace Translate {

        using boost::property_tree::ptree;
        using Model::SymbolKindT;

        bool InterpretationT::Lookup(const TupleT& Args, string& Value) const
        {
            for (auto const& Entry : Entries) {
                if (Entry.first == Args) {
                    Value = Entry.second;
                    return true;
                }
            }
            return false;
        }

        Trace::Trace()
        {
            // Nothing here
        }

        Trace::~Trace()
        {
            // Nothing here
        }

        void Trace::AddUniverse(const string& Sort, const vector<string>& Elements)
        {
            Universes.push_back(make_pair(Sort, Elements));
        }

        void Trace::AddImmutable(const InterpretationT& Interpretation)
        {
            Immutable.push_back(Interpretation);
        }

        u32 Trace::AddState()
        {
            States.push_back(StateT());
            return (u32)States.size() - 1;
        }

        void Trace::AddMutable(u32 StateIndex, const InterpretationT& Interpretation)
        {
            if (StateIndex >= States.size()) {
                FOPDR_INTERNAL_ERROR((string)"State index " + to_string(StateIndex) +
                                     " out of range in trace");
            }
            States[StateIndex].push_back(Interpretation);
        }

        void Trace::SetTransition(u32 StepIndex, const string& TransitionName)
        {
            if (Transitions.size() <= StepIndex) {
                Transitions.resize(StepIndex + 1);
            }
            Transitions[StepIndex] = TransitionName;
        }

        const vector<pair<string, vector<string>>>& Trace::GetUniverses() const
        {
            return Universes;
        }

        const vector<string>& Trace::GetUniverse(const string& Sort) const
        {
            for (auto const& Universe : Universes) {
                if (Universe.first == Sort) {
                    return Universe.second;
                }
            }
            FOPDR_INTERNAL_ERROR((string)"Sort " + Sort + " has no universe in trace");
        }

        const StateT& Trace::GetImmutable() const
        {
            return Immutable;
        }

        const StateT& Trace::GetState(u32 StateIndex) const
        {
            if (StateIndex >= States.size()) {
                FOPDR_INTERNAL_ERROR((string)"State index " + to_string(StateIndex) +
                                     " out of range in trace");
            }
            return States[StateIndex];
        }

        u32 Trace::GetNumStates() const
        {
            return (u32)States.size();
        }

        const vector<string>& Trace::GetTransitions() const
        {
            return Transitions;
        }

        string Trace::Evaluate(const string& Symbol, const TupleT& Args, u32 StateIndex) const
        {
            string Value;
            for (auto const& Interp : Immutable) {
                if (Interp.Symbol == Symbol && Interp.Lookup(Args, Value)) {
                    return Value;
                }
            }
            for (auto const& Interp : GetState(StateIndex)) {
                if (Interp.Symbol == Symbol && Interp.Lookup(Args, Value)) {
                    return Value;
                }
            }
            FOPDR_INTERNAL_ERROR((string)"No interpretation for " + Symbol + "(" +
                                 boost::algorithm::join(Args, ", ") + ") in state " +
                                 to_string(StateIndex));
        }

        void Trace::PrintState(ostream& Out, const StateT& State)
        {
            for (auto const& Interp : State) {
                for (auto const& Entry : Interp.Entries) {
                    string Application = Interp.Symbol;
                    if (Entry.first.size() > 0) {
                        Application += "(" + boost::algorithm::join(Entry.first, ", ") + ")";
                    }
                    if (Interp.Kind == SymbolKindT::Relation) {
                        Out << "    " << (Entry.second == "true" ? "" : "!")
                            << Application << endl;
                    } else {
                        Out << "    " << Application << " = " << Entry.second << endl;
                    }
                }
            }
        }

        string Trace::ToString(u32 Verbosity) const
        {
            ostringstream sstr;
            for (auto const& Universe : Universes) {
                sstr << "sort " << Universe.first << ": {"
                     << boost::algorithm::join(Universe.second, ", ") << "}" << endl;
            }
            if (Immutable.size() > 0) {
                sstr << "immutable:" << endl;
                PrintState(sstr, Immutable);
            }
            for (u32 i = 0; i < States.size(); ++i) {
                sstr << "state " << i << ":" << endl;
                PrintState(sstr, States[i]);
                if (i + 1 < States.size()) {
                    string TransitionName =
                        (i < Transitions.size() && Transitions[i] != "" ?
                         Transitions[i] : "<unknown>");
                    sstr << "  --> transition " << TransitionName << endl;
                }
            }
            return sstr.str();
        }

        ptree Trace::StateToPropertyTree(const StateT& State)
        {
            ptree Relations;
            ptree Constants;
            ptree Functions;

            for (auto const& Interp : State) {
                if (Interp.Kind == SymbolKindT::Constant) {
                    if (Interp.Entries.size() > 0) {
                        Constants.put(ptree::path_type(Interp.Symbol, '\0'),
                                      Interp.Entries[0].second);
                    }
                    continue;
                }
                ptree EntryList;
                for (auto const& Entry : Interp.Entries) {
                    ptree EntryTree;
                    ptree ArgList;
                    for (auto const& Arg : Entry.first) {
                        ptree ArgTree;
                        ArgTree.put_value(Arg);
                        ArgList.push_back(make_pair("", ArgTree));
                    }
                    EntryTree.add_child("args", ArgList);
                    EntryTree.put("value", Entry.second);
                    EntryList.push_back(make_pair("", EntryTree));
                }
                if (Interp.Kind == SymbolKindT::Relation) {
                    Relations.add_child(ptree::path_type(Interp.Symbol, '\0'), EntryList);
                } else {
                    Functions.add_child(ptree::path_type(Interp.Symbol, '\0'), EntryList);
                }
            }

            ptree Retval;
            Retval.add_child("relations", Relations);
            Retval.add_child("constants", Constants);
            Retval.add_child("functions", Functions);
            return Retval;
        }

        ptree Trace::ToPropertyTree() const
        {
            ptree Retval;

            ptree UniverseList;
            for (auto const& Universe : Universes) {
                ptree UniverseTree;
                UniverseTree.put("sort", Universe.first);
                ptree ElementList;
                for (auto const& Element : Universe.second) {
                    ptree ElementTree;
                    ElementTree.put_value(Element);
                    ElementList.push_back(make_pair("", ElementTree));
                }
                UniverseTree.add_child("elements", ElementList);
                UniverseList.push_back(make_pair("", UniverseTree));
            }
            Retval.add_child("universes", UniverseList);
            Retval.add_child("immutable", StateToPropertyTree(Immutable));

            ptree StateList;
            for (auto const& State : States) {
                StateList.push_back(make_pair("", StateToPropertyTree(State)));
            }
            Retval.add_child("mutable", StateList);

            ptree TransitionList;
            for (auto const& TransitionName : Transitions) {
                ptree TransitionTree;
                TransitionTree.put_value(TransitionName);
                TransitionList.push_back(make_pair("", TransitionTree));
            }
            Retval.add_child("transitions", TransitionList);
            return Retval;
        }

    } /* end namespace Translate */
} /* end namespace FOPDR */

//
// Trace.cpp ends here
