// Trace.hpp --- 
// 
// Filename: Trace.hpp
// Author: FOPDR developers
// Created: Tue Aug 18 22:33:27 2026 (-0400)
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

#if !defined FOPDR_TRANSLATE_TRACE_HPP_
#define FOPDR_TRANSLATE_TRACE_HPP_

#include <boost/property_tree/ptree.hpp>

#include "../model/Program.hpp"

namespace FOPDR {
    namespace Translate {

        typedef vector<string> TupleT;

        // The interpretation of one symbol in one state. Relations map
        // tuples to "true" or "false", constants have a single entry
        // with an empty tuple.
        class InterpretationT
        {
        public:
            string Symbol;
            Model::SymbolKindT Kind;
            vector<pair<TupleT, string>> Entries;

            inline InterpretationT() : Kind(Model::SymbolKindT::Relation) {}
            inline InterpretationT(const string& Symbol, Model::SymbolKindT Kind)
                : Symbol(Symbol), Kind(Kind) {}

            // Returns false if the tuple has no entry
            bool Lookup(const TupleT& Args, string& Value) const;
        };

        typedef vector<InterpretationT> StateT;

        // A counterexample (or any model read back from the solver):
        // the universes, the immutable symbols once, the mutable
        // symbols per step, and the transitions taken between steps.
        class Trace : public Stringifiable
        {
        private:
            vector<pair<string, vector<string>>> Universes;
            StateT Immutable;
            vector<StateT> States;
            vector<string> Transitions;

            static boost::property_tree::ptree StateToPropertyTree(const StateT& State);
            static void PrintState(ostream& Out, const StateT& State);

        public:
            Trace();
            virtual ~Trace();

            void AddUniverse(const string& Sort, const vector<string>& Elements);
            void AddImmutable(const InterpretationT& Interpretation);
            // Appends an empty state, returns its index
            u32 AddState();
            void AddMutable(u32 StateIndex, const InterpretationT& Interpretation);
            void SetTransition(u32 StepIndex, const string& TransitionName);

            const vector<pair<string, vector<string>>>& GetUniverses() const;
            const vector<string>& GetUniverse(const string& Sort) const;
            const StateT& GetImmutable() const;
            const StateT& GetState(u32 StateIndex) const;
            u32 GetNumStates() const;
            const vector<string>& GetTransitions() const;

            // Value of a symbol application in a state, looking in the
            // immutable interpretations first. Throws InternalError if
            // the symbol or tuple is not interpreted.
            string Evaluate(const string& Symbol, const TupleT& Args, u32 StateIndex) const;

            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;

            // { "universes": [...], "immutable": {...}, "mutable": [...],
            //   "transitions": [...] }
            boost::property_tree::ptree ToPropertyTree() const;
        };

    } /* end namespace Translate */
} /* end namespace FOPDR */

#endif /* FOPDR_TRANSLATE_TRACE_HPP_ */

//
// Trace.hpp ends here
