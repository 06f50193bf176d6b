// BoundedChecker.hpp --- 
// 
// Filename: BoundedChecker.hpp
// Author: FOPDR developers
// Created: Thu Aug 13 10:29:18 2026 (-0400)
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

#if !defined FOPDR_TRANSLATE_BOUNDED_CHECKER_HPP_
#define FOPDR_TRANSLATE_BOUNDED_CHECKER_HPP_

#include "StateTranslator.hpp"

namespace FOPDR {
    namespace Translate {

        // Bounded unrolling of the transition relation from the initial
        // states. Every query runs in its own scope of the session.
        class BoundedChecker
        {
        private:
            SolverSession& Session;

        public:
            BoundedChecker(SolverSession& Session);
            ~BoundedChecker();

            // Looks for a trace of StepConstraints.size() states that
            // starts in an initial state, where state i satisfies
            // StepConstraints[i] (null for no constraint), and step i
            // takes transition TransitionNames[i] ("" for any transition
            // or a stutter step). Returns true and fills Result, with
            // the transitions taken, if there is one.
            bool CheckTrace(const Model::ExpVecT& StepConstraints,
                            const vector<string>& TransitionNames,
                            Trace& Result, const string& QueryDescription = "trace");

            // Is there a state reachable in at most Depth steps that
            // violates Property? The trace ends in the violating state.
            bool CheckBMC(const Model::ExpT& Property, u32 Depth, Trace& Result);
        };

    } /* end namespace Translate */
} /* end namespace FOPDR */

#endif /* FOPDR_TRANSLATE_BOUNDED_CHECKER_HPP_ */

//
// BoundedChecker.hpp ends here
