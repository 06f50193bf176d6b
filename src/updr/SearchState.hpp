// SearchState.hpp --- 
// 
// Filename: SearchState.hpp
// Author: FOPDR developers
// Created: Sun Sep 06 10:21:58 2026 (-0400)
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

#if !defined FOPDR_UPDR_SEARCH_STATE_HPP_
#define FOPDR_UPDR_SEARCH_STATE_HPP_

#include "Diagram.hpp"

namespace FOPDR {
    namespace UPDR {

        // A bad state to be shown unreachable within FrameIndex steps
        class Obligation
        {
        public:
            u32 FrameIndex;
            Diagram Diag;
            // Transition from this state to the state of the parent
            string TransitionName;
            // Position of the parent on the obligation stack, -1 for a root
            i32 Parent;
            // Rooted in a failed push rather than in a safety violation;
            // reaching frame 0 does not disprove anything
            bool May;

            inline Obligation()
                : FrameIndex(0), Parent(-1), May(false) {}
            inline Obligation(u32 FrameIndex, const Diagram& Diag,
                              const string& TransitionName, i32 Parent, bool May)
                : FrameIndex(FrameIndex), Diag(Diag), TransitionName(TransitionName),
                  Parent(Parent), May(May) {}
        };

        // Everything the search needs to resume: the unit of checkpoints
        class SearchState
        {
        public:
            // Predicates of every frame, frame 0 first. The initial
            // condition is implicit in frame 0.
            vector<ExpVecT> Frames;
            // Distinct learned predicates in the order they were learned
            ExpVecT PredicateLog;
            // Blocked states, duplicates included
            u64 NumLearnedStates;
            u64 NumDistinctPredicates;
            u64 NumIterations;
            // Pending obligations, bottom of the stack first
            vector<Obligation> Obligations;

            inline SearchState()
                : NumLearnedStates(0), NumDistinctPredicates(0), NumIterations(0) {}
        };

    } /* end namespace UPDR */
} /* end namespace FOPDR */

#endif /* FOPDR_UPDR_SEARCH_STATE_HPP_ */

//
// SearchState.hpp ends here
