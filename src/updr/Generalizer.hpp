// Generalizer.hpp --- 
// 
// Filename: Generalizer.hpp
// Author: FOPDR developers
// Created: Fri Sep 04 21:16:39 2026 (-0400)
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

#if !defined FOPDR_UPDR_GENERALIZER_HPP_
#define FOPDR_UPDR_GENERALIZER_HPP_

#include "../translate/StateTranslator.hpp"

#include "Diagram.hpp"

namespace FOPDR {
    namespace UPDR {

        struct GeneralizerStatsT
        {
            u64 NumGeneralizations;
            u64 NumPredecessorQueries;
            u64 NumCoreDrops;
            u64 NumBruteForceDrops;
            u64 NumLiteralsIn;
            u64 NumLiteralsOut;

            inline GeneralizerStatsT()
                : NumGeneralizations(0), NumPredecessorQueries(0), NumCoreDrops(0),
                  NumBruteForceDrops(0), NumLiteralsIn(0), NumLiteralsOut(0)
            {
                // Nothing here
            }
        };

        // Relative induction checks against a frame, and minimization
        // of blocked diagrams into short clauses
        class Generalizer
        {
        private:
            Translate::SolverSession& Session;
            bool UseUnsatCores;
            GeneralizerStatsT Stats;

        public:
            Generalizer(Translate::SolverSession& Session, bool UseUnsatCores);
            ~Generalizer();

            // Does some state satisfying FrameFormula reach a state
            // satisfying the enabled part of Diag, by a transition or by
            // stuttering? Stuttering is tried first. When there is one,
            // TransitionName and Predecessor (the two states) are filled
            // if given. When there is none and Core is given, it gets
            // the indices of the conjuncts used by the refutations.
            bool HasPredecessor(const ExpT& FrameFormula, const Diagram& Diag,
                                const string& Context, string* TransitionName,
                                Translate::Trace* Predecessor, set<u32>* Core);

            // Drops conjuncts of a diagram that has no predecessor in
            // FrameFormula while it keeps having none. The result is
            // locally minimal: re-enabling is never needed, and no
            // single enabled conjunct can be dropped.
            Diagram Generalize(const Diagram& Diag, const ExpT& FrameFormula,
                               const string& Context);

            bool GetUseUnsatCores() const;
            const GeneralizerStatsT& GetStats() const;
        };

    } /* end namespace UPDR */
} /* end namespace FOPDR */

#endif /* FOPDR_UPDR_GENERALIZER_HPP_ */

//
// Generalizer.hpp ends here
