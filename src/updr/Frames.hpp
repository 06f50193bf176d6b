// Frames.hpp --- 
// 
// Filename: Frames.hpp
// Author: FOPDR developers
// Created: Wed Sep 02 15:13:53 2026 (-0400)
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

#if !defined FOPDR_UPDR_FRAMES_HPP_
#define FOPDR_UPDR_FRAMES_HPP_

#include <boost/property_tree/ptree.hpp>

#include "../translate/BoundedChecker.hpp"
#include "../translate/Verifier.hpp"

#include "Generalizer.hpp"
#include "SearchState.hpp"

namespace FOPDR {
    namespace UPDR {

        // Which bad states become root obligations first
        enum class ObligationOrderT {
            // one query against the conjunction of the safety properties
            DeepestFirst,
            // the safety properties one at a time, as declared
            DeclaredOrder
        };

        // Whether predicates of frame 0 are pushed to frame 1
        enum class PushFrameZeroT {
            IfTrivial, Always, Never
        };

        enum class SearchStatusT {
            Searching, Proved, Disproved, Interrupted
        };

        extern string SearchStatusToString(SearchStatusT Status);

        class UPDROptionsT
        {
        public:
            ObligationOrderT ObligationOrder;
            PushFrameZeroT PushFrameZero;
            bool BlockMayCexs;
            bool SmokeTest;
            bool AssertInductiveTrace;
            bool UseUnsatCores;
            bool SimplifyDiagram;
            // Replay a disproof to a concrete trace, otherwise report
            // the chain of diagrams
            bool ConcretizeCounterexample;
            // 0 for no limit
            u32 MaxIterations;
            // "" for all safety invariants
            string SafetyName;
            // Written at the end of every iteration and on interrupt,
            // "" for none
            string CheckpointFile;

            UPDROptionsT();
            UPDROptionsT(const UPDROptionsT& Other);
            UPDROptionsT& operator = (const UPDROptionsT& Other);
        };

        struct UPDRStatsT
        {
            u64 NumObligations;
            u64 NumMayObligations;
            u64 NumDiscardedMayChains;
            u64 NumBadStateQueries;
            u64 NumPushAttempts;
            u64 NumPushed;
            u64 NumSmokeTests;
            u64 NumSubsumed;

            inline UPDRStatsT()
                : NumObligations(0), NumMayObligations(0), NumDiscardedMayChains(0),
                  NumBadStateQueries(0), NumPushAttempts(0), NumPushed(0),
                  NumSmokeTests(0), NumSubsumed(0)
            {
                // Nothing here
            }
        };

        class SearchResult : public Stringifiable
        {
        public:
            SearchStatusT Status;
            string Message;
            // Proved: the predicates of the frame that reached the fixpoint
            ExpVecT Invariant;
            u32 FixpointFrame;
            // Disproved: a concrete trace if one could be built, else the
            // chain of diagrams from an initial state to a bad state
            bool ConcreteCounterexample;
            Translate::Trace Counterexample;
            vector<string> AbstractChain;
            vector<string> AbstractTransitions;
            u32 NumFrames;
            u64 NumQueries;

            SearchResult();
            virtual ~SearchResult();

            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;

            boost::property_tree::ptree ToPropertyTree() const;
        };

        // The frame manager: frames of predicates over-approximating
        // the states reachable within 0, 1, 2, ... steps, and the
        // search that strengthens them until two adjacent frames agree
        // or a bad state is traced back to an initial one.
        class Frames
        {
        private:
            Model::ProgramRef Prog;
            Translate::SolverSession& Session;
            UPDROptionsT Options;
            Generalizer Gen;
            Translate::BoundedChecker BMC;
            Translate::Verifier Checker;

            ExpT Safety;
            ExpVecT SafetyProperties;

            vector<ExpVecT> FrameSets;
            vector<Model::ExpSetT> FrameMembers;
            ExpVecT PredicateLog;
            Model::ExpSetT LoggedPredicates;
            u64 NumLearnedStates;
            u64 NumDistinctPredicates;
            u64 NumIterations;
            vector<Obligation> Stack;

            volatile bool InterruptRequested;
            UPDRStatsT Stats;

            void AddFrame();
            bool AddToFrame(const ExpT& Predicate, u32 FrameIndex);
            void LearnPredicate(const ExpT& Predicate, u32 FrameIndex);

            bool FindBadState(u32 FrameIndex, const ExpT& Property, Translate::Trace& Bad);
            // True if the search ended; Result is filled then
            bool BlockBadStates(SearchResult& Result);
            bool ProcessObligations(SearchResult& Result);
            void DiscardMayChain();
            void MakeCounterexample(SearchResult& Result);

            bool TryPush(const ExpT& Predicate, u32 FromIndex, Translate::Trace* Cex);
            void PushPredicates();
            i32 FindFixpoint() const;

            void SmokeTestPredicate(const ExpT& Predicate, u32 FrameIndex);
            void CheckInductiveTrace();
            void WriteCheckpoint() const;
            SearchResult& Finish(SearchResult& Result) const;

        public:
            Frames(const Model::ProgramRef& Prog, Translate::SolverSession& Session,
                   const UPDROptionsT& Options = UPDROptionsT());
            Frames(const Frames& Other) = delete;
            Frames& operator = (const Frames& Other) = delete;
            ~Frames();

            // Replaces the frames, counters and obligations
            void Restore(const SearchState& State);
            SearchState GetSearchState() const;

            // Runs until Proved, Disproved or Interrupted. Can be called
            // again after an interruption to resume, unless the interrupt
            // cut a running solver check short. Such a search resumes from
            // its checkpoint in a fresh session.
            SearchResult Search();
            // Safe to call from a signal or resource limit handler
            void Interrupt();

            // Removes from each frame the predicates subsumed by another
            // predicate of that frame, keeping frames monotone
            void Simplify();
            void PrintFrames(ostream& Out) const;

            u32 GetNumFrames() const;
            const ExpVecT& GetFrame(u32 FrameIndex) const;
            // Conjunction of a frame's predicates, with the initial
            // condition for frame 0
            ExpT GetFrameFormula(u32 FrameIndex) const;
            const ExpVecT& GetPredicateLog() const;
            const ExpT& GetSafety() const;
            u64 GetNumLearnedStates() const;
            u64 GetNumDistinctPredicates() const;
            const UPDROptionsT& GetOptions() const;
            const UPDRStatsT& GetStats() const;
            const GeneralizerStatsT& GetGeneralizerStats() const;
        };

    } /* end namespace UPDR */
} /* end namespace FOPDR */

#endif /* FOPDR_UPDR_FRAMES_HPP_ */

//
// Frames.hpp ends here
