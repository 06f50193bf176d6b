// TheoremProver.hpp --- 
// 
// Filename: TheoremProver.hpp
// Author: FOPDR developers
// Created: Fri Aug 07 00:52:13 2026 (-0400)
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

#if !defined FOPDR_TPINTERFACE_THEOREM_PROVER_HPP_
#define FOPDR_TPINTERFACE_THEOREM_PROVER_HPP_

#include <vector>

#include <signal.h>

#include <z3.h>

#include "../common/FOPDRFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"

#include "Z3Objects.hpp"

namespace FOPDR {
    namespace TP {

        enum class TPResult {
            SATISFIABLE, UNSATISFIABLE, UNKNOWN
        };

        extern string TPResultToString(TPResult Result);

        // Raised when a query stays unknown after all retries, or when
        // the query was cut short by an interrupt or a resource limit
        class QueryInconclusiveError : public FOPDRError
        {
        private:
            string QueryDescription;
            string Reason;
            bool Interrupted;

        public:
            QueryInconclusiveError(const string& QueryDescription,
                                   const string& Reason, bool Interrupted);
            virtual ~QueryInconclusiveError() throw ();

            const string& GetQueryDescription() const;
            const string& GetReason() const;
            bool WasInterrupted() const;
        };

        class TPOptionsT
        {
        public:
            // Per query timeout in milliseconds, 0 for none
            u32 TimeoutMillis;
            u32 RandomSeed;
            // How many times an unknown verdict is retried, each time
            // with twice the previous timeout
            u32 QueryRetries;
            bool MinimizeCores;
            // Shrink the universes of models before they are read back
            bool MinimizeModels;

            TPOptionsT();
            TPOptionsT(const TPOptionsT& Other);
            TPOptionsT& operator = (const TPOptionsT& Other);
        };

        struct TPStatsT
        {
            u64 NumQueries;
            u64 NumSat;
            u64 NumUnsat;
            u64 NumUnknown;
            u64 NumRetries;
            u64 TotalSMTTime;
            u64 MinSMTTime;
            u64 MaxSMTTime;

            inline TPStatsT()
                : NumQueries(0), NumSat(0), NumUnsat(0), NumUnknown(0),
                  NumRetries(0), TotalSMTTime(0), MinSMTTime(UINT64_MAX),
                  MaxSMTTime(0)
            {
                // Nothing here
            }
        };

        class Z3TheoremProver : public RefCountable
        {
        private:
            TPOptionsT Options;
            Z3Ctx Ctx;
            Z3Model TheModel;
            Z3Solver Solver;
            TPResult LastSolveResult;
            u32 CurrentTimeout;
            u32 NumScopes;
            // Written from the resource limit timer as well
            volatile sig_atomic_t Interrupted;
            volatile sig_atomic_t InCheck;
            // Set once Z3_interrupt has reached the context. Z3 keeps
            // the context canceled from then on.
            volatile sig_atomic_t Canceled;
            TPStatsT Stats;

            void SetSolverTimeout(u32 TimeoutMillis);
            void ThrowIfCanceled(const string& QueryDescription) const;
            TPResult RunCheck(const vector<Z3Expr>& Assumptions);
            TPResult CheckWithRetries(const vector<Z3Expr>& Assumptions,
                                      const string& QueryDescription);

        public:
            Z3TheoremProver(const TPOptionsT& Options = TPOptionsT());
            virtual ~Z3TheoremProver();

            void ClearSolution();
            void Push();
            void Pop(u32 NumScopes = 1);
            u32 GetNumScopes() const;

            void Assert(const Z3Expr& Assertion);

            // Both throw QueryInconclusiveError instead of returning
            // UNKNOWN
            TPResult CheckSat(const string& QueryDescription);
            TPResult CheckSatWithAssumptions(const vector<Z3Expr>& Assumptions,
                                             const string& QueryDescription);

            // Sticky until ClearInterrupt, so that a retry loop does not
            // resume a query that was asked to stop. Z3 itself is only
            // interrupted while a check is running. Between checks the
            // flag alone stops the next query, and the prover stays
            // usable after ClearInterrupt.
            void Interrupt();
            void ClearInterrupt();
            bool IsInterrupted() const;
            // True once a running check was cut short. Every later
            // query throws QueryInconclusiveError.
            bool IsCanceled() const;

            u64 GetNumAssertions() const;
            const Z3Model& GetModel();
            // Subset of the last assumptions used to refute them
            vector<Z3Expr> GetUnsatCore() const;

            // Fresh boolean constant, used as a tracking literal
            Z3Expr MakeIndicator(const string& Prefix);

            const Z3Ctx& GetCtx() const;
            const TPOptionsT& GetOptions() const;
            const TPStatsT& GetStats() const;
        };

        // Brackets one query: pushes a scope on construction and pops
        // it on destruction, whichever way the query ends
        class ScopedQuery
        {
        private:
            Z3TheoremProver* TP;

        public:
            ScopedQuery(const Z3TPRef& TP);
            ScopedQuery(const ScopedQuery& Other) = delete;
            ScopedQuery& operator = (const ScopedQuery& Other) = delete;
            ~ScopedQuery();
        };

    } /* end namespace TP */
} /* end namespace FOPDR */

#endif /* FOPDR_TPINTERFACE_THEOREM_PROVER_HPP_ */

//
// TheoremProver.hpp ends here
