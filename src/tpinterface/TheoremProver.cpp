// TheoremProver.cpp --- 
// 
// Filename: TheoremProver.cpp
// Author: FOPDR developers
// Created: Wed Aug 05 06:22:14 2026 (-0400)
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

#include "../utils/LogManager.hpp"
#include "../utils/ResourceLimitManager.hpp"
#include "../utils/TimeValue.hpp"

#include "TheoremProver.hpp"

namespace FOPDR {
    namespace TP {

        string TPResultToString(TPResult Result)
        {
            switch (Result) {
            case TPResult::SATISFIABLE:
                return "sat";
            case TPResult::UNSATISFIABLE:
                return "unsat";
            case TPResult::UNKNOWN:
                return "unknown";
            }
            return "unknown";
        }

        QueryInconclusiveError::QueryInconclusiveError(const string& QueryDescription,
                                                       const string& Reason,
                                                       bool Interrupted)
            : FOPDRError((string)"Solver could not decide query: " + QueryDescription +
                         " (reason: " + Reason + ")"),
              QueryDescription(QueryDescription), Reason(Reason),
              Interrupted(Interrupted)
        {
            // Nothing here
        }

        QueryInconclusiveError::~QueryInconclusiveError() throw ()
        {
            // Nothing here
        }

        const string& QueryInconclusiveError::GetQueryDescription() const
        {
            return QueryDescription;
        }

        const string& QueryInconclusiveError::GetReason() const
        {
            return Reason;
        }

        bool QueryInconclusiveError::WasInterrupted() const
        {
            return Interrupted;
        }

        TPOptionsT::TPOptionsT()
            : TimeoutMillis(0), RandomSeed(0), QueryRetries(2), MinimizeCores(true),
              MinimizeModels(true)
        {
            // Nothing here
        }

        TPOptionsT::TPOptionsT(const TPOptionsT& Other)
            : TimeoutMillis(Other.TimeoutMillis), RandomSeed(Other.RandomSeed),
              QueryRetries(Other.QueryRetries), MinimizeCores(Other.MinimizeCores),
              MinimizeModels(Other.MinimizeModels)
        {
            // Nothing here
        }

        TPOptionsT& TPOptionsT::operator = (const TPOptionsT& Other)
        {
            if (&Other == this) {
                return *this;
            }
            TimeoutMillis = Other.TimeoutMillis;
            RandomSeed = Other.RandomSeed;
            QueryRetries = Other.QueryRetries;
            MinimizeCores = Other.MinimizeCores;
            MinimizeModels = Other.MinimizeModels;
            return *this;
        }

        // Global parameters must be in place before the context and
        // solver are created
        static inline Z3Ctx MakeContext(const TPOptionsT& Options)
        {
            auto SeedString = to_string(Options.RandomSeed);
            Z3_global_param_set("smt.random_seed", SeedString.c_str());
            Z3_global_param_set("sat.random_seed", SeedString.c_str());
            Z3_global_param_set("smt.core.minimize", Options.MinimizeCores ? "true" : "false");
            return new Z3CtxWrapper();
        }

        Z3TheoremProver::Z3TheoremProver(const TPOptionsT& Options)
            : Options(Options), Ctx(MakeContext(Options)), TheModel(),
              Solver(Ctx), LastSolveResult(TPResult::UNKNOWN), CurrentTimeout(0),
              NumScopes(0), Interrupted(0), InCheck(0), Canceled(0)
        {
            SetSolverTimeout(Options.TimeoutMillis);
        }

        Z3TheoremProver::~Z3TheoremProver()
        {
            // Nothing here
        }

        void Z3TheoremProver::SetSolverTimeout(u32 TimeoutMillis)
        {
            if (TimeoutMillis == CurrentTimeout) {
                return;
            }
            auto Params = Z3_mk_params(*Ctx);
            Z3_params_inc_ref(*Ctx, Params);
            Z3_params_set_uint(*Ctx, Params, Z3_mk_string_symbol(*Ctx, "timeout"),
                               TimeoutMillis == 0 ? UINT32_MAX : TimeoutMillis);
            Z3_solver_set_params(*Ctx, Solver, Params);
            Z3_params_dec_ref(*Ctx, Params);
            CurrentTimeout = TimeoutMillis;
        }

        void Z3TheoremProver::ClearSolution()
        {
            TheModel = Z3Model();
        }

        void Z3TheoremProver::ThrowIfCanceled(const string& QueryDescription) const
        {
            if (Canceled != 0) {
                throw QueryInconclusiveError(QueryDescription,
                                             "solver context was canceled by an interrupt",
                                             true);
            }
        }

        void Z3TheoremProver::Push()
        {
            ThrowIfCanceled("push of a query scope");
            Z3_solver_push(*Ctx, Solver);
            ++NumScopes;
        }

        void Z3TheoremProver::Pop(u32 NumScopes)
        {
            if (NumScopes > this->NumScopes) {
                FOPDR_INTERNAL_ERROR((string)"Attempted to pop " + to_string(NumScopes) +
                                     " scopes with only " + to_string(this->NumScopes) +
                                     " pushed");
            }
            Z3_solver_pop(*Ctx, Solver, NumScopes);
            this->NumScopes -= NumScopes;
            TheModel = Z3Model();
        }

        u32 Z3TheoremProver::GetNumScopes() const
        {
            return NumScopes;
        }

        void Z3TheoremProver::Assert(const Z3Expr& Assertion)
        {
            FOPDR_LOG_FULL("TheoremProver.Assertions",
                           Out_ << "Asserting:" << endl << Assertion << endl;
                           );

            Z3_solver_assert(*Ctx, Solver, Assertion);
        }

        TPResult Z3TheoremProver::RunCheck(const vector<Z3Expr>& Assumptions)
        {
            vector<Z3_ast> AssumptionVec;
            for (auto const& Assumption : Assumptions) {
                AssumptionVec.push_back(Assumption);
            }

            auto StartTime = TimeValue::GetTimeValue();
            Z3_lbool Res = Z3_L_UNDEF;
            InCheck = 1;
            // An interrupt that arrived before InCheck was raised is
            // not delivered to Z3
            if (Interrupted == 0) {
                if (AssumptionVec.size() == 0) {
                    Res = Z3_solver_check(*Ctx, Solver);
                } else {
                    Res = Z3_solver_check_assumptions(*Ctx, Solver,
                                                      (u32)AssumptionVec.size(),
                                                      AssumptionVec.data());
                }
            }
            InCheck = 0;
            auto CurSMTTime = (TimeValue::GetTimeValue() - StartTime).InMicroSeconds();

            ++Stats.NumQueries;
            Stats.TotalSMTTime += CurSMTTime;
            if (CurSMTTime < Stats.MinSMTTime) {
                Stats.MinSMTTime = CurSMTTime;
            }
            if (CurSMTTime > Stats.MaxSMTTime) {
                Stats.MaxSMTTime = CurSMTTime;
            }

            if (Res == Z3_L_TRUE) {
                LastSolveResult = TPResult::SATISFIABLE;
                ++Stats.NumSat;
            } else if (Res == Z3_L_FALSE) {
                LastSolveResult = TPResult::UNSATISFIABLE;
                ++Stats.NumUnsat;
            } else {
                LastSolveResult = TPResult::UNKNOWN;
                ++Stats.NumUnknown;
            }
            TheModel = Z3Model();
            return LastSolveResult;
        }

        TPResult Z3TheoremProver::CheckWithRetries(const vector<Z3Expr>& Assumptions,
                                                   const string& QueryDescription)
        {
            ThrowIfCanceled(QueryDescription);
            if (Interrupted != 0) {
                throw QueryInconclusiveError(QueryDescription, "interrupted", true);
            }

            u32 Timeout = Options.TimeoutMillis;
            SetSolverTimeout(Timeout);

            for (u32 Attempt = 0; ; ++Attempt) {
                auto StartTime = TimeValue::GetTimeValue();
                auto Res = RunCheck(Assumptions);

                FOPDR_LOG_SHORT("TheoremProver.Queries",
                                Out_ << "[query " << Stats.NumQueries << "] "
                                     << QueryDescription << ": " << TPResultToString(Res)
                                     << " in " << (TimeValue::GetTimeValue() - StartTime)
                                     << " s, " << Assumptions.size() << " assumptions"
                                     << endl;
                                );

                if (Res != TPResult::UNKNOWN) {
                    SetSolverTimeout(Options.TimeoutMillis);
                    return Res;
                }

                string Reason = (Interrupted != 0 ? "interrupted" :
                                 Z3_solver_get_reason_unknown(*Ctx, Solver));
                if (Interrupted != 0 || ResourceLimitManager::CheckTimeOut() ||
                    ResourceLimitManager::CheckMemOut()) {
                    SetSolverTimeout(Options.TimeoutMillis);
                    throw QueryInconclusiveError(QueryDescription, Reason, true);
                }
                if (Attempt >= Options.QueryRetries) {
                    SetSolverTimeout(Options.TimeoutMillis);
                    throw QueryInconclusiveError(QueryDescription, Reason, false);
                }

                if (Timeout != 0) {
                    Timeout = (Timeout > UINT32_MAX / 2 ? UINT32_MAX : Timeout * 2);
                }
                ++Stats.NumRetries;
                FOPDR_LOG_MIN_SHORT(Out_ << "Query \"" << QueryDescription
                                         << "\" returned unknown (" << Reason
                                         << "), retrying with timeout " << Timeout
                                         << " ms" << endl;
                                    );
                SetSolverTimeout(Timeout);
            }
        }

        TPResult Z3TheoremProver::CheckSat(const string& QueryDescription)
        {
            return CheckWithRetries(vector<Z3Expr>(), QueryDescription);
        }

        TPResult Z3TheoremProver::CheckSatWithAssumptions(const vector<Z3Expr>& Assumptions,
                                                          const string& QueryDescription)
        {
            return CheckWithRetries(Assumptions, QueryDescription);
        }

        void Z3TheoremProver::Interrupt()
        {
            Interrupted = 1;
            if (InCheck != 0) {
                Canceled = 1;
                Z3_interrupt(*Ctx);
            }
        }

        void Z3TheoremProver::ClearInterrupt()
        {
            Interrupted = 0;
        }

        bool Z3TheoremProver::IsInterrupted() const
        {
            return (Interrupted != 0);
        }

        bool Z3TheoremProver::IsCanceled() const
        {
            return (Canceled != 0);
        }

        u64 Z3TheoremProver::GetNumAssertions() const
        {
            auto ASTVec = Z3_solver_get_assertions(*Ctx, Solver);
            Z3_ast_vector_inc_ref(*Ctx, ASTVec);
            u64 Retval = Z3_ast_vector_size(*Ctx, ASTVec);
            Z3_ast_vector_dec_ref(*Ctx, ASTVec);
            return Retval;
        }

        const Z3Model& Z3TheoremProver::GetModel()
        {
            if (LastSolveResult != TPResult::SATISFIABLE) {
                FOPDR_INTERNAL_ERROR((string)"Z3TheoremProver::GetModel() called, but " +
                                     "last solve was not satisfiable. No model to return.");
            }
            if (TheModel.IsNull()) {
                TheModel = Z3Model(Ctx, Z3_solver_get_model(*Ctx, Solver));
            }
            return TheModel;
        }

        vector<Z3Expr> Z3TheoremProver::GetUnsatCore() const
        {
            if (LastSolveResult != TPResult::UNSATISFIABLE) {
                FOPDR_INTERNAL_ERROR((string)"Z3TheoremProver::GetUnsatCore() called, but " +
                                     "last solve was not unsatisfiable.");
            }
            vector<Z3Expr> Retval;
            auto Core = Z3_solver_get_unsat_core(*Ctx, Solver);
            Z3_ast_vector_inc_ref(*Ctx, Core);
            const u32 CoreSize = Z3_ast_vector_size(*Ctx, Core);
            for (u32 i = 0; i < CoreSize; ++i) {
                Retval.push_back(Z3Expr(Ctx, Z3_ast_vector_get(*Ctx, Core, i)));
            }
            Z3_ast_vector_dec_ref(*Ctx, Core);
            return Retval;
        }

        Z3Expr Z3TheoremProver::MakeIndicator(const string& Prefix)
        {
            return Z3Expr(Ctx, Z3_mk_fresh_const(*Ctx, Prefix.c_str(), Z3_mk_bool_sort(*Ctx)));
        }

        const Z3Ctx& Z3TheoremProver::GetCtx() const
        {
            return Ctx;
        }

        const TPOptionsT& Z3TheoremProver::GetOptions() const
        {
            return Options;
        }

        const TPStatsT& Z3TheoremProver::GetStats() const
        {
            return Stats;
        }

        ScopedQuery::ScopedQuery(const Z3TPRef& TP)
            : TP(TP.GetPtr_())
        {
            this->TP->Push();
        }

        ScopedQuery::~ScopedQuery()
        {
            TP->Pop();
        }

    } /* end namespace TP */
} /* end namespace FOPDR */

//
// TheoremProver.cpp ends here
