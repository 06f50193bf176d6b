// TestUtils.hpp --- 
// 
// Filename: TestUtils.hpp
// Author: FOPDR developers
// Created: Sat Sep 12 02:47:02 2026 (-0400)
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

// Helpers shared by the test programs

#if !defined FOPDR_TEST_COMMON_TEST_UTILS_HPP_
#define FOPDR_TEST_COMMON_TEST_UTILS_HPP_

#include "../../src/model/SExprIO.hpp"
#include "../../src/translate/Trace.hpp"

#if !defined FOPDR_BENCHMARK_DIR
#define FOPDR_BENCHMARK_DIR "benchmarks"
#endif

#define FOPDR_TEST_CHECK(COND_, MSG_)                                   \
    do {                                                                \
        if (!(COND_)) {                                                 \
            cout << "Error: " << MSG_ << endl                           \
                 << "Check \"" << #COND_ << "\" failed at "             \
                 << __FILE__ << ":" << __LINE__ << endl;                \
            exit(1);                                                    \
        }                                                               \
    } while (false)

// Runs CODE_ and fails unless it throws an ERRTYPE_
#define FOPDR_TEST_EXPECT_THROW(ERRTYPE_, CODE_, MSG_)                  \
    do {                                                                \
        bool Threw_ = false;                                            \
        try {                                                           \
            CODE_;                                                      \
        } catch (const ERRTYPE_& Ex_) {                                 \
            cout << "Got expected error: " << Ex_.what() << endl;       \
            Threw_ = true;                                              \
        }                                                               \
        FOPDR_TEST_CHECK(Threw_, MSG_);                                 \
    } while (false)

namespace FOPDR {
    namespace Test {

        static inline Model::ProgramRef ReadBenchmark(const string& Name)
        {
            return Model::ReadProgramFromFile((string)FOPDR_BENCHMARK_DIR + "/" + Name);
        }

        static inline Model::ProgramRef ReadLockServer()
        {
            return ReadBenchmark("lockserv.fop");
        }

        static inline Model::ProgramRef ReadUnguardedLock()
        {
            return ReadBenchmark("unguarded_lock.fop");
        }

        // Nodes holding the lock in a state of a trace
        static inline vector<string> GetHolders(const Translate::Trace& TheTrace, u32 StateIndex)
        {
            vector<string> Retval;
            for (auto const& Node : TheTrace.GetUniverse("node")) {
                if (TheTrace.Evaluate("holds_lock", { Node }, StateIndex) == "true") {
                    Retval.push_back(Node);
                }
            }
            return Retval;
        }

    } /* end namespace Test */
} /* end namespace FOPDR */

#endif /* FOPDR_TEST_COMMON_TEST_UTILS_HPP_ */

//
// TestUtils.hpp ends here
