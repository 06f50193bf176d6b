// FOPDRMain.cpp --- 
// 
// Filename: FOPDRMain.cpp
// Author: FOPDR developers
// Created: Wed Sep 09 02:48:13 2026 (-0400)
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

#include <boost/property_tree/json_parser.hpp>

#include "../model/SExprIO.hpp"
#include "../translate/BoundedChecker.hpp"
#include "../translate/Verifier.hpp"
#include "../updr/Checkpoint.hpp"
#include "../utils/ResourceLimitManager.hpp"
#include "../utils/TimeValue.hpp"

#include "FOPDROptions.hpp"

using namespace FOPDR;
using boost::property_tree::ptree;

// Exit codes
static const int ExitOK = 0;
static const int ExitPropertyFails = 1;
static const int ExitInconclusive = 2;
static const int ExitError = 3;

static inline void PrintJSON(const Driver::DriverOptionsT& Options, const ptree& Result)
{
    ptree Root;
    Root.put("version", 1);
    Root.put("subcommand", Options.SubcommandName);
    for (auto const& Child : Result) {
        Root.push_back(Child);
    }
    boost::property_tree::write_json(cout, Root);
}

static inline ptree FailuresToPropertyTree(const vector<Translate::VerificationFailureT>& Failures)
{
    ptree FailureList;
    for (auto const& Failure : Failures) {
        ptree FailureTree;
        FailureTree.put("kind", Translate::CheckKindToString(Failure.Kind));
        FailureTree.put("property", Failure.Property);
        if (Failure.Transition != "") {
            FailureTree.put("transition", Failure.Transition);
        }
        FailureTree.add_child("counterexample", Failure.Counterexample.ToPropertyTree());
        FailureList.push_back(make_pair("", FailureTree));
    }
    return FailureList;
}

static int ReportFailures(const Driver::DriverOptionsT& Options, const string& What,
                          const vector<Translate::VerificationFailureT>& Failures)
{
    if (Options.JSONOutput) {
        ptree Result;
        Result.put("result", Failures.size() == 0 ? "valid" : "invalid");
        Result.add_child("failures", FailuresToPropertyTree(Failures));
        PrintJSON(Options, Result);
    } else if (Failures.size() == 0) {
        cout << "All " << What << " hold" << endl;
    } else {
        cout << Failures.size() << " check(s) on " << What << " failed:" << endl;
        for (auto const& Failure : Failures) {
            cout << Failure.ToString() << endl;
        }
    }
    return (Failures.size() == 0 ? ExitOK : ExitPropertyFails);
}

static int RunUPDR(const Driver::DriverOptionsT& Options, const Model::ProgramRef& Prog,
                   Translate::SolverSession& Session)
{
    UPDR::Frames TheFrames(Prog, Session, Options.UPDROptions);
    if (Options.CheckpointIn != "") {
        TheFrames.Restore(UPDR::Checkpoint::LoadFromFile(Options.CheckpointIn, Prog));
    }

    ResourceLimitManager::AddOnLimitHandler([&] (bool TimedOut) -> void
                                            {
                                                TheFrames.Interrupt();
                                            });
    auto Result = TheFrames.Search();
    ResourceLimitManager::QueryEnd();
    ResourceLimitManager::ClearOnLimitHandlers();

    if (Result.Status == UPDR::SearchStatusT::Proved) {
        // Independent re-check with a fresh solver
        Translate::SolverSession CheckSession(Prog, Options.TPOptions, Options.KeyPrefix);
        Translate::Verifier Checker(CheckSession);
        auto Failures = Checker.CheckInductiveInvariant(Result.Invariant, TheFrames.GetSafety());
        if (Failures.size() > 0) {
            FOPDR_INTERNAL_ERROR((string)"The frame found by the search is not an inductive " +
                                 "invariant:\n" + Failures[0].ToString());
        }
    }

    if (Options.JSONOutput) {
        PrintJSON(Options, Result.ToPropertyTree());
    } else {
        cout << Result.ToString();
    }

    switch (Result.Status) {
    case UPDR::SearchStatusT::Proved:
        return ExitOK;
    case UPDR::SearchStatusT::Disproved:
        return ExitPropertyFails;
    default:
        return ExitInconclusive;
    }
}

static int RunBMC(const Driver::DriverOptionsT& Options, const Model::ProgramRef& Prog,
                  Translate::SolverSession& Session)
{
    auto Safety = Prog->GetSafetyFormula(Options.UPDROptions.SafetyName);
    Translate::BoundedChecker BMC(Session);

    // Shortest counterexample first
    for (u32 Depth = 0; Depth <= Options.Depth; ++Depth) {
        Translate::Trace Cex;
        if (BMC.CheckBMC(Safety, Depth, Cex)) {
            if (Options.JSONOutput) {
                ptree Result;
                Result.put("result", "disproved");
                Result.put("depth", Depth);
                Result.add_child("counterexample", Cex.ToPropertyTree());
                PrintJSON(Options, Result);
            } else {
                cout << "Safety is violated after " << Depth << " steps:" << endl
                     << Cex.ToString();
            }
            return ExitPropertyFails;
        }
    }

    if (Options.JSONOutput) {
        ptree Result;
        Result.put("result", "bounded-safe");
        Result.put("depth", Options.Depth);
        PrintJSON(Options, Result);
    } else {
        cout << "No safety violation within " << Options.Depth << " steps" << endl;
    }
    return ExitOK;
}

static int Run(const Driver::DriverOptionsT& Options)
{
    TimeValue StartTime = TimeValue::GetTimeValue();
    auto Prog = Model::ReadProgramFromFile(Options.InputFileName);

    if (Options.Subcommand == Driver::SubcommandT::TypeCheck) {
        if (Options.JSONOutput) {
            ptree Result;
            Result.put("result", "ok");
            PrintJSON(Options, Result);
        } else {
            cout << Options.InputFileName << ": " << Prog->GetSorts().size() << " sorts, "
                 << Prog->GetSymbols().size() << " symbols, "
                 << Prog->GetTransitions().size() << " transitions, "
                 << Prog->GetInvariants().size() << " invariants" << endl;
        }
        return ExitOK;
    }

    Translate::SolverSession Session(Prog, Options.TPOptions, Options.KeyPrefix);
    ResourceLimitManager::AddOnLimitHandler([&] (bool TimedOut) -> void
                                            {
                                                Session.GetTP()->Interrupt();
                                            });
    ResourceLimitManager::QueryStart();

    int Retval = ExitOK;
    switch (Options.Subcommand) {
    case Driver::SubcommandT::UPDR:
        Retval = RunUPDR(Options, Prog, Session);
        break;
    case Driver::SubcommandT::Verify: {
        Translate::Verifier Checker(Session);
        Retval = ReportFailures(Options, "invariants",
                                Checker.VerifyInvariants(Options.CheckInvariants,
                                                         Options.CheckTransitions));
        break;
    }
    case Driver::SubcommandT::Theorem: {
        Translate::Verifier Checker(Session);
        Retval = ReportFailures(Options, "theorems", Checker.VerifyTheorems());
        break;
    }
    case Driver::SubcommandT::BMC:
        Retval = RunBMC(Options, Prog, Session);
        break;
    case Driver::SubcommandT::TypeCheck:
        break;
    }
    ResourceLimitManager::QueryEnd();
    ResourceLimitManager::ClearOnLimitHandlers();

    TimeValue EndTime = TimeValue::GetTimeValue();
    double CPUTime, PeakMem;
    ResourceLimitManager::GetUsage(CPUTime, PeakMem);
    FOPDR_LOG_MIN_SHORT(Out_ << "Solver queries: " << Session.GetNumQueries() << endl
                             << "Time: " << (EndTime - StartTime).InMilliSeconds()
                             << " ms (" << CPUTime << " s CPU)" << endl
                             << "Peak memory: " << PeakMem << " MB" << endl;
                        );
    return Retval;
}

int main(int Argc, char* ArgV[])
{
    Driver::DriverOptionsT Options;
    try {
        if (!Driver::ParseOptions(Argc, ArgV, Options)) {
            return ExitOK;
        }
        FOPDRLib::Initialize(Options.LibOptions);
    } catch (const FOPDRError& Ex) {
        cerr << "fopdr: " << Ex.what() << endl;
        return ExitError;
    }

    int Retval = ExitError;
    try {
        Retval = Run(Options);
    } catch (const TP::QueryInconclusiveError& Ex) {
        cerr << "fopdr: inconclusive: " << Ex.what() << endl;
        Retval = ExitInconclusive;
    } catch (const FOPDRError& Ex) {
        cerr << "fopdr: error: " << Ex.what() << endl;
        Retval = ExitError;
    } catch (const InternalError& Ex) {
        cerr << "fopdr: internal error: " << Ex.what() << endl;
        Retval = ExitError;
    }

    FOPDRLib::Finalize();
    return Retval;
}

//
// FOPDRMain.cpp ends here
