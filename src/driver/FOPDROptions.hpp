// FOPDROptions.hpp --- 
// 
// Filename: FOPDROptions.hpp
// Author: FOPDR developers
// Created: Tue Sep 08 15:48:59 2026 (-0400)
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

// Command line handling for the fopdr driver

#if !defined FOPDR_DRIVER_FOPDR_OPTIONS_HPP_
#define FOPDR_DRIVER_FOPDR_OPTIONS_HPP_

#include <boost/program_options.hpp>

#include "../lib/FOPDRLib.hpp"
#include "../tpinterface/TheoremProver.hpp"
#include "../updr/Frames.hpp"
#include "../utils/LogManager.hpp"

namespace FOPDR {
    namespace Driver {

        namespace po = boost::program_options;

        enum class SubcommandT {
            UPDR, Verify, BMC, Theorem, TypeCheck
        };

        struct DriverOptionsT
        {
            SubcommandT Subcommand;
            string SubcommandName;
            string InputFileName;
            bool JSONOutput;
            u32 Depth;
            string CheckpointIn;
            string KeyPrefix;
            // Restrictions of the verify subcommand, empty for all
            set<string> CheckInvariants;
            set<string> CheckTransitions;
            FOPDRLibOptionsT LibOptions;
            TP::TPOptionsT TPOptions;
            UPDR::UPDROptionsT UPDROptions;
        };

        class UsageError : public FOPDRError
        {
        public:
            inline UsageError(const string& ErrorMsg)
                : FOPDRError(ErrorMsg)
            {
                // Nothing here
            }

            inline virtual ~UsageError() throw ()
            {
                // Nothing here
            }
        };

        static inline bool ParseFlag(const string& Value, const string& OptionName)
        {
            if (Value == "true" || Value == "yes" || Value == "on" || Value == "1") {
                return true;
            } else if (Value == "false" || Value == "no" || Value == "off" || Value == "0") {
                return false;
            }
            throw UsageError((string)"Invalid value \"" + Value + "\" for --" + OptionName +
                             ", expected true or false");
        }

        // Returns false if only the help message was asked for
        static inline bool ParseOptions(int Argc, char* ArgV[], DriverOptionsT& Options)
        {
            po::options_description Desc("Usage: fopdr <updr|verify|bmc|theorem|typecheck> "
                                         "<program-file> [options]\nAllowed Options");
            auto&& LogOptionsDesc = Logging::LogManager::GetLogOptions();
            vector<string> LogOptions;
            string LogCompressionTechnique;
            u64 CPULimit;
            u64 MemLimit;
            u64 MemCeiling;
            string PushFrameZeroStr;
            string ObligationOrderStr;
            string UseUnsatCoresStr;
            string SimplifyDiagramStr;
            string MinimizeModelsStr;
            string ConcretizeStr;
            string CheckpointOut;
            vector<string> CheckInvariants;
            vector<string> CheckTransitions;

            Desc.add_options()
                ("help,h", "Produce this help message")
                ("safety", po::value<string>(&Options.UPDROptions.SafetyName)->default_value(""),
                 "Name of the safety invariant to prove; all safety invariants if not given")
                ("json", "Print the result as a JSON document")
                ("depth,d", po::value<u32>(&Options.Depth)->default_value(4),
                 "Number of steps to unroll for the bmc subcommand")
                ("max-iterations", po::value<u32>(&Options.UPDROptions.MaxIterations)->default_value(0),
                 "Stop the search after this many frames were added; 0 for no limit")
                ("checkpoint-in", po::value<string>(&Options.CheckpointIn)->default_value(""),
                 "Resume the search from this checkpoint")
                ("checkpoint-out", po::value<string>(&CheckpointOut)->default_value(""),
                 "Write a checkpoint to this file after every iteration and on interruption")
                ("push-frame-zero", po::value<string>(&PushFrameZeroStr)->default_value("if_trivial"),
                 "Whether predicates are pushed out of frame 0; one of: if_trivial, always, never")
                ("obligation-order", po::value<string>(&ObligationOrderStr)->default_value("deepest"),
                 ((string)"Order of root obligations; one of: deepest (one query against all " +
                  "safety properties), declared (safety properties one at a time)").c_str())
                ("use-unsat-cores", po::value<string>(&UseUnsatCoresStr)->default_value("true"),
                 "Generalize with unsat cores before dropping conjuncts one at a time")
                ("simplify-diagram", po::value<string>(&SimplifyDiagramStr)->default_value("true"),
                 "Replace diagram variables equal to a constant by the constant")
                ("concretize-cex", po::value<string>(&ConcretizeStr)->default_value("true"),
                 "Replay a counterexample found by the search into a concrete trace")
                ("smoke-test", "Check every learned predicate by bounded model checking")
                ("block-may-cexs", "Block the successors that prevent a predicate from being pushed")
                ("assert-inductive-trace", "Check that each frame is inductive relative to "
                 "the previous one after every iteration")
                ("check-invariant", po::value<vector<string>>(&CheckInvariants)->multitoken(),
                 "With verify, check only these invariants")
                ("check-transition", po::value<vector<string>>(&CheckTransitions)->multitoken(),
                 "With verify, check consecution over these transitions only")
                ("minimize-models", po::value<string>(&MinimizeModelsStr)->default_value("true"),
                 "Search for models with universes of minimal cardinality")
                ("key-prefix", po::value<string>(&Options.KeyPrefix)->default_value(""),
                 "Prefix for the names of state symbols sent to the solver")
                ("timeout", po::value<u32>(&Options.TPOptions.TimeoutMillis)->default_value(0),
                 "Per query solver timeout in milliseconds; 0 for none")
                ("seed", po::value<u32>(&Options.TPOptions.RandomSeed)->default_value(0),
                 "Random seed for the solver")
                ("query-retries", po::value<u32>(&Options.TPOptions.QueryRetries)->default_value(2),
                 "Retries, with doubled timeouts, of a query the solver gives up on")
                ("cpu-limit,t", po::value<u64>(&CPULimit)->default_value(UINT64_MAX),
                 "CPU Time limit in seconds")
                ("mem-limit,m", po::value<u64>(&MemLimit)->default_value(UINT64_MAX),
                 "Memory limit in MB")
                ("mem-ceiling", po::value<u64>(&MemCeiling)->default_value(0),
                 "Hard address space ceiling in MB; 0 for none")
                ("log-file", po::value<string>(&Options.LibOptions.LogFileName)->default_value(""),
                 "Name of file to write logging info into, defaults to stdout")
                ("log-compression", po::value<string>(&LogCompressionTechnique)->default_value("none"),
                 "Compression option for log file; one of: none, gzip, bzip2")
                ("log-opts", po::value<vector<string>>(&LogOptions)->multitoken(),
                 ((string)"Logging Options to enable\n" + LogOptionsDesc).c_str());

            po::options_description Hidden;
            Hidden.add_options()
                ("subcommand", po::value<string>(&Options.SubcommandName), "")
                ("input-file", po::value<string>(&Options.InputFileName), "");

            po::options_description AllOptions;
            AllOptions.add(Desc).add(Hidden);

            po::positional_options_description Positional;
            Positional.add("subcommand", 1).add("input-file", 1);

            po::variables_map vm;
            try {
                po::store(po::command_line_parser(Argc, ArgV).options(AllOptions)
                          .positional(Positional).run(), vm);
                po::notify(vm);
            } catch (const po::error& Ex) {
                throw UsageError(Ex.what());
            }

            if (vm.count("help") > 0) {
                cout << Desc << endl;
                return false;
            }

            if (Options.SubcommandName == "updr") {
                Options.Subcommand = SubcommandT::UPDR;
            } else if (Options.SubcommandName == "verify") {
                Options.Subcommand = SubcommandT::Verify;
            } else if (Options.SubcommandName == "bmc") {
                Options.Subcommand = SubcommandT::BMC;
            } else if (Options.SubcommandName == "theorem") {
                Options.Subcommand = SubcommandT::Theorem;
            } else if (Options.SubcommandName == "typecheck") {
                Options.Subcommand = SubcommandT::TypeCheck;
            } else if (Options.SubcommandName == "") {
                throw UsageError("No subcommand given; see --help");
            } else {
                throw UsageError((string)"Unknown subcommand \"" + Options.SubcommandName +
                                 "\"; see --help");
            }
            if (Options.InputFileName == "") {
                throw UsageError("No program file given; see --help");
            }

            if (PushFrameZeroStr == "if_trivial") {
                Options.UPDROptions.PushFrameZero = UPDR::PushFrameZeroT::IfTrivial;
            } else if (PushFrameZeroStr == "always") {
                Options.UPDROptions.PushFrameZero = UPDR::PushFrameZeroT::Always;
            } else if (PushFrameZeroStr == "never") {
                Options.UPDROptions.PushFrameZero = UPDR::PushFrameZeroT::Never;
            } else {
                throw UsageError((string)"Invalid value \"" + PushFrameZeroStr +
                                 "\" for --push-frame-zero");
            }

            if (ObligationOrderStr == "deepest") {
                Options.UPDROptions.ObligationOrder = UPDR::ObligationOrderT::DeepestFirst;
            } else if (ObligationOrderStr == "declared") {
                Options.UPDROptions.ObligationOrder = UPDR::ObligationOrderT::DeclaredOrder;
            } else {
                throw UsageError((string)"Invalid value \"" + ObligationOrderStr +
                                 "\" for --obligation-order");
            }

            if (LogCompressionTechnique == "none") {
                Options.LibOptions.LogCompressionTechnique =
                    LogFileCompressionTechniqueT::COMPRESS_NONE;
            } else if (LogCompressionTechnique == "gzip") {
                Options.LibOptions.LogCompressionTechnique =
                    LogFileCompressionTechniqueT::COMPRESS_GZIP;
            } else if (LogCompressionTechnique == "bzip2") {
                Options.LibOptions.LogCompressionTechnique =
                    LogFileCompressionTechniqueT::COMPRESS_BZIP2;
            } else {
                throw UsageError((string)"Invalid value \"" + LogCompressionTechnique +
                                 "\" for --log-compression");
            }

            Options.UPDROptions.UseUnsatCores = ParseFlag(UseUnsatCoresStr, "use-unsat-cores");
            Options.UPDROptions.SimplifyDiagram = ParseFlag(SimplifyDiagramStr, "simplify-diagram");
            Options.TPOptions.MinimizeModels = ParseFlag(MinimizeModelsStr, "minimize-models");
            if ((CheckInvariants.size() > 0 || CheckTransitions.size() > 0) &&
                Options.Subcommand != SubcommandT::Verify) {
                throw UsageError("--check-invariant and --check-transition only apply to verify");
            }
            Options.CheckInvariants.insert(CheckInvariants.begin(), CheckInvariants.end());
            Options.CheckTransitions.insert(CheckTransitions.begin(), CheckTransitions.end());
            Options.UPDROptions.ConcretizeCounterexample = ParseFlag(ConcretizeStr, "concretize-cex");
            Options.UPDROptions.SmokeTest = (vm.count("smoke-test") > 0);
            Options.UPDROptions.BlockMayCexs = (vm.count("block-may-cexs") > 0);
            Options.UPDROptions.AssertInductiveTrace = (vm.count("assert-inductive-trace") > 0);
            Options.UPDROptions.CheckpointFile = CheckpointOut;
            Options.JSONOutput = (vm.count("json") > 0);

            Options.LibOptions.LoggingOptions.insert(LogOptions.begin(), LogOptions.end());
            Options.LibOptions.CPULimitSeconds = CPULimit;
            Options.LibOptions.MemLimitMB = MemLimit;
            Options.LibOptions.MemCeilingMB = MemCeiling;
            return true;
        }

    } /* end namespace Driver */
} /* end namespace FOPDR */

#endif /* FOPDR_DRIVER_FOPDR_OPTIONS_HPP_ */

//
// FOPDROptions.hpp ends here
