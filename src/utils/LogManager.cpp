// LogManager.cpp --- 
// 
// Filename: LogManager.cpp
// Author: FOPDR developers
// Created: Mon Jul 13 21:33:59 2026 (-0400)
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

#include <stdlib.h>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "LogManager.hpp"

namespace FOPDR {
    namespace Logging {

        const map<string, string> LogManager::LogOptionDescriptions =
            {
                {
                    "TheoremProver.Assertions",
                    (string)"Print assertions as they are asserted into the theorem prover."
                },
                {
                    "TheoremProver.Queries",
                    (string)"Print a line for every satisfiability query, with its " +
                    "description, verdict and time taken."
                },
                {
                    "Translator.Lowered",
                    "Print formulas along with their lowered Z3 counterparts."
                },
                {
                    "BoundedChecker.Traces",
                    "Print every trace found by bounded unrolling."
                },
                {
                    "Diagram.Extraction",
                    "Print every diagram extracted from a model."
                },
                {
                    "Generalizer.Detailed",
                    (string)"Print every literal removal attempted while generalizing " +
                    "a diagram, and the unsat cores used."
                },
                {
                    "UPDR.Frames",
                    "Print the frames at the end of every iteration of the search."
                },
                {
                    "UPDR.Blocking",
                    "Print proof obligations as they are pushed and discharged."
                },
                {
                    "UPDR.Pushing",
                    "Print predicates as they are pushed to later frames."
                },
                {
                    "UPDR.Stats",
                    "Print statistics at the end of the search."
                },
                {
                    "Checkpoint.Detailed",
                    "Print the contents of checkpoints as they are written and read."
                },
                {
                    "FOPDR.Minimal",
                    (string)"Bare minimal trace output from the search engine, " +
                    "serving only to indicate progress. Disabling this will cause NOTHING " +
                    "to ever be printed on the trace stream by the FOPDR library. This " +
                    "is option is always enabled, unless disabled by FOPDR.None below. " +
                    "Further, this option is enabled, even if the FOPDR library has been " +
                    "built without -DFOPDR_ENABLE_TRACING_ set."
                },
                {
                    "FOPDR.None",
                    (string)"Turns off ALL tracing options (including FOPDR.Minimal)."
                },
                {
                    "FOPDR.All",
                    (string)"Turns ON ALL tracing options."
                }
            };

        unordered_set<string>& LogManager::EnabledLogOptions()
        {
            static unordered_set<string> EnabledLogOptions_;
            return EnabledLogOptions_;
        }

        ostream*& LogManager::LogStream()
        {
            static ostream* LogStream_ = nullptr;
            return LogStream_;
        }

        bool& LogManager::NoLoggingEnabled()
        {
            static bool NoLoggingEnabled_ = false;
            return NoLoggingEnabled_;
        }

        LogManager::LogManager()
        {
            // Nothing here
        }

        void LogManager::Initialize(const string& LogStreamName,
                                    LogFileCompressionTechniqueT LogCompressionTechnique)
        {
            Finalize();

            if (LogStreamName == "") {
                LogStream() = &std::cout;
            } else {
                auto LogStreamFileName = LogStreamName;
                auto LocalLogStream = new boost::iostreams::filtering_ostream();
                if (LogCompressionTechnique == LogFileCompressionTechniqueT::COMPRESS_BZIP2) {
                    LocalLogStream->push(boost::iostreams::bzip2_compressor(9));
                    if (!boost::algorithm::ends_with(LogStreamFileName, ".bz2")) {
                        LogStreamFileName = LogStreamFileName + ".bz2";
                    }
                } else if (LogCompressionTechnique == LogFileCompressionTechniqueT::COMPRESS_GZIP) {
                    LocalLogStream->push(boost::iostreams::gzip_compressor(9));
                    if (!boost::algorithm::ends_with(LogStreamFileName, ".gz")) {
                        LogStreamFileName += ".gz";
                    }
                }

                auto OpenFlags = ios_base::out;
                if (LogCompressionTechnique != LogFileCompressionTechniqueT::COMPRESS_NONE) {
                    OpenFlags = OpenFlags | ios_base::binary;
                }

                LocalLogStream->push(boost::iostreams::file_sink(LogStreamFileName, OpenFlags));
                LogStream() = LocalLogStream;
            }
        }

        void LogManager::Finalize()
        {
            if (LogStream() != nullptr && LogStream() != &cout) {
                auto FilteringStream =
                    dynamic_cast<boost::iostreams::filtering_ostream*>(LogStream());
                if (FilteringStream != nullptr) {
                    FilteringStream->flush();
                    // pops the compressor first, so that it writes its trailer
                    FilteringStream->reset();
                }
                delete LogStream();
            } else if (LogStream() != nullptr) {
                LogStream()->flush();
            }
            LogStream() = nullptr;
            EnabledLogOptions().clear();
            NoLoggingEnabled() = false;
        }

        ostream& LogManager::GetLogStream()
        {
            if (LogStream() == nullptr) {
                return std::cout;
            }
            return *(LogStream());
        }

        void LogManager::EnableLogOption(const string& OptionName)
        {
            if (LogOptionDescriptions.find(OptionName) ==
                LogOptionDescriptions.end()) {
                throw FOPDRError((string)"Log option \"" + OptionName + "\" is not " +
                                 "a recognized log option.\nIn call to " + __FUNCTION__ +
                                 " at " + __FILE__ + ":" + to_string(__LINE__));
            }

            if (OptionName == "FOPDR.All") {
                NoLoggingEnabled() = false;
                for (auto const& OptionDesc : LogOptionDescriptions) {
                    if (OptionDesc.first != "FOPDR.None") {
                        EnabledLogOptions().insert(OptionDesc.first);
                    }
                }
            } else if (OptionName == "FOPDR.None") {
                NoLoggingEnabled() = true;
                EnabledLogOptions().clear();
            } else {
                NoLoggingEnabled() = false;
                EnabledLogOptions().insert(OptionName);
            }
        }

        bool LogManager::IsOptionEnabled(const string& OptionName)
        {
            return (!NoLoggingEnabled() && (EnabledLogOptions().find(OptionName) !=
                                            EnabledLogOptions().end()));
        }

        bool LogManager::IsLoggingDisabled()
        {
            return NoLoggingEnabled();
        }

        string LogManager::GetLogOptions()
        {
            ostringstream sstr;
            sstr << "Available logging options:" << endl;
            for (auto const& Option : LogOptionDescriptions) {
                sstr << left << setw(28) << setfill(' ') << Option.first
                     << ": " << Option.second << endl;
            }
            return sstr.str();
        }

    } /* end namespace Logging */
} /* end namespace FOPDR */

//
// LogManager.cpp ends here
