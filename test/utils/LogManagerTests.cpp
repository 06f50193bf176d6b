// LogManagerTests.cpp --- 
// 
// Filename: LogManagerTests.cpp
// Author: FOPDR developers
// Created: Thu Sep 10 19:22:41 2026 (-0400)
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

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include "../../src/lib/FOPDRLib.hpp"
#include "../../src/utils/LogManager.hpp"
#include "../common/TestUtils.hpp"

using namespace FOPDR;
using Logging::LogManager;

static inline void TestLogOptions()
{
    cout << "Testing log options" << endl;

    FOPDR_TEST_EXPECT_THROW(FOPDRError, LogManager::EnableLogOption("UPDR.NoSuchTag"),
                            "unknown log option accepted");

    LogManager::EnableLogOption("UPDR.Frames");
    FOPDR_TEST_CHECK(LogManager::IsOptionEnabled("UPDR.Frames"), "option not enabled");
    FOPDR_TEST_CHECK(!LogManager::IsOptionEnabled("UPDR.Pushing"), "unrelated option enabled");

    LogManager::EnableLogOption("FOPDR.None");
    FOPDR_TEST_CHECK(LogManager::IsLoggingDisabled(), "FOPDR.None did not disable logging");
    FOPDR_TEST_CHECK(!LogManager::IsOptionEnabled("UPDR.Frames"),
                     "option still enabled after FOPDR.None");

    LogManager::EnableLogOption("FOPDR.All");
    FOPDR_TEST_CHECK(!LogManager::IsLoggingDisabled(), "FOPDR.All left logging disabled");
    FOPDR_TEST_CHECK(LogManager::IsOptionEnabled("Generalizer.Detailed") &&
                     LogManager::IsOptionEnabled("Checkpoint.Detailed"),
                     "FOPDR.All did not enable every option");
    FOPDR_TEST_CHECK(!LogManager::IsOptionEnabled("FOPDR.None"), "FOPDR.All enabled FOPDR.None");

    FOPDR_TEST_CHECK(LogManager::GetLogOptions().find("UPDR.Blocking") != string::npos,
                     "option missing from the description");
    FOPDRLib::Finalize();
}

static inline void TestCompressedLog()
{
    cout << "Testing a gzip compressed log file" << endl;

    const string BaseName = "fopdr_log_test.log";
    const string Marker = "Learned at frames 0..2: (forall ((n node)) (not (holds_lock n)))";

    FOPDRLibOptionsT Options;
    Options.LogFileName = BaseName;
    Options.LogCompressionTechnique = LogFileCompressionTechniqueT::COMPRESS_GZIP;
    Options.LoggingOptions.insert("UPDR.Blocking");
    FOPDRLib::Initialize(Options);

    FOPDR_TEST_CHECK(LogManager::IsOptionEnabled("UPDR.Blocking"),
                     "library did not enable its log options");
    LogManager::GetLogStream() << Marker << endl;
    FOPDRLib::Finalize();

    boost::iostreams::filtering_istream In;
    In.push(boost::iostreams::gzip_decompressor());
    In.push(boost::iostreams::file_source(BaseName + ".gz", ios_base::in | ios_base::binary));
    string Line;
    getline(In, Line);
    FOPDR_TEST_CHECK(Line == Marker, "log file holds \"" << Line << "\"");
    In.reset();

    std::remove((BaseName + ".gz").c_str());
}

int main()
{
    TestLogOptions();
    TestCompressedLog();
    cout << "All log manager tests passed" << endl;
    return 0;
}

//
// LogManagerTests.cpp ends here
