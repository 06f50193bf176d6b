// FOPDRLib.cpp --- 
// 
// Filename: FOPDRLib.cpp
// Author: FOPDR developers
// Created: Wed Jul 22 15:06:40 2026 (-0400)
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
#include <string.h>

#include "../utils/LogManager.hpp"
#include "../utils/ResourceLimitManager.hpp"

#include "FOPDRLib.hpp"

namespace FOPDR {

FOPDRLibOptionsT::FOPDRLibOptionsT()
    : LogFileName(""),
      LogCompressionTechnique(LogFileCompressionTechniqueT::COMPRESS_NONE),
      LoggingOptions(),
      MemCeilingMB(0),
      CPULimitSeconds(UINT64_MAX),
      MemLimitMB(UINT64_MAX)
{
    // Nothing here
}

FOPDRLibOptionsT::~FOPDRLibOptionsT()
{
    // Nothing here
}

FOPDRLibOptionsT::FOPDRLibOptionsT(const FOPDRLibOptionsT& Other)
    : LogFileName(Other.LogFileName),
      LogCompressionTechnique(Other.LogCompressionTechnique),
      LoggingOptions(Other.LoggingOptions),
      MemCeilingMB(Other.MemCeilingMB),
      CPULimitSeconds(Other.CPULimitSeconds),
      MemLimitMB(Other.MemLimitMB)
{
    // Nothing here
}

FOPDRLibOptionsT& FOPDRLibOptionsT::operator = (const FOPDRLibOptionsT& Other)
{
    if (&Other == this) {
        return *this;
    }
    LogFileName = Other.LogFileName;
    LogCompressionTechnique = Other.LogCompressionTechnique;
    LoggingOptions = Other.LoggingOptions;
    MemCeilingMB = Other.MemCeilingMB;
    CPULimitSeconds = Other.CPULimitSeconds;
    MemLimitMB = Other.MemLimitMB;
    return *this;
}

FOPDRLibOptionsT& FOPDRLib::FOPDRLibOptions()
{
    static FOPDRLibOptionsT FOPDRLibOptions_;
    return FOPDRLibOptions_;
}

FOPDRLib::FOPDRLib()
{
    // Nothing here
}

void FOPDRLib::Initialize()
{
    Logging::LogManager::Initialize();
}

void FOPDRLib::Initialize(const FOPDRLibOptionsT& LibOptions)
{
    FOPDRLibOptions() = LibOptions;
    Logging::LogManager::Initialize(FOPDRLibOptions().LogFileName,
                                    FOPDRLibOptions().LogCompressionTechnique);
    Logging::LogManager::EnableLogOptions(FOPDRLibOptions().LoggingOptions.begin(),
                                          FOPDRLibOptions().LoggingOptions.end());

    if (FOPDRLibOptions().MemCeilingMB != 0) {
        ResourceLimitManager::SetHardMemoryCeiling(FOPDRLibOptions().MemCeilingMB *
                                                   (u64)1024 * (u64)1024);
    }
    ResourceLimitManager::SetCPULimit(FOPDRLibOptions().CPULimitSeconds);
    if (FOPDRLibOptions().MemLimitMB == UINT64_MAX) {
        ResourceLimitManager::SetMemLimit(UINT64_MAX);
    } else {
        ResourceLimitManager::SetMemLimit(FOPDRLibOptions().MemLimitMB *
                                          (u64)1024 * (u64)1024);
    }
}

const FOPDRLibOptionsT& FOPDRLib::GetOptions()
{
    return FOPDRLibOptions();
}

void FOPDRLib::Finalize()
{
    ResourceLimitManager::ClearOnLimitHandlers();
    Logging::LogManager::Finalize();
}

// The library initializer
__attribute__((constructor)) void FOPDRLibInitialize_()
{
    FOPDRLib::Initialize();
}

__attribute__((destructor)) void FOPDRLibFinalize_()
{
    FOPDRLib::Finalize();
}

} /* end namespace FOPDR */

//
// FOPDRLib.cpp ends here
