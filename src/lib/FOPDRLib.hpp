// FOPDRLib.hpp --- 
// 
// Filename: FOPDRLib.hpp
// Author: FOPDR developers
// Created: Sun Jul 26 04:18:14 2026 (-0400)
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

#if !defined FOPDR_LIB_FOPDR_LIB_HPP_
#define FOPDR_LIB_FOPDR_LIB_HPP_

#include <set>

#include "../common/FOPDRFwdDecls.hpp"

namespace FOPDR {

class FOPDRLibOptionsT
{
public:
    string LogFileName;
    LogFileCompressionTechniqueT LogCompressionTechnique;
    set<string> LoggingOptions;
    // Hard address space ceiling in MB, 0 for none
    u64 MemCeilingMB;
    // Soft limits watched while a search runs, UINT64_MAX for none
    u64 CPULimitSeconds;
    u64 MemLimitMB;

    FOPDRLibOptionsT();
    virtual ~FOPDRLibOptionsT();

    FOPDRLibOptionsT(const FOPDRLibOptionsT& Other);
    FOPDRLibOptionsT& operator = (const FOPDRLibOptionsT& Other);
};

class FOPDRLib
{
private:
    static FOPDRLibOptionsT& FOPDRLibOptions();

    FOPDRLib();
    FOPDRLib(const FOPDRLib& Other) = delete;
    FOPDRLib(FOPDRLib&& Other) = delete;

public:
    static void Initialize();
    static void Initialize(const FOPDRLibOptionsT& LibOptions);
    static const FOPDRLibOptionsT& GetOptions();
    static void Finalize();
};

__attribute__((constructor)) extern void FOPDRLibInitialize_();
__attribute__((destructor)) extern void FOPDRLibFinalize_();

} /* end namespace FOPDR */

#endif /* FOPDR_LIB_FOPDR_LIB_HPP_ */

//
// FOPDRLib.hpp ends here
