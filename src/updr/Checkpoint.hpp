// Checkpoint.hpp --- 
// 
// Filename: Checkpoint.hpp
// Author: FOPDR developers
// Created: Wed Aug 26 06:33:34 2026 (-0400)
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

#if !defined FOPDR_UPDR_CHECKPOINT_HPP_
#define FOPDR_UPDR_CHECKPOINT_HPP_

#include "SearchState.hpp"

namespace FOPDR {
    namespace UPDR {

        // A checkpoint that cannot be restored. Nothing of it is used.
        class CheckpointError : public FOPDRError
        {
        public:
            CheckpointError(const string& ErrorMsg);
            virtual ~CheckpointError() throw ();
        };

        // Versioned s-expression encoding of a SearchState. Loading
        // checks the version and the fingerprint of the program, and
        // re-reads every formula against the program.
        class Checkpoint
        {
        private:
            Checkpoint();

        public:
            static const u32 FormatVersion;
            static const string HeaderName;

            static void Save(const SearchState& State, const Model::Program& Prog, ostream& Out);
            static SearchState Load(istream& In, const Model::ProgramRef& Prog,
                                    const string& SourceName = "<checkpoint>");

            static void SaveToFile(const SearchState& State, const Model::Program& Prog,
                                   const string& FileName);
            static SearchState LoadFromFile(const string& FileName, const Model::ProgramRef& Prog);
        };

    } /* end namespace UPDR */
} /* end namespace FOPDR */

#endif /* FOPDR_UPDR_CHECKPOINT_HPP_ */

//
// Checkpoint.hpp ends here
