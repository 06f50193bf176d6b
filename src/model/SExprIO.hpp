// SExprIO.hpp --- 
// 
// Filename: SExprIO.hpp
// Author: FOPDR developers
// Created: Sun Aug 02 21:11:20 2026 (-0400)
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

#if !defined FOPDR_MODEL_SEXPR_IO_HPP_
#define FOPDR_MODEL_SEXPR_IO_HPP_

#include "Program.hpp"

namespace FOPDR {
    namespace Model {

        // A parsed s-expression, atom or list, with the line it starts on
        class SExpr
        {
        public:
            bool IsAtom;
            string Atom;
            vector<SExpr> Items;
            u32 Line;

            inline SExpr() : IsAtom(false), Line(0) {}

            string ToString() const;
        };

        class SExprReader
        {
        private:
            istream& In;
            string SourceName;
            u32 CurLine;

            int Peek();
            int Get();
            void SkipWhitespaceAndComments();
            SExpr ReadOne();

        public:
            SExprReader(istream& In, const string& SourceName);
            ~SExprReader();

            // Returns false at end of input
            bool Read(SExpr& Result);
            vector<SExpr> ReadAll();

            FOPDRError MakeError(u32 Line, const string& Message) const;
        };

        // Reads and validates a program. Throws FOPDRError.
        extern ProgramRef ReadProgram(istream& In, const string& SourceName);
        extern ProgramRef ReadProgramFromFile(const string& FileName);
        extern ProgramRef ReadProgramFromString(const string& Text,
                                                const string& SourceName = "<string>");

        // Parses a formula without checking it against any vocabulary
        extern ExpT ReadFormula(const string& Text);
        extern ExpT ParseFormula(const SExpr& Expr, const SExprReader& Reader);

        extern void WriteProgram(ostream& Out, const Program& Prog);

    } /* end namespace Model */
} /* end namespace FOPDR */

#endif /* FOPDR_MODEL_SEXPR_IO_HPP_ */

//
// SExprIO.hpp ends here
