// FOPDRFwdDecls.hpp --- 
// 
// Filename: FOPDRFwdDecls.hpp
// Author: FOPDR developers
// Created: Wed Jul 08 17:07:41 2026 (-0400)
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

// Forward declarations of classes and types

#if !defined FOPDR_COMMON_FOPDR_FWD_DECLS_HPP_
#define FOPDR_COMMON_FOPDR_FWD_DECLS_HPP_

#include "FOPDRTypes.hpp"
#include <vector>
#include <list>

namespace FOPDR {

    // SmartPtrs and such
    class RefCountable;
    template <typename T> class SmartPtr;
    template <typename T> class CSmartPtr;

    namespace Model {

        enum class ExprKind;
        class ExprNode;
        class SortDecl;
        class SymbolDecl;
        class TransitionDecl;
        class Program;

        typedef CSmartPtr<ExprNode> ExpT;
        typedef vector<ExpT> ExpVecT;
        typedef CSmartPtr<SortDecl> SortRef;
        typedef CSmartPtr<SymbolDecl> SymbolRef;
        typedef CSmartPtr<TransitionDecl> TransitionRef;

        class ExprPtrHasher;
        class ExprPtrEquals;

    } /* end namespace Model */

    namespace TP {

        class Z3Object;
        class Z3CtxWrapper;
        class Z3Expr;
        class Z3Sort;
        class Z3FuncDecl;
        class Z3Model;
        class Z3Solver;

        typedef CSmartPtr<Z3CtxWrapper> Z3Ctx;

        class Z3TheoremProver;
        class ScopedQuery;

        typedef SmartPtr<Z3TheoremProver> Z3TPRef;

    } /* end namespace TP */

    namespace Translate {

        class Translator;
        class SolverSession;
        class Trace;
        class BoundedChecker;

    } /* end namespace Translate */

    namespace UPDR {

        class Diagram;
        class Generalizer;
        class Frames;
        class Obligation;
        class SearchResult;
        class Checkpoint;

    } /* end namespace UPDR */

} /* end namespace FOPDR */

#endif /* FOPDR_COMMON_FOPDR_FWD_DECLS_HPP_ */

//
// FOPDRFwdDecls.hpp ends here
