// Z3Objects.hpp --- 
// 
// Filename: Z3Objects.hpp
// Author: FOPDR developers
// Created: Mon Aug 10 08:31:42 2026 (-0400)
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

// Reference counted handles on Z3 objects. Every handle keeps its
// context alive, so objects may outlive the prover that made them.

#if !defined FOPDR_TPINTERFACE_Z3_OBJECTS_HPP_
#define FOPDR_TPINTERFACE_Z3_OBJECTS_HPP_

#include <z3.h>

#include "../common/FOPDRFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"

namespace FOPDR {
    namespace TP {

        // Owns a Z3 context created with reference counted ASTs
        class Z3CtxWrapper : public RefCountable
        {
        private:
            Z3_context Ctx;

        public:
            Z3CtxWrapper();
            virtual ~Z3CtxWrapper();

            operator Z3_context () const;
            Z3_context GetCtx() const;
        };

        class Z3Object : public Stringifiable
        {
        protected:
            Z3Ctx Ctx;

        public:
            Z3Object();
            Z3Object(const Z3Ctx& Ctx);
            Z3Object(const Z3Object& Other);
            virtual ~Z3Object();

            const Z3Ctx& GetCtx() const;
            using Stringifiable::ToString;
        };

        class Z3Expr : public Z3Object
        {
        private:
            Z3_ast AST;

        public:
            Z3Expr();
            Z3Expr(const Z3Expr& Other);
            Z3Expr(const Z3Ctx& Ctx, Z3_ast AST);
            Z3Expr(Z3Expr&& Other);
            virtual ~Z3Expr();

            Z3Expr& operator = (Z3Expr Other);
            // Structural equality, as decided by Z3
            bool operator == (const Z3Expr& Other) const;

            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;

            bool IsNull() const;
            bool IsTrue() const;
            bool IsFalse() const;

            operator Z3_ast () const;
        };

        class Z3Sort : public Z3Object
        {
        private:
            Z3_sort Sort;

        public:
            Z3Sort();
            Z3Sort(const Z3Sort& Other);
            Z3Sort(const Z3Ctx& Ctx, Z3_sort Sort);
            Z3Sort(Z3Sort&& Other);
            virtual ~Z3Sort();

            Z3Sort& operator = (Z3Sort Other);
            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;

            operator Z3_sort () const;
        };

        class Z3FuncDecl : public Z3Object
        {
        private:
            Z3_func_decl FuncDecl;

        public:
            Z3FuncDecl();
            Z3FuncDecl(const Z3FuncDecl& Other);
            Z3FuncDecl(const Z3Ctx& Ctx, Z3_func_decl FuncDecl);
            Z3FuncDecl(Z3FuncDecl&& Other);
            virtual ~Z3FuncDecl();

            Z3FuncDecl& operator = (Z3FuncDecl Other);
            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;

            Z3Expr Apply(const vector<Z3Expr>& Args) const;
            u32 GetArity() const;

            operator Z3_func_decl () const;
        };

        // A fresh solver of the context, owned by one prover
        class Z3Solver : public Z3Object
        {
        private:
            Z3_solver Solver;

        public:
            Z3Solver(const Z3Ctx& Ctx);
            Z3Solver(const Z3Solver& Other) = delete;
            Z3Solver& operator = (const Z3Solver& Other) = delete;
            virtual ~Z3Solver();

            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;

            operator Z3_solver () const;
        };

        class Z3Model : public Z3Object
        {
        private:
            Z3_model Model;

        public:
            Z3Model();
            Z3Model(const Z3Model& Other);
            Z3Model(const Z3Ctx& Ctx, Z3_model Model);
            Z3Model(Z3Model&& Other);
            virtual ~Z3Model();

            Z3Model& operator = (Z3Model Other);
            virtual string ToString(u32 Verbosity) const override;
            using Stringifiable::ToString;

            bool IsNull() const;

            // Evaluates with model completion. Throws InternalError if
            // Z3 cannot evaluate the expression.
            Z3Expr Evaluate(const Z3Expr& Expr) const;
            bool EvaluateBool(const Z3Expr& Expr) const;
            // Distinct elements of an uninterpreted sort, empty if the
            // model does not interpret the sort
            vector<Z3Expr> GetUniverse(const Z3Sort& Sort) const;

            operator Z3_model () const;
        };

    } /* end namespace TP */
} /* end namespace FOPDR */

#endif /* FOPDR_TPINTERFACE_Z3_OBJECTS_HPP_ */

//
// Z3Objects.hpp ends here
