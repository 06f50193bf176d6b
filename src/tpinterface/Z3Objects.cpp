// Z3Objects.cpp --- 
// 
// Filename: Z3Objects.cpp
// Author: FOPDR developers
// Created: Sun Aug 09 12:17:36 2026 (-0400)
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

#include "Z3Objects.hpp"

namespace FOPDR {
    namespace TP {

        // Errors from the Z3 API are the result of malformed terms,
        // which only a bug in the translator can produce
        static void Z3ErrorHandler(Z3_context Ctx, Z3_error_code Code)
        {
            throw InternalError((string)"Z3 reported an error: " +
                                Z3_get_error_msg(Ctx, Code));
        }

        Z3CtxWrapper::Z3CtxWrapper()
        {
            Z3_global_param_set("model_evaluator.completion", "true");
            auto Cfg = Z3_mk_config();
            Z3_set_param_value(Cfg, "model", "true");
            Ctx = Z3_mk_context_rc(Cfg);
            Z3_del_config(Cfg);
            Z3_set_error_handler(Ctx, Z3ErrorHandler);
        }

        Z3CtxWrapper::~Z3CtxWrapper()
        {
            Z3_del_context(Ctx);
        }

        Z3CtxWrapper::operator Z3_context () const
        {
            return Ctx;
        }

        Z3_context Z3CtxWrapper::GetCtx() const
        {
            return Ctx;
        }

        Z3Object::Z3Object()
            : Ctx(Z3Ctx::NullPtr)
        {
            // Nothing here
        }

        Z3Object::Z3Object(const Z3Ctx& Ctx)
            : Ctx(Ctx)
        {
            // Nothing here
        }

        Z3Object::Z3Object(const Z3Object& Other)
            : Stringifiable(), Ctx(Other.Ctx)
        {
            // Nothing here
        }

        Z3Object::~Z3Object()
        {
            // Nothing here
        }

        const Z3Ctx& Z3Object::GetCtx() const
        {
            return Ctx;
        }

        // Sorts and declarations are counted through their AST views
        static inline void IncRef(const Z3Ctx& Ctx, Z3_ast AST)
        {
            if (Ctx != Z3Ctx::NullPtr && AST != nullptr) {
                Z3_inc_ref(*Ctx, AST);
            }
        }

        static inline void DecRef(const Z3Ctx& Ctx, Z3_ast AST)
        {
            if (Ctx != Z3Ctx::NullPtr && AST != nullptr) {
                Z3_dec_ref(*Ctx, AST);
            }
        }

        static inline Z3_ast SortAST(const Z3Ctx& Ctx, Z3_sort Sort)
        {
            return (Ctx == Z3Ctx::NullPtr || Sort == nullptr ?
                    nullptr : Z3_sort_to_ast(*Ctx, Sort));
        }

        static inline Z3_ast FuncDeclAST(const Z3Ctx& Ctx, Z3_func_decl FuncDecl)
        {
            return (Ctx == Z3Ctx::NullPtr || FuncDecl == nullptr ?
                    nullptr : Z3_func_decl_to_ast(*Ctx, FuncDecl));
        }

        // Z3Expr
        Z3Expr::Z3Expr()
            : Z3Object(), AST(nullptr)
        {
            // Nothing here
        }

        Z3Expr::Z3Expr(const Z3Expr& Other)
            : Z3Object(Other), AST(Other.AST)
        {
            IncRef(Ctx, AST);
        }

        Z3Expr::Z3Expr(const Z3Ctx& Ctx, Z3_ast AST)
            : Z3Object(Ctx), AST(AST)
        {
            IncRef(Ctx, AST);
        }

        Z3Expr::Z3Expr(Z3Expr&& Other)
            : Z3Object(), AST(nullptr)
        {
            swap(Ctx, Other.Ctx);
            swap(AST, Other.AST);
        }

        Z3Expr::~Z3Expr()
        {
            DecRef(Ctx, AST);
        }

        Z3Expr& Z3Expr::operator = (Z3Expr Other)
        {
            swap(Ctx, Other.Ctx);
            swap(AST, Other.AST);
            return *this;
        }

        bool Z3Expr::operator == (const Z3Expr& Other) const
        {
            if (IsNull() || Other.IsNull()) {
                return (IsNull() && Other.IsNull());
            }
            return (Ctx == Other.Ctx && Z3_is_eq_ast(*Ctx, AST, Other.AST));
        }

        string Z3Expr::ToString(u32 Verbosity) const
        {
            if (IsNull()) {
                return "nullexpr";
            }
            return Z3_ast_to_string(*Ctx, AST);
        }

        bool Z3Expr::IsNull() const
        {
            return (Ctx == Z3Ctx::NullPtr || AST == nullptr);
        }

        bool Z3Expr::IsTrue() const
        {
            return (!IsNull() && Z3_get_bool_value(*Ctx, AST) == Z3_L_TRUE);
        }

        bool Z3Expr::IsFalse() const
        {
            return (!IsNull() && Z3_get_bool_value(*Ctx, AST) == Z3_L_FALSE);
        }

        Z3Expr::operator Z3_ast () const
        {
            return AST;
        }

        // Z3Sort
        Z3Sort::Z3Sort()
            : Z3Object(), Sort(nullptr)
        {
            // Nothing here
        }

        Z3Sort::Z3Sort(const Z3Ctx& Ctx, Z3_sort Sort)
            : Z3Object(Ctx), Sort(Sort)
        {
            IncRef(Ctx, SortAST(Ctx, Sort));
        }

        Z3Sort::Z3Sort(const Z3Sort& Other)
            : Z3Object(Other), Sort(Other.Sort)
        {
            IncRef(Ctx, SortAST(Ctx, Sort));
        }

        Z3Sort::Z3Sort(Z3Sort&& Other)
            : Z3Object(), Sort(nullptr)
        {
            swap(Ctx, Other.Ctx);
            swap(Sort, Other.Sort);
        }

        Z3Sort::~Z3Sort()
        {
            DecRef(Ctx, SortAST(Ctx, Sort));
        }

        Z3Sort& Z3Sort::operator = (Z3Sort Other)
        {
            swap(Ctx, Other.Ctx);
            swap(Sort, Other.Sort);
            return *this;
        }

        string Z3Sort::ToString(u32 Verbosity) const
        {
            if (Ctx == Z3Ctx::NullPtr || Sort == nullptr) {
                return "nullsort";
            }
            return Z3_sort_to_string(*Ctx, Sort);
        }

        Z3Sort::operator Z3_sort () const
        {
            return Sort;
        }

        // Z3FuncDecl
        Z3FuncDecl::Z3FuncDecl()
            : Z3Object(), FuncDecl(nullptr)
        {
            // Nothing here
        }

        Z3FuncDecl::Z3FuncDecl(const Z3Ctx& Ctx, Z3_func_decl FuncDecl)
            : Z3Object(Ctx), FuncDecl(FuncDecl)
        {
            IncRef(Ctx, FuncDeclAST(Ctx, FuncDecl));
        }

        Z3FuncDecl::Z3FuncDecl(const Z3FuncDecl& Other)
            : Z3Object(Other), FuncDecl(Other.FuncDecl)
        {
            IncRef(Ctx, FuncDeclAST(Ctx, FuncDecl));
        }

        Z3FuncDecl::Z3FuncDecl(Z3FuncDecl&& Other)
            : Z3Object(), FuncDecl(nullptr)
        {
            swap(Ctx, Other.Ctx);
            swap(FuncDecl, Other.FuncDecl);
        }

        Z3FuncDecl::~Z3FuncDecl()
        {
            DecRef(Ctx, FuncDeclAST(Ctx, FuncDecl));
        }

        Z3FuncDecl& Z3FuncDecl::operator = (Z3FuncDecl Other)
        {
            swap(Ctx, Other.Ctx);
            swap(FuncDecl, Other.FuncDecl);
            return *this;
        }

        string Z3FuncDecl::ToString(u32 Verbosity) const
        {
            if (Ctx == Z3Ctx::NullPtr || FuncDecl == nullptr) {
                return "nullfuncdecl";
            }
            return Z3_func_decl_to_string(*Ctx, FuncDecl);
        }

        Z3Expr Z3FuncDecl::Apply(const vector<Z3Expr>& Args) const
        {
            vector<Z3_ast> ArgASTs(Args.begin(), Args.end());
            return Z3Expr(Ctx, Z3_mk_app(*Ctx, FuncDecl, (u32)ArgASTs.size(),
                                         ArgASTs.data()));
        }

        u32 Z3FuncDecl::GetArity() const
        {
            return Z3_get_arity(*Ctx, FuncDecl);
        }

        Z3FuncDecl::operator Z3_func_decl () const
        {
            return FuncDecl;
        }

        // Z3Solver
        Z3Solver::Z3Solver(const Z3Ctx& Ctx)
            : Z3Object(Ctx), Solver(Z3_mk_solver(*Ctx))
        {
            Z3_solver_inc_ref(*Ctx, Solver);
        }

        Z3Solver::~Z3Solver()
        {
            Z3_solver_dec_ref(*Ctx, Solver);
        }

        string Z3Solver::ToString(u32 Verbosity) const
        {
            return string(Z3_solver_to_string(*Ctx, Solver));
        }

        Z3Solver::operator Z3_solver () const
        {
            return Solver;
        }

        // Z3Model
        Z3Model::Z3Model()
            : Z3Object(), Model(nullptr)
        {
            // Nothing here
        }

        Z3Model::Z3Model(const Z3Model& Other)
            : Z3Object(Other), Model(Other.Model)
        {
            if (!IsNull()) {
                Z3_model_inc_ref(*Ctx, Model);
            }
        }

        Z3Model::Z3Model(const Z3Ctx& Ctx, Z3_model Model)
            : Z3Object(Ctx), Model(Model)
        {
            if (!IsNull()) {
                Z3_model_inc_ref(*Ctx, Model);
            }
        }

        Z3Model::Z3Model(Z3Model&& Other)
            : Z3Model()
        {
            swap(Ctx, Other.Ctx);
            swap(Model, Other.Model);
        }

        Z3Model::~Z3Model()
        {
            if (!IsNull()) {
                Z3_model_dec_ref(*Ctx, Model);
            }
        }

        Z3Model& Z3Model::operator = (Z3Model Other)
        {
            swap(Ctx, Other.Ctx);
            swap(Model, Other.Model);
            return *this;
        }

        string Z3Model::ToString(u32 Verbosity) const
        {
            if (IsNull()) {
                return "nullmodel";
            }
            return string(Z3_model_to_string(*Ctx, Model));
        }

        bool Z3Model::IsNull() const
        {
            return (Ctx == Z3Ctx::NullPtr || Model == nullptr);
        }

        Z3Expr Z3Model::Evaluate(const Z3Expr& Expr) const
        {
            Z3_ast OutAST = nullptr;
            if (!Z3_model_eval(*Ctx, Model, Expr, true, &OutAST) || OutAST == nullptr) {
                throw InternalError((string)"Could not evaluate expression in model:\n" +
                                    Expr.ToString());
            }
            return Z3Expr(Ctx, OutAST);
        }

        bool Z3Model::EvaluateBool(const Z3Expr& Expr) const
        {
            auto Value = Evaluate(Expr);
            if (Value.IsTrue()) {
                return true;
            } else if (Value.IsFalse()) {
                return false;
            }
            throw InternalError((string)"Expression did not evaluate to a boolean " +
                                "constant in model:\n" + Expr.ToString() + "\nGot: " +
                                Value.ToString());
        }

        vector<Z3Expr> Z3Model::GetUniverse(const Z3Sort& Sort) const
        {
            vector<Z3Expr> Retval;
            const u32 NumSorts = Z3_model_get_num_sorts(*Ctx, Model);
            bool Found = false;
            for (u32 i = 0; i < NumSorts && !Found; ++i) {
                Found = Z3_is_eq_sort(*Ctx, Z3_model_get_sort(*Ctx, Model, i), Sort);
            }
            if (!Found) {
                return Retval;
            }

            auto Universe = Z3_model_get_sort_universe(*Ctx, Model, Sort);
            Z3_ast_vector_inc_ref(*Ctx, Universe);
            const u32 NumElems = Z3_ast_vector_size(*Ctx, Universe);
            for (u32 i = 0; i < NumElems; ++i) {
                Retval.push_back(Z3Expr(Ctx, Z3_ast_vector_get(*Ctx, Universe, i)));
            }
            Z3_ast_vector_dec_ref(*Ctx, Universe);
            return Retval;
        }

        Z3Model::operator Z3_model () const
        {
            return Model;
        }

    } /* end namespace TP */
} /* end namespace FOPDR */

//
// Z3Objects.cpp ends here
