// SExprIO.cpp --- 
// 
// Filename: SExprIO.cpp
// Author: FOPDR developers
// Created: Sat Aug 01 04:46:18 2026 (-0400)
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

#include <ctype.h>

#include "SExprIO.hpp"

namespace FOPDR {
    namespace Model {

        string SExpr::ToString() const
        {
            if (IsAtom) {
                return Atom;
            }
            ostringstream sstr;
            sstr << "(";
            for (u32 i = 0; i < Items.size(); ++i) {
                if (i > 0) {
                    sstr << " ";
                }
                sstr << Items[i].ToString();
            }
            sstr << ")";
            return sstr.str();
        }

        SExprReader::SExprReader(istream& In, const string& SourceName)
            : In(In), SourceName(SourceName), CurLine(1)
        {
            // Nothing here
        }

        SExprReader::~SExprReader()
        {
            // Nothing here
        }

        FOPDRError SExprReader::MakeError(u32 Line, const string& Message) const
        {
            return FOPDRError(SourceName + ":" + to_string(Line) + ": " + Message);
        }

        int SExprReader::Peek()
        {
            return In.peek();
        }

        int SExprReader::Get()
        {
            int Char = In.get();
            if (Char == '\n') {
                ++CurLine;
            }
            return Char;
        }

        void SExprReader::SkipWhitespaceAndComments()
        {
            while (true) {
                int Char = Peek();
                if (Char == EOF) {
                    return;
                }
                if (isspace(Char)) {
                    Get();
                } else if (Char == ';') {
                    while (Peek() != EOF && Peek() != '\n') {
                        Get();
                    }
                } else {
                    return;
                }
            }
        }

        SExpr SExprReader::ReadOne()
        {
            SkipWhitespaceAndComments();
            SExpr Retval;
            Retval.Line = CurLine;

            int Char = Peek();
            if (Char == EOF) {
                throw MakeError(CurLine, "Unexpected end of input");
            }
            if (Char == ')') {
                throw MakeError(CurLine, "Unbalanced \")\"");
            }

            if (Char == '(') {
                Get();
                Retval.IsAtom = false;
                while (true) {
                    SkipWhitespaceAndComments();
                    if (Peek() == EOF) {
                        throw MakeError(Retval.Line, "Unterminated \"(\"");
                    }
                    if (Peek() == ')') {
                        Get();
                        break;
                    }
                    Retval.Items.push_back(ReadOne());
                }
                return Retval;
            }

            Retval.IsAtom = true;
            while (true) {
                Char = Peek();
                if (Char == EOF || isspace(Char) || Char == '(' || Char == ')' || Char == ';') {
                    break;
                }
                Retval.Atom.push_back((char)Get());
            }
            return Retval;
        }

        bool SExprReader::Read(SExpr& Result)
        {
            SkipWhitespaceAndComments();
            if (Peek() == EOF) {
                return false;
            }
            Result = ReadOne();
            return true;
        }

        vector<SExpr> SExprReader::ReadAll()
        {
            vector<SExpr> Retval;
            SExpr Expr;
            while (Read(Expr)) {
                Retval.push_back(Expr);
            }
            return Retval;
        }

        static inline const string& ExpectAtom(const SExpr& Expr, const SExprReader& Reader,
                                               const string& What)
        {
            if (!Expr.IsAtom) {
                throw Reader.MakeError(Expr.Line, (string)"Expected " + What + ", got \"" +
                                       Expr.ToString() + "\"");
            }
            return Expr.Atom;
        }

        static inline const vector<SExpr>& ExpectList(const SExpr& Expr,
                                                      const SExprReader& Reader,
                                                      const string& What)
        {
            if (Expr.IsAtom) {
                throw Reader.MakeError(Expr.Line, (string)"Expected " + What + ", got \"" +
                                       Expr.Atom + "\"");
            }
            return Expr.Items;
        }

        static VarDeclVecT ParseBinder(const SExpr& Expr, const SExprReader& Reader)
        {
            VarDeclVecT Retval;
            for (auto const& Item : ExpectList(Expr, Reader, "a list of variable declarations")) {
                auto const& Pair = ExpectList(Item, Reader, "a (name sort) pair");
                if (Pair.size() != 2) {
                    throw Reader.MakeError(Item.Line, (string)"Expected a (name sort) pair, " +
                                           "got \"" + Item.ToString() + "\"");
                }
                Retval.push_back(VarDeclT(ExpectAtom(Pair[0], Reader, "a variable name"),
                                          ExpectAtom(Pair[1], Reader, "a sort name")));
            }
            return Retval;
        }

        static inline void CheckArgCount(const SExpr& Expr, const SExprReader& Reader,
                                         u32 Expected)
        {
            if (Expr.Items.size() != Expected + 1) {
                throw Reader.MakeError(Expr.Line, (string)"\"" + Expr.Items[0].Atom +
                                       "\" expects " + to_string(Expected) +
                                       " operands in \"" + Expr.ToString() + "\"");
            }
        }

        ExpT ParseFormula(const SExpr& Expr, const SExprReader& Reader)
        {
            if (Expr.IsAtom) {
                if (Expr.Atom == "true") {
                    return MkTrue();
                } else if (Expr.Atom == "false") {
                    return MkFalse();
                }
                return MkId(Expr.Atom);
            }

            if (Expr.Items.size() == 0) {
                throw Reader.MakeError(Expr.Line, "Empty list where a formula was expected");
            }

            auto const& Head = ExpectAtom(Expr.Items[0], Reader, "an operator or symbol");
            auto ParseOperand = [&] (u32 Index) -> ExpT
                {
                    return ParseFormula(Expr.Items[Index], Reader);
                };

            if (Head == "not") {
                CheckArgCount(Expr, Reader, 1);
                return MkNot(ParseOperand(1));
            } else if (Head == "and" || Head == "or") {
                ExpVecT Operands;
                for (u32 i = 1; i < Expr.Items.size(); ++i) {
                    Operands.push_back(ParseOperand(i));
                }
                return (Head == "and" ? MkAnd(Operands) : MkOr(Operands));
            } else if (Head == "=>") {
                CheckArgCount(Expr, Reader, 2);
                return MkImplies(ParseOperand(1), ParseOperand(2));
            } else if (Head == "<=>") {
                CheckArgCount(Expr, Reader, 2);
                return MkIff(ParseOperand(1), ParseOperand(2));
            } else if (Head == "=") {
                CheckArgCount(Expr, Reader, 2);
                return MkEq(ParseOperand(1), ParseOperand(2));
            } else if (Head == "!=") {
                CheckArgCount(Expr, Reader, 2);
                return MkNeq(ParseOperand(1), ParseOperand(2));
            } else if (Head == "ite") {
                CheckArgCount(Expr, Reader, 3);
                return MkIte(ParseOperand(1), ParseOperand(2), ParseOperand(3));
            } else if (Head == "forall" || Head == "exists") {
                CheckArgCount(Expr, Reader, 2);
                auto Bound = ParseBinder(Expr.Items[1], Reader);
                if (Bound.size() == 0) {
                    throw Reader.MakeError(Expr.Line, (string)"Empty binder in \"" +
                                           Expr.ToString() + "\"");
                }
                auto Body = ParseOperand(2);
                return (Head == "forall" ? MkForall(Bound, Body) : MkExists(Bound, Body));
            } else if (Head == "new") {
                CheckArgCount(Expr, Reader, 1);
                return MkNew(ParseOperand(1));
            }

            ExpVecT Args;
            for (u32 i = 1; i < Expr.Items.size(); ++i) {
                Args.push_back(ParseOperand(i));
            }
            return MkApp(Head, Args);
        }

        ExpT ReadFormula(const string& Text)
        {
            istringstream Input(Text);
            SExprReader Reader(Input, "<formula>");
            SExpr Expr;
            if (!Reader.Read(Expr)) {
                throw FOPDRError("Empty formula text");
            }
            auto Retval = ParseFormula(Expr, Reader);
            SExpr Trailing;
            if (Reader.Read(Trailing)) {
                throw Reader.MakeError(Trailing.Line, (string)"Trailing text after formula: \"" +
                                       Trailing.ToString() + "\"");
            }
            return Retval;
        }

        static inline bool ParseMutability(const SExpr& Expr, const SExprReader& Reader)
        {
            auto const& Atom = ExpectAtom(Expr, Reader, "\"mutable\" or \"immutable\"");
            if (Atom == "mutable") {
                return true;
            } else if (Atom == "immutable") {
                return false;
            }
            throw Reader.MakeError(Expr.Line, (string)"Expected \"mutable\" or \"immutable\", " +
                                   "got \"" + Atom + "\"");
        }

        static vector<string> ParseSortList(const SExpr& Expr, const SExprReader& Reader)
        {
            vector<string> Retval;
            for (auto const& Item : ExpectList(Expr, Reader, "a list of sorts")) {
                Retval.push_back(ExpectAtom(Item, Reader, "a sort name"));
            }
            return Retval;
        }

        // Splits (keyword [name] formula) into its name and formula
        static inline void ParseNamedFormula(const SExpr& Decl, const SExprReader& Reader,
                                             string& Name, ExpT& Formula)
        {
            if (Decl.Items.size() == 2) {
                Name = "";
                Formula = ParseFormula(Decl.Items[1], Reader);
            } else if (Decl.Items.size() == 3) {
                Name = ExpectAtom(Decl.Items[1], Reader, "a name");
                Formula = ParseFormula(Decl.Items[2], Reader);
            } else {
                throw Reader.MakeError(Decl.Line, (string)"Malformed \"" + Decl.Items[0].Atom +
                                       "\" declaration");
            }
        }

        static void ProcessDeclaration(const SExpr& Decl, const SExprReader& Reader,
                                       Program& Prog)
        {
            auto const& Items = ExpectList(Decl, Reader, "a declaration");
            if (Items.size() == 0) {
                throw Reader.MakeError(Decl.Line, "Empty declaration");
            }
            auto const& Keyword = ExpectAtom(Items[0], Reader, "a declaration keyword");

            if (Keyword == "sort") {
                if (Items.size() != 2) {
                    throw Reader.MakeError(Decl.Line, "Expected (sort NAME)");
                }
                Prog.AddSort(ExpectAtom(Items[1], Reader, "a sort name"));

            } else if (Keyword == "relation") {
                if (Items.size() != 4 && Items.size() != 5) {
                    throw Reader.MakeError(Decl.Line, (string)"Expected (relation NAME (SORTS) " +
                                           "MUTABILITY [(derived FORMULA)])");
                }
                ExpT Definition = ExpT::NullPtr;
                if (Items.size() == 5) {
                    auto const& DerivedItems = ExpectList(Items[4], Reader, "(derived FORMULA)");
                    if (DerivedItems.size() != 2 ||
                        ExpectAtom(DerivedItems[0], Reader, "\"derived\"") != "derived") {
                        throw Reader.MakeError(Items[4].Line, "Expected (derived FORMULA)");
                    }
                    Definition = ParseFormula(DerivedItems[1], Reader);
                }
                Prog.AddRelation(ExpectAtom(Items[1], Reader, "a relation name"),
                                 ParseSortList(Items[2], Reader),
                                 ParseMutability(Items[3], Reader), Definition);

            } else if (Keyword == "constant") {
                if (Items.size() != 4) {
                    throw Reader.MakeError(Decl.Line, "Expected (constant NAME SORT MUTABILITY)");
                }
                Prog.AddConstant(ExpectAtom(Items[1], Reader, "a constant name"),
                                 ExpectAtom(Items[2], Reader, "a sort name"),
                                 ParseMutability(Items[3], Reader));

            } else if (Keyword == "function") {
                if (Items.size() != 5) {
                    throw Reader.MakeError(Decl.Line, (string)"Expected (function NAME (SORTS) " +
                                           "SORT MUTABILITY)");
                }
                Prog.AddFunction(ExpectAtom(Items[1], Reader, "a function name"),
                                 ParseSortList(Items[2], Reader),
                                 ExpectAtom(Items[3], Reader, "a sort name"),
                                 ParseMutability(Items[4], Reader));

            } else if (Keyword == "transition") {
                if (Items.size() != 5) {
                    throw Reader.MakeError(Decl.Line, (string)"Expected (transition NAME " +
                                           "(PARAMS) (mods SYMBOLS) FORMULA)");
                }
                auto const& ModItems = ExpectList(Items[3], Reader, "(mods SYMBOLS)");
                if (ModItems.size() == 0 ||
                    ExpectAtom(ModItems[0], Reader, "\"mods\"") != "mods") {
                    throw Reader.MakeError(Items[3].Line, "Expected (mods SYMBOLS)");
                }
                set<string> Mods;
                for (u32 i = 1; i < ModItems.size(); ++i) {
                    Mods.insert(ExpectAtom(ModItems[i], Reader, "a symbol name"));
                }
                Prog.AddTransition(ExpectAtom(Items[1], Reader, "a transition name"),
                                   ParseBinder(Items[2], Reader), Mods,
                                   ParseFormula(Items[4], Reader));

            } else if (Keyword == "axiom" || Keyword == "init" || Keyword == "safety" ||
                       Keyword == "invariant" || Keyword == "theorem" ||
                       Keyword == "twostate-theorem") {
                string Name;
                ExpT Formula;
                ParseNamedFormula(Decl, Reader, Name, Formula);
                if (Keyword == "axiom") {
                    Prog.AddAxiom(Name, Formula);
                } else if (Keyword == "init") {
                    Prog.AddInit(Name, Formula);
                } else if (Keyword == "safety" || Keyword == "invariant") {
                    Prog.AddInvariant(Name, Formula, Keyword == "safety");
                } else {
                    Prog.AddTheorem(Name, Formula, Keyword == "twostate-theorem");
                }

            } else {
                throw Reader.MakeError(Decl.Line, (string)"Unknown declaration keyword \"" +
                                       Keyword + "\"");
            }
        }

        ProgramRef ReadProgram(istream& In, const string& SourceName)
        {
            SExprReader Reader(In, SourceName);
            SmartPtr<Program> Prog = new Program();

            SExpr Decl;
            while (Reader.Read(Decl)) {
                try {
                    ProcessDeclaration(Decl, Reader, *Prog);
                } catch (const FOPDRError& Ex) {
                    string Message = Ex.what();
                    // Errors raised by the reader already carry a location
                    if (Message.compare(0, SourceName.length() + 1, SourceName + ":") == 0) {
                        throw;
                    }
                    throw Reader.MakeError(Decl.Line, Message);
                }
            }

            try {
                Prog->Validate();
            } catch (const FOPDRError& Ex) {
                throw FOPDRError(SourceName + ": " + Ex.what());
            }
            return Prog;
        }

        ProgramRef ReadProgramFromFile(const string& FileName)
        {
            ifstream In(FileName);
            if (!In.is_open()) {
                throw FOPDRError((string)"Could not open program file \"" + FileName + "\"");
            }
            return ReadProgram(In, FileName);
        }

        ProgramRef ReadProgramFromString(const string& Text, const string& SourceName)
        {
            istringstream In(Text);
            return ReadProgram(In, SourceName);
        }

        void WriteProgram(ostream& Out, const Program& Prog)
        {
            Out << Prog.ToString(1);
        }

    } /* end namespace Model */
} /* end namespace FOPDR */

//
// SExprIO.cpp ends here
