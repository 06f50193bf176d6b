// Checkpoint.cpp --- 
// 
// Filename: Checkpoint.cpp
// Author: FOPDR developers
// Created: Sun Aug 23 18:24:12 2026 (-0400)
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

#include "../model/SExprIO.hpp"
#include "../translate/StateTranslator.hpp"
#include "../utils/LogManager.hpp"

#include "Checkpoint.hpp"

namespace FOPDR {
    namespace UPDR {

        using Model::SExpr;
        using Model::SExprReader;
        using Model::FormulaContextT;

        CheckpointError::CheckpointError(const string& ErrorMsg)
            : FOPDRError(ErrorMsg)
        {
            // Nothing here
        }

        CheckpointError::~CheckpointError() throw ()
        {
            // Nothing here
        }

        const u32 Checkpoint::FormatVersion = 1;
        const string Checkpoint::HeaderName = "fopdr-checkpoint";

        // An empty transition name is written as this atom
        static const string NoTransitionAtom = "-";

        static inline void WritePredicates(ostream& Out, const string& Keyword,
                                           const ExpVecT& Predicates)
        {
            Out << "  (" << Keyword;
            for (auto const& Predicate : Predicates) {
                Out << endl << "    " << Predicate->ToString();
            }
            Out << ")" << endl;
        }

        void Checkpoint::Save(const SearchState& State, const Model::Program& Prog, ostream& Out)
        {
            Out << "(" << HeaderName << endl;
            Out << "  (version " << FormatVersion << ")" << endl;
            Out << "  (fingerprint " << Prog.GetFingerprint() << ")" << endl;
            Out << "  (counters " << State.NumLearnedStates << " "
                << State.NumDistinctPredicates << " " << State.NumIterations << ")" << endl;
            WritePredicates(Out, "log", State.PredicateLog);
            for (auto const& Frame : State.Frames) {
                WritePredicates(Out, "frame", Frame);
            }

            for (auto const& Ob : State.Obligations) {
                auto const& Diag = Ob.Diag;
                Out << "  (obligation " << Ob.FrameIndex << " " << Ob.Parent << " "
                    << (Ob.May ? "may" : "must") << " "
                    << (Ob.TransitionName == "" ? NoTransitionAtom : Ob.TransitionName)
                    << endl << "    (";
                bool First = true;
                for (auto const& Var : Diag.GetVars()) {
                    Out << (First ? "" : " ") << "(" << Var.Name << " " << Var.Sort << ")";
                    First = false;
                }
                Out << ")" << endl << "    (";
                First = true;
                for (auto const& Conjunct : Diag.GetConjuncts()) {
                    if (!First) {
                        Out << endl << "     ";
                    }
                    First = false;
                    Out << "(" << ConjunctKindToString(Conjunct.Kind) << " "
                        << (Conjunct.Enabled ? "on" : "off") << " "
                        << Conjunct.Formula->ToString() << ")";
                }
                Out << "))" << endl;
            }
            Out << ")" << endl;

            if (!Out.good()) {
                throw CheckpointError("Error writing checkpoint");
            }
        }

        namespace {

            // Decodes one checkpoint and checks it against a program
            class CheckpointDecoder
            {
            private:
                const SExprReader& Reader;
                const Model::ProgramRef& Prog;

            public:
                CheckpointDecoder(const SExprReader& Reader, const Model::ProgramRef& Prog)
                    : Reader(Reader), Prog(Prog)
                {
                    // Nothing here
                }

                FOPDRError Error(const SExpr& Where, const string& Message) const
                {
                    return Reader.MakeError(Where.Line, Message);
                }

                const string& Atom(const SExpr& Expr, const string& What) const
                {
                    if (!Expr.IsAtom) {
                        throw Error(Expr, "Expected " + What + ", got \"" + Expr.ToString() + "\"");
                    }
                    return Expr.Atom;
                }

                u64 Number(const SExpr& Expr, const string& What) const
                {
                    auto const& Text = Atom(Expr, What);
                    if (Text.size() == 0 || Text.find_first_not_of("0123456789") != string::npos) {
                        throw Error(Expr, "Expected " + What + ", got \"" + Text + "\"");
                    }
                    try {
                        return stoull(Text);
                    } catch (const out_of_range&) {
                        throw Error(Expr, What + " out of range: " + Text);
                    }
                }

                i32 SignedNumber(const SExpr& Expr, const string& What) const
                {
                    auto const& Text = Atom(Expr, What);
                    if (Text == "-1") {
                        return -1;
                    }
                    auto Value = Number(Expr, What);
                    if (Value > (u64)INT32_MAX) {
                        throw Error(Expr, What + " out of range: " + Text);
                    }
                    return (i32)Value;
                }

                // (keyword args...)
                const vector<SExpr>& Entry(const SExpr& Expr, const string& Keyword,
                                           u32 MinArgs, u32 MaxArgs) const
                {
                    if (Expr.IsAtom || Expr.Items.size() == 0 || !Expr.Items[0].IsAtom ||
                        Expr.Items[0].Atom != Keyword) {
                        throw Error(Expr, "Expected a \"" + Keyword + "\" entry, got \"" +
                                    Expr.ToString() + "\"");
                    }
                    auto NumArgs = Expr.Items.size() - 1;
                    if (NumArgs < MinArgs || NumArgs > MaxArgs) {
                        throw Error(Expr, "Malformed \"" + Keyword + "\" entry");
                    }
                    return Expr.Items;
                }

                ExpT Predicate(const SExpr& Expr) const
                {
                    auto Retval = Model::ParseFormula(Expr, Reader);
                    Prog->CheckFormula(Retval, FormulaContextT::SingleState);
                    return Retval;
                }

                ExpVecT Predicates(const SExpr& Expr, const string& Keyword) const
                {
                    auto const& Items = Entry(Expr, Keyword, 0, UINT32_MAX);
                    ExpVecT Retval;
                    for (u32 i = 1; i < Items.size(); ++i) {
                        Retval.push_back(Predicate(Items[i]));
                    }
                    return Retval;
                }

                ConjunctKindT Kind(const SExpr& Expr) const
                {
                    auto const& Text = Atom(Expr, "a conjunct kind");
                    for (auto Candidate : { ConjunctKindT::Distinct, ConjunctKindT::Relation,
                                            ConjunctKindT::Constant, ConjunctKindT::Function }) {
                        if (ConjunctKindToString(Candidate) == Text) {
                            return Candidate;
                        }
                    }
                    throw Error(Expr, "Unknown conjunct kind \"" + Text + "\"");
                }

                bool Flag(const SExpr& Expr, const string& OnText, const string& OffText) const
                {
                    auto const& Text = Atom(Expr, "\"" + OnText + "\" or \"" + OffText + "\"");
                    if (Text == OnText) {
                        return true;
                    } else if (Text == OffText) {
                        return false;
                    }
                    throw Error(Expr, "Expected \"" + OnText + "\" or \"" + OffText +
                                "\", got \"" + Text + "\"");
                }

                Obligation MakeObligation(const SExpr& Expr) const
                {
                    auto const& Items = Entry(Expr, "obligation", 6, 6);
                    Obligation Retval;
                    Retval.FrameIndex = (u32)Number(Items[1], "a frame index");
                    Retval.Parent = SignedNumber(Items[2], "a parent index");
                    Retval.May = Flag(Items[3], "may", "must");
                    auto const& TransitionName = Atom(Items[4], "a transition name");
                    if (TransitionName != NoTransitionAtom) {
                        Retval.TransitionName = TransitionName;
                    }

                    VarDeclVecT Vars;
                    if (Items[5].IsAtom) {
                        throw Error(Items[5], "Expected a list of diagram variables");
                    }
                    for (auto const& VarExpr : Items[5].Items) {
                        if (VarExpr.IsAtom || VarExpr.Items.size() != 2) {
                            throw Error(VarExpr, "Malformed diagram variable");
                        }
                        auto const& Sort = Atom(VarExpr.Items[1], "a sort name");
                        if (Prog->LookupSort(Sort) == Model::SortRef::NullPtr) {
                            throw Error(VarExpr, "Unknown sort \"" + Sort + "\"");
                        }
                        Vars.push_back(VarDeclT(Atom(VarExpr.Items[0], "a variable name"), Sort));
                    }

                    vector<DiagramConjunctT> Conjuncts;
                    if (Items[6].IsAtom) {
                        throw Error(Items[6], "Expected a list of diagram conjuncts");
                    }
                    for (auto const& ConjExpr : Items[6].Items) {
                        if (ConjExpr.IsAtom || ConjExpr.Items.size() != 3) {
                            throw Error(ConjExpr, "Malformed diagram conjunct");
                        }
                        auto Formula = Model::ParseFormula(ConjExpr.Items[2], Reader);
                        // Closed under the diagram's variables
                        Prog->CheckFormula(Model::MkExists(Vars, Formula),
                                           FormulaContextT::SingleState);
                        Conjuncts.push_back(DiagramConjunctT(Formula, Kind(ConjExpr.Items[0]),
                                                             Flag(ConjExpr.Items[1], "on", "off")));
                    }
                    Retval.Diag = Diagram(Vars, Conjuncts);
                    return Retval;
                }

                SearchState Decode(const SExpr& Top) const
                {
                    if (Top.IsAtom || Top.Items.size() < 5 || !Top.Items[0].IsAtom ||
                        Top.Items[0].Atom != Checkpoint::HeaderName) {
                        throw Error(Top, "Not a checkpoint");
                    }
                    auto const& Items = Top.Items;

                    auto Version = Number(Entry(Items[1], "version", 1, 1)[1], "a version");
                    if (Version != Checkpoint::FormatVersion) {
                        throw Error(Items[1], "Checkpoint format version " + to_string(Version) +
                                    " is not supported, expected version " +
                                    to_string(Checkpoint::FormatVersion));
                    }

                    auto Fingerprint = Number(Entry(Items[2], "fingerprint", 1, 1)[1],
                                              "a fingerprint");
                    if (Fingerprint != Prog->GetFingerprint()) {
                        throw Error(Items[2], (string)"Checkpoint was written for a different " +
                                    "program (fingerprint " + to_string(Fingerprint) +
                                    ", expected " + to_string(Prog->GetFingerprint()) + ")");
                    }

                    SearchState Retval;
                    auto const& Counters = Entry(Items[3], "counters", 3, 3);
                    Retval.NumLearnedStates = Number(Counters[1], "a counter");
                    Retval.NumDistinctPredicates = Number(Counters[2], "a counter");
                    Retval.NumIterations = Number(Counters[3], "a counter");
                    Retval.PredicateLog = Predicates(Items[4], "log");

                    u32 i = 5;
                    for (; i < Items.size() && !Items[i].IsAtom && Items[i].Items.size() > 0 &&
                             Items[i].Items[0].IsAtom && Items[i].Items[0].Atom == "frame"; ++i) {
                        Retval.Frames.push_back(Predicates(Items[i], "frame"));
                    }
                    for (; i < Items.size(); ++i) {
                        Retval.Obligations.push_back(MakeObligation(Items[i]));
                    }

                    Validate(Top, Retval);
                    return Retval;
                }

                // Structural invariants a resumed search relies on
                void Validate(const SExpr& Top, const SearchState& State) const
                {
                    if (State.Frames.size() < 2) {
                        throw Error(Top, "Checkpoint has fewer than two frames");
                    }
                    for (u32 i = 1; i < State.Frames.size(); ++i) {
                        Model::ExpSetT Previous(State.Frames[i - 1].begin(),
                                                State.Frames[i - 1].end());
                        for (auto const& Predicate : State.Frames[i]) {
                            if (Previous.find(Predicate) == Previous.end()) {
                                throw Error(Top, "Frame " + to_string(i) + " is not contained in "
                                            "frame " + to_string(i - 1) + ": " +
                                            Predicate->ToString());
                            }
                        }
                    }
                    for (u32 i = 0; i < State.Obligations.size(); ++i) {
                        auto const& Ob = State.Obligations[i];
                        if (Ob.FrameIndex >= State.Frames.size()) {
                            throw Error(Top, "Obligation " + to_string(i) + " refers to frame " +
                                        to_string(Ob.FrameIndex));
                        }
                        if (Ob.Parent >= (i32)i || Ob.Parent < -1) {
                            throw Error(Top, "Obligation " + to_string(i) +
                                        " has a parent above it on the stack");
                        }
                        // A predecessor sits one frame below its parent
                        // and inherits its kind
                        if (Ob.Parent >= 0) {
                            auto const& ParentOb = State.Obligations[Ob.Parent];
                            if (Ob.FrameIndex + 1 != ParentOb.FrameIndex) {
                                throw Error(Top, "Obligation " + to_string(i) + " at frame " +
                                            to_string(Ob.FrameIndex) + " has its parent at frame " +
                                            to_string(ParentOb.FrameIndex));
                            }
                            if (Ob.May != ParentOb.May) {
                                throw Error(Top, "Obligation " + to_string(i) + " is a " +
                                            (Ob.May ? "may" : "must") + " obligation under a " +
                                            (ParentOb.May ? "may" : "must") + " obligation");
                            }
                        }
                        if (Ob.TransitionName != "" &&
                            Ob.TransitionName != Translate::StutterTransitionName &&
                            Prog->LookupTransition(Ob.TransitionName) ==
                            Model::TransitionRef::NullPtr) {
                            throw Error(Top, "Obligation " + to_string(i) +
                                        " refers to unknown transition \"" +
                                        Ob.TransitionName + "\"");
                        }
                    }
                }
            };

        } /* end anonymous namespace */

        SearchState Checkpoint::Load(istream& In, const Model::ProgramRef& Prog,
                                     const string& SourceName)
        {
            try {
                SExprReader Reader(In, SourceName);
                auto Items = Reader.ReadAll();
                if (Items.size() != 1) {
                    throw CheckpointError(SourceName + ": expected exactly one checkpoint, found " +
                                          to_string(Items.size()) + " top level expressions");
                }
                CheckpointDecoder Decoder(Reader, Prog);
                auto Retval = Decoder.Decode(Items[0]);

                FOPDR_LOG_SHORT("Checkpoint.Detailed",
                                Out_ << "Loaded checkpoint " << SourceName << ": "
                                     << Retval.Frames.size() << " frames, "
                                     << Retval.Obligations.size() << " obligations" << endl;
                                );
                return Retval;
            } catch (const CheckpointError&) {
                throw;
            } catch (const FOPDRError& Ex) {
                throw CheckpointError((string)"Invalid checkpoint: " + Ex.what());
            }
        }

        void Checkpoint::SaveToFile(const SearchState& State, const Model::Program& Prog,
                                    const string& FileName)
        {
            // Written aside, then renamed over the old checkpoint
            auto TempName = FileName + ".tmp";
            {
                ofstream Out(TempName);
                if (!Out.is_open()) {
                    throw CheckpointError("Could not open \"" + TempName + "\" for writing");
                }
                Save(State, Prog, Out);
                Out.close();
                if (Out.fail()) {
                    throw CheckpointError("Error writing \"" + TempName + "\"");
                }
            }
            if (rename(TempName.c_str(), FileName.c_str()) != 0) {
                throw CheckpointError("Could not move \"" + TempName + "\" to \"" +
                                      FileName + "\"");
            }
        }

        SearchState Checkpoint::LoadFromFile(const string& FileName, const Model::ProgramRef& Prog)
        {
            ifstream In(FileName);
            if (!In.is_open()) {
                throw CheckpointError("Could not open checkpoint \"" + FileName + "\"");
            }
            return Load(In, Prog, FileName);
        }

    } /* end namespace UPDR */
} /* end namespace FOPDR */

//
// Checkpoint.cpp ends here
