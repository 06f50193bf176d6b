// Frames.cpp --- 
// 
// Filename: Frames.cpp
// Author: FOPDR developers
// Created: Mon Aug 31 20:47:17 2026 (-0400)
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

#include "../utils/LogManager.hpp"

#include "Checkpoint.hpp"
#include "Frames.hpp"

namespace FOPDR {
    namespace UPDR {

        using boost::property_tree::ptree;
        using Translate::Trace;
        using TP::TPResult;

        string SearchStatusToString(SearchStatusT Status)
        {
            switch (Status) {
            case SearchStatusT::Searching:
                return "searching";
            case SearchStatusT::Proved:
                return "proved";
            case SearchStatusT::Disproved:
                return "disproved";
            case SearchStatusT::Interrupted:
                return "interrupted";
            }
            return "unknown";
        }

        UPDROptionsT::UPDROptionsT()
            : ObligationOrder(ObligationOrderT::DeepestFirst),
              PushFrameZero(PushFrameZeroT::IfTrivial),
              BlockMayCexs(false), SmokeTest(false), AssertInductiveTrace(false),
              UseUnsatCores(true), SimplifyDiagram(true), ConcretizeCounterexample(true),
              MaxIterations(0),
              SafetyName(""), CheckpointFile("")
        {
            // Nothing here
        }

        UPDROptionsT::UPDROptionsT(const UPDROptionsT& Other)
            : ObligationOrder(Other.ObligationOrder), PushFrameZero(Other.PushFrameZero),
              BlockMayCexs(Other.BlockMayCexs), SmokeTest(Other.SmokeTest),
              AssertInductiveTrace(Other.AssertInductiveTrace),
              UseUnsatCores(Other.UseUnsatCores), SimplifyDiagram(Other.SimplifyDiagram),
              ConcretizeCounterexample(Other.ConcretizeCounterexample),
              MaxIterations(Other.MaxIterations), SafetyName(Other.SafetyName),
              CheckpointFile(Other.CheckpointFile)
        {
            // Nothing here
        }

        UPDROptionsT& UPDROptionsT::operator = (const UPDROptionsT& Other)
        {
            if (&Other == this) {
                return *this;
            }
            ObligationOrder = Other.ObligationOrder;
            PushFrameZero = Other.PushFrameZero;
            BlockMayCexs = Other.BlockMayCexs;
            SmokeTest = Other.SmokeTest;
            AssertInductiveTrace = Other.AssertInductiveTrace;
            UseUnsatCores = Other.UseUnsatCores;
            SimplifyDiagram = Other.SimplifyDiagram;
            ConcretizeCounterexample = Other.ConcretizeCounterexample;
            MaxIterations = Other.MaxIterations;
            SafetyName = Other.SafetyName;
            CheckpointFile = Other.CheckpointFile;
            return *this;
        }

        SearchResult::SearchResult()
            : Status(SearchStatusT::Searching), FixpointFrame(0),
              ConcreteCounterexample(false), NumFrames(0), NumQueries(0)
        {
            // Nothing here
        }

        SearchResult::~SearchResult()
        {
            // Nothing here
        }

        string SearchResult::ToString(u32 Verbosity) const
        {
            ostringstream sstr;
            sstr << "Result: " << SearchStatusToString(Status);
            if (Message != "") {
                sstr << " (" << Message << ")";
            }
            sstr << endl;

            if (Status == SearchStatusT::Proved) {
                sstr << "Inductive invariant from frame " << FixpointFrame << ", "
                     << Invariant.size() << " predicates:" << endl;
                for (auto const& Predicate : Invariant) {
                    sstr << "    " << Predicate << endl;
                }
            } else if (Status == SearchStatusT::Disproved) {
                if (ConcreteCounterexample) {
                    sstr << "Counterexample trace:" << endl << Counterexample.ToString(Verbosity);
                } else {
                    sstr << "Abstract counterexample, from an initial state:" << endl;
                    for (u32 i = 0; i < AbstractChain.size(); ++i) {
                        sstr << "state " << i << ":" << endl << "    "
                             << AbstractChain[i] << endl;
                        if (i < AbstractTransitions.size()) {
                            sstr << "  --> transition " << AbstractTransitions[i] << endl;
                        }
                    }
                }
            }
            sstr << "Frames: " << NumFrames << ", solver queries: " << NumQueries << endl;
            return sstr.str();
        }

        ptree SearchResult::ToPropertyTree() const
        {
            ptree Retval;
            Retval.put("result", SearchStatusToString(Status));
            Retval.put("message", Message);
            Retval.put("frames", NumFrames);
            Retval.put("queries", NumQueries);

            if (Status == SearchStatusT::Proved) {
                ptree PredicateList;
                for (auto const& Predicate : Invariant) {
                    ptree PredicateTree;
                    PredicateTree.put_value(Predicate->ToString());
                    PredicateList.push_back(make_pair("", PredicateTree));
                }
                Retval.add_child("predicates", PredicateList);
            } else if (Status == SearchStatusT::Disproved) {
                if (ConcreteCounterexample) {
                    Retval.add_child("counterexample", Counterexample.ToPropertyTree());
                } else {
                    ptree ChainTree;
                    ptree StateList;
                    for (auto const& State : AbstractChain) {
                        ptree StateTree;
                        StateTree.put_value(State);
                        StateList.push_back(make_pair("", StateTree));
                    }
                    ptree TransitionList;
                    for (auto const& TransitionName : AbstractTransitions) {
                        ptree TransitionTree;
                        TransitionTree.put_value(TransitionName);
                        TransitionList.push_back(make_pair("", TransitionTree));
                    }
                    ChainTree.add_child("states", StateList);
                    ChainTree.add_child("transitions", TransitionList);
                    Retval.add_child("abstract-counterexample", ChainTree);
                }
            }
            return Retval;
        }

        Frames::Frames(const Model::ProgramRef& Prog, Translate::SolverSession& Session,
                       const UPDROptionsT& Options)
            : Prog(Prog), Session(Session), Options(Options),
              Gen(Session, Options.UseUnsatCores), BMC(Session), Checker(Session),
              Safety(Prog->GetSafetyFormula(Options.SafetyName)),
              NumLearnedStates(0), NumDistinctPredicates(0), NumIterations(0),
              InterruptRequested(false)
        {
            if (Options.SafetyName != "") {
                SafetyProperties.push_back(Safety);
            } else {
                for (auto const& Invariant : Prog->GetSafeties()) {
                    SafetyProperties.push_back(Invariant.Formula);
                }
            }
        }

        Frames::~Frames()
        {
            // Nothing here
        }

        void Frames::AddFrame()
        {
            FrameSets.push_back(ExpVecT());
            FrameMembers.push_back(Model::ExpSetT());
        }

        bool Frames::AddToFrame(const ExpT& Predicate, u32 FrameIndex)
        {
            if (FrameMembers[FrameIndex].find(Predicate) != FrameMembers[FrameIndex].end()) {
                return false;
            }
            FrameMembers[FrameIndex].insert(Predicate);
            FrameSets[FrameIndex].push_back(Predicate);
            return true;
        }

        void Frames::LearnPredicate(const ExpT& Predicate, u32 FrameIndex)
        {
            for (u32 i = 0; i <= FrameIndex; ++i) {
                AddToFrame(Predicate, i);
            }
            ++NumLearnedStates;
            if (LoggedPredicates.find(Predicate) == LoggedPredicates.end()) {
                LoggedPredicates.insert(Predicate);
                PredicateLog.push_back(Predicate);
                ++NumDistinctPredicates;
            }

            FOPDR_LOG_SHORT("UPDR.Blocking",
                            Out_ << "Learned at frames 0.." << FrameIndex << ": "
                                 << Predicate << endl;
                            );
        }

        ExpT Frames::GetFrameFormula(u32 FrameIndex) const
        {
            ExpVecT Conjuncts;
            if (FrameIndex == 0) {
                Conjuncts.push_back(Prog->GetInitFormula());
            }
            auto const& Frame = GetFrame(FrameIndex);
            Conjuncts.insert(Conjuncts.end(), Frame.begin(), Frame.end());
            return Model::MkAnd(Conjuncts);
        }

        bool Frames::FindBadState(u32 FrameIndex, const ExpT& Property, Trace& Bad)
        {
            auto const& Prover = Session.GetTP();
            auto const& Trans = Session.GetTranslator(Translate::MakeStepKeys(1));
            Translate::QueryScope Scope(Session, Trans);

            Prover->Assert(Trans.Translate(GetFrameFormula(FrameIndex)));
            Prover->Assert(Trans.Translate(Model::MkNot(Property)));
            ++Stats.NumBadStateQueries;
            auto Description = "bad states in frame " + to_string(FrameIndex);
            auto Res = Prover->CheckSat(Description);
            if (Res == TPResult::UNSATISFIABLE) {
                return false;
            }
            Bad = Trans.ReadModel(Session.GetMinimalModel(Trans, vector<Translate::Z3Expr>(),
                                                          Description));
            return true;
        }

        bool Frames::BlockBadStates(SearchResult& Result)
        {
            const u32 Deepest = (u32)FrameSets.size() - 1;
            ExpVecT Properties;
            if (Options.ObligationOrder == ObligationOrderT::DeclaredOrder) {
                Properties = SafetyProperties;
            } else {
                Properties.push_back(Safety);
            }

            for (auto const& Property : Properties) {
                Trace Bad;
                while (FindBadState(Deepest, Property, Bad)) {
                    auto Diag = Diagram::FromTrace(*Prog, Bad, 0, Options.SimplifyDiagram);
                    Stack.push_back(Obligation(Deepest, Diag, "", -1, false));
                    ++Stats.NumObligations;

                    FOPDR_LOG_FULL("UPDR.Blocking",
                                   Out_ << "Bad state in frame " << Deepest << ":" << endl
                                        << Diag << endl;
                                   );
                    if (ProcessObligations(Result)) {
                        return true;
                    }
                }
            }
            return false;
        }

        void Frames::DiscardMayChain()
        {
            i32 Root = (i32)Stack.size() - 1;
            while (Stack[Root].Parent >= 0) {
                Root = Stack[Root].Parent;
            }
            Stack.resize(Root);
            ++Stats.NumDiscardedMayChains;
        }

        bool Frames::ProcessObligations(SearchResult& Result)
        {
            while (Stack.size() > 0) {
                const u32 Top = (u32)Stack.size() - 1;
                const u32 FrameIndex = Stack[Top].FrameIndex;
                const bool May = Stack[Top].May;

                if (FrameIndex == 0) {
                    if (May) {
                        FOPDR_LOG_SHORT("UPDR.Blocking",
                                        Out_ << "May obligation reached frame 0, "
                                             << "giving up on it" << endl;
                                        );
                        DiscardMayChain();
                        continue;
                    }
                    MakeCounterexample(Result);
                    return true;
                }

                auto Context = (string)"obligation " + to_string(Top) + " at frame " +
                    to_string(FrameIndex);
                auto FrameFormula = GetFrameFormula(FrameIndex - 1);
                string TransitionName;
                Trace Predecessor;

                if (Gen.HasPredecessor(FrameFormula, Stack[Top].Diag, Context,
                                       &TransitionName, &Predecessor, nullptr)) {
                    auto Diag = Diagram::FromTrace(*Prog, Predecessor, 0, Options.SimplifyDiagram);
                    Stack.push_back(Obligation(FrameIndex - 1, Diag, TransitionName, (i32)Top, May));
                    ++Stats.NumObligations;

                    FOPDR_LOG_SHORT("UPDR.Blocking",
                                    Out_ << "Predecessor of " << Context << " via "
                                         << TransitionName << ", new obligation at frame "
                                         << (FrameIndex - 1) << endl;
                                    );
                    continue;
                }

                auto Generalized = Gen.Generalize(Stack[Top].Diag, FrameFormula, Context);
                auto Predicate = Generalized.ToPredicate();
                LearnPredicate(Predicate, FrameIndex);
                if (Options.SmokeTest) {
                    SmokeTestPredicate(Predicate, FrameIndex);
                }
                Stack.pop_back();
            }
            return false;
        }

        void Frames::MakeCounterexample(SearchResult& Result)
        {
            // Chain[0] is the obligation at frame 0, the last one the root
            vector<u32> Chain;
            for (i32 i = (i32)Stack.size() - 1; i >= 0; i = Stack[i].Parent) {
                Chain.push_back((u32)i);
            }

            // Stutter steps join the diagrams of two equal states
            ExpVecT StepConstraints;
            vector<string> TransitionNames;
            ExpVecT Pending;
            Result.AbstractChain.clear();
            Result.AbstractTransitions.clear();
            for (u32 k = 0; k < Chain.size(); ++k) {
                auto const& Ob = Stack[Chain[k]];
                Pending.push_back(Ob.Diag.ToFormula());
                if (k + 1 == Chain.size()) {
                    Pending.push_back(Model::MkNot(Safety));
                    StepConstraints.push_back(Model::MkAnd(Pending));
                    Result.AbstractChain.push_back(StepConstraints.back()->ToString());
                    break;
                }
                if (Ob.TransitionName == Translate::StutterTransitionName) {
                    continue;
                }
                StepConstraints.push_back(Model::MkAnd(Pending));
                Result.AbstractChain.push_back(StepConstraints.back()->ToString());
                Pending.clear();
                TransitionNames.push_back(Ob.TransitionName);
                Result.AbstractTransitions.push_back(Ob.TransitionName);
            }

            Result.Status = SearchStatusT::Disproved;
            Trace Cex;
            if (Options.ConcretizeCounterexample &&
                BMC.CheckTrace(StepConstraints, TransitionNames, Cex,
                               "replay of the counterexample chain")) {
                Result.ConcreteCounterexample = true;
                Result.Message = "Safety is violated by a concrete trace of " +
                    to_string(TransitionNames.size()) + " steps";
            } else if (Options.ConcretizeCounterexample &&
                       BMC.CheckBMC(Safety, (u32)TransitionNames.size(), Cex)) {
                Result.ConcreteCounterexample = true;
                Result.Message = "Safety is violated within " + to_string(TransitionNames.size()) +
                    " steps";
            } else {
                Result.ConcreteCounterexample = false;
                Result.Message = "Safety is violated by an abstract trace of " +
                    to_string(TransitionNames.size()) + " steps";
            }
            Result.Counterexample = Cex;
            Stack.clear();
        }

        bool Frames::TryPush(const ExpT& Predicate, u32 FromIndex, Trace* Cex)
        {
            auto FrameFormula = GetFrameFormula(FromIndex);
            for (auto const& Transition : Prog->GetTransitions()) {
                Trace Successor;
                if (!Checker.CheckConsecution(FrameFormula, Predicate, *Transition, Successor)) {
                    if (Cex != nullptr) {
                        *Cex = Successor;
                    }
                    return false;
                }
            }
            return true;
        }

        void Frames::PushPredicates()
        {
            const u32 Start = (Options.PushFrameZero == PushFrameZeroT::Never ? 1 : 0);
            for (u32 i = Start; i + 1 < FrameSets.size(); ++i) {
                auto Candidates = FrameSets[i];
                for (auto const& Predicate : Candidates) {
                    if (FrameMembers[i + 1].find(Predicate) != FrameMembers[i + 1].end()) {
                        continue;
                    }
                    ++Stats.NumPushAttempts;
                    Trace Cex;
                    bool Pushed = TryPush(Predicate, i, &Cex);

                    if (!Pushed && Options.BlockMayCexs) {
                        auto Diag = Diagram::FromTrace(*Prog, Cex, 1, Options.SimplifyDiagram);
                        Stack.push_back(Obligation(i + 1, Diag, "", -1, true));
                        ++Stats.NumMayObligations;
                        SearchResult MayResult;
                        if (ProcessObligations(MayResult)) {
                            FOPDR_INTERNAL_ERROR("A may obligation ended the search");
                        }
                        Pushed = TryPush(Predicate, i, nullptr);
                    }

                    if (Pushed) {
                        AddToFrame(Predicate, i + 1);
                        ++Stats.NumPushed;
                        FOPDR_LOG_SHORT("UPDR.Pushing",
                                        Out_ << "Pushed to frame " << (i + 1) << ": "
                                             << Predicate << endl;
                                        );
                    }
                }
            }
        }

        i32 Frames::FindFixpoint() const
        {
            // Frame 0 also carries the initial condition, so it takes no part
            for (u32 i = 1; i + 1 < FrameSets.size(); ++i) {
                if (FrameSets[i].size() != FrameSets[i + 1].size()) {
                    continue;
                }
                bool Equal = true;
                for (auto const& Predicate : FrameSets[i]) {
                    if (FrameMembers[i + 1].find(Predicate) == FrameMembers[i + 1].end()) {
                        Equal = false;
                        break;
                    }
                }
                if (Equal) {
                    return (i32)i;
                }
            }
            return -1;
        }

        void Frames::SmokeTestPredicate(const ExpT& Predicate, u32 FrameIndex)
        {
            ++Stats.NumSmokeTests;
            Trace Cex;
            if (BMC.CheckBMC(Predicate, FrameIndex, Cex)) {
                FOPDR_INTERNAL_ERROR((string)"Smoke test failed: " + Predicate->ToString() +
                                     " was learned at frame " + to_string(FrameIndex) +
                                     " but is violated within as many steps:\n" +
                                     Cex.ToString());
            }
        }

        void Frames::CheckInductiveTrace()
        {
            for (u32 i = 0; i + 1 < FrameSets.size(); ++i) {
                auto FrameFormula = GetFrameFormula(i);
                for (auto const& Predicate : FrameSets[i + 1]) {
                    for (auto const& Transition : Prog->GetTransitions()) {
                        Trace Cex;
                        if (!Checker.CheckConsecution(FrameFormula, Predicate, *Transition, Cex)) {
                            FOPDR_INTERNAL_ERROR((string)"Frame " + to_string(i) +
                                                 " does not imply " + Predicate->ToString() +
                                                 " of frame " + to_string(i + 1) +
                                                 " after transition " +
                                                 Transition->GetName() + ":\n" +
                                                 Cex.ToString());
                        }
                    }
                }
            }
        }

        void Frames::WriteCheckpoint() const
        {
            // Nothing to resume before the first two frames exist
            if (Options.CheckpointFile == "" || FrameSets.size() < 2) {
                return;
            }
            Checkpoint::SaveToFile(GetSearchState(), *Prog, Options.CheckpointFile);
            FOPDR_LOG_SHORT("Checkpoint.Detailed",
                            Out_ << "Checkpoint written to " << Options.CheckpointFile
                                 << " after iteration " << NumIterations << endl;
                            );
        }

        SearchResult& Frames::Finish(SearchResult& Result) const
        {
            Result.NumFrames = (u32)FrameSets.size();
            Result.NumQueries = Session.GetNumQueries();

            FOPDR_LOG_FULL("UPDR.Stats",
                           auto const& GenStats = Gen.GetStats();
                           Out_ << "Iterations: " << NumIterations << endl
                                << "Frames: " << FrameSets.size() << endl
                                << "Learned states: " << NumLearnedStates << endl
                                << "Distinct predicates: " << NumDistinctPredicates << endl
                                << "Obligations: " << Stats.NumObligations << endl
                                << "May obligations: " << Stats.NumMayObligations << endl
                                << "Push attempts / pushed: " << Stats.NumPushAttempts
                                << " / " << Stats.NumPushed << endl
                                << "Subsumed predicates removed: " << Stats.NumSubsumed << endl
                                << "Generalizations: " << GenStats.NumGeneralizations << endl
                                << "Literals before / after generalization: "
                                << GenStats.NumLiteralsIn << " / " << GenStats.NumLiteralsOut
                                << endl
                                << "Solver queries: " << Result.NumQueries << endl;
                           );
            return Result;
        }

        SearchResult Frames::Search()
        {
            SearchResult Result;
            try {
                if (FrameSets.size() == 0) {
                    Trace Cex;
                    if (BMC.CheckBMC(Safety, 0, Cex)) {
                        Result.Status = SearchStatusT::Disproved;
                        Result.ConcreteCounterexample = true;
                        Result.Counterexample = Cex;
                        Result.Message = "An initial state violates safety";
                        return Finish(Result);
                    }
                    AddFrame();
                    AddFrame();
                }

                while (true) {
                    if (InterruptRequested) {
                        Result.Message = "Interrupted on request";
                        break;
                    }
                    if (Options.MaxIterations != 0 && NumIterations >= Options.MaxIterations) {
                        Result.Message = "Iteration limit of " + to_string(Options.MaxIterations) +
                            " reached";
                        break;
                    }
                    ++NumIterations;

                    FOPDR_LOG_MIN_SHORT(Out_ << "UPDR iteration " << NumIterations << ": "
                                             << FrameSets.size() << " frames, "
                                             << PredicateLog.size() << " predicates, "
                                             << Session.GetNumQueries() << " queries"
                                             << endl;
                                        );

                    if (ProcessObligations(Result) || BlockBadStates(Result)) {
                        return Finish(Result);
                    }
                    if (Options.AssertInductiveTrace) {
                        CheckInductiveTrace();
                    }

                    AddFrame();
                    PushPredicates();
                    Simplify();

                    FOPDR_LOG_FULL("UPDR.Frames",
                                   PrintFrames(Out_);
                                   );

                    auto Fixpoint = FindFixpoint();
                    if (Fixpoint >= 0) {
                        Result.Status = SearchStatusT::Proved;
                        Result.FixpointFrame = (u32)Fixpoint;
                        Result.Invariant = FrameSets[Fixpoint];
                        Result.Message = "Frames " + to_string(Fixpoint) + " and " +
                            to_string(Fixpoint + 1) + " are equal";
                        return Finish(Result);
                    }
                    WriteCheckpoint();
                }
            } catch (const TP::QueryInconclusiveError& Ex) {
                if (!Ex.WasInterrupted()) {
                    throw;
                }
                Result.Message = Ex.what();
            }

            Result.Status = SearchStatusT::Interrupted;
            InterruptRequested = false;
            Session.GetTP()->ClearInterrupt();
            WriteCheckpoint();
            FOPDR_LOG_MIN_SHORT(Out_ << "UPDR interrupted: " << Result.Message << endl;);
            return Finish(Result);
        }

        void Frames::Interrupt()
        {
            InterruptRequested = true;
            Session.GetTP()->Interrupt();
        }

        // Clauses forall V. (or L1 .. Ln), a single literal being a
        // clause of one disjunct
        static inline void GetClause(const ExpT& Predicate, Model::VarDeclVecT& Vars,
                                     ExpVecT& Disjuncts)
        {
            auto Body = Predicate;
            if (Predicate->Is(Model::ExprKind::Forall)) {
                Vars = Predicate->GetBound();
                Body = Predicate->GetBody();
            }
            if (Body->Is(Model::ExprKind::Or)) {
                Disjuncts = Body->GetChildren();
            } else {
                Disjuncts.push_back(Body);
            }
        }

        // Does the clause First imply the clause Second because its
        // disjuncts are a subset of those of Second?
        static inline bool Subsumes(const ExpT& First, const ExpT& Second)
        {
            Model::VarDeclVecT FirstVars, SecondVars;
            ExpVecT FirstDisjuncts, SecondDisjuncts;
            GetClause(First, FirstVars, FirstDisjuncts);
            GetClause(Second, SecondVars, SecondDisjuncts);

            for (auto const& Var : FirstVars) {
                if (find(SecondVars.begin(), SecondVars.end(), Var) == SecondVars.end()) {
                    return false;
                }
            }
            for (auto const& Disjunct : FirstDisjuncts) {
                bool Found = false;
                for (auto const& Other : SecondDisjuncts) {
                    if (Disjunct->Equals(*Other)) {
                        Found = true;
                        break;
                    }
                }
                if (!Found) {
                    return false;
                }
            }
            return true;
        }

        void Frames::Simplify()
        {
            // Last frame first, so a predicate stays wherever it is
            // still present in the next frame
            for (i32 k = (i32)FrameSets.size() - 1; k >= 0; --k) {
                auto const& Frame = FrameSets[k];
                vector<bool> Removed(Frame.size(), false);
                for (u32 j = 0; j < Frame.size(); ++j) {
                    if (k + 1 < (i32)FrameSets.size() &&
                        FrameMembers[k + 1].find(Frame[j]) != FrameMembers[k + 1].end()) {
                        continue;
                    }
                    for (u32 l = 0; l < Frame.size(); ++l) {
                        if (l != j && !Removed[l] && Subsumes(Frame[l], Frame[j])) {
                            Removed[j] = true;
                            ++Stats.NumSubsumed;
                            break;
                        }
                    }
                }

                ExpVecT Kept;
                Model::ExpSetT KeptMembers;
                for (u32 j = 0; j < Frame.size(); ++j) {
                    if (!Removed[j]) {
                        Kept.push_back(Frame[j]);
                        KeptMembers.insert(Frame[j]);
                    }
                }
                FrameSets[k] = Kept;
                FrameMembers[k] = KeptMembers;
            }
        }

        void Frames::PrintFrames(ostream& Out) const
        {
            for (u32 i = 0; i < FrameSets.size(); ++i) {
                Out << "Frame " << i << " (" << FrameSets[i].size() << " predicates"
                    << (i == 0 ? ", and the initial condition" : "") << "):" << endl;
                for (auto const& Predicate : FrameSets[i]) {
                    Out << "    " << Predicate << endl;
                }
            }
        }

        void Frames::Restore(const SearchState& State)
        {
            if (State.Frames.size() == 1) {
                FOPDR_INTERNAL_ERROR("Search state with a single frame");
            }
            FrameSets.clear();
            FrameMembers.clear();
            for (auto const& Frame : State.Frames) {
                AddFrame();
                for (auto const& Predicate : Frame) {
                    AddToFrame(Predicate, (u32)FrameSets.size() - 1);
                }
            }
            PredicateLog.clear();
            LoggedPredicates.clear();
            for (auto const& Predicate : State.PredicateLog) {
                if (LoggedPredicates.find(Predicate) == LoggedPredicates.end()) {
                    LoggedPredicates.insert(Predicate);
                    PredicateLog.push_back(Predicate);
                }
            }
            NumLearnedStates = State.NumLearnedStates;
            NumDistinctPredicates = State.NumDistinctPredicates;
            NumIterations = State.NumIterations;
            Stack = State.Obligations;

            FOPDR_LOG_MIN_SHORT(Out_ << "Restored " << FrameSets.size() << " frames, "
                                     << PredicateLog.size() << " predicates and "
                                     << Stack.size() << " obligations" << endl;
                                );
        }

        SearchState Frames::GetSearchState() const
        {
            SearchState Retval;
            Retval.Frames = FrameSets;
            Retval.PredicateLog = PredicateLog;
            Retval.NumLearnedStates = NumLearnedStates;
            Retval.NumDistinctPredicates = NumDistinctPredicates;
            Retval.NumIterations = NumIterations;
            Retval.Obligations = Stack;
            return Retval;
        }

        u32 Frames::GetNumFrames() const
        {
            return (u32)FrameSets.size();
        }

        const ExpVecT& Frames::GetFrame(u32 FrameIndex) const
        {
            if (FrameIndex >= FrameSets.size()) {
                FOPDR_INTERNAL_ERROR((string)"Frame " + to_string(FrameIndex) +
                                     " requested, but there are only " +
                                     to_string(FrameSets.size()) + " frames");
            }
            return FrameSets[FrameIndex];
        }

        const ExpVecT& Frames::GetPredicateLog() const
        {
            return PredicateLog;
        }

        const ExpT& Frames::GetSafety() const
        {
            return Safety;
        }

        u64 Frames::GetNumLearnedStates() const
        {
            return NumLearnedStates;
        }

        u64 Frames::GetNumDistinctPredicates() const
        {
            return NumDistinctPredicates;
        }

        const UPDROptionsT& Frames::GetOptions() const
        {
            return Options;
        }

        const UPDRStatsT& Frames::GetStats() const
        {
            return Stats;
        }

        const GeneralizerStatsT& Frames::GetGeneralizerStats() const
        {
            return Gen.GetStats();
        }

    } /* end namespace UPDR */
} /* end namespace FOPDR */

//
// Frames.cpp ends here
