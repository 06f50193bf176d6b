// LogManager.hpp --- 
// 
// Filename: LogManager.hpp
// Author: FOPDR developers
// Created: Thu Jul 16 13:29:04 2026 (-0400)
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

#if !defined FOPDR_UTILS_LOG_MANAGER_HPP_
#define FOPDR_UTILS_LOG_MANAGER_HPP_

#include <unordered_set>
#include <map>
#include <vector>

#include "../common/FOPDRFwdDecls.hpp"

namespace FOPDR {
    namespace Logging {

        class LogManager
        {
        private:
            static unordered_set<string>& EnabledLogOptions();
            static ostream*& LogStream();
            static bool& NoLoggingEnabled();
            static const map<string, string> LogOptionDescriptions;

            LogManager();

        public:
            LogManager(const LogManager& Other) = delete;
            LogManager(LogManager&& Other) = delete;

            static void Initialize(const string& LogStreamName = "",
                                   LogFileCompressionTechniqueT LogCompressionTechnique =
                                   LogFileCompressionTechniqueT::COMPRESS_NONE);
            static void Finalize();

            static ostream& GetLogStream();
            static void EnableLogOption(const string& OptionName);
            template <typename ForwardIterator>
            static inline void EnableLogOptions(const ForwardIterator& First,
                                                const ForwardIterator& Last);
            static bool IsOptionEnabled(const string& OptionName);
            static bool IsLoggingDisabled();
            static string GetLogOptions();
        };

        template <typename ForwardIterator>
        inline void LogManager::EnableLogOptions(const ForwardIterator& First,
                                                 const ForwardIterator& Last)
        {
            for (auto it = First; it != Last; ++it) {
                EnableLogOption(*it);
            }
        }

    } /* end namespace Logging */
} /* end namespace FOPDR */


// Inspired from Z3's tracing/logging mechanism

#ifdef FOPDR_ENABLE_TRACING_
#define FOPDR_LOG_CODE(CODE_) { CODE_ } ((void)0)
#else
#define FOPDR_LOG_CODE(CODE_) ((void)0)
#endif /* FOPDR_ENABLE_TRACING_ */

#define FOPDR_LOG_FULL(TAG_, CODE_) \
    FOPDR_LOG_CODE(if (FOPDR::Logging::LogManager::IsOptionEnabled(TAG_)) { \
        ostream& Out_ = FOPDR::Logging::LogManager::GetLogStream();\
        Out_ << "------------- [" << TAG_ << "], at " << __FUNCTION__ << ", "\
             << __FILE__ << ":" << __LINE__ << " -------------" << endl; \
        CODE_ \
        Out_ << "-----------------------------------------------------------" \
             << "--------------------" << endl;                         \
        Out_.flush(); \
    })

#define FOPDR_LOG_SHORT(TAG_, CODE_) \
    FOPDR_LOG_CODE(\
    if (FOPDR::Logging::LogManager::IsOptionEnabled(TAG_)) {\
        ostream& Out_ = FOPDR::Logging::LogManager::GetLogStream();  \
        CODE_ \
        Out_.flush(); \
    })

#define FOPDR_LOG_MIN_FULL(CODE_) \
    if (!FOPDR::Logging::LogManager::IsLoggingDisabled()) {\
        ostream& Out_ = FOPDR::Logging::LogManager::GetLogStream();\
        Out_ << "------------- at " << __FUNCTION__ << ", "\
             << __FILE__ << ":" << __LINE__ << " -------------" << endl; \
        CODE_ \
        Out_ << "-----------------------------------------------------------" \
             << "--------------------" << endl;                         \
        Out_.flush(); \
    }\
    ((void)0)

#define FOPDR_LOG_MIN_SHORT(CODE_) \
    if (!FOPDR::Logging::LogManager::IsLoggingDisabled()) {\
        ostream& Out_ = FOPDR::Logging::LogManager::GetLogStream();\
        CODE_ \
        Out_.flush(); \
    }\
    ((void)0)


#endif /* FOPDR_UTILS_LOG_MANAGER_HPP_ */

//
// LogManager.hpp ends here
