// TimeValue.hpp --- 
// 
// Filename: TimeValue.hpp
// Author: FOPDR developers
// Created: Thu Jul 23 01:04:16 2026 (-0400)
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

#if !defined FOPDR_UTILS_TIME_VALUE_HPP_
#define FOPDR_UTILS_TIME_VALUE_HPP_

#include <time.h>

#include "../common/FOPDRFwdDecls.hpp"

namespace FOPDR {

class TimeValue : public Stringifiable
{
private:
    struct timespec Value;

public:
    TimeValue();
    TimeValue(const struct timespec& Value);
    TimeValue(time_t Sec, long NSec);
    TimeValue(const TimeValue& Other);
    virtual ~TimeValue();

    TimeValue& operator = (const TimeValue& Other);
    TimeValue operator - (const TimeValue& Other) const;
    TimeValue operator + (const TimeValue& Other) const;
    TimeValue& operator += (const TimeValue& Other);
    bool operator < (const TimeValue& Other) const;
    bool operator > (const TimeValue& Other) const;

    u64 InMicroSeconds() const;
    u64 InMilliSeconds() const;
    double InSeconds() const;

    virtual string ToString(u32 Verbosity) const override;
    using Stringifiable::ToString;

    // Wall clock, used for per query timing
    static TimeValue GetTimeValue();
    static TimeValue GetTimeValue(clockid_t ClockID);
};

} /* end namespace FOPDR */

#endif /* FOPDR_UTILS_TIME_VALUE_HPP_ */

//
// TimeValue.hpp ends here
