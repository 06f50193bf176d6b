// TimeValue.cpp --- 
// 
// Filename: TimeValue.cpp
// Author: FOPDR developers
// Created: Sun Jul 19 12:55:17 2026 (-0400)
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

#include "TimeValue.hpp"

namespace FOPDR {

static const long NanoSecondsPerSecond = 1000000000L;

TimeValue::TimeValue()
{
    Value.tv_sec = 0;
    Value.tv_nsec = 0;
}

TimeValue::TimeValue(const struct timespec& Value)
    : Value(Value)
{
    // Nothing here
}

TimeValue::TimeValue(time_t Sec, long NSec)
{
    Value.tv_sec = Sec;
    Value.tv_nsec = NSec;
}

TimeValue::TimeValue(const TimeValue& Other)
    : Stringifiable(), Value(Other.Value)
{
    // Nothing here
}

TimeValue::~TimeValue()
{
    // Nothing here
}

TimeValue& TimeValue::operator = (const TimeValue& Other)
{
    if (&Other == this) {
        return *this;
    }
    Value = Other.Value;
    return *this;
}

TimeValue TimeValue::operator - (const TimeValue& Other) const
{
    struct timespec tv = Value;

    if (tv.tv_nsec < Other.Value.tv_nsec) {
        tv.tv_nsec += NanoSecondsPerSecond;
        tv.tv_sec--;
    }

    return TimeValue(tv.tv_sec - Other.Value.tv_sec,
                     tv.tv_nsec - Other.Value.tv_nsec);
}

TimeValue TimeValue::operator + (const TimeValue& Other) const
{
    TimeValue Retval(*this);
    Retval += Other;
    return Retval;
}

TimeValue& TimeValue::operator += (const TimeValue& Other)
{
    Value.tv_nsec += Other.Value.tv_nsec;
    if (Value.tv_nsec >= NanoSecondsPerSecond) {
        Value.tv_nsec -= NanoSecondsPerSecond;
        Value.tv_sec += 1;
    }
    Value.tv_sec += Other.Value.tv_sec;
    return *this;
}

bool TimeValue::operator < (const TimeValue& Other) const
{
    if (Value.tv_sec != Other.Value.tv_sec) {
        return Value.tv_sec < Other.Value.tv_sec;
    }
    return Value.tv_nsec < Other.Value.tv_nsec;
}

bool TimeValue::operator > (const TimeValue& Other) const
{
    return Other < *this;
}

u64 TimeValue::InMicroSeconds() const
{
    return ((u64)Value.tv_sec * (u64)1000000 + ((u64)Value.tv_nsec) / 1000);
}

u64 TimeValue::InMilliSeconds() const
{
    return InMicroSeconds() / 1000;
}

double TimeValue::InSeconds() const
{
    return ((double)Value.tv_sec + ((double)Value.tv_nsec / 1000000000.0));
}

string TimeValue::ToString(u32 Verbosity) const
{
    ostringstream sstr;
    sstr << fixed << setprecision(3) << InSeconds();
    return sstr.str();
}

TimeValue TimeValue::GetTimeValue(clockid_t ClockID)
{
    struct timespec tv;
    clock_gettime(ClockID, &tv);
    return TimeValue(tv);
}

TimeValue TimeValue::GetTimeValue()
{
    return TimeValue::GetTimeValue(CLOCK_MONOTONIC);
}

} /* End namespace FOPDR */

//
// TimeValue.cpp ends here
