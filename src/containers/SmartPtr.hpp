// SmartPtr.hpp --- 
// 
// Filename: SmartPtr.hpp
// Author: FOPDR developers
// Created: Sat Jul 11 06:30:53 2026 (-0400)
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

// Smart pointers over RefCountable objects. SmartPtr hands out
// mutable access, CSmartPtr only const access; both compare by
// pointer identity.

#if !defined FOPDR_CONTAINERS_SMART_PTR_HPP_
#define FOPDR_CONTAINERS_SMART_PTR_HPP_

#include <utility>
#include <functional>

#include "../common/FOPDRFwdDecls.hpp"

namespace FOPDR {

    namespace Detail {

        template <typename PtrType>
        class PtrHolder
        {
        protected:
            PtrType Ptr_;

            inline void Acquire_()
            {
                if (Ptr_ != nullptr) {
                    Ptr_->IncRef_();
                }
            }

            inline void Release_()
            {
                if (Ptr_ != nullptr) {
                    Ptr_->DecRef_();
                }
                Ptr_ = nullptr;
            }

            inline PtrHolder(PtrType Ptr)
                : Ptr_(Ptr)
            {
                Acquire_();
            }

            inline ~PtrHolder()
            {
                Release_();
            }

        public:
            inline bool IsNull_() const
            {
                return (Ptr_ == nullptr);
            }

            inline bool operator ! () const
            {
                return IsNull_();
            }

            inline u64 Hash_() const
            {
                return (u64)std::hash<const void*>()((const void*)Ptr_);
            }
        };

    } /* end namespace Detail */

    template <typename T>
    class SmartPtr : public Detail::PtrHolder<T*>
    {
        friend class CSmartPtr<T>;
        typedef Detail::PtrHolder<T*> BaseT;

    public:
        static const SmartPtr NullPtr;

        inline SmartPtr() : BaseT(nullptr) {}
        inline SmartPtr(T* OtherPtr) : BaseT(OtherPtr) {}
        inline SmartPtr(const SmartPtr& Other) : BaseT(Other.Ptr_) {}
        inline SmartPtr(SmartPtr&& Other)
            : BaseT(nullptr)
        {
            std::swap(this->Ptr_, Other.Ptr_);
        }

        inline SmartPtr& operator = (SmartPtr Other)
        {
            std::swap(this->Ptr_, Other.Ptr_);
            return *this;
        }

        inline T* GetPtr_() const { return this->Ptr_; }
        inline T* operator -> () const { return this->Ptr_; }
        inline T& operator * () const { return *(this->Ptr_); }

        inline bool operator == (const SmartPtr& Other) const { return this->Ptr_ == Other.Ptr_; }
        inline bool operator != (const SmartPtr& Other) const { return this->Ptr_ != Other.Ptr_; }
        inline bool operator < (const SmartPtr& Other) const
        {
            return std::less<const T*>()(this->Ptr_, Other.Ptr_);
        }
        inline bool operator == (const T* OtherPtr) const { return this->Ptr_ == OtherPtr; }
        inline bool operator != (const T* OtherPtr) const { return this->Ptr_ != OtherPtr; }
    };

    template <typename T>
    class CSmartPtr : public Detail::PtrHolder<const T*>
    {
        typedef Detail::PtrHolder<const T*> BaseT;

    public:
        static const CSmartPtr NullPtr;

        inline CSmartPtr() : BaseT(nullptr) {}
        inline CSmartPtr(const T* OtherPtr) : BaseT(OtherPtr) {}
        inline CSmartPtr(const CSmartPtr& Other) : BaseT(Other.Ptr_) {}
        inline CSmartPtr(const SmartPtr<T>& Other) : BaseT(Other.Ptr_) {}
        inline CSmartPtr(CSmartPtr&& Other)
            : BaseT(nullptr)
        {
            std::swap(this->Ptr_, Other.Ptr_);
        }

        inline CSmartPtr& operator = (CSmartPtr Other)
        {
            std::swap(this->Ptr_, Other.Ptr_);
            return *this;
        }

        inline const T* GetPtr_() const { return this->Ptr_; }
        inline const T* operator -> () const { return this->Ptr_; }
        inline const T& operator * () const { return *(this->Ptr_); }

        inline bool operator == (const CSmartPtr& Other) const { return this->Ptr_ == Other.Ptr_; }
        inline bool operator != (const CSmartPtr& Other) const { return this->Ptr_ != Other.Ptr_; }
        inline bool operator < (const CSmartPtr& Other) const
        {
            return std::less<const T*>()(this->Ptr_, Other.Ptr_);
        }
        inline bool operator == (const T* OtherPtr) const { return this->Ptr_ == OtherPtr; }
        inline bool operator != (const T* OtherPtr) const { return this->Ptr_ != OtherPtr; }
    };

    template <typename T>
    const SmartPtr<T> SmartPtr<T>::NullPtr;

    template <typename T>
    const CSmartPtr<T> CSmartPtr<T>::NullPtr;

    template <typename T>
    static inline ostream& operator << (ostream& Out, const SmartPtr<T>& Ptr)
    {
        Out << Ptr->ToString();
        return Out;
    }

    template <typename T>
    static inline ostream& operator << (ostream& Out, const CSmartPtr<T>& Ptr)
    {
        Out << Ptr->ToString();
        return Out;
    }

    // Hashes by identity, for use in unordered containers
    class SmartPtrHasher
    {
    public:
        template <typename PtrT>
        inline u64 operator () (const PtrT& Ptr) const
        {
            return Ptr.Hash_();
        }
    };

} /* end namespace FOPDR */

#endif /* FOPDR_CONTAINERS_SMART_PTR_HPP_ */

//
// SmartPtr.hpp ends here
