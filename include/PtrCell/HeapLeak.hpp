#pragma once
#include <optional>
#include <utility>

#include "PtrCell/AllocatorPolicies.hpp"

// 堆间接层：把 optional<T> 泄漏成裸指针，或者反过来收回
// 空值 <-> nullptr，除此之外不做任何记账 (没有引用计数，没有标记位)
//
// 约定 (调用方负责)：
//   - reclaim 只能收到同一 T / AllocPolicy 组合 leak 出来的指针
//   - 每个指针只能 reclaim 一次，之后不能再解引用
template <class T, class AllocPolicy = StandardAllocPolicy>
struct HeapLeak {
    HeapLeak() = delete;

    static T* leak(std::optional<T> slot) {
        if (!slot) {
            return nullptr;
        }
        return AllocPolicy::template allocate<T>(std::move(*slot));
    }

    static std::optional<T> reclaim(T* ptr) {
        if (ptr == nullptr) {
            return std::nullopt;
        }
        // 即使 T 的移动构造抛异常也要把内存还回去
        struct DeallocateGuard {
            T* p;
            ~DeallocateGuard() { AllocPolicy::deallocate(p); }
        } guard{ptr};

        return std::optional<T>(std::move(*ptr));
    }
};
