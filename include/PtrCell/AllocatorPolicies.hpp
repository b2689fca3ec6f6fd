#pragma once
#include <cstdio>
#include <cstdlib>
#include <new> // For placement new
#include <utility>

// 默认策略：标准的 new/delete
struct StandardAllocPolicy {
    template <class T, class... Args>
    static T* allocate(Args&&... args) {
        return new T(std::forward<Args>(args)...);
    }

    template <class T>
    static void deallocate(T* p) noexcept {
        delete p;
    }
};

// C 堆策略：malloc + placement new
// 用于 FFI 边界另一侧的 C 代码自己 malloc / free 这块内存的场景
struct MallocAllocPolicy {
    template <class T, class... Args>
    static T* allocate(Args&&... args) {
        void* mem = std::malloc(sizeof(T));
        if (!mem) {
            std::fprintf(stderr, "[MallocAllocPolicy] malloc(%zu) failed\n", sizeof(T));
            throw std::bad_alloc();
        }
        try {
            return ::new (mem) T(std::forward<Args>(args)...);
        } catch (...) {
            std::free(mem);
            throw;
        }
    }

    template <class T>
    static void deallocate(T* p) noexcept {
        if (p) {
            p->~T();
            std::free(p);
        }
    }
};
