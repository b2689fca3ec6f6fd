#pragma once
#include <iosfwd>

#include "atomics/x86_atomics.hpp"

// 原子操作的内存序语义，按强度从弱到强排列
// 不确定用哪个时选 Coupled
enum class Semantics {
    // 不提供跨线程的顺序保证；适合值只在单线程里流转，或顺序已由别的手段建立 (fence 等)
    Relaxed = 0,
    // Release 写 + Acquire 读：happens-before 于某次读的写，一定对该读可见
    Coupled = 1,
    // SeqCst：所有使用该语义的操作处在同一个全序里，开销最大
    Ordered = 2,
};

constexpr Semantics kDefaultSemantics = Semantics::Coupled;

// 只读操作 (load) 使用的内存序
constexpr MemoryOrder readOrder(Semantics semantics) noexcept {
    switch (semantics) {
        case Semantics::Ordered: return MemoryOrder::SeqCst;
        case Semantics::Coupled: return MemoryOrder::Acquire;
        case Semantics::Relaxed: return MemoryOrder::Relaxed;
    }
    return MemoryOrder::SeqCst;
}

// 只写操作 (store) 使用的内存序
constexpr MemoryOrder writeOrder(Semantics semantics) noexcept {
    switch (semantics) {
        case Semantics::Ordered: return MemoryOrder::SeqCst;
        case Semantics::Coupled: return MemoryOrder::Release;
        case Semantics::Relaxed: return MemoryOrder::Relaxed;
    }
    return MemoryOrder::SeqCst;
}

// 读改写操作 (exchange / CAS 成功路径) 使用的内存序
constexpr MemoryOrder readWriteOrder(Semantics semantics) noexcept {
    switch (semantics) {
        case Semantics::Ordered: return MemoryOrder::SeqCst;
        case Semantics::Coupled: return MemoryOrder::AcqRel;
        case Semantics::Relaxed: return MemoryOrder::Relaxed;
    }
    return MemoryOrder::SeqCst;
}

const char* toString(Semantics semantics) noexcept;
const char* toString(MemoryOrder order) noexcept;

std::ostream& operator<<(std::ostream& os, Semantics semantics);
std::ostream& operator<<(std::ostream& os, MemoryOrder order);
