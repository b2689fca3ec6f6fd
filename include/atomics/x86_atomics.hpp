#pragma once
#include <cstdint>
#include <type_traits>

// 引入标准原子库 (TSan 模式 / 非 x86 环境 / 显式要求时使用)
#include <atomic>

#if defined(__SANITIZE_THREAD__) || defined(PTRCELL_USE_STD_ATOMIC) \
    || !(defined(__x86_64__) || defined(__i386__))
    #define PTRCELL_ATOMIC_STD_BACKEND 1
#else
    #define PTRCELL_ATOMIC_STD_BACKEND 0
#endif

// 内存序定义
enum class MemoryOrder {
    Relaxed,
    Acquire,
    Release,
    AcqRel,
    SeqCst
};

// 将自定义枚举转换为标准库枚举
constexpr std::memory_order to_std_order(MemoryOrder order) noexcept {
    switch (order) {
        case MemoryOrder::Relaxed: return std::memory_order_relaxed;
        case MemoryOrder::Acquire: return std::memory_order_acquire;
        case MemoryOrder::Release: return std::memory_order_release;
        case MemoryOrder::AcqRel:  return std::memory_order_acq_rel;
        case MemoryOrder::SeqCst:  return std::memory_order_seq_cst;
    }
    return std::memory_order_seq_cst;
}

template <typename T>
class Atomic {
    static_assert(sizeof(T) == 4 || sizeof(T) == 8, "Atomic<T> only supports 4 or 8 byte types");
    static_assert(std::is_trivially_copyable<T>::value, "Atomic<T> requires a trivially copyable T");

private:
/*
 * ============================================================================
 * [模式 A] std::atomic 后端
 * 条件：开启了 ThreadSanitizer、定义了 PTRCELL_USE_STD_ATOMIC，或者不是 x86 目标
 * 作用：TSan 能够正确追踪 happens-before 关系；其它架构按标准内存模型执行。
 * ============================================================================
 */
#if PTRCELL_ATOMIC_STD_BACKEND
    std::atomic<T> data;

public:
    Atomic() noexcept = default;
    constexpr Atomic(T val) noexcept : data(val) {}
    Atomic(const Atomic&) = delete;
    Atomic& operator=(const Atomic&) = delete;

    T load(MemoryOrder order = MemoryOrder::SeqCst) const noexcept {
        return data.load(to_std_order(order));
    }

    void store(T val, MemoryOrder order = MemoryOrder::SeqCst) noexcept {
        data.store(val, to_std_order(order));
    }

    T exchange(T val, MemoryOrder order = MemoryOrder::SeqCst) noexcept {
        return data.exchange(val, to_std_order(order));
    }

    bool compare_exchange_strong(T& expected, T desired,
                                 MemoryOrder success_order,
                                 MemoryOrder failure_order) noexcept {
        return data.compare_exchange_strong(expected, desired,
                                            to_std_order(success_order),
                                            to_std_order(failure_order));
    }

    bool compare_exchange_weak(T& expected, T desired,
                               MemoryOrder success_order,
                               MemoryOrder failure_order) noexcept {
        return data.compare_exchange_weak(expected, desired,
                                          to_std_order(success_order),
                                          to_std_order(failure_order));
    }

/*
 * ============================================================================
 * [模式 B] x86 内联汇编后端
 * 条件：x86 目标且未开启 TSan
 * 作用：x86 TSO 下读写只需 mov + 编译器屏障；xchg / lock cmpxchg 自带全屏障。
 * ============================================================================
 */
#else
    alignas(sizeof(T)) volatile T data;

public:
    Atomic() noexcept = default;
    constexpr Atomic(T val) noexcept : data(val) {}
    Atomic(const Atomic&) = delete;
    Atomic& operator=(const Atomic&) = delete;

    T load(MemoryOrder order = MemoryOrder::SeqCst) const noexcept {
        (void)order;
        T v;
        // SeqCst 的代价放在写侧 (xchg / mfence)，读侧统一是 mov
        asm volatile (
            "mov %1, %0"
            : "=r" (v)
            : "m" (data)
            : "memory"
        );
        return v;
    }

    void store(T val, MemoryOrder order = MemoryOrder::SeqCst) noexcept {
        if (order == MemoryOrder::SeqCst) {
            // SeqCst 写需要 mfence 防止 StoreBuffer 导致重排
            asm volatile (
                "mov %1, %0 \n\t"
                "mfence"
                : "=m" (data)
                : "r" (val)
                : "memory"
            );
        } else {
            asm volatile (
                "mov %1, %0"
                : "=m" (data)
                : "r" (val)
                : "memory"
            );
        }
    }

    T exchange(T val, MemoryOrder order = MemoryOrder::SeqCst) noexcept {
        (void)order;
        // 带内存操作数的 xchg 隐含 lock 前缀
        asm volatile (
            "xchg %0, %1"
            : "+r" (val),
              "+m" (data)
            :
            : "memory"
        );
        return val;
    }

    bool compare_exchange_strong(T& expected, T desired,
                                 MemoryOrder success_order,
                                 MemoryOrder failure_order) noexcept {
        (void)success_order;
        (void)failure_order;
        bool success;
        T prev = expected;
        // lock cmpxchg 自身带有 Full Barrier 语义
        asm volatile (
            "lock cmpxchg %3, %1"
            : "=@ccz" (success),
              "+m" (data),
              "+a" (prev)
            : "q" (desired)
            : "memory"
        );
        if(!success) {
            expected = prev;
        }
        return success;
    }

    bool compare_exchange_weak(T& expected, T desired,
                               MemoryOrder success_order,
                               MemoryOrder failure_order) noexcept {
        // x86 上没有 LL/SC，所以 weak 和 strong 实现一致
        return compare_exchange_strong(expected, desired, success_order, failure_order);
    }
#endif
};

// 自旋等待时给 CPU 的提示
static inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
    asm volatile("pause" ::: "memory");
#else
    std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}
