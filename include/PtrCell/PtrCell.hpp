// PtrCell/PtrCell.hpp
#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>

#include "atomics/x86_atomics.hpp"
#include "PtrCell/Config.hpp"
#include "PtrCell/AllocatorPolicies.hpp"
#include "PtrCell/HeapLeak.hpp"
#include "PtrCell/Semantics.hpp"

// mapOwner 通过这个 traits 找到 owner 内部用来挂旧内容的那个 cell
// 默认约定是成员 next，其它布局特化即可：
//
//   template <> struct OwnerLinkTraits<MyNode> {
//       static auto& link(MyNode& n) noexcept { return n.tail; }
//   };
template <class Owner>
struct OwnerLinkTraits {
    static auto& link(Owner& owner) noexcept { return owner.next; }
};

/**
 * @brief 基于原子指针的单槽线程安全容器
 *
 * 值不直接存放在 cell 里：非空的值被泄漏到堆上，cell 只持有一个原子指针，
 * 同步完全靠对这个指针做 exchange / CAS。
 *   - 空 <-> nullptr，没有额外的 "是否有值" 标志位
 *   - 内存布局与 T* 完全相同，可以作为不透明句柄穿过 FFI 边界
 *   - 想看里面的值，要么把值取出来，要么独占这个 cell (getMut)
 *
 * 用法：
 *   PtrCell<uint16_t> cell(0x81D);
 *   cell.replace(2047, Semantics::Relaxed);   // -> 0x81D
 *   cell.isEmpty(Semantics::Relaxed);         // -> false
 *   cell.take(Semantics::Relaxed);            // -> 2047
 */
template <class T, class AllocPolicy = StandardAllocPolicy>
class PtrCell {
public:
    using value_type = T;
    using pointer    = T*;
    using heap_type  = HeapLeak<T, AllocPolicy>;

public:
    // 空 cell
    PtrCell() noexcept;
    // 有值则泄漏到堆上，std::nullopt 得到空 cell
    explicit PtrCell(std::optional<T> slot);
    PtrCell(T value);
    ~PtrCell();

    PtrCell(const PtrCell&)            = delete;
    PtrCell& operator=(const PtrCell&) = delete;

    // 移动要求独占源对象 (右值)，源对象变为空
    PtrCell(PtrCell&& other) noexcept;
    PtrCell& operator=(PtrCell&& other) noexcept;

    /**
     * @brief 接管 ptr 指向的那块内存，构造一个 cell
     *
     * nullptr 合法，表示空。
     * 前置条件 (调用方保证，违反即 UB)：
     *   - 非空的 ptr 必须来自同一 T / AllocPolicy 的 heapLeak
     *   - 调用之后调用方不能再解引用或释放 ptr
     */
    static PtrCell fromPtr(pointer ptr) noexcept;

    // FFI 用：把值泄漏成裸指针 / 从裸指针收回值 (见 HeapLeak 的约定)
    static pointer heapLeak(std::optional<T> slot);
    static std::optional<T> heapReclaim(pointer ptr);

    // 用 slot 替换 cell 的值，返回原来的值
    std::optional<T> replace(std::optional<T> slot, Semantics order = kDefaultSemantics);

    // 取出 cell 的值，留下空；等价于 replace(std::nullopt, order)
    std::optional<T> take(Semantics order = kDefaultSemantics);

    // 同 replace，但原来的值直接销毁，不返回
    void set(std::optional<T> slot, Semantics order = kDefaultSemantics);

    /**
     * @brief 交换两个 cell 的内容
     *
     * 只要求共享访问 *this，但 other 必须由调用方独占，否则会出现三方竞争。
     * 对 *this 做一次原子 exchange，再把换出来的指针写进 other。
     */
    void swapWith(PtrCell& other, Semantics order = kDefaultSemantics) noexcept;

    /**
     * @brief 用一个由 cell 旧内容构造出来的新 owner 替换 cell 的内容
     *
     * 读取-构造-提交整体对外表现为一次原子操作，可以用来实现共享的链表类结构。
     *
     * build 的签名是 T(PtrCell&& link)：传入的 link 为空，build 需要把它放进
     * 返回的 owner 里 (通过 OwnerLinkTraits<T> 能找到的位置)。提交时 link
     * 会指向提交那一刻 cell 中的旧内容。CAS 失败时只改挂 link 并重试，
     * 不会再次调用 build。
     *
     * build 也可以写成 T(PtrCell&& link, const T* prior)：prior 是第一次读到的
     * 旧地址，只读、不转移所有权，CAS 重试后可能已经过时。只有调用方能保证
     * 期间没有别的线程回收旧内容 (take / replace / set) 时才能解引用 prior。
     *
     * build 抛出的异常原样传给调用方，cell 保持不变。
     * build 返回的 owner 如果 link 非空，owner 被销毁并抛出 std::logic_error，
     * cell 同样保持不变。
     */
    template <class Build>
    void mapOwner(Build&& build, Semantics order = kDefaultSemantics);

    /**
     * @brief 返回指向值的指针，空则返回 nullptr
     *
     * 前置条件：在返回的指针使用期间，调用方独占这个 cell。这是调用方自己的
     * 约定，不是运行时锁。
     */
    pointer getMut() noexcept;

    bool isEmpty(Semantics order = kDefaultSemantics) const noexcept;

    /**
     * @brief 观察当前地址，不获取所有权
     *
     * cell 可能被并发修改时不要解引用：其它线程的 replace / take / set / 析构
     * 随时可能回收这块内存。
     */
    pointer getPtr(Semantics order = kDefaultSemantics) const noexcept;

private:
    struct AdoptTag {};
    PtrCell(AdoptTag, pointer ptr) noexcept;

private:
    Atomic<pointer> value_;
};

// 调试输出：PtrCell { value: 0x... }
template <class T, class AllocPolicy>
std::ostream& operator<<(std::ostream& os, const PtrCell<T, AllocPolicy>& cell);

// 在头文件末尾包含实现，实现 Header-Only
#include "PtrCell_impl.hpp"
