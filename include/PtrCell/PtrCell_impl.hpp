// PtrCell_impl.hpp
#pragma once

#include <cstdio>
#include <ostream>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

template <class T, class AllocPolicy>
PtrCell<T, AllocPolicy>::PtrCell() noexcept : value_(nullptr) {}

template <class T, class AllocPolicy>
PtrCell<T, AllocPolicy>::PtrCell(std::optional<T> slot)
    : value_(heap_type::leak(std::move(slot))) {}

template <class T, class AllocPolicy>
PtrCell<T, AllocPolicy>::PtrCell(T value)
    : value_(AllocPolicy::template allocate<T>(std::move(value))) {}

template <class T, class AllocPolicy>
PtrCell<T, AllocPolicy>::PtrCell(AdoptTag, pointer ptr) noexcept : value_(ptr) {}

template <class T, class AllocPolicy>
PtrCell<T, AllocPolicy>::~PtrCell() {
    static_assert(sizeof(PtrCell) == sizeof(pointer), "PtrCell must have the layout of a T*");
    // 到这里已经没有别的线程能看到这个 cell
    AllocPolicy::deallocate(value_.load(MemoryOrder::Relaxed));
}

template <class T, class AllocPolicy>
PtrCell<T, AllocPolicy>::PtrCell(PtrCell&& other) noexcept
    : value_(other.value_.load(MemoryOrder::Relaxed)) {
    other.value_.store(nullptr, MemoryOrder::Relaxed);
}

template <class T, class AllocPolicy>
PtrCell<T, AllocPolicy>& PtrCell<T, AllocPolicy>::operator=(PtrCell&& other) noexcept {
    if (this != &other) {
        pointer incoming = other.value_.load(MemoryOrder::Relaxed);
        other.value_.store(nullptr, MemoryOrder::Relaxed);
        pointer old = value_.exchange(incoming, MemoryOrder::Relaxed);
        AllocPolicy::deallocate(old);
    }
    return *this;
}

template <class T, class AllocPolicy>
PtrCell<T, AllocPolicy> PtrCell<T, AllocPolicy>::fromPtr(pointer ptr) noexcept {
    return PtrCell(AdoptTag{}, ptr);
}

template <class T, class AllocPolicy>
typename PtrCell<T, AllocPolicy>::pointer
PtrCell<T, AllocPolicy>::heapLeak(std::optional<T> slot) {
    return heap_type::leak(std::move(slot));
}

template <class T, class AllocPolicy>
std::optional<T> PtrCell<T, AllocPolicy>::heapReclaim(pointer ptr) {
    return heap_type::reclaim(ptr);
}

template <class T, class AllocPolicy>
std::optional<T> PtrCell<T, AllocPolicy>::replace(std::optional<T> slot, Semantics order) {
    // 先泄漏：分配失败时 cell 保持原样
    pointer new_leak = heap_type::leak(std::move(slot));
    pointer old_leak = value_.exchange(new_leak, readWriteOrder(order));

    // 换出来的指针现在只属于当前线程
    return heap_type::reclaim(old_leak);
}

template <class T, class AllocPolicy>
std::optional<T> PtrCell<T, AllocPolicy>::take(Semantics order) {
    return replace(std::nullopt, order);
}

template <class T, class AllocPolicy>
void PtrCell<T, AllocPolicy>::set(std::optional<T> slot, Semantics order) {
    pointer new_leak = heap_type::leak(std::move(slot));
    pointer old_leak = value_.exchange(new_leak, readWriteOrder(order));
    AllocPolicy::deallocate(old_leak);
}

template <class T, class AllocPolicy>
void PtrCell<T, AllocPolicy>::swapWith(PtrCell& other, Semantics order) noexcept {
    if (&other == this) {
        return;
    }
    // other 由调用方独占，直接读
    pointer theirs = other.value_.load(MemoryOrder::Relaxed);
    pointer mine   = value_.exchange(theirs, readWriteOrder(order));
    other.value_.store(mine, writeOrder(order));
}

template <class T, class AllocPolicy>
template <class Build>
void PtrCell<T, AllocPolicy>::mapOwner(Build&& build, Semantics order) {
    using LinkRef = decltype(OwnerLinkTraits<T>::link(std::declval<T&>()));
    static_assert(std::is_same<LinkRef, PtrCell&>::value,
                  "OwnerLinkTraits<T>::link must return PtrCell<T, AllocPolicy>&");

    pointer observed = value_.load(readOrder(order));

    // build 拿到的是空 link：build 期间不持有任何共享内存的所有权
    pointer owner = nullptr;
    if constexpr (std::is_invocable<Build, PtrCell&&, const T*>::value) {
        owner = AllocPolicy::template allocate<T>(
            std::forward<Build>(build)(PtrCell(), static_cast<const T*>(observed)));
    } else {
        owner = AllocPolicy::template allocate<T>(std::forward<Build>(build)(PtrCell()));
    }

    PtrCell& link = OwnerLinkTraits<T>::link(*owner);
    if (link.value_.load(MemoryOrder::Relaxed) != nullptr) {
        // owner 还没发布，整个销毁即可 (连同 build 塞进 link 的内容)
        std::fprintf(stderr, "[PtrCell::mapOwner] cell:%p | build returned an owner with a non-empty link\n",
                     static_cast<void*>(this));
        AllocPolicy::deallocate(owner);
        throw std::logic_error("PtrCell::mapOwner: build must leave the link empty");
    }

    // owner 还没发布，普通写即可
    link.value_.store(observed, MemoryOrder::Relaxed);

    std::size_t failures = 0;
    pointer expected = observed;
    while (!value_.compare_exchange_weak(expected, owner,
                                         readWriteOrder(order),
                                         readOrder(order))) {
        // expected 已刷新为当前值：改挂 link，不重新调用 build
        link.value_.store(expected, MemoryOrder::Relaxed);
        ++failures;
        PTRCELL_LOG("[PtrCell::mapOwner] cell:%p | CAS failed #%zu | retarget link -> %p\n",
                    static_cast<void*>(this), failures, static_cast<void*>(expected));
#if PTRCELL_MAP_OWNER_YIELD_EVERY > 0
        if (failures % PTRCELL_MAP_OWNER_YIELD_EVERY == 0) {
            std::this_thread::yield();
            continue;
        }
#endif
        cpu_relax();
    }
}

template <class T, class AllocPolicy>
typename PtrCell<T, AllocPolicy>::pointer PtrCell<T, AllocPolicy>::getMut() noexcept {
    return value_.load(MemoryOrder::Relaxed);
}

template <class T, class AllocPolicy>
bool PtrCell<T, AllocPolicy>::isEmpty(Semantics order) const noexcept {
    return value_.load(readOrder(order)) == nullptr;
}

template <class T, class AllocPolicy>
typename PtrCell<T, AllocPolicy>::pointer PtrCell<T, AllocPolicy>::getPtr(Semantics order) const noexcept {
    return value_.load(readOrder(order));
}

template <class T, class AllocPolicy>
std::ostream& operator<<(std::ostream& os, const PtrCell<T, AllocPolicy>& cell) {
    return os << "PtrCell { value: "
              << static_cast<const void*>(cell.getPtr(Semantics::Relaxed)) << " }";
}
