// tests/Semantics_test.cpp
#include <gtest/gtest.h>
#include <sstream>

#include "PtrCell/Semantics.hpp"

// 映射是纯 constexpr 函数
static_assert(readOrder(Semantics::Coupled) == MemoryOrder::Acquire, "Coupled read must be Acquire");
static_assert(writeOrder(Semantics::Coupled) == MemoryOrder::Release, "Coupled write must be Release");
static_assert(readWriteOrder(Semantics::Coupled) == MemoryOrder::AcqRel, "Coupled rmw must be AcqRel");
static_assert(kDefaultSemantics == Semantics::Coupled, "default semantics must be Coupled");

TEST(SemanticsTest, Relaxed_AllRelaxed) {
    EXPECT_EQ(readOrder(Semantics::Relaxed), MemoryOrder::Relaxed);
    EXPECT_EQ(writeOrder(Semantics::Relaxed), MemoryOrder::Relaxed);
    EXPECT_EQ(readWriteOrder(Semantics::Relaxed), MemoryOrder::Relaxed);
}

TEST(SemanticsTest, Coupled_AcquireReleasePairs) {
    EXPECT_EQ(readOrder(Semantics::Coupled), MemoryOrder::Acquire);
    EXPECT_EQ(writeOrder(Semantics::Coupled), MemoryOrder::Release);
    EXPECT_EQ(readWriteOrder(Semantics::Coupled), MemoryOrder::AcqRel);
}

TEST(SemanticsTest, Ordered_AllSeqCst) {
    EXPECT_EQ(readOrder(Semantics::Ordered), MemoryOrder::SeqCst);
    EXPECT_EQ(writeOrder(Semantics::Ordered), MemoryOrder::SeqCst);
    EXPECT_EQ(readWriteOrder(Semantics::Ordered), MemoryOrder::SeqCst);
}

TEST(SemanticsTest, StrengthOrdering) {
    EXPECT_LT(Semantics::Relaxed, Semantics::Coupled);
    EXPECT_LT(Semantics::Coupled, Semantics::Ordered);
    EXPECT_EQ(static_cast<int>(Semantics::Relaxed), 0);
    EXPECT_EQ(static_cast<int>(Semantics::Ordered), 2);
}

// CAS 失败路径使用 readOrder，标准要求它不能带 release
TEST(SemanticsTest, ReadOrder_IsValidCasFailureOrder) {
    for (Semantics s : {Semantics::Relaxed, Semantics::Coupled, Semantics::Ordered}) {
        EXPECT_NE(readOrder(s), MemoryOrder::Release) << s;
        EXPECT_NE(readOrder(s), MemoryOrder::AcqRel) << s;
    }
}

TEST(SemanticsTest, ToStd_MatchesStandardOrders) {
    EXPECT_EQ(to_std_order(readOrder(Semantics::Coupled)), std::memory_order_acquire);
    EXPECT_EQ(to_std_order(writeOrder(Semantics::Coupled)), std::memory_order_release);
    EXPECT_EQ(to_std_order(readWriteOrder(Semantics::Ordered)), std::memory_order_seq_cst);
    EXPECT_EQ(to_std_order(readWriteOrder(Semantics::Relaxed)), std::memory_order_relaxed);
}

TEST(SemanticsTest, Names) {
    EXPECT_STREQ(toString(Semantics::Relaxed), "Relaxed");
    EXPECT_STREQ(toString(Semantics::Coupled), "Coupled");
    EXPECT_STREQ(toString(Semantics::Ordered), "Ordered");
    EXPECT_STREQ(toString(MemoryOrder::AcqRel), "AcqRel");

    std::ostringstream os;
    os << Semantics::Ordered << "/" << readOrder(Semantics::Coupled);
    EXPECT_EQ(os.str(), "Ordered/Acquire");
}
