#pragma once

#include <cstdio>

// =============================================================
// 编译期配置
//
// PTRCELL_USE_STD_ATOMIC
//     定义后 Atomic<T> 固定走 std::atomic 后端 (TSan / 非 x86 会自动选择)
//
// PTRCELL_MAP_OWNER_YIELD_EVERY
//     mapOwner 每失败多少次 CAS 让出一次时间片，0 表示从不让出
//
// PTRCELL_ENABLE_LOGGING
//     0: 关闭日志 (默认)
//     1: 开启日志 (调试用，竞争激烈时 stderr 会成为瓶颈)
// =============================================================

#ifndef PTRCELL_MAP_OWNER_YIELD_EVERY
#define PTRCELL_MAP_OWNER_YIELD_EVERY 64
#endif

#ifndef PTRCELL_ENABLE_LOGGING
#define PTRCELL_ENABLE_LOGGING 0
#endif

#if PTRCELL_ENABLE_LOGGING
    #define PTRCELL_LOG(...) std::fprintf(stderr, __VA_ARGS__)
#else
    #define PTRCELL_LOG(...) ((void)0)
#endif
