#pragma once

// A "platform include" given by the user overrides the detection below
#ifdef OPFLOW_PLATFORM_INCLUDE
#include OPFLOW_PLATFORM_INCLUDE
#endif

#ifndef OPFLOW_PLATFORM

#if __linux__ || __FreeBSD__ || __NetBSD__ || __OpenBSD__
#define OPFLOW_PLATFORM_LINUX 1
#elif __APPLE__
#define OPFLOW_PLATFORM_APPLE 1
#else
#define OPFLOW_PLATFORM_UNKNOWN 1
#endif

#define OPFLOW_PLATFORM(X) (OPFLOW_PLATFORM_##X)
#endif

#if !defined(OPFLOW_CPU_ARCH)

#if defined(_M_ARM) || defined(__arm__) || defined(__aarch64__)
#define OPFLOW_CPU_ARCH_arm 1
#elif defined(_M_X64) || defined(__x86_64__) || defined(_M_IX86) || defined(__i386__)
#define OPFLOW_CPU_ARCH_x86 1
#else
#define OPFLOW_CPU_ARCH_generic 1
#endif

#define OPFLOW_CPU_ARCH(X) (OPFLOW_CPU_ARCH_##X)
#endif

#if defined(__clang__)
#define OPFLOW_CPP_COMPILER_clang 1
#elif defined(__GNUC__)
#define OPFLOW_CPP_COMPILER_gcc 1
#elif defined(_MSC_VER)
#define OPFLOW_CPP_COMPILER_msvc 1
#endif

#define OPFLOW_CPP_COMPILER(X) (OPFLOW_CPP_COMPILER_##X)
