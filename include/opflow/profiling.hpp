#pragma once

#include <cstring>

// User can specify a "profiling include" to specify how profiling needs to be done
#ifdef OPFLOW_PROFILING_INCLUDE
#include OPFLOW_PROFILING_INCLUDE
#endif

#if TRACY_ENABLE

#include "Tracy.hpp"

#define OPFLOW_ENABLE_PROFILING 1

#define OPFLOW_PROFILING_INIT() static_cast<void>(tracy::GetProfiler())
#define OPFLOW_PROFILING_FUNCTION() ZoneScopedN(__FUNCTION__)
#define OPFLOW_PROFILING_SCOPE() ZoneScoped
#define OPFLOW_PROFILING_SCOPE_N(staticName) ZoneScopedN(staticName)
#define OPFLOW_PROFILING_SCOPE_C(color) ZoneScopedC(color)
#define OPFLOW_PROFILING_SET_DYNNAME(name) ZoneName(name, strlen(name))
#define OPFLOW_PROFILING_SET_TEXT(text) ZoneText(text, strlen(text))
#define OPFLOW_PROFILING_MESSAGE(text) TracyMessage(text, strlen(text))
#define OPFLOW_PROFILING_PLOT(staticName, val) TracyPlot(staticName, val)
#define OPFLOW_PROFILING_SETTHREADNAME(staticName) tracy::SetThreadName(staticName)

#define OPFLOW_PROFILING_COLOR_SILVER 0xC0C0C0
#define OPFLOW_PROFILING_COLOR_YELLOW 0xFFFF00
#define OPFLOW_PROFILING_COLOR_LIME 0x00FF00
#define OPFLOW_PROFILING_COLOR_RED 0xFF0000
#define OPFLOW_PROFILING_COLOR_BLUE 0x0000FF

#endif

#if !OPFLOW_ENABLE_PROFILING

#define OPFLOW_PROFILING_INIT()                    /*nothing*/
#define OPFLOW_PROFILING_FUNCTION()                /*nothing*/
#define OPFLOW_PROFILING_SCOPE()                   /*nothing*/
#define OPFLOW_PROFILING_SCOPE_N(staticName)       /*nothing*/
#define OPFLOW_PROFILING_SCOPE_C(color)            /*nothing*/
#define OPFLOW_PROFILING_SET_DYNNAME(name)         /*nothing*/
#define OPFLOW_PROFILING_SET_TEXT(text)            /*nothing*/
#define OPFLOW_PROFILING_MESSAGE(text)             /*nothing*/
#define OPFLOW_PROFILING_PLOT(staticName, val)     /*nothing*/
#define OPFLOW_PROFILING_SETTHREADNAME(staticName) /*nothing*/

#define OPFLOW_PROFILING_COLOR_SILVER /*nothing*/
#define OPFLOW_PROFILING_COLOR_YELLOW /*nothing*/
#define OPFLOW_PROFILING_COLOR_LIME   /*nothing*/
#define OPFLOW_PROFILING_COLOR_RED    /*nothing*/
#define OPFLOW_PROFILING_COLOR_BLUE   /*nothing*/

#endif
