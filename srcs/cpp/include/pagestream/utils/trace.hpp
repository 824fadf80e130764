#pragma once
#ifdef PAGESTREAM_ENABLE_TRACE

#include <stdtracer_thread>

#else

#define TRACE_SCOPE(name)

#define DEFINE_TRACE_CONTEXT(name)

#endif

#define DEFINE_TRACE_CONTEXTS DEFINE_TRACE_CONTEXT(global)
