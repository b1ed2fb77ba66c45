#pragma once

// Profiling zones. Compiled out unless the build enables Tracy.
#ifdef PERFPROF_ENABLE_TRACY
#  include <tracy/Tracy.hpp>
#  define PERFPROF_ZONE ZoneScoped
#  define PERFPROF_ZONE_N(name) ZoneScopedN(name)
#else
#  define PERFPROF_ZONE
#  define PERFPROF_ZONE_N(name)
#endif
