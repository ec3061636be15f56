#pragma once

#ifdef PARLEY_ENABLE_TRACING
#  include <tracy/Tracy.hpp>
#  define PARLEY_ZONE ZoneScoped
#  define PARLEY_ZONE_N(name) ZoneScopedN(name)
#else
#  define PARLEY_ZONE
#  define PARLEY_ZONE_N(name)
#endif
