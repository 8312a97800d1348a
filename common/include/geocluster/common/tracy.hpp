#pragma once

#ifdef GEOCLUSTER_ENABLE_TRACY
#  include <tracy/Tracy.hpp>
#  define GEOCLUSTER_ZONE ZoneScoped
#  define GEOCLUSTER_ZONE_N(name) ZoneScopedN(name)
#else
#  define GEOCLUSTER_ZONE
#  define GEOCLUSTER_ZONE_N(name)
#endif
