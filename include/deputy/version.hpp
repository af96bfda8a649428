#pragma once

// Set by the build; these fallbacks apply to ad-hoc builds.
#ifndef DEPUTY_VERSION
#define DEPUTY_VERSION "dev"
#endif

#ifndef DEPUTY_COMMIT
#define DEPUTY_COMMIT "unknown"
#endif

#ifndef DEPUTY_BUILD_DATE
#define DEPUTY_BUILD_DATE "unknown"
#endif

namespace deputy {

inline const char* version() { return DEPUTY_VERSION; }
inline const char* commit() { return DEPUTY_COMMIT; }
inline const char* build_date() { return DEPUTY_BUILD_DATE; }

} // namespace deputy
