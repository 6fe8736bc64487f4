#ifndef GRAVDIR_CONFIG_CONFIG_H
#define GRAVDIR_CONFIG_CONFIG_H

#include "gravdir/build_settings.h"

#ifndef GRAVDIR_DISABLE_ASSERT
#include <cassert>
#define GRAVDIR_ASSERT(condition, ...) assert(condition)
#else // GRAVDIR_DISABLE_ASSERT
#undef GRAVDIR_ASSERT
#define GRAVDIR_ASSERT(...) ((void)0)
#endif // GRAVDIR_DISABLE_ASSERT

#endif // GRAVDIR_CONFIG_CONFIG_H
