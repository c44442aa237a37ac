#pragma once

#if defined(TLSCORO_MODULE_EXPORT)
#define TLSCORO_EXPORT export
#else
#define TLSCORO_EXPORT
#endif
