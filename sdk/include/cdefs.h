// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

// glibc provides `__always_inline` in <sys/cdefs.h> with the same meaning.
#ifndef __always_inline
#	define __always_inline inline __attribute__((always_inline))
#endif

#define __predict_false(exp) __builtin_expect((exp), 0)

#define APPCHECK_VERSION_TRIPLE(major, minor, patch)                           \
	((major * 10000) + (minor * 100) + (patch))

/// The version of the credential-checking core.
#define APPCHECK_VERSION APPCHECK_VERSION_TRIPLE(1, 0, 0)
