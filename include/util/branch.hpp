#pragma once

// Branch prediction hints for the chunk write path and frame dispatch.
// No-ops on compilers without __builtin_expect.
#if defined(__GNUC__) || defined(__clang__)
#define WIRESPEED_LIKELY(x) (__builtin_expect(!!(x), 1))
#define WIRESPEED_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define WIRESPEED_LIKELY(x) (x)
#define WIRESPEED_UNLIKELY(x) (x)
#endif
