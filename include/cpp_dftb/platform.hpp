// platform.hpp - branch hint for rare failure paths
#pragma once

#ifndef DFTB_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define DFTB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define DFTB_UNLIKELY(x) (x)
#  endif
#endif
