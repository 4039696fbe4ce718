#pragma once

#include <absl/base/thread_annotations.h>

// Options setters: `options.name(value)` assigns and returns *this so calls
// chain, `options.name()` reads.
// clang-format off
#define DEFINE_ARG(T, name)                                       \
 public:                                                          \
  inline auto name(const T& name) ->decltype(*this) {             \
    this->name##_ = name;                                         \
    return *this;                                                 \
  }                                                               \
  inline const T& name() const noexcept { return this->name##_; } \
  inline T& name() noexcept { return this->name##_; }             \
                                                                  \
  T name##_
// clang-format on

// members only touched with the given mutex held
#define GUARDED_BY(x) ABSL_GUARDED_BY(x)

#define MODELHOST_STR_CAT(s1, s2) s1##s2

// unique local name per source line, for scope guards such as AUTO_COUNTER
#define MODELHOST_ANON_VAR(str) MODELHOST_STR_CAT(str, __LINE__)
