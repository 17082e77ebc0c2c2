#ifndef SWEEPER_COMPAT_MAKE_UNIQUE_H_
#define SWEEPER_COMPAT_MAKE_UNIQUE_H_

#include <memory>
#include <utility>

// Stand-in for std::make_unique, which arrived in C++14.
template <typename T, typename... Args>
std::unique_ptr<T> MakeUnique(Args&&... args) {
  return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
}

#endif  // SWEEPER_COMPAT_MAKE_UNIQUE_H_
