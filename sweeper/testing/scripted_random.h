#ifndef SWEEPER_TESTING_SCRIPTED_RANDOM_H_
#define SWEEPER_TESTING_SCRIPTED_RANDOM_H_

#include <cstddef>
#include <utility>
#include <vector>

#include "sweeper/game/random.h"

namespace sweeper {
namespace testing {

// A Random that replays a fixed script of values.
//
// Each call to Uniform(n) consumes the next value and returns it modulo n.
// The script repeats once exhausted. The script must not be empty.
class ScriptedRandom : public Random {
 public:
  explicit ScriptedRandom(std::vector<std::size_t> values)
      : values_(std::move(values)) {}

  ~ScriptedRandom() final = default;

  std::size_t Uniform(std::size_t n) final {
    const std::size_t value = values_[next_ % values_.size()];
    ++next_;
    return value % n;
  }

  // Returns the number of values consumed so far.
  std::size_t GetCalls() const { return next_; }

 private:
  std::vector<std::size_t> values_;
  std::size_t next_ = 0;
};

}  // namespace testing
}  // namespace sweeper

#endif  // SWEEPER_TESTING_SCRIPTED_RANDOM_H_
