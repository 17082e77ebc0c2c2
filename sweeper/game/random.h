#ifndef SWEEPER_GAME_RANDOM_H_
#define SWEEPER_GAME_RANDOM_H_

#include <cstddef>
#include <memory>

namespace sweeper {

// A source of uniformly distributed integers.
//
// Every game and every solver owns (or borrows) its own instance, so games
// can be reproduced from a seed and run side by side without sharing state.
class Random {
 public:
  virtual ~Random() = default;

  // Returns an integer uniformly distributed in [0, n). n must be positive.
  virtual std::size_t Uniform(std::size_t n) = 0;
};

// Creates a Random backed by a Mersenne Twister seeded with seed.
std::unique_ptr<Random> NewRandom(unsigned seed);

}  // namespace sweeper

#endif  // SWEEPER_GAME_RANDOM_H_
