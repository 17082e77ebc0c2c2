#include "sweeper/game/random.h"

#include <random>

#include "sweeper/compat/make_unique.h"

namespace sweeper {

namespace {

class MersenneRandom : public Random {
 public:
  explicit MersenneRandom(unsigned seed) : engine_(seed) {}

  ~MersenneRandom() final = default;

  std::size_t Uniform(std::size_t n) final {
    std::uniform_int_distribution<std::size_t> d(0, n - 1);
    return d(engine_);
  }

 private:
  std::mt19937 engine_;
};

}  // namespace

std::unique_ptr<Random> NewRandom(unsigned seed) {
  return MakeUnique<MersenneRandom>(seed);
}

}  // namespace sweeper
