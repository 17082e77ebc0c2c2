#include "sweeper/solver/solver.h"

#include "sweeper/solver/local.h"
#include "sweeper/solver/subset.h"

namespace sweeper {
namespace solver {

std::unique_ptr<Solver> New(Algorithm alg, Game& game) {
  std::unique_ptr<Solver> solver;
  switch (alg) {
    case Algorithm::LOCAL:
      solver = local::New(game);
      break;
    case Algorithm::SUBSET:
      solver = subset::New(game);
      break;
    default:
      return nullptr;
  }
  game.Subscribe(solver.get());
  return solver;
}

}  // namespace solver
}  // namespace sweeper
