#include "sweeper/solver/autosolver.h"

#include <glib.h>

#include "sweeper/solver/local.h"

namespace sweeper {
namespace solver {

AutoSolver::AutoSolver(Game& game, Random& random)
    : game_(game),
      random_(random),
      knowledge_(game.GetRows(), game.GetCols()),
      subset_(New(Algorithm::SUBSET, game)),
      state_(State::NOT_STARTED) {
  game_.Subscribe(&knowledge_);
}

bool AutoSolver::Solve() {
  if (state_ != State::NOT_STARTED) {
    return state_ == State::WON;
  }
  state_ = State::RUNNING;

  bool can_move = Guess();

  // Progress is measured by the number of opened or flagged cells.
  std::size_t known = knowledge_.CountOpenedOrFlagged();
  while (can_move && !game_.IsGameOver()) {
    // The safe pass runs after the flags of the mine pass are placed.
    Execute(local::FindMines(knowledge_), "local", &stats_.local_flags,
            &stats_.local_uncovers);
    Execute(local::FindSafe(knowledge_), "local", &stats_.local_flags,
            &stats_.local_uncovers);

    if (!game_.IsGameOver() && knowledge_.CountOpenedOrFlagged() == known) {
      g_info("Local analysis is stuck, comparing pairs of cells");
      if (!Execute(subset_->Analyze(), "subset", &stats_.subset_flags,
                   &stats_.subset_uncovers)) {
        g_info("Subset analysis is stuck, guessing");
        can_move = Guess();
      }
    }

    known = knowledge_.CountOpenedOrFlagged();
  }

  if (!game_.IsGameOver()) {
    g_warning("Stopped after %zu guesses with the game still in progress",
              stats_.random_guesses);
    return false;
  }
  state_ = game_.IsWin() ? State::WON : State::LOST;
  g_info("Game %s after %zu guesses", game_.IsWin() ? "won" : "lost",
         stats_.random_guesses);
  return state_ == State::WON;
}

bool AutoSolver::Execute(const std::vector<Action>& actions,
                         const char* strategy, std::size_t* flags,
                         std::size_t* uncovers) {
  for (const Action& action : actions) {
    if (game_.IsGameOver()) {
      break;
    }
    if (action.type == Action::Type::FLAG) {
      g_debug("%s: flag (%zu, %zu)", strategy, action.row, action.col);
      ++*flags;
    } else {
      g_debug("%s: uncover (%zu, %zu)", strategy, action.row, action.col);
      ++*uncovers;
    }
    game_.Execute(action);
  }
  return !actions.empty();
}

bool AutoSolver::Guess() {
  CellLocation location;
  if (game_.IsFirstMove()) {
    const std::size_t index =
        random_.Uniform(knowledge_.GetRows() * knowledge_.GetCols());
    location = CellLocation{index / knowledge_.GetCols(),
                            index % knowledge_.GetCols()};
  } else {
    const std::vector<CellLocation> unresolved = knowledge_.GetUnresolved();
    if (unresolved.empty()) {
      g_warning("No unresolved cell left to guess");
      return false;
    }
    location = unresolved[random_.Uniform(unresolved.size())];
  }

  g_debug("random: uncover (%zu, %zu)", location.row, location.col);
  ++stats_.random_guesses;
  game_.Reveal(location.row, location.col);
  return true;
}

}  // namespace solver
}  // namespace sweeper
