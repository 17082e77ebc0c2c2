#include "sweeper/game/game.h"

#include <queue>
#include <string>

#include <glib.h>

#include "sweeper/compat/make_unique.h"
#include "sweeper/game/grid.h"

namespace sweeper {

namespace {

// Convenience function to create an UNCOVER event.
constexpr Event UncoverEvent(std::size_t row, std::size_t col,
                             std::size_t adjacent_mines) {
  return Event{Event::Type::UNCOVER, row, col, adjacent_mines};
}

// Convenience function to create a FLAG event.
constexpr Event FlagEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::FLAG, row, col, 0};
}

// Convenience function to create an UNFLAG event.
constexpr Event UnflagEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::UNFLAG, row, col, 0};
}

// Convenience function to create a SHOW_MINE event.
constexpr Event ShowMineEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::SHOW_MINE, row, col, 0};
}

// Convenience function to create a BAD_FLAG event.
constexpr Event BadFlagEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::BAD_FLAG, row, col, 0};
}

// Convenience function to create a WIN event.
constexpr Event WinEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::WIN, row, col, 0};
}

// Convenience function to create a LOSS event.
constexpr Event LossEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::LOSS, row, col, 0};
}

// A single cell in a game.
class Cell {
 public:
  // Returns true if the cell contains a mine.
  bool IsMine() const { return is_mine_; }

  // Sets this cell as a mine.
  //
  // Returns false if the cell was already a mine.
  bool SetMine() {
    if (is_mine_) {
      return false;
    }
    is_mine_ = true;
    return true;
  }

  // Returns the number of mines in adjacent cells.
  std::size_t GetAdjacentMines() const { return adjacent_mines_; }

  // Records one more mine in an adjacent cell.
  void AddAdjacentMine() { ++adjacent_mines_; }

  bool IsFlagged() const { return state_ == State::FLAGGED; }

  bool IsCovered() const { return state_ == State::COVERED; }

  bool IsUncovered() const { return state_ == State::UNCOVERED; }

  // Toggles a cell between flagged and covered.
  //
  // Returns false (and does nothing) if the cell is uncovered.
  bool ToggleFlagged() {
    switch (state_) {
      case State::COVERED:
        state_ = State::FLAGGED;
        return true;
      case State::FLAGGED:
        state_ = State::COVERED;
        return true;
      case State::UNCOVERED:
      default:
        return false;
    }
  }

  // Uncovers the cell if it is covered.
  //
  // Returns false (and does nothing) if the cell is flagged or uncovered.
  bool Uncover() {
    if (state_ != State::COVERED) {
      return false;
    }
    state_ = State::UNCOVERED;
    return true;
  }

 private:
  enum class State {
    COVERED,
    UNCOVERED,
    FLAGGED,
  };

  bool is_mine_ = false;
  std::size_t adjacent_mines_ = 0;
  State state_ = State::COVERED;
};

// The game implementation.
class GameImpl : public Game {
 public:
  GameImpl(const GameConfig& config, Random& random)
      : mines_(config.mines),
        random_(random),
        state_(State::NEW),
        remaining_safe_(config.rows * config.cols - config.mines),
        unflagged_mines_(config.mines),
        flags_(0),
        grid_(config.rows, config.cols) {
    g_info("Game grid: %zux%zu with %zu mines", config.rows, config.cols,
           config.mines);
  }

  ~GameImpl() final = default;

  void Execute(const Action& action) final {
    if (IsGameOver() || !grid_.IsValid(action.row, action.col)) {
      return;
    }

    std::vector<Event> events;
    switch (action.type) {
      case Action::Type::UNCOVER:
        Uncover(action.row, action.col, events);
        break;
      case Action::Type::CHORD:
        Chord(action.row, action.col, events);
        break;
      case Action::Type::FLAG:
        ToggleFlagged(action.row, action.col, events);
        break;
      default:
        break;
    }

    // A no-op action cannot change the outcome.
    if (state_ == State::PLAYING && !events.empty() && CheckWin()) {
      RevealAllAndWin(action.row, action.col, events);
    }

    for (const Event& event : events) {
      for (EventSubscriber* subscriber : subscribers_) {
        subscriber->NotifyEvent(event);
      }
    }
  }

  void Subscribe(EventSubscriber* subscriber) final {
    subscribers_.push_back(subscriber);
  }

  std::size_t GetRows() const final { return grid_.GetRows(); }

  std::size_t GetCols() const final { return grid_.GetCols(); }

  std::size_t GetMines() const final { return mines_; }

  std::size_t GetFlags() const final { return flags_; }

  State GetState() const final { return state_; }

  CellInfo GetCell(std::size_t row, std::size_t col) const final {
    const Cell& cell = grid_(row, col);
    return CellInfo{row,
                    col,
                    cell.IsMine(),
                    cell.IsUncovered(),
                    cell.IsFlagged(),
                    cell.GetAdjacentMines()};
  }

  bool CheckWin() const final {
    return state_ != State::NEW &&
           (remaining_safe_ == 0 || unflagged_mines_ == 0);
  }

 private:
  // Places the mines, keeping the genesis cell and (if there is room) its
  // neighbours free of mines.
  void PlaceMines(std::size_t genesis_row, std::size_t genesis_col) {
    const std::size_t cells = grid_.GetSize();
    const std::size_t safe_zone =
        1 + grid_.ForEachAdjacent(genesis_row, genesis_col,
                                  [](std::size_t, std::size_t) {
                                    return true;
                                  });
    const bool protect_neighbours = mines_ <= cells - safe_zone;
    if (!protect_neighbours) {
      g_warning("No room for %zu mines outside the safe zone around (%zu, %zu)"
                "; only the first cell is kept free",
                mines_, genesis_row, genesis_col);
    }

    g_debug("First move at (%zu, %zu)", genesis_row, genesis_col);
    for (std::size_t remaining_mines = mines_; remaining_mines > 0;) {
      const std::size_t index = random_.Uniform(cells);
      const std::size_t row = grid_.Row(index);
      const std::size_t col = grid_.Col(index);

      if (row == genesis_row && col == genesis_col) {
        continue;
      }
      if (protect_neighbours &&
          Grid<Cell>::IsAdjacent(row, col, genesis_row, genesis_col)) {
        continue;
      }
      if (!grid_[index].SetMine()) {
        continue;
      }
      --remaining_mines;

      grid_.ForEachAdjacent(row, col, [this](std::size_t row, std::size_t col) {
        grid_(row, col).AddAdjacentMine();
        return false;
      });
      g_debug("Placed mine at (%zu, %zu)", row, col);
    }
    g_debug("Placed %zu mines", mines_);
    LogLayout();
  }

  // Logs each row of the grid, with '*' for a mine and the clue otherwise.
  void LogLayout() const {
    for (std::size_t row = 0; row < grid_.GetRows(); ++row) {
      std::string line;
      for (std::size_t col = 0; col < grid_.GetCols(); ++col) {
        const Cell& cell = grid_(row, col);
        if (col > 0) {
          line += ' ';
        }
        line += cell.IsMine() ? std::string("*")
                              : std::to_string(cell.GetAdjacentMines());
      }
      g_debug("Row %zu: %s", row, line.c_str());
    }
  }

  // Attempts to uncover the specified cell, placing the mines first if this
  // is the first move.
  //
  // Does nothing if the cell is flagged or already uncovered.
  void Uncover(std::size_t row, std::size_t col, std::vector<Event>& events) {
    if (state_ == State::NEW) {
      PlaceMines(row, col);
      state_ = State::PLAYING;
    }

    Cell& cell = grid_(row, col);
    if (!cell.IsCovered()) {
      g_debug("Uncover (%zu, %zu): already uncovered or flagged", row, col);
      return;
    }

    if (cell.IsMine()) {
      g_debug("Uncover (%zu, %zu): mine", row, col);
      RevealAllAndLose(row, col, events);
      return;
    }

    g_debug("Uncover (%zu, %zu)", row, col);
    UncoverRegion(row, col, events);
  }

  // Uncovers all unflagged neighbours of an uncovered cell once the flags
  // around it account for all of its adjacent mines.
  //
  // Does nothing for flagged or covered cells, cells without adjacent mines,
  // or if the wrong number of neighbours are flagged. If any of the cells to
  // uncover is a mine the game is lost before anything else is uncovered.
  void Chord(std::size_t row, std::size_t col, std::vector<Event>& events) {
    const Cell& cell = grid_(row, col);
    if (!cell.IsUncovered() || cell.GetAdjacentMines() == 0) {
      return;
    }

    if (CountAdjacentFlagged(row, col) != cell.GetAdjacentMines()) {
      g_debug("Chord (%zu, %zu): flags do not match", row, col);
      return;
    }

    std::vector<std::size_t> covered;
    grid_.ForEachAdjacent(
        row, col, [this, &covered](std::size_t row, std::size_t col) {
          if (grid_(row, col).IsCovered()) {
            covered.push_back(grid_.Index(row, col));
          }
          return false;
        });

    for (std::size_t index : covered) {
      if (grid_[index].IsMine()) {
        g_debug("Chord (%zu, %zu): mine at (%zu, %zu)", row, col,
                grid_.Row(index), grid_.Col(index));
        RevealAllAndLose(grid_.Row(index), grid_.Col(index), events);
        return;
      }
    }

    g_debug("Chord (%zu, %zu)", row, col);
    for (std::size_t index : covered) {
      UncoverRegion(grid_.Row(index), grid_.Col(index), events);
    }
  }

  // Toggles the flag on the specified cell.
  //
  // Does nothing before the first move or if the cell is already uncovered.
  void ToggleFlagged(std::size_t row, std::size_t col,
                     std::vector<Event>& events) {
    if (state_ == State::NEW) {
      g_debug("Flag (%zu, %zu): no mines before the first move", row, col);
      return;
    }

    Cell& cell = grid_(row, col);
    if (!cell.ToggleFlagged()) {
      g_debug("Flag (%zu, %zu): already uncovered", row, col);
      return;
    }

    if (cell.IsFlagged()) {
      ++flags_;
      if (cell.IsMine()) {
        --unflagged_mines_;
      }
      events.push_back(FlagEvent(row, col));
      g_debug("Flag (%zu, %zu): flagged", row, col);
    } else {
      --flags_;
      if (cell.IsMine()) {
        ++unflagged_mines_;
      }
      events.push_back(UnflagEvent(row, col));
      g_debug("Flag (%zu, %zu): unflagged", row, col);
    }
  }

  // Counts the number of adjacent flagged cells.
  std::size_t CountAdjacentFlagged(std::size_t row, std::size_t col) const {
    return grid_.ForEachAdjacent(row, col,
                                 [this](std::size_t row, std::size_t col) {
                                   return grid_(row, col).IsFlagged();
                                 });
  }

  // Uncovers a mine-free cell and, if it has no adjacent mines, the whole
  // connected blank region around it together with its numbered border.
  //
  // Uses an explicit queue so the depth of the region does not matter.
  // Flagged and already uncovered cells stop the expansion.
  void UncoverRegion(std::size_t row, std::size_t col,
                     std::vector<Event>& events) {
    std::queue<std::size_t> uncover_queue;
    auto queue_cell = [this, &uncover_queue](std::size_t row,
                                             std::size_t col) {
      if (grid_(row, col).IsCovered()) {
        uncover_queue.push(grid_.Index(row, col));
      }
      return false;
    };
    uncover_queue.push(grid_.Index(row, col));

    while (!uncover_queue.empty()) {
      const std::size_t index = uncover_queue.front();
      uncover_queue.pop();
      Cell& cell = grid_[index];

      // Cells may be queued more than once; only the first visit counts.
      if (!cell.Uncover()) {
        continue;
      }

      row = grid_.Row(index);
      col = grid_.Col(index);
      const std::size_t adjacent_mines = cell.GetAdjacentMines();
      events.push_back(UncoverEvent(row, col, adjacent_mines));
      --remaining_safe_;

      // Neighbours of a blank cell are never mines.
      if (adjacent_mines == 0) {
        grid_.ForEachAdjacent(row, col, queue_cell);
      }
    }
  }

  // Uncovers every remaining covered cell at the end of the game.
  //
  // Flagged cells keep their flags. When show_bad_flags is set, flags on
  // mine-free cells are reported.
  void RevealAll(bool show_bad_flags, std::vector<Event>& events) {
    grid_.ForEach([this, show_bad_flags, &events](std::size_t row,
                                                  std::size_t col,
                                                  Cell& cell) {
      if (cell.IsFlagged()) {
        if (show_bad_flags && !cell.IsMine()) {
          events.push_back(BadFlagEvent(row, col));
        }
        return;
      }
      if (!cell.Uncover()) {
        return;
      }
      if (cell.IsMine()) {
        events.push_back(ShowMineEvent(row, col));
      } else {
        --remaining_safe_;
        events.push_back(UncoverEvent(row, col, cell.GetAdjacentMines()));
      }
    });
  }

  // Uncovers the mine at row and col, reveals the rest of the grid, and
  // finishes the game as a loss.
  void RevealAllAndLose(std::size_t row, std::size_t col,
                        std::vector<Event>& events) {
    grid_(row, col).Uncover();
    RevealAll(true, events);
    events.push_back(LossEvent(row, col));
    state_ = State::LOSS;
    g_info("Game lost at (%zu, %zu)", row, col);
  }

  // Reveals the rest of the grid and finishes the game as a win.
  void RevealAllAndWin(std::size_t row, std::size_t col,
                       std::vector<Event>& events) {
    RevealAll(false, events);
    events.push_back(WinEvent(row, col));
    state_ = State::WIN;
    g_info("Game won");
  }

  const std::size_t mines_;
  Random& random_;
  State state_;

  // The number of covered (or flagged) cells without a mine.
  std::size_t remaining_safe_;

  // The number of mines without a flag.
  std::size_t unflagged_mines_;

  std::size_t flags_;
  Grid<Cell> grid_;
  std::vector<EventSubscriber*> subscribers_;
};

}  // namespace

std::unique_ptr<Game> NewGame(const GameConfig& config, Random& random) {
  if (!IsValidConfig(config)) {
    return nullptr;
  }
  return MakeUnique<GameImpl>(config, random);
}

}  // namespace sweeper
