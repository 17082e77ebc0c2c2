#ifndef SWEEPER_GAME_GAME_H_
#define SWEEPER_GAME_GAME_H_

#include <cstddef>
#include <memory>
#include <vector>

#include "sweeper/game/config.h"
#include "sweeper/game/random.h"

namespace sweeper {

// Represents the actions a player (or a solver) may perform on a game.
struct Action {
  enum class Type {
    // Uncover (reveal) a cell.
    UNCOVER,

    // Chord a cell: uncover all unflagged neighbours of an uncovered cell
    // whose flagged neighbours account for all of its adjacent mines.
    CHORD,

    // Toggle the flag state of a cell.
    FLAG,
  };

  Type type;
  std::size_t row;
  std::size_t col;
};

// Events are generated in response to actions taken in a game.
struct Event {
  enum class Type {
    // A cell was uncovered.
    UNCOVER,

    // A cell was flagged.
    FLAG,

    // A cell was unflagged.
    UNFLAG,

    // A mine was uncovered by the reveal at the end of the game.
    SHOW_MINE,

    // A flag was placed on a cell without a mine. Only generated when a game
    // is lost.
    BAD_FLAG,

    // The game was won.
    WIN,

    // The game was lost.
    LOSS,
  };

  // The type of event.
  Type type;

  // The row and column for which the event was generated.
  // For a LOSS event this was the mine that caused the loss.
  // For a WIN event this was the cell acted upon by the winning action.
  std::size_t row;
  std::size_t col;

  // The number of mines in adjacent cells.
  // Only set for UNCOVER events.
  std::size_t adjacent_mines;
};

// Represents the states that a cell can take from a player's point of view.
enum class CellState {
  // The cell is uncovered.
  UNCOVERED,

  // The cell is covered (but not flagged).
  COVERED,

  // The cell is flagged.
  FLAGGED,

  // The cell is a mine (revealed when the game ends).
  MINE,

  // The cell is the mine that caused a loss.
  LOSING_MINE,

  // The cell is flagged but does not contain a mine (revealed when the game
  // is lost).
  BAD_FLAG,
};

// A snapshot of a single cell.
struct CellInfo {
  std::size_t row;
  std::size_t col;
  bool has_mine;
  bool is_opened;
  bool is_flagged;

  // The number of mines among the up to eight neighbours.
  std::size_t nearby_mines;
};

// Implementations of EventSubscriber may call Game::Subscribe to receive
// event updates as actions are executed.
class EventSubscriber {
 public:
  virtual ~EventSubscriber() = default;

  // Notifies the subscriber that an event occurred.
  virtual void NotifyEvent(const Event& event) = 0;
};

// The interface through which a game is played.
//
// Mines are placed lazily by the first UNCOVER action so that the uncovered
// cell and its neighbours never contain a mine.
class Game {
 public:
  // Current game state.
  enum class State {
    // A new game is ready but no cell has been uncovered yet.
    NEW,

    // The game is ongoing.
    PLAYING,

    // The game ended in a win.
    WIN,

    // The game ended in a loss.
    LOSS,
  };

  virtual ~Game() = default;

  // Executes the supplied action and updates all subscribers.
  //
  // Actions on cells outside the grid, and any action once the game is over,
  // are ignored.
  virtual void Execute(const Action& action) = 0;

  // Executes all of the supplied actions.
  //
  // This is a convenience function that repeatedly calls the Execute method
  // above.
  void Execute(const std::vector<Action>& actions) {
    for (const Action& action : actions) {
      Execute(action);
    }
  }

  void Reveal(std::size_t row, std::size_t col) {
    Execute(Action{Action::Type::UNCOVER, row, col});
  }

  void ToggleFlag(std::size_t row, std::size_t col) {
    Execute(Action{Action::Type::FLAG, row, col});
  }

  void Chord(std::size_t row, std::size_t col) {
    Execute(Action{Action::Type::CHORD, row, col});
  }

  // Subscribes the given subscriber to receive event updates when actions are
  // executed. The subscriber must outlive the game or the game must no longer
  // be executing actions.
  virtual void Subscribe(EventSubscriber* subscriber) = 0;

  // Returns the number of rows in the game.
  virtual std::size_t GetRows() const = 0;

  // Returns the number of columns in the game.
  virtual std::size_t GetCols() const = 0;

  // Returns the number of mines in the game.
  virtual std::size_t GetMines() const = 0;

  // Returns the number of flags currently placed.
  virtual std::size_t GetFlags() const = 0;

  // Returns the current game state.
  virtual State GetState() const = 0;

  // Returns a snapshot of the cell at row and col, which must be valid.
  virtual CellInfo GetCell(std::size_t row, std::size_t col) const = 0;

  // Returns true if every mine-free cell is uncovered or every mine is
  // flagged. Before the first move there are no mines and this is false.
  virtual bool CheckWin() const = 0;

  // Returns true until the first cell is uncovered.
  bool IsFirstMove() const { return GetState() == State::NEW; }

  // Returns true if the game is over.
  bool IsGameOver() const {
    const State state = GetState();
    return state == State::WIN || state == State::LOSS;
  }

  // Returns true if the game ended in a win.
  bool IsWin() const { return GetState() == State::WIN; }
};

// Creates a new game.
//   config - The dimensions and number of mines.
//   random - Source used to place the mines. Must outlive the game.
//
// Returns nullptr if the configuration is invalid.
std::unique_ptr<Game> NewGame(const GameConfig& config, Random& random);

}  // namespace sweeper

#endif  // SWEEPER_GAME_GAME_H_
