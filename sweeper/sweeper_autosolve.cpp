// Main program to measure how often the autosolver wins.
//
// Plays a number of games with the autosolver and reports the win rate.

#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include <glib.h>
#include <glibmm/error.h>
#include <glibmm/init.h>
#include <glibmm/optioncontext.h>
#include <glibmm/optionentry.h>
#include <glibmm/optiongroup.h>
#include <glibmm/ustring.h>

#include "sweeper/game/config.h"
#include "sweeper/game/game.h"
#include "sweeper/game/random.h"
#include "sweeper/solver/autosolver.h"

namespace {

// Values collected from the command line.
struct Options {
  Glib::ustring difficulty;
  int rows = 0;
  int cols = 0;
  int mines = 0;
  int games = 1;
  int seed = static_cast<int>(std::time(nullptr));
  bool debug = false;
};

Glib::OptionEntry MakeEntry(const char* long_name, char short_name,
                            const char* description,
                            const char* arg_description = nullptr) {
  Glib::OptionEntry entry;
  entry.set_long_name(long_name);
  if (short_name != '\0') {
    entry.set_short_name(short_name);
  }
  entry.set_description(description);
  if (arg_description != nullptr) {
    entry.set_arg_description(arg_description);
  }
  return entry;
}

// Converts the parsed options into a game configuration.
//
// Returns false and sets *error if the options are invalid.
bool MakeConfig(const Options& options, sweeper::GameConfig* config,
                std::string* error) {
  if (options.rows < 0 || options.cols < 0 || options.mines < 0) {
    *error = "Invalid number of rows, columns or mines";
    return false;
  }
  if (options.games <= 0) {
    *error = "Invalid number of games";
    return false;
  }
  sweeper::ConfigOptions config_options;
  config_options.difficulty = options.difficulty.raw();
  config_options.rows = static_cast<std::size_t>(options.rows);
  config_options.cols = static_cast<std::size_t>(options.cols);
  config_options.mines = static_cast<std::size_t>(options.mines);
  return sweeper::ResolveConfig(config_options, config, error);
}

}  // namespace

int main(int argc, char* argv[]) {
  Glib::init();

  Options options;
  Glib::OptionGroup group("sweeper", "Game options", "Show game options");
  group.add_entry(MakeEntry("difficulty", 'd',
                            "Preset grid: beginner, intermediate or expert",
                            "NAME"),
                  options.difficulty);
  group.add_entry(MakeEntry("rows", 'r', "Number of rows in a custom grid",
                            "N"),
                  options.rows);
  group.add_entry(MakeEntry("columns", 'c',
                            "Number of columns in a custom grid", "N"),
                  options.cols);
  group.add_entry(MakeEntry("mines", 'm', "Number of mines in a custom grid",
                            "N"),
                  options.mines);
  group.add_entry(MakeEntry("games", 'n', "Number of games to play", "N"),
                  options.games);
  group.add_entry(MakeEntry("seed", 's',
                            "Seed of the first game; game i uses seed + i",
                            "SEED"),
                  options.seed);
  group.add_entry(MakeEntry("debug", '\0', "Enable debug logging"),
                  options.debug);

  Glib::OptionContext context("- play minesweeper with the autosolver");
  context.set_main_group(group);

  try {
    context.parse(argc, argv);
  } catch (const Glib::Error& e) {
    std::cerr << argv[0] << ": " << e.what() << '\n';
    return 1;
  }

  if (options.debug) {
    g_setenv("G_MESSAGES_DEBUG", G_LOG_DOMAIN, TRUE);
  }

  sweeper::GameConfig config;
  std::string error;
  if (!MakeConfig(options, &config, &error)) {
    std::cerr << argv[0] << ": " << error << '\n';
    return 1;
  }

  const std::size_t games = static_cast<std::size_t>(options.games);
  std::size_t won = 0;
  std::size_t guesses = 0;
  for (std::size_t i = 0; i < games; ++i) {
    // Each game owns its randomness so it can be replayed from its seed.
    const unsigned seed = static_cast<unsigned>(options.seed) + i;
    std::unique_ptr<sweeper::Random> random = sweeper::NewRandom(seed);
    std::unique_ptr<sweeper::Game> game = sweeper::NewGame(config, *random);
    if (!game) {
      std::cerr << argv[0] << ": could not create game\n";
      return 1;
    }

    sweeper::solver::AutoSolver solver(*game, *random);
    if (solver.Solve()) {
      ++won;
    }
    guesses += solver.GetStats().random_guesses;
  }

  std::cout << "Games won: " << won << '/' << games << " (" << std::fixed
            << std::setprecision(2) << 100.0 * won / games << "%)\n";
  std::cout << "Random guesses: " << guesses << '\n';
  return 0;
}
