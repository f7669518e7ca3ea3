#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "LevelData.hpp"
#include "Log.hpp"
#include "Movement.hpp"
#include "Session.hpp"

using Block::RollingBlock;
using Board::TileBoard;
using Geometry::Cell;
using Level::GameLevel;
using Movement::Direction;
using Session::GameSession;

// ------------------------------
// Helpers
// ------------------------------
static Direction parse_dir(const std::string& s) {
  if (s == "+X") return Direction::PosX;
  if (s == "-X") return Direction::NegX;
  if (s == "+Z") return Direction::PosZ;
  return Direction::NegZ;
}

// Plays a space separated move list; every move must be legal
static void play(GameLevel& level, const std::string& moves) {
  for (size_t i = 0; i + 1 < moves.size(); i += 3) {
    Direction d = parse_dir(moves.substr(i, 2));
    Movement::RollPlan plan = Movement::computeRoll(level, d);
    assert(plan.legal);
    level.getBlock().commitRoll(plan.target, Movement::isAlongX(d));
  }
}

// ------------------------------
// Bundled level data
// ------------------------------
static void test_level_table_shape() {
  assert(LevelData::count() == 12);
  assert(LevelData::maxIndex() == 11);
  assert(LevelData::isValidIndex(0));
  assert(LevelData::isValidIndex(11));
  assert(!LevelData::isValidIndex(-1));
  assert(!LevelData::isValidIndex(12));
}

static void test_every_level_loads_consistently() {
  for (int i = 0; i < LevelData::count(); ++i) {
    GameLevel level;
    assert(GameLevel::load(i, level));
    assert(level.getIndex() == i);

    const TileBoard& board = level.getBoard();
    const Cell start = LevelData::get(i).start;
    assert(board.hasTile(start));
    assert(board.hasTile(board.getWinningCell()));
    assert(!board.isWinningCell(start));

    std::vector<Cell> cells = level.blockCells();
    assert(cells.size() == 1);
    assert(cells[0] == start);
    assert(level.getBlock().getStance() == Geometry::Stance::Standing);
    assert(!level.isWon());
  }
}

static void test_load_is_deterministic() {
  GameLevel a;
  GameLevel b;
  assert(GameLevel::load(7, a));
  assert(GameLevel::load(7, b));
  assert(a.getBoard().getTiles() == b.getBoard().getTiles());
  assert(a.getBoard().getWinningCell() == b.getBoard().getWinningCell());
  assert(a.blockCells() == b.blockCells());
}

static void test_load_rejects_bad_index() {
  GameLevel level;
  assert(GameLevel::load(3, level));
  assert(!GameLevel::load(-1, level));
  assert(!GameLevel::load(12, level));
  assert(level.getIndex() == 3);
}

// ------------------------------
// Win detection
// ------------------------------
static void test_win_requires_standing_on_winning_cell() {
  TileBoard board;
  board.addTile(Cell(0, 0));
  board.addTile(Cell(1, 0));
  board.setWinningCell(Cell(2, 0));

  assert(Level::isWinningPlacement(board, {Cell(2, 0)}));
  assert(!Level::isWinningPlacement(board, {Cell(1, 0)}));
  assert(!Level::isWinningPlacement(board, {Cell(1, 0), Cell(2, 0)}));
  assert(!Level::isWinningPlacement(board, {Cell(2, 0), Cell(3, 0)}));
  assert(!Level::isWinningPlacement(board, {}));
}

static void test_lying_over_winning_cell_is_not_a_win() {
  TileBoard board;
  board.addTile(Cell(0, 0));
  board.addTile(Cell(2, 0));
  board.setWinningCell(Cell(1, 0));
  GameLevel level(0, board, RollingBlock(Cell(0, 0)));

  // Stand (0,0) -> lie across (1,0)-(2,0)
  Movement::RollPlan plan = Movement::computeRoll(level, Direction::PosX);
  assert(plan.legal);
  level.getBlock().commitRoll(plan.target, true);

  std::vector<Cell> cells = level.blockCells();
  assert(cells.size() == 2);
  assert(cells[0] == board.getWinningCell());
  assert(!level.isWon());
}

static void test_known_solutions_win() {
  GameLevel level0;
  assert(GameLevel::load(0, level0));
  play(level0, "-X -X +Z +Z +Z -X +Z");
  assert(level0.isWon());

  GameLevel level2;
  assert(GameLevel::load(2, level2));
  play(level2, "+X +Z -X -Z +X");
  assert(!level2.isWon());
  play(level2, "+Z");
  assert(level2.isWon());
}

// ------------------------------
// Session lifecycle
// ------------------------------
static void test_change_level_bounds() {
  GameSession session;
  assert(!session.changeLevel(1));  // nothing loaded yet
  assert(session.getLevelIndex() == -1);

  assert(session.loadLevel(0));
  assert(!session.canChangeLevel(-1));
  assert(!session.changeLevel(-1));
  assert(session.getLevelIndex() == 0);

  assert(session.changeLevel(11));
  assert(session.getLevelIndex() == 11);
  assert(!session.changeLevel(1));
  assert(session.getLevelIndex() == 11);
  assert(!session.changeLevel(-12));
  assert(session.getLevelIndex() == 11);

  assert(session.changeLevel(-10));
  assert(session.getLevelIndex() == 1);
}

static void test_restart_rebuilds_level() {
  GameSession session;
  assert(session.loadLevel(2));
  play(session.getLevel(), "+X +Z");
  assert(session.getLevel().blockCells().size() == 2);

  assert(session.changeLevel(0));
  assert(session.getLevelIndex() == 2);
  std::vector<Cell> cells = session.getLevel().blockCells();
  assert(cells.size() == 1);
  assert(cells[0] == LevelData::get(2).start);
  assert(session.getLevel().getBlock().getStance() == Geometry::Stance::Standing);
}

static void test_load_clears_completed_flag() {
  GameSession session;
  assert(session.loadLevel(11));
  session.setCompleted(true);
  assert(session.overlayActive());
  assert(!session.changeLevel(1));
  assert(session.isCompleted());

  assert(session.changeLevel(-11));
  assert(!session.isCompleted());
  assert(!session.overlayActive());
}

// ------------------------------
// Main
// ------------------------------
int main() {
  Log::setLevel(Log::Level::Off);

  test_level_table_shape();
  test_every_level_loads_consistently();
  test_load_is_deterministic();
  test_load_rejects_bad_index();

  test_win_requires_standing_on_winning_cell();
  test_lying_over_winning_cell_is_not_a_win();
  test_known_solutions_win();

  test_change_level_bounds();
  test_restart_rebuilds_level();
  test_load_clears_completed_flag();

  std::cout << "[OK] Level & session tests passed\n";
  return 0;
}
