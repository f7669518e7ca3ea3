#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "Animation.hpp"
#include "Config.hpp"
#include "LevelData.hpp"
#include "Log.hpp"

using Animation::Animator;
using Animation::TweenKind;
using Block::RollingBlock;
using Board::TileBoard;
using Geometry::Body;
using Geometry::Cell;
using Geometry::Stance;
using Level::GameLevel;
using Math::Vec3;
using Movement::Direction;
using Movement::RollPlan;
using Session::GameSession;

static const double ROLL_MS = Config::ROLL_STEPS * Config::ROLL_STEP_MS;
static const double BOUNCE_MS = 2 * Config::BOUNCE_STEPS * Config::BOUNCE_STEP_MS;
static const double FADE_MS = 2 * Config::FADE_STEPS * Config::FADE_STEP_MS;

// ------------------------------
// Helpers
// ------------------------------
static bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

static bool nearVec(const Vec3& a, const Vec3& b, double eps = 1e-9) {
  return near(a.x, b.x, eps) && near(a.y, b.y, eps) && near(a.z, b.z, eps);
}

static bool samePose(const Body& a, const Body& b) {
  return a.position.x == b.position.x && a.position.y == b.position.y &&
         a.position.z == b.position.z && a.orientation.w == b.orientation.w &&
         a.orientation.x == b.orientation.x && a.orientation.y == b.orientation.y &&
         a.orientation.z == b.orientation.z;
}

// What the input layer does for one key press
static bool press(GameSession& session, Animator& animator, Direction dir, double nowMs) {
  RollPlan plan;
  if (!Movement::planRoll(session, dir, plan)) return false;
  return animator.startRoll(plan, nowMs);
}

// Row of tiles (0,0)..(3,0) with the hole at (3,0): two +X rolls win
static GameLevel short_row_level(int index) {
  TileBoard board;
  board.addTile(Cell(0, 0));
  board.addTile(Cell(1, 0));
  board.addTile(Cell(2, 0));
  board.setWinningCell(Cell(3, 0));
  return GameLevel(index, board, RollingBlock(Cell(0, 0)));
}

// ------------------------------
// Rolls
// ------------------------------
static void test_roll_lands_exactly_on_validated_pose() {
  GameSession session;
  assert(session.loadLevel(2));
  Animator animator(session);

  RollPlan plan;
  assert(Movement::planRoll(session, Direction::PosX, plan));
  assert(plan.legal);
  Body start = session.getLevel().getBlock().getBody();

  assert(animator.startRoll(plan, 1000));
  assert(session.isBusy());
  assert(animator.currentKind() == TweenKind::Roll);

  // Halfway: 9 of 18 steps
  animator.tick(1000 + 9 * Config::ROLL_STEP_MS);
  Body half = Geometry::rotatedCopy(start, plan.pivot, plan.axis, plan.angleDeg / 2);
  assert(nearVec(session.getLevel().getBlock().getPosition(), half.position));
  assert(session.getLevel().getBlock().getStance() == Stance::Standing);
  assert(session.isBusy());

  animator.tick(1000 + ROLL_MS);
  assert(!session.isBusy());
  assert(!animator.isRunning());
  assert(samePose(session.getLevel().getBlock().getBody(), plan.target));
  assert(session.getLevel().getBlock().getStance() == Stance::LyingAlongX);
}

static void test_camera_follows_roll() {
  GameSession session;
  assert(session.loadLevel(2));
  Animator animator(session);

  Vec3 offset(Config::CAMERA_OFFSET_X, Config::CAMERA_OFFSET_Y, Config::CAMERA_OFFSET_Z);
  Vec3 before = animator.getCamera();
  assert(nearVec(before, session.getLevel().getBlock().getPosition() + offset));

  assert(press(session, animator, Direction::PosX, 0));
  animator.tick(ROLL_MS);

  Vec3 goal = session.getLevel().getBlock().getPosition() + offset;
  Vec3 after = animator.getCamera();
  assert(after.distance(goal) < before.distance(goal));
  // 18 steps of 1/18 each
  double expected = before.distance(goal) * std::pow(17.0 / 18.0, 18);
  assert(near(after.distance(goal), expected, 1e-9));
}

static void test_second_request_while_busy_is_dropped() {
  GameSession session;
  assert(session.loadLevel(2));
  Animator animator(session);

  GameLevel reference;
  assert(GameLevel::load(2, reference));
  RollPlan only = Movement::computeRoll(reference, Direction::PosX);
  reference.getBlock().commitRoll(only.target, true);

  assert(press(session, animator, Direction::PosX, 0));
  assert(!press(session, animator, Direction::PosZ, 50));
  assert(!press(session, animator, Direction::PosX, 100));

  RollPlan direct = Movement::computeRoll(session.getLevel(), Direction::NegZ);
  assert(!animator.startRoll(direct, 120));

  animator.tick(ROLL_MS + 1000);
  assert(!session.isBusy());
  assert(samePose(session.getLevel().getBlock().getBody(), reference.getBlock().getBody()));
  assert(session.getLevel().getBlock().getStance() == reference.getBlock().getStance());
}

static void test_input_accepted_after_roll_finishes() {
  GameSession session;
  assert(session.loadLevel(2));
  Animator animator(session);

  assert(press(session, animator, Direction::PosX, 0));
  animator.tick(ROLL_MS - 1);
  assert(!press(session, animator, Direction::PosZ, ROLL_MS - 1));
  animator.tick(ROLL_MS);
  assert(press(session, animator, Direction::PosZ, ROLL_MS));
}

// ------------------------------
// Bounce
// ------------------------------
static void test_bounce_returns_to_start_pose() {
  GameSession session;
  assert(session.loadLevel(2));
  Animator animator(session);
  Body start = session.getLevel().getBlock().getBody();

  // Level 2 starts at (1,1); rolling -Z would need (1,-1)
  RollPlan plan;
  assert(Movement::planRoll(session, Direction::NegZ, plan));
  assert(!plan.legal);
  assert(near(plan.angleDeg, -Config::BOUNCE_ANGLE_DEG));

  assert(animator.startRoll(plan, 0));
  assert(animator.currentKind() == TweenKind::Bounce);

  // Peak of the bounce
  animator.tick(Config::BOUNCE_STEPS * Config::BOUNCE_STEP_MS);
  Body peak = Geometry::rotatedCopy(start, plan.pivot, plan.axis, plan.angleDeg);
  assert(nearVec(session.getLevel().getBlock().getPosition(), peak.position));
  assert(session.isBusy());

  animator.tick(BOUNCE_MS);
  assert(!session.isBusy());
  assert(samePose(session.getLevel().getBlock().getBody(), start));
  assert(session.getLevel().getBlock().getStance() == Stance::Standing);
}

// ------------------------------
// Win sequence
// ------------------------------
static void test_win_sinks_block_and_loads_next_level() {
  GameSession session;
  assert(session.loadLevel(2));
  Animator animator(session);

  const Direction solution[] = {Direction::PosX, Direction::PosZ, Direction::NegX,
                                Direction::NegZ, Direction::PosX, Direction::PosZ};
  double t = 0;
  for (Direction d : solution) {
    assert(press(session, animator, d, t));
    t += ROLL_MS;
    animator.tick(t);
  }

  assert(animator.getWinCount() == 1);
  assert(animator.currentKind() == TweenKind::WinSink);
  assert(session.isBusy());
  assert(!press(session, animator, Direction::PosX, t));

  // 50 ms delay, then 0.1 every 30 ms
  animator.tick(t + Config::WIN_DELAY_MS + 5 * Config::WIN_STEP_MS);
  assert(near(session.getLevel().getBlock().getPosition().y, 0.5, 1e-9));
  assert(session.getLevelIndex() == 2);

  animator.tick(t + 10000);
  assert(!session.isBusy());
  assert(!animator.isRunning());
  assert(session.getLevelIndex() == 3);
  assert(near(animator.getOpacity(), 1.0));

  std::vector<Cell> cells = session.getLevel().blockCells();
  assert(cells.size() == 1);
  assert(cells[0] == LevelData::get(3).start);

  Vec3 offset(Config::CAMERA_OFFSET_X, Config::CAMERA_OFFSET_Y, Config::CAMERA_OFFSET_Z);
  assert(nearVec(animator.getCamera(), session.getLevel().getBlock().getPosition() + offset));
}

static void test_win_on_last_level_completes_game() {
  GameSession session;
  assert(session.loadLevel(LevelData::maxIndex()));
  session.getLevel() = short_row_level(LevelData::maxIndex());
  Animator animator(session);

  assert(press(session, animator, Direction::PosX, 0));
  animator.tick(ROLL_MS);
  assert(press(session, animator, Direction::PosX, ROLL_MS));
  animator.tick(2 * ROLL_MS);
  assert(animator.currentKind() == TweenKind::WinSink);

  animator.tick(2 * ROLL_MS + 10000);
  assert(!animator.isRunning());
  assert(!session.isBusy());
  assert(session.isCompleted());
  assert(session.getLevelIndex() == LevelData::maxIndex());
  assert(session.getLevel().getBlock().getPosition().y < Config::WIN_SINK_FLOOR);

  RollPlan plan;
  assert(!Movement::planRoll(session, Direction::NegX, plan));
}

// ------------------------------
// Level transitions
// ------------------------------
static void test_fade_swaps_level_at_midpoint() {
  GameSession session;
  assert(session.loadLevel(0));
  Animator animator(session);

  assert(animator.startLevelTransition(1, 0));
  assert(session.isBusy());
  assert(!press(session, animator, Direction::PosX, 10));

  animator.tick(10 * Config::FADE_STEP_MS);
  assert(near(animator.getOpacity(), 0.5));
  assert(session.getLevelIndex() == 0);

  animator.tick(FADE_MS / 2);
  assert(near(animator.getOpacity(), 0.0));
  assert(session.getLevelIndex() == 1);
  assert(session.isBusy());

  // No second transition while the first is running
  assert(!animator.startLevelTransition(1, FADE_MS / 2));

  animator.tick(FADE_MS);
  assert(near(animator.getOpacity(), 1.0));
  assert(!session.isBusy());
  assert(session.getLevelIndex() == 1);
}

static void test_out_of_range_transition_is_noop() {
  GameSession session;
  assert(session.loadLevel(0));
  Animator animator(session);

  assert(!animator.startLevelTransition(-1, 0));
  assert(!session.isBusy());
  assert(!animator.isRunning());
  animator.tick(FADE_MS);
  assert(session.getLevelIndex() == 0);

  assert(session.changeLevel(LevelData::maxIndex()));
  assert(!animator.startLevelTransition(1, 0));
  assert(session.getLevelIndex() == LevelData::maxIndex());
}

static void test_restart_transition_resets_block() {
  GameSession session;
  assert(session.loadLevel(2));
  Animator animator(session);

  assert(press(session, animator, Direction::PosX, 0));
  animator.tick(ROLL_MS);
  assert(session.getLevel().blockCells().size() == 2);

  assert(animator.startLevelTransition(0, ROLL_MS));
  animator.tick(ROLL_MS + FADE_MS);
  assert(session.getLevelIndex() == 2);
  assert(session.getLevel().blockCells().size() == 1);
  assert(session.getLevel().blockCells()[0] == LevelData::get(2).start);
}

// ------------------------------
// Easing
// ------------------------------
static void test_easing_endpoints() {
  assert(Animation::linear(0.0) == 0.0);
  assert(Animation::linear(1.0) == 1.0);
  assert(near(Animation::easeInOutCubic(0.0), 0.0));
  assert(near(Animation::easeInOutCubic(0.5), 0.5));
  assert(near(Animation::easeInOutCubic(1.0), 1.0));
}

// ------------------------------
// Main
// ------------------------------
int main() {
  Log::setLevel(Log::Level::Off);

  test_roll_lands_exactly_on_validated_pose();
  test_camera_follows_roll();
  test_second_request_while_busy_is_dropped();
  test_input_accepted_after_roll_finishes();

  test_bounce_returns_to_start_pose();

  test_win_sinks_block_and_loads_next_level();
  test_win_on_last_level_completes_game();

  test_fade_swaps_level_at_midpoint();
  test_out_of_range_transition_is_noop();
  test_restart_transition_resets_block();

  test_easing_endpoints();

  std::cout << "[OK] Animation tests passed\n";
  return 0;
}
