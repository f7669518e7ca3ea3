// BlockRoll - roll the block onto the hole
// Build: cmake -S . -B build && cmake --build build

#include "BlockFont.hpp"
#include "Config.hpp"
#include "GameEngine.hpp"
#include "LevelData.hpp"
#include "Log.hpp"

#include <GL/glut.h>

#include <iostream>
#include <sstream>
#include <string>

using Movement::Direction;

// ============================================================================
// GLOBAL GAME INSTANCE
// ============================================================================

GameEngine::Game *gameInstance = nullptr;

// ============================================================================
// GLUT CALLBACKS
// ============================================================================

void display() {
    if (gameInstance)
        gameInstance->render();
}

void timerFunc(int value) {
    if (gameInstance) {
        gameInstance->update();
        glutPostRedisplay();
        glutTimerFunc(Config::TICK_MS, timerFunc, 0);
    }
}

void specialKey(int key, int x, int y) {
    if (!gameInstance) return;

    switch (key) {
    case GLUT_KEY_RIGHT:
        gameInstance->handleRoll(Direction::PosX);
        break;
    case GLUT_KEY_LEFT:
        gameInstance->handleRoll(Direction::NegX);
        break;
    case GLUT_KEY_DOWN:
        gameInstance->handleRoll(Direction::PosZ);
        break;
    case GLUT_KEY_UP:
        gameInstance->handleRoll(Direction::NegZ);
        break;
    }
    glutPostRedisplay();
}

void keyboard(unsigned char key, int x, int y) {
    if (!gameInstance) return;

    switch (key) {
    case 27:
        gameInstance->handleKeyEscape();
        break;
    case 'd': case 'D':
        gameInstance->handleRoll(Direction::PosX);
        break;
    case 'a': case 'A':
        gameInstance->handleRoll(Direction::NegX);
        break;
    case 's': case 'S':
        gameInstance->handleRoll(Direction::PosZ);
        break;
    case 'w': case 'W':
        gameInstance->handleRoll(Direction::NegZ);
        break;
    case 'p': case 'P':
        gameInstance->handleMenuLevel(-1);
        break;
    case 'r': case 'R':
        gameInstance->handleMenuLevel(0);
        break;
    case 'n': case 'N':
        gameInstance->handleMenuLevel(1);
        break;
    }
    glutPostRedisplay();
}

void reshape(int w, int h) {
    if (gameInstance)
        gameInstance->reshape(w, h);
}

// ============================================================================
// COMMAND LINE
// ============================================================================

static void printUsage(const char *prog) {
    std::cout << "Usage: " << prog << " [--level N] [--verbose|--quiet]\n";
}

// Returns false when the program should exit (help or bad arguments)
static bool parseArgs(int argc, char **argv, int &startLevel) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--level" && i + 1 < argc) {
            std::istringstream iss(argv[++i]);
            if (!(iss >> startLevel)) {
                std::cerr << "--level expects a number\n";
                return false;
            }
        } else if (arg == "--verbose") {
            Log::setLevel(Log::Level::Debug);
        } else if (arg == "--quiet") {
            Log::setLevel(Log::Level::Warn);
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return false;
        } else {
            std::cerr << "unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return false;
        }
    }

    if (!LevelData::isValidIndex(startLevel)) {
        std::ostringstream oss;
        oss << "start level " << startLevel << " out of range, using 0";
        Log::warn(oss.str());
        startLevel = 0;
    }
    return true;
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char **argv) {
    glutInit(&argc, argv);

    int startLevel = 0;
    if (!parseArgs(argc, argv, startLevel))
        return 1;

    BlockFont::init();
    glutInitDisplayMode(GLUT_DOUBLE | GLUT_RGBA | GLUT_DEPTH);
    glutInitWindowSize(Config::WINDOW_W, Config::WINDOW_H);
    glutInitWindowPosition(Config::WINDOW_POS_X, Config::WINDOW_POS_Y);
    glutCreateWindow("BlockRoll");

    gameInstance = new GameEngine::Game();
    if (!gameInstance->start(startLevel)) {
        Log::error("could not load the first level");
        delete gameInstance;
        return 1;
    }
    gameInstance->initGL();
    Log::info("ESC to pause, WASD/ARROWS to move");

    glutDisplayFunc(display);
    glutReshapeFunc(reshape);
    glutKeyboardFunc(keyboard);
    glutSpecialFunc(specialKey);
    glutTimerFunc(Config::TICK_MS, timerFunc, 0);

    glutMainLoop();

    delete gameInstance;
    return 0;
}
