#include "Renderer.hpp"

#include "BlockFont.hpp"
#include "Config.hpp"
#include "LevelData.hpp"

#include <GL/gl.h>
#include <GL/glu.h>
#include <GL/glut.h>

#include <cmath>

namespace Renderer {
    using namespace Math;

    namespace {
        struct RGB {
            float r, g, b;
            RGB(float _r = 0, float _g = 0, float _b = 0) : r(_r), g(_g), b(_b) {}
        };

        RGB fromHex(unsigned int hex) {
            return RGB(((hex >> 16) & 0xff) / 255.0f, ((hex >> 8) & 0xff) / 255.0f, (hex & 0xff) / 255.0f);
        }

        const unsigned int TILE_LIGHT = 0xc4c2be;
        const unsigned int TILE_DARK = 0xa384cc;
        const unsigned int BLOCK_COLOR = 0x999999;

        void setColor(const RGB &c) {
            glColor3f(c.r, c.g, c.b);
        }
    }

    void GameRenderer::initGL() const {
        glClearColor(0.08f, 0.08f, 0.1f, 1.0f);
        glEnable(GL_DEPTH_TEST);
        glDepthFunc(GL_LESS);
        glShadeModel(GL_SMOOTH);
        glEnable(GL_NORMALIZE);

        glEnable(GL_LIGHTING);
        glEnable(GL_LIGHT0);
        glEnable(GL_COLOR_MATERIAL);
        glColorMaterial(GL_FRONT_AND_BACK, GL_AMBIENT_AND_DIFFUSE);

        GLfloat ambient[] = {0.55f, 0.55f, 0.55f, 1.0f};
        glLightModelfv(GL_LIGHT_MODEL_AMBIENT, ambient);
        GLfloat diffuse[] = {0.6f, 0.6f, 0.6f, 1.0f};
        glLightfv(GL_LIGHT0, GL_DIFFUSE, diffuse);

        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    }

    void GameRenderer::resize(int w, int h) {
        viewW = w > 0 ? w : 1;
        viewH = h > 0 ? h : 1;
        glViewport(0, 0, viewW, viewH);
    }

    void GameRenderer::setupCamera() const {
        double aspect = (double)viewW / viewH;
        double half = Config::FRUSTUM_SIZE / 2.0;

        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        glOrtho(-half * aspect, half * aspect, -half, half, Config::CAMERA_NEAR, Config::CAMERA_FAR);

        // Fixed viewing direction, camera position follows the block
        const Vec3 &cam = animator->getCamera();
        Vec3 offset(Config::CAMERA_OFFSET_X, Config::CAMERA_OFFSET_Y, Config::CAMERA_OFFSET_Z);
        Vec3 look = cam - offset;

        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();
        gluLookAt(cam.x, cam.y, cam.z, look.x, look.y, look.z, 0.0, 1.0, 0.0);
    }

    void GameRenderer::setupLights() const {
        // Directional light from above, in world space
        GLfloat dir[] = {0.0f, 1.0f, 0.0f, 0.0f};
        glLightfv(GL_LIGHT0, GL_POSITION, dir);

        // Keep y >= -CLIP_PLANE_DEPTH so the block vanishes into the hole
        GLdouble plane[] = {0.0, 1.0, 0.0, Config::CLIP_PLANE_DEPTH};
        glClipPlane(GL_CLIP_PLANE0, plane);
    }

    void GameRenderer::drawBox(double sx, double sy, double sz) const {
        const double x = sx * 0.5, y = sy * 0.5, z = sz * 0.5;

        glBegin(GL_QUADS);
        // +Z
        glNormal3d(0, 0, 1);
        glVertex3d(-x, -y, z); glVertex3d(x, -y, z); glVertex3d(x, y, z); glVertex3d(-x, y, z);
        // -Z
        glNormal3d(0, 0, -1);
        glVertex3d(x, -y, -z); glVertex3d(-x, -y, -z); glVertex3d(-x, y, -z); glVertex3d(x, y, -z);
        // -X
        glNormal3d(-1, 0, 0);
        glVertex3d(-x, -y, -z); glVertex3d(-x, -y, z); glVertex3d(-x, y, z); glVertex3d(-x, y, -z);
        // +X
        glNormal3d(1, 0, 0);
        glVertex3d(x, -y, z); glVertex3d(x, -y, -z); glVertex3d(x, y, -z); glVertex3d(x, y, z);
        // +Y
        glNormal3d(0, 1, 0);
        glVertex3d(-x, y, z); glVertex3d(x, y, z); glVertex3d(x, y, -z); glVertex3d(-x, y, -z);
        // -Y
        glNormal3d(0, -1, 0);
        glVertex3d(-x, -y, -z); glVertex3d(x, -y, -z); glVertex3d(x, -y, z); glVertex3d(-x, -y, z);
        glEnd();
    }

    void GameRenderer::drawBoxEdges(double sx, double sy, double sz) const {
        const double x = sx * 0.5, y = sy * 0.5, z = sz * 0.5;

        glDisable(GL_LIGHTING);
        glColor3f(0.1f, 0.1f, 0.1f);
        glBegin(GL_LINE_LOOP);
        glVertex3d(-x, y, -z); glVertex3d(x, y, -z); glVertex3d(x, y, z); glVertex3d(-x, y, z);
        glEnd();
        glBegin(GL_LINE_LOOP);
        glVertex3d(-x, -y, -z); glVertex3d(x, -y, -z); glVertex3d(x, -y, z); glVertex3d(-x, -y, z);
        glEnd();
        glBegin(GL_LINES);
        glVertex3d(-x, -y, -z); glVertex3d(-x, y, -z);
        glVertex3d(x, -y, -z); glVertex3d(x, y, -z);
        glVertex3d(x, -y, z); glVertex3d(x, y, z);
        glVertex3d(-x, -y, z); glVertex3d(-x, y, z);
        glEnd();
        glEnable(GL_LIGHTING);
    }

    void GameRenderer::drawBoard() const {
        const Board::TileBoard &board = session->getLevel().getBoard();

        for (const auto &cell : board.getTiles()) {
            // Winning tile is a hole
            if (board.isWinningCell(cell)) continue;

            setColor(fromHex(((cell.x + cell.z) % 2 == 0) ? TILE_LIGHT : TILE_DARK));
            glPushMatrix();
            glTranslated(cell.x, -Config::TILE_THICKNESS / 2.0, cell.z);
            drawBox(1.0, Config::TILE_THICKNESS, 1.0);
            drawBoxEdges(1.0, Config::TILE_THICKNESS, 1.0);
            glPopMatrix();
        }
    }

    void GameRenderer::drawBlock() const {
        const Geometry::Body &body = session->getLevel().getBlock().getBody();
        double m[16];
        body.orientation.toMatrix(m);

        glEnable(GL_CLIP_PLANE0);
        setColor(fromHex(BLOCK_COLOR));
        glPushMatrix();
        glTranslated(body.position.x, body.position.y, body.position.z);
        glMultMatrixd(m);
        drawBox(1.0, 2.0, 1.0);
        drawBoxEdges(1.0, 2.0, 1.0);
        glPopMatrix();
        glDisable(GL_CLIP_PLANE0);
    }

    void GameRenderer::beginOverlay() const {
        glDisable(GL_LIGHTING);
        glDisable(GL_DEPTH_TEST);
        glMatrixMode(GL_PROJECTION);
        glPushMatrix();
        glLoadIdentity();
        gluOrtho2D(0, viewW, 0, viewH);
        glMatrixMode(GL_MODELVIEW);
        glPushMatrix();
        glLoadIdentity();
    }

    void GameRenderer::endOverlay() const {
        glMatrixMode(GL_MODELVIEW);
        glPopMatrix();
        glMatrixMode(GL_PROJECTION);
        glPopMatrix();
        glMatrixMode(GL_MODELVIEW);
        glEnable(GL_DEPTH_TEST);
        glEnable(GL_LIGHTING);
    }

    void GameRenderer::drawText(float x, float y, const std::string &s) const {
        glRasterPos2f(x, y);
        for (char ch : s)
            glutBitmapCharacter(GLUT_BITMAP_HELVETICA_12, ch);
    }

    void GameRenderer::drawBanner(const std::string &text, float x, float y, float cell) {
        float cx = x;
        for (char c : text) {
            auto it = BlockFont::font.find(c);
            if (it != BlockFont::font.end()) {
                for (const auto &g : it->second) {
                    float px = cx + g.x * cell;
                    float py = y + g.y * cell;
                    glBegin(GL_QUADS);
                    glVertex2f(px, py);
                    glVertex2f(px + cell, py);
                    glVertex2f(px + cell, py + cell);
                    glVertex2f(px, py + cell);
                    glEnd();
                }
            }
            cx += 8 * cell;
        }
    }

    void GameRenderer::drawHud() const {
        float y = viewH - 24.0f;

        glColor3f(1, 1, 1);
        drawText(16, y, "Level " + std::to_string(session->getLevelIndex()) + " / "
                            + std::to_string(LevelData::maxIndex()));

        glColor3f(0.7f, 0.7f, 0.7f);
        drawText(16, y - 20, "Arrows / WASD: Roll");
        drawText(16, y - 40, "Esc: Pause");
    }

    void GameRenderer::drawPauseMenu() const {
        glEnable(GL_BLEND);
        glColor4f(0.0f, 0.0f, 0.0f, 0.55f);
        glBegin(GL_QUADS);
        glVertex2f(0, 0);
        glVertex2f(viewW, 0);
        glVertex2f(viewW, viewH);
        glVertex2f(0, viewH);
        glEnd();
        glDisable(GL_BLEND);

        float cell = 8.0f;
        float cx = viewW / 2.0f - 3 * 8 * cell;
        float cy = viewH / 2.0f + 20.0f;

        glColor3f(1.0f, 0.85f, 0.3f);
        drawBanner("PAUSED", cx, cy, cell);

        glColor3f(1, 1, 1);
        drawText(cx, cy - 30, "P: Previous level");
        drawText(cx, cy - 50, "R: Restart level");
        drawText(cx, cy - 70, "N: Next level");
        drawText(cx, cy - 90, "Esc: Resume");
    }

    void GameRenderer::drawFade() const {
        double alpha = 1.0 - animator->getOpacity();
        if (alpha <= 0.0) return;

        glEnable(GL_BLEND);
        glColor4f(0.0f, 0.0f, 0.0f, (float)alpha);
        glBegin(GL_QUADS);
        glVertex2f(0, 0);
        glVertex2f(viewW, 0);
        glVertex2f(viewW, viewH);
        glVertex2f(0, viewH);
        glEnd();
        glDisable(GL_BLEND);
    }

    void GameRenderer::render() const {
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        if (session->hasLevel()) {
            setupCamera();
            setupLights();
            drawBoard();
            drawBlock();
        }

        beginOverlay();
        if (session->hasLevel())
            drawHud();

        if (session->isCompleted()) {
            // Pulsing banner, same animation as the old game over text
            float t = glutGet(GLUT_ELAPSED_TIME) / 1000.0f;
            float cell = 10.0f * (1.0f + 0.15f * sinf(t * 4.0f));
            glColor3f(0.4f, 1.0f, 0.4f);
            drawBanner("CLEAR", viewW / 2.0f - 2.5f * 8 * cell, viewH / 2.0f, cell);
        }
        if (session->isPaused())
            drawPauseMenu();

        drawFade();
        endOverlay();

        glutSwapBuffers();
    }
}
