#include <iostream>
#include <vector>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <GL/glut.h>

#include "cube_mesh.hpp"
#include "instances.hpp"
#include "life_world.hpp"
#include "sim_params.hpp"

// ============================================================
// Visualization settings
// ============================================================
constexpr int   WINDOW_WIDTH  = 1280;
constexpr int   WINDOW_HEIGHT = 720;
constexpr float CUBE_FILL     = 0.9f;   // drawn cube side relative to a cell
bool showBoundingBox = true;
bool showHUD = true;

// ============================================================
// Camera controls
// ============================================================
float camDist = 3.5f;
float camAngleX = 25.0f;
float camAngleY = 45.0f;
int mouseX = 0, mouseY = 0;
bool mouseDown = false;
float autoRotate = 0.0f;

// ============================================================
// Global simulation data
// ============================================================
std::unique_ptr<LifeWorld> world;
int lastFrameMs = 0;

// ============================================================
// Instance renderer (fixed-function OpenGL)
// ============================================================
class GlutCubeRenderer : public InstanceRenderer {
    public:
        void init(float cellSize) {
            CubeMesh mesh = makeCubeMesh(cellSize * CUBE_FILL);
            cubeList = glGenLists(1);
            glNewList(cubeList, GL_COMPILE);
            glBegin(GL_TRIANGLES);
            for (unsigned i : mesh.indices) {
                const MeshVertex& v = mesh.vertices[i];
                // The mesh stores the positive axis normal on both faces of
                // an axis; face it outwards for lighting.
                float side = v.position.x * v.normal.x + v.position.y * v.normal.y +
                             v.position.z * v.normal.z;
                float sign = side < 0.0f ? -1.0f : 1.0f;
                glNormal3f(sign * v.normal.x, sign * v.normal.y, sign * v.normal.z);
                glVertex3f(v.position.x, v.position.y, v.position.z);
            }
            glEnd();
            glEndList();
        }

        void clearInstances() override { offsets.clear(); }

        void addInstance(const Vec3& position) override { offsets.push_back(position); }

        void draw(std::size_t instanceCount) override {
            glEnable(GL_LIGHTING);
            glColor4f(0.2f, 0.8f, 0.4f, 1.0f);
            for (std::size_t i = 0; i < instanceCount && i < offsets.size(); i++) {
                const Vec3& p = offsets[i];
                glPushMatrix();
                glTranslatef(p.x, p.y, p.z);
                glCallList(cubeList);
                glPopMatrix();
            }
            glDisable(GL_LIGHTING);
        }

        void drawCursor(const Vec3& p, bool alive, float cellSize) {
            glPushMatrix();
            glTranslatef(p.x, p.y, p.z);
            if (alive) {
                glEnable(GL_LIGHTING);
                glColor4f(1.0f, 0.6f, 0.1f, 1.0f);
                glCallList(cubeList);
                glDisable(GL_LIGHTING);
            }
            glColor4f(1.0f, 1.0f, 0.2f, 1.0f);
            glLineWidth(2.0f);
            glutWireCube(cellSize * 1.05f);
            glPopMatrix();
        }

    private:
        GLuint cubeList = 0;
        std::vector<Vec3> offsets;
};

GlutCubeRenderer cubeRenderer;

// ============================================================
// OpenGL visualization
// ============================================================
void drawBoundingBox() {
    if (!showBoundingBox) return;

    const int n = world->grid().size();
    const float cs = world->params().cellSize;
    const float lo = gridToWorld(0, n, cs) - 0.5f * cs;
    const float hi = gridToWorld(n - 1, n, cs) + 0.5f * cs;

    glColor4f(0.5f, 0.5f, 0.5f, 0.3f);
    glLineWidth(2.0f);

    glBegin(GL_LINE_LOOP);
    glVertex3f(lo, lo, lo);
    glVertex3f(hi, lo, lo);
    glVertex3f(hi, hi, lo);
    glVertex3f(lo, hi, lo);
    glEnd();

    glBegin(GL_LINE_LOOP);
    glVertex3f(lo, lo, hi);
    glVertex3f(hi, lo, hi);
    glVertex3f(hi, hi, hi);
    glVertex3f(lo, hi, hi);
    glEnd();

    glBegin(GL_LINES);
    glVertex3f(lo, lo, lo); glVertex3f(lo, lo, hi);
    glVertex3f(hi, lo, lo); glVertex3f(hi, lo, hi);
    glVertex3f(hi, hi, lo); glVertex3f(hi, hi, hi);
    glVertex3f(lo, hi, lo); glVertex3f(lo, hi, hi);
    glEnd();
}

void drawText(float x, float y, const std::string& text, void* font) {
    glRasterPos2f(x, y);
    for (char c : text) {
        glutBitmapCharacter(font, c);
    }
}

void drawHUD() {
    if (!showHUD) return;

    glMatrixMode(GL_PROJECTION);
    glPushMatrix();
    glLoadIdentity();
    gluOrtho2D(0, 1000, 0, 1000);

    glMatrixMode(GL_MODELVIEW);
    glPushMatrix();
    glLoadIdentity();

    glDisable(GL_DEPTH_TEST);

    LifeStats stats = world->stats();
    const Cursor& cursor = world->cursor();

    glColor3f(0.0f, 1.0f, 0.0f);
    std::string info = "LIFE 3D | Generation: " + std::to_string(stats.generation) +
                       " | Live: " + std::to_string(stats.liveCells) +
                       " | Speed: " + std::to_string(stats.speed) +
                       (stats.paused ? " | PAUSED" : "");
    drawText(10, 970, info, GLUT_BITMAP_9_BY_15);

    std::string where = "Cursor: (" + std::to_string(cursor.x()) + ", " + std::to_string(cursor.y()) +
                        ", " + std::to_string(cursor.z()) + ")";
    drawText(10, 950, where, GLUT_BITMAP_8_BY_13);

    std::string controls = "[WASDQE]Cursor [F]Flip [SPACE]Pause [+/-]Speed [R]Randomize [C]Clear [B]Box [H]HUD [O]Rotate";
    drawText(10, 930, controls, GLUT_BITMAP_8_BY_13);

    glEnable(GL_DEPTH_TEST);

    glPopMatrix();
    glMatrixMode(GL_PROJECTION);
    glPopMatrix();
    glMatrixMode(GL_MODELVIEW);
}

void display() {
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    glMatrixMode(GL_MODELVIEW);
    glLoadIdentity();

    glTranslatef(0, 0, -camDist);
    glRotatef(camAngleX, 1, 0, 0);
    glRotatef(camAngleY, 0, 1, 0);

    // Fit the whole arena into [-1, 1].
    float scale = 2.0f / (world->grid().size() * world->params().cellSize);
    glScalef(scale, scale, scale);

    drawBoundingBox();
    world->emitInstances(cubeRenderer);

    const Cursor& cursor = world->cursor();
    bool alive = isAlive(world->grid().get(cursor.x(), cursor.y(), cursor.z()));
    cubeRenderer.drawCursor(world->cursorPosition(), alive, world->params().cellSize);

    drawHUD();

    glutSwapBuffers();
}

void reshape(int width, int height) {
    if (height == 0) height = 1;
    glViewport(0, 0, width, height);
    glMatrixMode(GL_PROJECTION);
    glLoadIdentity();
    gluPerspective(50.0, double(width) / height, 0.1, 100.0);
    glMatrixMode(GL_MODELVIEW);
}

// ============================================================
// Time stepping loop
// ============================================================
void idle() {
    int now = glutGet(GLUT_ELAPSED_TIME);
    float deltaTime = (now - lastFrameMs) / 1000.0f;
    lastFrameMs = now;

    if (world->frame(deltaTime)) {
        LifeStats stats = world->stats();
        if (stats.generation % REPORT_EVERY == 0) {
            std::cout << "generation=" << stats.generation << " live=" << stats.liveCells << std::endl;
        }
    }

    if (autoRotate != 0) {
        camAngleY += autoRotate;
    }

    glutPostRedisplay();
}

// ============================================================
// Input controls
// ============================================================
void keyboard(unsigned char key, int x, int y) {
    switch(key) {
        case 'a': case 'A': world->apply(Command::MoveXMinus); break;
        case 'd': case 'D': world->apply(Command::MoveXPlus); break;
        case 's': case 'S': world->apply(Command::MoveYMinus); break;
        case 'w': case 'W': world->apply(Command::MoveYPlus); break;
        case 'q': case 'Q': world->apply(Command::MoveZMinus); break;
        case 'e': case 'E': world->apply(Command::MoveZPlus); break;
        case 'f': case 'F': case 13: {
            world->apply(Command::FlipCell);
            const Cursor& c = world->cursor();
            std::cout << "Flipped (" << c.x() << ", " << c.y() << ", " << c.z() << "): "
                      << (isAlive(world->grid().get(c.x(), c.y(), c.z())) ? "ALIVE" : "DEAD") << std::endl;
            break;
        }
        case ' ':
            world->apply(Command::TogglePause);
            std::cout << "Paused: " << (world->scheduler().paused() ? "ON" : "OFF") << std::endl;
            break;
        case '+': case '=':
            world->apply(Command::SpeedUp);
            std::cout << "Speed: " << world->scheduler().speed() << std::endl;
            break;
        case '-': case '_':
            world->apply(Command::SpeedDown);
            std::cout << "Speed: " << world->scheduler().speed() << std::endl;
            break;
        case 'r': case 'R':
            world->apply(Command::Randomize);
            std::cout << "Randomized: " << world->stats().liveCells << " live cells" << std::endl;
            break;
        case 'c': case 'C':
            world->apply(Command::Clear);
            std::cout << "Cleared arena" << std::endl;
            break;
        case 'b': case 'B':
            showBoundingBox = !showBoundingBox;
            std::cout << "Bounding box: " << (showBoundingBox ? "ON" : "OFF") << std::endl;
            break;
        case 'h': case 'H':
            showHUD = !showHUD;
            break;
        case 'o': case 'O':
            autoRotate = (autoRotate == 0) ? 0.5f : 0.0f;
            std::cout << "Auto-rotate: " << (autoRotate != 0 ? "ON" : "OFF") << std::endl;
            break;
        case 27: // ESC
            world.reset();
            exit(0);
            break;
    }
}

void mouse(int button, int state, int x, int y) {
    if (button == GLUT_LEFT_BUTTON) {
        mouseDown = (state == GLUT_DOWN);
        mouseX = x;
        mouseY = y;
    }

    if (button == 3) camDist *= 0.9f;
    if (button == 4) camDist *= 1.1f;

    if (camDist < 1.0f) camDist = 1.0f;
    if (camDist > 10.0f) camDist = 10.0f;
}

void motion(int x, int y) {
    if (mouseDown) {
        camAngleY += (x - mouseX) * 0.5f;
        camAngleX += (y - mouseY) * 0.5f;

        if (camAngleX > 89) camAngleX = 89;
        if (camAngleX < -89) camAngleX = -89;

        mouseX = x;
        mouseY = y;
    }
}

// ============================================================
// Initialization
// ============================================================
void initSimulation() {
    world.reset(new LifeWorld(SimParams()));

    const int n = world->grid().size();
    std::cout << "\n╔════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║            3D GAME OF LIFE - INITIALIZED           ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════════╝" << std::endl;
    std::cout << "\nArena: " << n << "×" << n << "×" << n << " = " << (n * n * n) << " cells" << std::endl;
    std::cout << "Rule: survive on 3 or 5, born on 5 (26 neighbours)" << std::endl;
    std::cout << "Tick: " << world->scheduler().threshold() << " s per generation at speed 1" << std::endl;
    std::cout << "Seeded: " << world->stats().liveCells << " live cells" << std::endl;
    std::cout << "\n━━━━━━━━━━━━━━━ CONTROLS ━━━━━━━━━━━━━━━" << std::endl;
    std::cout << "[A/D] Cursor X   [S/W] Cursor Y   [Q/E] Cursor Z" << std::endl;
    std::cout << "[F]/[ENTER] Flip cell under cursor" << std::endl;
    std::cout << "[SPACE] Pause / resume" << std::endl;
    std::cout << "[+/-] Speed " << MIN_TICK_SPEED << ".." << MAX_TICK_SPEED << std::endl;
    std::cout << "[R] Randomize center   [C] Clear" << std::endl;
    std::cout << "[B] Bounding box   [H] HUD   [O] Auto-rotate" << std::endl;
    std::cout << "Mouse: Left-click + drag to rotate" << std::endl;
    std::cout << "       Scroll to zoom" << std::endl;
    std::cout << "[ESC] Exit" << std::endl;
    std::cout << "━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━\n" << std::endl;
}

void initOpenGL() {
    glClearColor(0.02f, 0.02f, 0.05f, 1.0f);
    glEnable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glEnable(GL_LINE_SMOOTH);
    glHint(GL_LINE_SMOOTH_HINT, GL_NICEST);

    glEnable(GL_NORMALIZE);
    glEnable(GL_LIGHT0);
    GLfloat lightDir[] = {0.4f, 1.0f, 0.6f, 0.0f};
    glLightfv(GL_LIGHT0, GL_POSITION, lightDir);
    glEnable(GL_COLOR_MATERIAL);
    glColorMaterial(GL_FRONT_AND_BACK, GL_AMBIENT_AND_DIFFUSE);

    glEnable(GL_FOG);
    glFogi(GL_FOG_MODE, GL_LINEAR);
    glFogf(GL_FOG_START, 2.0f);
    glFogf(GL_FOG_END, 8.0f);
    GLfloat fogColor[] = {0.02f, 0.02f, 0.05f, 1.0f};
    glFogfv(GL_FOG_COLOR, fogColor);

    cubeRenderer.init(world->params().cellSize);
}

// ============================================================
// Main
// ============================================================
int main(int argc, char** argv) {
    glutInit(&argc, argv);
    glutInitDisplayMode(GLUT_DOUBLE | GLUT_RGB | GLUT_DEPTH);
    glutInitWindowSize(WINDOW_WIDTH, WINDOW_HEIGHT);
    glutCreateWindow("Life 3D");

    try {
        initSimulation();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize simulation: " << e.what() << std::endl;
        return 1;
    }
    initOpenGL();
    lastFrameMs = glutGet(GLUT_ELAPSED_TIME);

    glutDisplayFunc(display);
    glutReshapeFunc(reshape);
    glutIdleFunc(idle);
    glutKeyboardFunc(keyboard);
    glutMouseFunc(mouse);
    glutMotionFunc(motion);

    glutMainLoop();
    return 0;
}
