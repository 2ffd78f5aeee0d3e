#include "visualizer.hpp"
#include <common/logging.hpp>

#ifdef SERPENT_HAS_VISUALIZATION

#include <creature/tube_mesh.hpp>
#include <GLFW/glfw3.h>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>
#include <utility>

namespace serpent {

namespace {

constexpr float kPi = std::numbers::pi_v<float>;
constexpr float kFov = 45.0f * kPi / 180.0f;

// Orbit camera around a look-at point
struct Camera {
    float distance = 40.0f;
    float yaw = 0.0f;      // radians about world up
    float pitch = 0.6f;    // radians, looking down
    Vec3 target;

    void apply() const {
        glTranslatef(0, 0, -distance);
        glRotatef(pitch * 180.0f / kPi, 1, 0, 0);
        glRotatef(yaw * 180.0f / kPi, 0, 1, 0);
        glTranslatef(-target.x, -target.y, -target.z);
    }

    // Camera space to world space, the inverse of the rotations in apply()
    Vec3 to_world(const Vec3& v) const {
        return v.rotated(vec3::unit_x(), -pitch).rotated(vec3::unit_y(), -yaw);
    }

    Vec3 eye() const {
        return target + to_world({0.0f, 0.0f, distance});
    }

    // Ray through a window pixel
    Vec3 ray_direction(double px, double py, int width, int height) const {
        float aspect = static_cast<float>(width) / static_cast<float>(height);
        float ndc_x = static_cast<float>(2.0 * px / width - 1.0);
        float ndc_y = static_cast<float>(1.0 - 2.0 * py / height);
        float half = std::tan(kFov / 2.0f);
        return to_world({ndc_x * half * aspect, ndc_y * half, -1.0f}).normalized();
    }
};

// Everything the GLFW callbacks touch, reached through the window user pointer
struct InputState {
    Camera camera;
    float default_pitch = 0.6f;
    float rotation_speed = 0.5f;
    float zoom_speed = 1.1f;

    bool dragging = false;
    double drag_x = 0.0;
    double drag_y = 0.0;

    // Latest pointer position in window coordinates
    std::optional<std::pair<double, double>> pointer;

    bool paused = false;
    bool free_roam_requested = false;
    bool show_frames = false;
};

InputState& input_of(GLFWwindow* window) {
    return *static_cast<InputState*>(glfwGetWindowUserPointer(window));
}

void on_mouse_button(GLFWwindow* window, int button, int action, int /*mods*/) {
    if (button == GLFW_MOUSE_BUTTON_RIGHT) {
        input_of(window).dragging = action == GLFW_PRESS;
    }
}

void on_cursor_moved(GLFWwindow* window, double x, double y) {
    InputState& input = input_of(window);
    if (input.dragging) {
        const float step = input.rotation_speed * 0.01f;
        input.camera.yaw += static_cast<float>(x - input.drag_x) * step;
        input.camera.pitch = std::clamp(
            input.camera.pitch + static_cast<float>(y - input.drag_y) * step, 0.05f, 1.5f);
    }
    input.drag_x = x;
    input.drag_y = y;
    input.pointer = std::make_pair(x, y);
}

void on_cursor_enter(GLFWwindow* window, int entered) {
    if (entered != GLFW_TRUE) {
        input_of(window).pointer.reset();
    }
}

void on_scroll(GLFWwindow* window, double /*dx*/, double dy) {
    InputState& input = input_of(window);
    float& distance = input.camera.distance;
    if (dy > 0.0) {
        distance /= input.zoom_speed;
    } else if (dy < 0.0) {
        distance *= input.zoom_speed;
    }
    distance = std::clamp(distance, 2.0f, 500.0f);
}

void on_key(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/) {
    if (action != GLFW_PRESS) {
        return;
    }
    InputState& input = input_of(window);
    switch (key) {
    case GLFW_KEY_ESCAPE:
    case GLFW_KEY_Q:
        glfwSetWindowShouldClose(window, GLFW_TRUE);
        break;
    case GLFW_KEY_SPACE:
        input.paused = !input.paused;
        break;
    case GLFW_KEY_F:
        input.free_roam_requested = true;
        break;
    case GLFW_KEY_N:
        input.show_frames = !input.show_frames;
        break;
    case GLFW_KEY_R:
        input.camera.yaw = 0.0f;
        input.camera.pitch = input.default_pitch;
        break;
    default:
        break;
    }
}

// Steer along the pointer ray while the pointer is over the window
void aim_at_pointer(GLFWwindow* window, const InputState& input, Serpent& creature) {
    int w = 0;
    int h = 0;
    glfwGetWindowSize(window, &w, &h);
    if (!input.pointer || w <= 0 || h <= 0) {
        creature.aim(std::nullopt);
        return;
    }
    const auto [x, y] = *input.pointer;
    creature.aim_ray(input.camera.eye(), input.camera.ray_direction(x, y, w, h));
}

void set_projection(int width, int height) {
    constexpr float near_plane = 0.1f;
    constexpr float far_plane = 1000.0f;
    const float top = near_plane * std::tan(kFov / 2.0f);
    const float right = top * static_cast<float>(width) / static_cast<float>(height);

    glMatrixMode(GL_PROJECTION);
    glLoadIdentity();
    glFrustum(-right, right, -top, top, near_plane, far_plane);
}

void draw_sphere(const Vec3& center, float radius, int segments = 8) {
    glPushMatrix();
    glTranslatef(center.x, center.y, center.z);

    for (int i = 0; i < segments; ++i) {
        float lat0 = kPi * (-0.5f + static_cast<float>(i) / segments);
        float lat1 = kPi * (-0.5f + static_cast<float>(i + 1) / segments);
        float y0 = std::sin(lat0) * radius;
        float y1 = std::sin(lat1) * radius;
        float r0 = std::cos(lat0) * radius;
        float r1 = std::cos(lat1) * radius;

        glBegin(GL_QUAD_STRIP);
        for (int j = 0; j <= segments; ++j) {
            float lng = 2.0f * kPi * static_cast<float>(j) / segments;
            float cx = std::cos(lng);
            float cz = std::sin(lng);

            glNormal3f(cx * r0, y0, cz * r0);
            glVertex3f(cx * r0, y0, cz * r0);
            glNormal3f(cx * r1, y1, cz * r1);
            glVertex3f(cx * r1, y1, cz * r1);
        }
        glEnd();
    }

    glPopMatrix();
}

void render_ground(float extent, float spacing) {
    glDisable(GL_LIGHTING);
    glColor3f(0.22f, 0.22f, 0.28f);
    glBegin(GL_LINES);
    for (float x = -extent; x <= extent; x += spacing) {
        glVertex3f(x, 0.0f, -extent);
        glVertex3f(x, 0.0f, extent);
    }
    for (float z = -extent; z <= extent; z += spacing) {
        glVertex3f(-extent, 0.0f, z);
        glVertex3f(extent, 0.0f, z);
    }
    glEnd();
    glEnable(GL_LIGHTING);
}

void render_tube(const TubeMesh& mesh) {
    glColor3f(0.35f, 0.75f, 0.4f);
    glBegin(GL_QUADS);
    for (const auto& quad : mesh.quads) {
        for (int index : quad) {
            const Vec3& n = mesh.normals[index];
            const Vec3& p = mesh.positions[index];
            glNormal3f(n.x, n.y, n.z);
            glVertex3f(p.x, p.y, p.z);
        }
    }
    glEnd();
}

// Spine normals as short lines
void render_frames(const SpineSampler& sampler, float length) {
    glDisable(GL_LIGHTING);
    glColor3f(0.9f, 0.8f, 0.2f);
    glBegin(GL_LINES);
    for (size_t i = 0; i < sampler.texture_points(); ++i) {
        Vec3 p = sampler.position(i);
        Vec3 q = p + sampler.normal(i) * length;
        glVertex3f(p.x, p.y, p.z);
        glVertex3f(q.x, q.y, q.z);
    }
    glEnd();
    glEnable(GL_LIGHTING);
}

void setup_lighting() {
    glEnable(GL_LIGHTING);
    glEnable(GL_LIGHT0);
    glEnable(GL_COLOR_MATERIAL);
    glEnable(GL_NORMALIZE);
    glColorMaterial(GL_FRONT_AND_BACK, GL_AMBIENT_AND_DIFFUSE);

    GLfloat light_pos[] = {1.0f, 1.0f, 1.0f, 0.0f};
    GLfloat light_ambient[] = {0.2f, 0.2f, 0.2f, 1.0f};
    GLfloat light_diffuse[] = {0.8f, 0.8f, 0.8f, 1.0f};

    glLightfv(GL_LIGHT0, GL_POSITION, light_pos);
    glLightfv(GL_LIGHT0, GL_AMBIENT, light_ambient);
    glLightfv(GL_LIGHT0, GL_DIFFUSE, light_diffuse);
}

}  // namespace

ViewerResult run_viewer(Serpent& creature, const ViewerConfig& config) {
    auto log = serpent::logging::get_logger();
    ViewerResult result;

    if (!glfwInit()) {
        log->error("Failed to initialize GLFW");
        return result;
    }

    GLFWwindow* window = glfwCreateWindow(
        config.window_width,
        config.window_height,
        config.window_title.c_str(),
        nullptr, nullptr);

    if (!window) {
        log->error("Failed to create GLFW window");
        glfwTerminate();
        return result;
    }

    InputState input;
    input.camera.distance = config.camera_distance;
    input.camera.pitch = config.camera_pitch;
    input.default_pitch = config.camera_pitch;
    input.rotation_speed = config.rotation_speed;
    input.zoom_speed = config.zoom_speed;
    input.show_frames = config.show_frames;

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);
    glfwSetWindowUserPointer(window, &input);

    glfwSetMouseButtonCallback(window, on_mouse_button);
    glfwSetCursorPosCallback(window, on_cursor_moved);
    glfwSetCursorEnterCallback(window, on_cursor_enter);
    glfwSetScrollCallback(window, on_scroll);
    glfwSetKeyCallback(window, on_key);

    glEnable(GL_DEPTH_TEST);
    setup_lighting();
    glClearColor(0.08f, 0.08f, 0.12f, 1.0f);

    log->info("Viewer controls: pointer steers, right drag rotates, scroll zooms");
    log->info("  space pause, f free roam, n normals, r reset camera, q quit");

    // Populate the spine before the first draw
    creature.update(0.0f);

    double previous = glfwGetTime();

    while (!glfwWindowShouldClose(window)) {
        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(window, &width, &height);
        if (width <= 0 || height <= 0) {
            // Minimized
            glfwWaitEvents();
            continue;
        }

        const double now = glfwGetTime();
        const float dt = std::min(static_cast<float>(now - previous), config.max_frame_time);
        previous = now;

        if (input.free_roam_requested) {
            input.free_roam_requested = false;
            creature.set_free_roam(!creature.free_roam());
            log->info("Free roam {}", creature.free_roam() ? "on" : "off");
        }

        if (!input.paused) {
            aim_at_pointer(window, input, creature);
            creature.update(dt);
            input.camera.target = lerp(input.camera.target,
                                       creature.curve().position_at_local(0.5f),
                                       config.camera_follow);
        }

        glViewport(0, 0, width, height);
        set_projection(width, height);
        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();
        input.camera.apply();
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        render_ground(config.grid_extent, config.grid_spacing);
        render_tube(build_tube(creature.sampler(), creature.config()));
        if (input.show_frames) {
            render_frames(creature.sampler(), creature.config().scale_max * 2.0f);
        }
        if (!creature.free_roam()) {
            glColor3f(0.9f, 0.3f, 0.3f);
            draw_sphere(creature.follower().position(), config.target_size);
        }

        glfwSwapBuffers(window);
        glfwPollEvents();
        ++result.frames;
    }

    result.completed = true;
    result.distance = creature.distance();

    glfwDestroyWindow(window);
    glfwTerminate();

    log->info("Viewer closed after {} frames, distance {:.1f}", result.frames, result.distance);

    return result;
}

bool visualization_available() {
    return true;
}

}  // namespace serpent

#else  // SERPENT_HAS_VISUALIZATION not defined

namespace serpent {

ViewerResult run_viewer(Serpent&, const ViewerConfig&) {
    auto log = serpent::logging::get_logger();
    log->error("Visualization not available - compile with GLFW and OpenGL");
    return ViewerResult{};
}

bool visualization_available() {
    return false;
}

}  // namespace serpent

#endif  // SERPENT_HAS_VISUALIZATION
