#ifndef SERPENT_VISUALIZER_HPP
#define SERPENT_VISUALIZER_HPP

#include <creature/serpent.hpp>
#include <string>

namespace serpent {

// Configuration for the interactive viewer
struct ViewerConfig {
    int window_width = 1280;
    int window_height = 720;
    std::string window_title = "serpent";

    // Camera
    float camera_distance = 40.0f;    // Initial camera distance
    float camera_pitch = 0.6f;        // Initial look-down angle (radians)
    float rotation_speed = 0.5f;      // Right-drag rotation speed
    float zoom_speed = 1.1f;          // Scroll zoom factor
    float camera_follow = 0.05f;      // Per-frame lerp of the look-at point toward the body

    // Rendering
    float target_size = 0.3f;         // Radius of the target marker
    float grid_extent = 50.0f;        // Half-size of the ground grid
    float grid_spacing = 2.0f;
    bool show_frames = false;         // Draw spine normals

    // Frame time is clamped so a stalled window does not teleport the body
    float max_frame_time = 0.1f;
};

// Result of a viewer session
struct ViewerResult {
    bool completed = false;           // User closed window normally
    int frames = 0;                   // Rendered frames
    double distance = 0.0;            // Distance travelled by the creature
};

// Run the interactive viewer. The cursor's ground hit steers the creature.
// Returns when the window is closed.
ViewerResult run_viewer(Serpent& creature, const ViewerConfig& config = ViewerConfig{});

// Check if visualization is available (GLFW/OpenGL compiled in)
bool visualization_available();

}  // namespace serpent

#endif // SERPENT_VISUALIZER_HPP
