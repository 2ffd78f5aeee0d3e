#include "serpent.hpp"
#include <common/logging.hpp>
#include <cmath>

namespace serpent {

namespace {

const SerpentConfig& validated(const SerpentConfig& config) {
    config.validate();
    return config;
}

}  // namespace

Serpent::Serpent(const SerpentConfig& config,
                 const SteeringConfig& steering,
                 const EndlessCurveConfig& curve)
    : config_(validated(config)),
      generator_(steering),
      curve_([this](const std::optional<Vec3>& target) { return generator_.next(target); },
             curve),
      sampler_(static_cast<size_t>(config.texture_points)),
      follower_(config.target_lerp) {
    auto log = serpent::logging::get_logger();
    log->debug("Serpent: length={}, speed={}, texture_points={}, samples_per_segment={}",
               config_.length, config_.speed, config_.texture_points,
               curve_.config().samples_per_segment);
}

void Serpent::update(float delta) {
    if (!std::isfinite(delta) || delta < 0.0f) {
        auto log = serpent::logging::get_logger();
        log->debug("Serpent: ignoring frame delta {}", delta);
        return;
    }

    distance_ += static_cast<double>(delta) * static_cast<double>(config_.speed);

    if (free_roam_) {
        curve_.clear_target();
    } else {
        curve_.set_target(follower_.position());
    }

    curve_.configure_start_end(distance_, config_.length);
    sampler_.update(curve_);
}

}  // namespace serpent
