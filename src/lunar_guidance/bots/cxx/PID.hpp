#pragma once
#include <array>
#include <functional>
#include <limits>
#include <memory>

// Controlled axes. One controller per axis at most.
enum class Axis {
    X = 0,
    Y,
    Heading,
    VX,
    VY,
};
constexpr int NUM_AXES = 5;

const char* axis_name(Axis axis);

struct PidGains {
    float kp = 0.0f;
    float ki = 0.0f;
    float kd = 0.0f;
    float output_min = -std::numeric_limits<float>::infinity();
    float output_max = std::numeric_limits<float>::infinity();
};

// Drives a measured value toward a setpoint fixed at construction.
// A new setpoint means a new controller.
class FeedbackController {
public:
    virtual ~FeedbackController() = default;

    // Returns the correction for this tick. dt must be > 0.
    virtual float update(float value, float dt) = 0;
    virtual float setpoint() const = 0;
};

// Positional PID.
//   error      = setpoint - value
//   integral  += ki * error * dt          (clamped to the output limits)
//   derivative = -kd * (value - last_value) / dt
//   output     = clamp(kp * error + integral + derivative)
// The derivative acts on the measurement so a setpoint change gives no kick.
class PID : public FeedbackController {
public:
    PID(const PidGains& gains, float setpoint);

    float update(float value, float dt) override;
    float setpoint() const override { return setpoint_; }

    float integral() const { return integral_; }
    float last_output() const { return last_output_; }
    void reset();

private:
    PidGains gains;
    float setpoint_;

    float integral_ = 0.0f;
    float last_input = 0.0f;
    bool has_last_input = false;
    float last_output_ = 0.0f;
};

using ControllerFactory = std::function<std::unique_ptr<FeedbackController>(Axis axis, float setpoint)>;

// Per-axis controller storage. ensure() re-creates the controller of an axis
// whenever the requested setpoint differs from the one it was built with,
// so no integrator state leaks from one setpoint to the next.
class ControllerBank {
public:
    explicit ControllerBank(ControllerFactory factory);

    FeedbackController& ensure(Axis axis, float setpoint);
    const FeedbackController* get(Axis axis) const;
    void clear();

private:
    ControllerFactory factory;
    std::array<std::unique_ptr<FeedbackController>, NUM_AXES> controllers;
};
