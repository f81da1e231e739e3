#include "PID.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

const char* axis_name(Axis axis) {
    switch (axis) {
        case Axis::X: return "x";
        case Axis::Y: return "y";
        case Axis::Heading: return "heading";
        case Axis::VX: return "vx";
        case Axis::VY: return "vy";
    }
    return "unknown";
}

PID::PID(const PidGains& gains, float setpoint) : gains(gains), setpoint_(setpoint) {
    if (!(gains.output_min < gains.output_max)) {
        throw std::invalid_argument("PID: output_min must be lower than output_max");
    }
}

float PID::update(float value, float dt) {
    if (!(dt > 0.0f)) {
        throw std::invalid_argument("PID: dt must be positive, got " + std::to_string(dt));
    }

    float error = setpoint_ - value;
    float d_input = has_last_input ? value - last_input : 0.0f;

    // Clamp the integral term so it cannot wind up past what the output can express
    integral_ += gains.ki * error * dt;
    integral_ = std::max(gains.output_min, std::min(gains.output_max, integral_));

    float proportional = gains.kp * error;
    float derivative = -gains.kd * d_input / dt;

    float output = proportional + integral_ + derivative;
    output = std::max(gains.output_min, std::min(gains.output_max, output));

    last_input = value;
    has_last_input = true;
    last_output_ = output;
    return output;
}

void PID::reset() {
    integral_ = 0.0f;
    last_input = 0.0f;
    has_last_input = false;
    last_output_ = 0.0f;
}

ControllerBank::ControllerBank(ControllerFactory factory) : factory(std::move(factory)) {
    if (!this->factory) {
        throw std::invalid_argument("ControllerBank: empty controller factory");
    }
}

FeedbackController& ControllerBank::ensure(Axis axis, float setpoint) {
    auto& slot = controllers[static_cast<int>(axis)];
    if (!slot || slot->setpoint() != setpoint) {
        slot = factory(axis, setpoint);
        if (!slot) {
            throw std::runtime_error(std::string("ControllerBank: factory returned no controller for axis ") + axis_name(axis));
        }
    }
    return *slot;
}

const FeedbackController* ControllerBank::get(Axis axis) const {
    return controllers[static_cast<int>(axis)].get();
}

void ControllerBank::clear() {
    for (auto& c : controllers) c.reset();
}
