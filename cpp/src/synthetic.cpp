#include "qorsense/synthetic.hpp"

#include <cmath>
#include <random>

#include "qorsense/errors.hpp"

namespace qorsense {

SignalKind signal_kind_from_string(const std::string& name) {
    if (name == "Normal") {
        return SignalKind::kNormal;
    }
    if (name == "Drifting") {
        return SignalKind::kDrifting;
    }
    if (name == "Noisy") {
        return SignalKind::kNoisy;
    }
    if (name == "Oscillation") {
        return SignalKind::kOscillation;
    }
    throw InvalidInputError("unknown signal type: " + name);
}

std::string signal_kind_name(SignalKind kind) {
    switch (kind) {
        case SignalKind::kNormal:
            return "Normal";
        case SignalKind::kDrifting:
            return "Drifting";
        case SignalKind::kNoisy:
            return "Noisy";
        case SignalKind::kOscillation:
            return "Oscillation";
    }
    return "Normal";
}

SignalShape shape_for(SignalKind kind) {
    SignalShape shape;
    switch (kind) {
        case SignalKind::kNormal:
            break;
        case SignalKind::kDrifting:
            shape.drift_total = 5.0;
            break;
        case SignalKind::kNoisy:
            shape.noise_std = 3.0;
            break;
        case SignalKind::kOscillation:
            shape.noise_std = 0.2;
            shape.oscillation_amplitude = 5.0;
            break;
    }
    return shape;
}

std::vector<double> generate_signal(SignalKind kind, std::size_t length, std::uint64_t seed) {
    return generate_signal(shape_for(kind), length, seed);
}

std::vector<double> generate_signal(const SignalShape& shape, std::size_t length, std::uint64_t seed) {
    std::vector<double> values;
    values.reserve(length);
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> noise(0.0, shape.noise_std > 0.0 ? shape.noise_std : 1.0);

    const double last = length > 1 ? static_cast<double>(length - 1) : 1.0;
    for (std::size_t i = 0; i < length; ++i) {
        const double fraction = static_cast<double>(i) / last;
        const double t = shape.duration * fraction;
        double value = shape.amplitude * std::sin(t);
        value += shape.drift_total * fraction;
        value += shape.oscillation_amplitude * std::sin(t * shape.oscillation_rate);
        if (shape.noise_std > 0.0) {
            value += noise(rng);
        }
        values.push_back(value);
    }
    return values;
}

}  // namespace qorsense
