#ifndef QORSENSE_SYNTHETIC_HPP
#define QORSENSE_SYNTHETIC_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qorsense {

enum class SignalKind {
    kNormal,
    kDrifting,
    kNoisy,
    kOscillation,
};

SignalKind signal_kind_from_string(const std::string& name);
std::string signal_kind_name(SignalKind kind);

struct SignalShape {
    double amplitude = 10.0;
    double noise_std = 0.5;
    double drift_total = 0.0;
    double oscillation_amplitude = 0.0;
    double oscillation_rate = 10.0;
    double duration = 10.0;
};

SignalShape shape_for(SignalKind kind);

// 10*sin(t) over t in [0, 10] plus the kind's drift, oscillation and Gaussian noise.
// Same kind, length and seed always give the same series.
std::vector<double> generate_signal(SignalKind kind, std::size_t length, std::uint64_t seed = 42);
std::vector<double> generate_signal(const SignalShape& shape, std::size_t length, std::uint64_t seed = 42);

}  // namespace qorsense

#endif  // QORSENSE_SYNTHETIC_HPP
