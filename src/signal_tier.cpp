#include "signal_tier.hpp"

SignalTier classifySignal(float signal) {
    if (signal >= -30.0f) return SignalTier::Maximum;
    if (signal >= -50.0f) return SignalTier::Excellent;
    if (signal >= -60.0f) return SignalTier::Good;
    if (signal >= -67.0f) return SignalTier::Reliable;
    if (signal >= -70.0f) return SignalTier::Weak;
    if (signal >= -80.0f) return SignalTier::Unreliable;
    // below -80, and NaN
    return SignalTier::Bad;
}

static const TierStyle kTierStyles[] = {
    {"Maximum",    "\033[1;5;32m"},
    {"Excellent",  "\033[1;5;32m"},
    {"Good",       "\033[5;32m"},
    {"Reliable",   "\033[1;5;33m"},
    {"Weak",       "\033[33m"},
    {"Unreliable", "\033[31m"},
    {"Bad",        "\033[1;31m"},
};

const TierStyle& tierStyle(SignalTier tier) {
    return kTierStyles[static_cast<int>(tier)];
}

const char* tierName(SignalTier tier) {
    return tierStyle(tier).name;
}
