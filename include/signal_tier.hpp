#ifndef SIGNAL_TIER_HPP
#define SIGNAL_TIER_HPP

// Quality tiers, strongest first. Declaration order is for display only,
// classification is driven by the dBm thresholds in classifySignal().
enum class SignalTier {
    Maximum,
    Excellent,
    Good,
    Reliable,
    Weak,
    Unreliable,
    Bad
};

struct TierStyle {
    const char* name;
    const char* sgr;   // ANSI SGR sequence used when colour is on
};

SignalTier classifySignal(float signal);

const TierStyle& tierStyle(SignalTier tier);
const char* tierName(SignalTier tier);

#endif
