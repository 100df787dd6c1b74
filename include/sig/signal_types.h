#pragma once

#include <array>
#include <cstddef>
#include <string_view>

enum class VsaPattern {
  Stopping,      // down bar on ultra-high volume closing off the lows
  NoSupply,      // narrow down bar on low volume
  TestBar,       // low-volume retest of recent lows closing high
  Shakeout,      // up bar on high volume with a long lower wick
  Climactic,     // wide down bar on ultra-high volume after a decline
  Spring,        // new low reclaimed within the bar
  Demand,        // wide up bar on high volume closing near the high
  EffortResult,  // ultra-high volume absorbed with little net movement
};

inline constexpr size_t N_VSA_PATTERNS = 8;

inline constexpr std::array<VsaPattern, N_VSA_PATTERNS> vsa_patterns = {
    VsaPattern::Stopping,  VsaPattern::NoSupply,  VsaPattern::TestBar,
    VsaPattern::Shakeout,  VsaPattern::Climactic, VsaPattern::Spring,
    VsaPattern::Demand,    VsaPattern::EffortResult,
};

enum class Component {
  Bollinger,
  Macd,
  Rsi,
  Vsa,
  SmaStack,
  PrevLowUp,
  PiDeep,
};

inline constexpr std::array<Component, 7> components = {
    Component::Bollinger, Component::Macd,      Component::Rsi,
    Component::Vsa,       Component::SmaStack,  Component::PrevLowUp,
    Component::PiDeep,
};

constexpr std::string_view to_str(VsaPattern p) {
  switch (p) {
    case VsaPattern::Stopping:
      return "stopping";
    case VsaPattern::NoSupply:
      return "no_supply";
    case VsaPattern::TestBar:
      return "test_bar";
    case VsaPattern::Shakeout:
      return "shakeout";
    case VsaPattern::Climactic:
      return "climactic";
    case VsaPattern::Spring:
      return "spring";
    case VsaPattern::Demand:
      return "demand";
    case VsaPattern::EffortResult:
      return "effort_result";
  }
  return "";
}

constexpr std::string_view to_str(Component c) {
  switch (c) {
    case Component::Bollinger:
      return "bollinger";
    case Component::Macd:
      return "macd";
    case Component::Rsi:
      return "rsi";
    case Component::Vsa:
      return "vsa";
    case Component::SmaStack:
      return "sma_stack";
    case Component::PrevLowUp:
      return "prev_low_up";
    case Component::PiDeep:
      return "pi_deep";
  }
  return "";
}
