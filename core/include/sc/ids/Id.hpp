#pragma once
#include <cstdint>
#include <string>

namespace sc {

// Stable, host-chosen component identity.
using ComponentId = std::string;

// Opaque host reference to a component's visual representation.
using HandleId = std::uint64_t;

inline constexpr HandleId kInvalidHandle = 0;

// Listener token returned by EventEmitter::subscribe.
using ListenerId = std::uint32_t;

inline constexpr ListenerId kInvalidListener = 0;

// Unique within the process: "<prefix>_<counter>_<suffix>".
std::string generateComponentId(const std::string& prefix = "component");

} // namespace sc
