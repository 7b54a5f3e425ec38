#pragma once
#include <cstdint>

namespace sc {

enum class PointerSource : std::uint8_t { Mouse = 0, Touch };

enum class PointerPhase : std::uint8_t { Down = 0, Move, Up, Cancel };

// Generic pointer sample, tagged by modality. Touch hosts report the first
// active touch point; Up/Cancel coordinates are ignored.
struct PointerEvent {
  PointerSource source{PointerSource::Mouse};
  PointerPhase phase{PointerPhase::Move};
  double clientX{0}, clientY{0};  // host client coordinates
};

inline PointerEvent mouseEvent(PointerPhase phase, double x, double y) {
  return {PointerSource::Mouse, phase, x, y};
}

inline PointerEvent touchEvent(PointerPhase phase, double x, double y) {
  return {PointerSource::Touch, phase, x, y};
}

} // namespace sc
