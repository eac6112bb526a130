/* @file ParameterStore.cpp
 * @brief clamped duration store + slider mapping
 *
 * © 2025 EchoMe Labs — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// EchoMe headers
#include "core/ParameterStore.hpp"

using namespace echome::core;

SessionParameterStore::SessionParameterStore(double minHours, double maxHours, double initialHours)
    : min_(std::max(0.0, minHours)), max_(std::max(min_, maxHours)), value_(min_) {
  set(initialHours);
}

void SessionParameterStore::set(double hours) {
  if (std::isnan(hours))
    return;
  value_ = std::clamp(hours, min_, max_);
}

void SessionParameterStore::setFromSlider(int sliderValue) {
  int pos = std::clamp(sliderValue, kSliderMin, kSliderMax);
  set(min_ + (max_ - min_) * static_cast<double>(pos) / kSliderMax);
}

int SessionParameterStore::sliderValue() const {
  return static_cast<int>(ratio() * kSliderMax + 1e-9);
}

double SessionParameterStore::ratio() const {
  if (max_ <= min_)
    return 0.0;
  return (value_ - min_) / (max_ - min_);
}
