#pragma once
/** @file  ParameterStore.hpp
 *  @brief Selected focus duration shared by the Navigation and Focus pages.
 *
 *  © 2025 EchoMe Labs — MIT-licensed.
 */

#include <utility>

namespace echome {
  namespace core {

    /** @class SessionParameterStore
 *  @brief Holds the user's duration choice (hours), clamped to configured bounds.
 *
 *  * Loop-thread only, so no lock (unlike the multi-threaded stores elsewhere).
 *  * Outlives every session: the Navigation page shows the last choice again.
 *  * The slider speaks 0-100; the store maps that linearly onto [min, max].
 */
    class SessionParameterStore {

    public:
      static constexpr int kSliderMin = 0;
      static constexpr int kSliderMax = 100;

      SessionParameterStore(double minHours = 0.0, double maxHours = 2.0,
                            double initialHours = 1.0);
      ~SessionParameterStore() = default;

      /// Stores \p hours clamped to [min, max]; out-of-range input is not an error.
      void set(double hours);

      double get() const { return value_; }

      /// Slider position (clamped to 0..100) -> hours.
      void setFromSlider(int sliderValue);

      /// Current value expressed as a slider position, truncated.
      int sliderValue() const;

      /// (value - min) / (max - min), drives the Navigation background gradient.
      double ratio() const;

      std::pair<double, double> bounds() const { return { min_, max_ }; }

    private:
      double min_;
      double max_;
      double value_;
    };

  } // namespace core
} // namespace echome
