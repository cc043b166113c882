#pragma once

#include "Nimbus/Services/Weather.hpp"

namespace nimbus::services::weather {
  class OpenMeteoService final : public IWeatherService {
   public:
    OpenMeteoService() = default;

    [[nodiscard]] fn resolve(const String& city, const String& country) const -> Result<Location> override;
    [[nodiscard]] fn fetchWeather(const Coords& coords, const String& language, UnitSystem units) const -> Result<Report> override;
  };
} // namespace nimbus::services::weather
