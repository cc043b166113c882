#pragma once

#include "Nimbus/Services/Weather.hpp"

namespace nimbus::services::weather {
  class OpenWeatherMapService final : public IWeatherService {
   public:
    explicit OpenWeatherMapService(String apiKey);

    [[nodiscard]] fn resolve(const String& city, const String& country) const -> Result<Location> override;
    [[nodiscard]] fn fetchWeather(const Coords& coords, const String& language, UnitSystem units) const -> Result<Report> override;

   private:
    String m_apiKey;
  };
} // namespace nimbus::services::weather
