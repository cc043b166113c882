#include "Nimbus/Services/Weather.hpp"

#include "Services/Weather/OpenMeteoService.hpp"
#include "Services/Weather/OpenWeatherMapService.hpp"

namespace nimbus::services::weather {
  fn CreateWeatherService(const Provider provider, const Option<String>& apiKey) -> Result<UniquePointer<IWeatherService>> {
    using enum Provider;

    switch (provider) {
      case OpenWeatherMap:
        if (!apiKey || apiKey->empty())
          ERR(::nimbus::utils::error::NimbusErrorCode::ConfigurationError, "OpenWeatherMap requires an API key (set weather.api_key or NIMBUS_API_KEY)");

        return std::make_unique<OpenWeatherMapService>(*apiKey);
      case OpenMeteo:
        return std::make_unique<OpenMeteoService>();
    }

    ERR(::nimbus::utils::error::NimbusErrorCode::InvalidArgument, "Unknown weather provider");
  }
} // namespace nimbus::services::weather
