#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace jobguard::observability {

inline constexpr std::string_view kServiceName    = "jobguard";
inline constexpr std::string_view kServiceVersion = "0.1.0";

struct OtlpSettings {
  bool        http = false;
  std::string endpoint;
};

/*
  Exporter target for one signal ("traces" or "metrics"). The configured
  endpoint wins, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
*/
OtlpSettings ResolveOtlp(const jobguard::runtime::config::ObservabilityConfig& config, std::string_view signal);

opentelemetry::sdk::resource::Resource ServiceResource();

} // namespace jobguard::observability

#endif
