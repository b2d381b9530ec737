#include "internal/observability/otlp_settings.hpp"

#ifdef ENABLE_OTEL

#include <cctype>
#include <cstdlib>

namespace jobguard::observability {

OtlpSettings ResolveOtlp(const jobguard::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  OtlpSettings settings;
  settings.http = config.transport() == jobguard::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    settings.endpoint = config.otlp_endpoint();
    return settings;
  }

  std::string signal_var = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) signal_var.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  signal_var += "_ENDPOINT";

  if (const char* endpoint = std::getenv(signal_var.c_str())) {
    settings.endpoint = endpoint;
  } else if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = shared;
  } else {
    settings.endpoint = settings.http ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
  }
  return settings;
}

opentelemetry::sdk::resource::Resource ServiceResource() {
  const std::string                                  name(kServiceName);
  const std::string                                  version(kServiceVersion);
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", name}, {"service.version", version}};
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace jobguard::observability

#endif
