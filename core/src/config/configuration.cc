#include "emitcore/config/configuration.h"

namespace emitcore::config {

std::string_view ToString(ExporterKind kind) noexcept {
  switch (kind) {
    case ExporterKind::OtlpGrpc:
      return "otlp-grpc";
    case ExporterKind::OtlpHttp:
      return "otlp-http";
    case ExporterKind::Console:
      return "console";
    case ExporterKind::File:
      return "file";
  }
  return "otlp-http";
}

std::string_view ToString(OtlpProtocol protocol) noexcept {
  return protocol == OtlpProtocol::Grpc ? "grpc" : "http";
}

std::optional<ExporterKind> ParseExporterKind(std::string_view name) noexcept {
  if (name == "otlp-grpc")
    return ExporterKind::OtlpGrpc;
  if (name == "otlp-http")
    return ExporterKind::OtlpHttp;
  if (name == "console")
    return ExporterKind::Console;
  if (name == "file")
    return ExporterKind::File;
  return std::nullopt;
}

}  // namespace emitcore::config
