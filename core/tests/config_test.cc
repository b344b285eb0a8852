#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <string>

#include "emitcore/config/configuration.h"
#include "emitcore/config/resolver.h"
#include "emitcore/v1/settings.pb.h"

namespace emitcore::config {
namespace {

struct ResolveFixture {
  Environment env;
  v1::HostSettings settings;
  std::string host_telemetry_level;

  Configuration Run() const {
    return Resolve({
        .env = env,
        .settings = settings,
        .service_version = "1.2.3",
        .session_id = "session-1",
        .host_telemetry_level = host_telemetry_level,
    });
  }
};

}  // namespace

// ------------------------------------------------------------
// Enablement
// ------------------------------------------------------------
TEST(ResolveTest, DisabledByDefault) {
  ResolveFixture f;
  auto cfg = f.Run();

  EXPECT_FALSE(cfg.enabled);
  EXPECT_EQ(cfg.service_name, "emitcore");
  EXPECT_EQ(cfg.service_version, "1.2.3");
  EXPECT_EQ(cfg.session_id, "session-1");
  EXPECT_FALSE(cfg.capture_content);
  EXPECT_FALSE(cfg.file_path.has_value());
}

TEST(ResolveTest, StandardEndpointImpliesEnabled) {
  ResolveFixture f;
  f.env[env::kOtlpEndpoint] = "http://collector:4318";

  auto cfg = f.Run();
  EXPECT_TRUE(cfg.enabled);
  EXPECT_EQ(cfg.exporter_kind, ExporterKind::OtlpHttp);
  EXPECT_EQ(cfg.endpoint, "http://collector:4318/");
}

TEST(ResolveTest, EmptyStandardEndpointDoesNotEnable) {
  ResolveFixture f;
  f.env[env::kOtlpEndpoint] = "";

  EXPECT_FALSE(f.Run().enabled);
}

TEST(ResolveTest, EnvBoolAcceptsOnlyLowercaseTrueAndOne) {
  ResolveFixture f;
  f.env[env::kEnabled] = "TRUE";
  EXPECT_FALSE(f.Run().enabled);

  f.env[env::kEnabled] = "true";
  EXPECT_TRUE(f.Run().enabled);

  f.env[env::kEnabled] = "1";
  EXPECT_TRUE(f.Run().enabled);
}

TEST(ResolveTest, EnvOverrideBeatsSetting) {
  ResolveFixture f;
  f.env[env::kEnabled] = "false";
  f.settings.set_enabled(true);

  EXPECT_FALSE(f.Run().enabled);

  f.env[env::kEnabled] = "1";
  f.settings.set_enabled(false);
  EXPECT_TRUE(f.Run().enabled);
}

TEST(ResolveTest, SettingBeatsImpliedEndpoint) {
  ResolveFixture f;
  f.env[env::kOtlpEndpoint] = "http://collector:4318";
  f.settings.set_enabled(false);

  EXPECT_FALSE(f.Run().enabled);
}

TEST(ResolveTest, KillSwitchBeatsEverything) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.settings.set_enabled(true);
  f.host_telemetry_level = "off";

  auto cfg = f.Run();
  EXPECT_FALSE(cfg.enabled);
  EXPECT_EQ(cfg.service_name, "emitcore");
}

// ------------------------------------------------------------
// Endpoint normalization
// ------------------------------------------------------------
TEST(ResolveTest, GrpcKeepsOnlyOrigin) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kOtlpProtocol] = "grpc";
  f.env[env::kOtlpEndpoint] = "http://collector:4317/v1/traces";

  auto cfg = f.Run();
  EXPECT_EQ(cfg.protocol, OtlpProtocol::Grpc);
  EXPECT_EQ(cfg.exporter_kind, ExporterKind::OtlpGrpc);
  EXPECT_EQ(cfg.endpoint, "http://collector:4317");
}

TEST(ResolveTest, HttpKeepsPath) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kOtlpEndpoint] = "http://collector:4317/v1/traces";

  auto cfg = f.Run();
  EXPECT_EQ(cfg.protocol, OtlpProtocol::Http);
  EXPECT_EQ(cfg.endpoint, "http://collector:4317/v1/traces");
}

TEST(ResolveTest, AppEndpointBeatsStandardEndpointAndSetting) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kEndpoint] = "http://app:1111";
  f.env[env::kOtlpEndpoint] = "http://std:2222";
  f.settings.set_otlp_endpoint("http://setting:3333");

  EXPECT_EQ(f.Run().endpoint, "http://app:1111/");

  f.env.erase(env::kEndpoint);
  EXPECT_EQ(f.Run().endpoint, "http://std:2222/");

  f.env.erase(env::kOtlpEndpoint);
  EXPECT_EQ(f.Run().endpoint, "http://setting:3333/");
}

TEST(ResolveTest, QuotedEndpointIsUnwrapped) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kEndpoint] = "\"https://collector.example.com:443/otlp\"";

  EXPECT_EQ(f.Run().endpoint, "https://collector.example.com/otlp");
}

TEST(ResolveTest, InvalidEndpointFallsBackToDefault) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kEndpoint] = "not a url";

  EXPECT_EQ(f.Run().endpoint, "http://localhost:4318/");

  f.env[env::kOtlpProtocol] = "grpc";
  EXPECT_EQ(f.Run().endpoint, "http://localhost:4318");
}

TEST(ResolveTest, ProtocolMustBeExactlyGrpc) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kOtlpProtocol] = "http/protobuf";
  EXPECT_EQ(f.Run().protocol, OtlpProtocol::Http);

  f.env[env::kOtlpProtocol] = "GRPC";
  EXPECT_EQ(f.Run().protocol, OtlpProtocol::Http);

  f.env.erase(env::kOtlpProtocol);
  f.env[env::kProtocol] = "grpc";
  EXPECT_EQ(f.Run().protocol, OtlpProtocol::Grpc);
}

TEST(ResolveTest, PerSignalEndpointsAreNormalizedAndInvalidOnesDropped) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kOtlpTracesEndpoint] = "http://traces:4318/custom/traces";
  f.env[env::kOtlpLogsEndpoint] = "ftp://logs";

  auto cfg = f.Run();
  ASSERT_TRUE(cfg.signal_endpoints.traces.has_value());
  EXPECT_EQ(*cfg.signal_endpoints.traces, "http://traces:4318/custom/traces");
  EXPECT_FALSE(cfg.signal_endpoints.metrics.has_value());
  EXPECT_FALSE(cfg.signal_endpoints.logs.has_value());
}

// ------------------------------------------------------------
// Exporter kind
// ------------------------------------------------------------
TEST(ResolveTest, FilePathAlwaysWins) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kOtlpProtocol] = "grpc";
  f.settings.set_exporter_type("console");
  f.settings.set_outfile("/tmp/from-setting.jsonl");

  auto cfg = f.Run();
  EXPECT_EQ(cfg.exporter_kind, ExporterKind::File);
  EXPECT_EQ(cfg.file_path, "/tmp/from-setting.jsonl");

  f.env[env::kFileExporterPath] = "/tmp/from-env.jsonl";
  EXPECT_EQ(f.Run().file_path, "/tmp/from-env.jsonl");
}

TEST(ResolveTest, EmptyFilePathEnvShadowsSetting) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kFileExporterPath] = "";
  f.settings.set_outfile("/tmp/from-setting.jsonl");

  auto cfg = f.Run();
  EXPECT_FALSE(cfg.file_path.has_value());
  EXPECT_EQ(cfg.exporter_kind, ExporterKind::OtlpHttp);
}

TEST(ResolveTest, ExporterTypeSettingBeatsProtocol) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kOtlpProtocol] = "grpc";
  f.settings.set_exporter_type("console");

  EXPECT_EQ(f.Run().exporter_kind, ExporterKind::Console);

  f.settings.set_exporter_type("otlp-http");
  EXPECT_EQ(f.Run().exporter_kind, ExporterKind::OtlpHttp);
}

TEST(ResolveTest, UnknownOrPathlessExporterTypeFallsBackToProtocol) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kOtlpProtocol] = "grpc";

  f.settings.set_exporter_type("zipkin");
  EXPECT_EQ(f.Run().exporter_kind, ExporterKind::OtlpGrpc);

  f.settings.set_exporter_type("file");
  EXPECT_EQ(f.Run().exporter_kind, ExporterKind::OtlpGrpc);
}

// ------------------------------------------------------------
// Flags and identity
// ------------------------------------------------------------
TEST(ResolveTest, CaptureContentPrecedence) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  EXPECT_FALSE(f.Run().capture_content);

  f.settings.set_capture_content(true);
  EXPECT_TRUE(f.Run().capture_content);

  f.env[env::kCaptureContent] = "false";
  EXPECT_FALSE(f.Run().capture_content);

  f.env[env::kCaptureContent] = "yes";
  EXPECT_FALSE(f.Run().capture_content);
}

TEST(ResolveTest, LogLevelAndFlags) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  EXPECT_EQ(f.Run().log_level, observability::LogLevel::Info);
  EXPECT_FALSE(f.Run().http_auto_instrument);

  f.env[env::kLogLevel] = "debug";
  f.env[env::kHttpInstrumentation] = "true";
  f.env[env::kMetricsCountersOnly] = "1";

  auto cfg = f.Run();
  EXPECT_EQ(cfg.log_level, observability::LogLevel::Debug);
  EXPECT_TRUE(cfg.http_auto_instrument);
  EXPECT_TRUE(cfg.metrics_counters_only);

  f.env[env::kLogLevel] = "verbose";
  EXPECT_EQ(f.Run().log_level, observability::LogLevel::Info);
}

TEST(ResolveTest, ServiceNameOverride) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kServiceName] = "bench-runner";

  EXPECT_EQ(f.Run().service_name, "bench-runner");
}

TEST(ResolveTest, ResourceAttributesAndHeaders) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kResourceAttributes] = "benchmark.id=abc-123,benchmark.name=say_hello";
  f.env[env::kOtlpHeaders] = "authorization=Bearer token,x-tenant = acme";

  auto cfg = f.Run();
  EXPECT_EQ(cfg.resource_attributes,
            (std::map<std::string, std::string>{{"benchmark.id", "abc-123"},
                                                {"benchmark.name", "say_hello"}}));
  EXPECT_EQ(cfg.headers, (std::map<std::string, std::string>{{"authorization", "Bearer token"},
                                                             {"x-tenant", "acme"}}));
}

TEST(ResolveTest, ExportCadence) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  EXPECT_EQ(f.Run().metric_export_interval, std::chrono::milliseconds(10000));

  f.env[env::kMetricExportInterval] = "2500";
  f.env[env::kSpanScheduleDelay] = "100";
  f.env[env::kLogScheduleDelay] = "-5";

  auto cfg = f.Run();
  EXPECT_EQ(cfg.metric_export_interval, std::chrono::milliseconds(2500));
  EXPECT_EQ(cfg.span_schedule_delay, std::chrono::milliseconds(100));
  EXPECT_FALSE(cfg.log_schedule_delay.has_value());

  f.env[env::kMetricExportInterval] = "soon";
  EXPECT_EQ(f.Run().metric_export_interval, std::chrono::milliseconds(10000));
}

TEST(ResolveTest, IsDeterministic) {
  ResolveFixture f;
  f.env[env::kEnabled] = "true";
  f.env[env::kOtlpEndpoint] = "http://collector:4318/v1/traces";
  f.env[env::kResourceAttributes] = "a=1,b=2";
  f.settings.set_capture_content(true);

  EXPECT_EQ(f.Run(), f.Run());
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
TEST(ParseKeyValueListTest, SkipsMalformedPairs) {
  auto parsed = ParseKeyValueList("benchmark.id=abc-123,garbage,=novalue,benchmark.name=say_hello");

  EXPECT_EQ(parsed, (std::map<std::string, std::string>{{"benchmark.id", "abc-123"},
                                                        {"benchmark.name", "say_hello"}}));
}

TEST(ParseKeyValueListTest, LaterDuplicatesOverwrite) {
  auto parsed = ParseKeyValueList("k=first,k=second");
  ASSERT_EQ(parsed.size(), 1u);
  EXPECT_EQ(parsed["k"], "second");
}

TEST(ParseKeyValueListTest, KeepsEqualsInValues) {
  auto parsed = ParseKeyValueList("token=a=b");
  EXPECT_EQ(parsed["token"], "a=b");
}

TEST(NormalizeEndpointTest, ByProtocol) {
  EXPECT_EQ(NormalizeEndpoint("http://collector:4317/v1/traces", OtlpProtocol::Grpc),
            "http://collector:4317");
  EXPECT_EQ(NormalizeEndpoint("http://collector:4317/v1/traces", OtlpProtocol::Http),
            "http://collector:4317/v1/traces");
  EXPECT_EQ(NormalizeEndpoint("'HTTP://Collector:80'", OtlpProtocol::Http),
            "http://collector/");
  EXPECT_FALSE(NormalizeEndpoint("collector:4317", OtlpProtocol::Grpc).has_value());
}

TEST(ExporterKindTest, ParseAndPrint) {
  EXPECT_EQ(ParseExporterKind("otlp-grpc"), ExporterKind::OtlpGrpc);
  EXPECT_EQ(ParseExporterKind("otlp-http"), ExporterKind::OtlpHttp);
  EXPECT_EQ(ParseExporterKind("console"), ExporterKind::Console);
  EXPECT_EQ(ParseExporterKind("file"), ExporterKind::File);
  EXPECT_FALSE(ParseExporterKind("jaeger").has_value());

  EXPECT_EQ(ToString(ExporterKind::OtlpGrpc), "otlp-grpc");
  EXPECT_EQ(ToString(OtlpProtocol::Http), "http");
}

}  // namespace emitcore::config
