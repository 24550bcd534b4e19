// tests/unit/driver/test_batch_resolver.cpp - Unit tests for the batch driver
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include <utility>

#include "entity_resolver/driver/batch_resolver.hpp"

using namespace entity_resolver;
using nlohmann::json;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

/// Options anchored at 1970-01-01T00:00:00Z
ResolveOptions epoch_options()
{
  ResolveOptions options;
  options.now = 0;
  options.utc_offset = 0;
  return options;
}

const char * k_next_monday = R"({
  "kind": "datetime", "datetime_kind": "date",
  "constraint": {"type": "day_of_week", "weekday": "monday"},
  "form": {"kind": "day_of_week"}
})";

}  // namespace

TEST(BatchResolverTest, ResolvesArrayDocument)
{
  const json document = json::array({
    json::parse(k_next_monday),
    json::parse(R"({"kind": "amount_of_money", "value": 42.5, "precision": "approximate", "unit": "USD"})"),
    json::parse(R"({"kind": "unit_of_duration", "grain": "day"})"),
  });

  const auto result = BatchResolver::resolve_document(document, epoch_options());
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.outputs.size(), 3U);
  EXPECT_EQ(result.resolved_count, 2U);

  EXPECT_EQ(result.outputs[0]["kind"], "datetime");
  EXPECT_EQ(result.outputs[0]["value"], "1970-01-05T00:00:00+00:00");
  EXPECT_EQ(result.outputs[0]["grain"], "day");
  EXPECT_EQ(result.outputs[1]["unit"], "USD");
  EXPECT_TRUE(result.outputs[2].is_null());

  // The unresolved value is reported at info level only
  ASSERT_EQ(result.diagnostics.size(), 1U);
  const Diagnostic & d = result.diagnostics.all()[0];
  EXPECT_EQ(d.severity, Severity::Info);
  EXPECT_EQ(d.code, diag_codes::k_unresolved_value);
  EXPECT_EQ(d.value_index, std::optional<size_t>(2));
}

TEST(BatchResolverTest, ValuesObjectDocument)
{
  const json document = {{"values", json::array({json::parse(R"({"kind": "ordinal", "value": 2})")})}};
  const auto result = BatchResolver::resolve_document(document, epoch_options());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.outputs, json::parse(R"([{"kind": "ordinal", "value": 2}])"));
}

TEST(BatchResolverTest, MalformedDocument)
{
  const auto result = BatchResolver::resolve_document(json{{"items", 1}}, epoch_options());
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].code, diag_codes::k_malformed_document);
  EXPECT_TRUE(result.outputs.empty());
}

TEST(BatchResolverTest, InvalidDimensionDoesNotStopOthers)
{
  const json document = json::array({
    json::parse(R"({"kind": "datetime", "constraint": {"type": "day_of_week", "weekday": 9}})"),
    json::parse(k_next_monday),
  });

  const auto result = BatchResolver::resolve_document(document, epoch_options());
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.outputs.size(), 2U);
  EXPECT_TRUE(result.outputs[0].is_null());
  EXPECT_EQ(result.outputs[1]["value"], "1970-01-05T00:00:00+00:00");

  const auto errors = result.diagnostics.errors();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].code, diag_codes::k_invalid_dimension);
  EXPECT_EQ(errors[0].value_index, std::optional<size_t>(0));
  EXPECT_NE(errors[0].message.find("weekday out of range"), std::string::npos);
}

TEST(BatchResolverTest, KindWithIntervalWarningKeepsDocumentIndex)
{
  const json document = json::array({
    json::parse(R"({"kind": "bogus"})"),
    json::parse(R"({
      "kind": "datetime", "datetime_kind": "time",
      "constraint": {"type": "span",
                     "from": {"type": "hour", "hour": 9},
                     "to": {"type": "hour", "hour": 17}}
    })"),
  });

  const auto result = BatchResolver::resolve_document(document, epoch_options());
  const auto warnings = result.diagnostics.warnings();
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0].code, diag_codes::k_kind_with_interval);
  EXPECT_EQ(warnings[0].value_index, std::optional<size_t>(1));

  EXPECT_EQ(result.outputs[1]["interval_kind"], "between");
  EXPECT_EQ(result.outputs[1]["from"], "1970-01-01T09:00:00+00:00");
  EXPECT_EQ(result.outputs[1]["to"], "1970-01-01T18:00:00+00:00");
}

TEST(BatchResolverTest, DropLatent)
{
  const json document = json::array({
    json::parse(R"({"kind": "temperature", "value": 20, "latent": true})"),
    json::parse(R"({"kind": "temperature", "value": 21})"),
  });

  ResolveOptions options = epoch_options();
  options.drop_latent = true;
  const auto result = BatchResolver::resolve_document(document, options);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.outputs[0].is_null());
  EXPECT_FALSE(result.outputs[1].is_null());
  EXPECT_EQ(result.resolved_count, 1U);
}

// ============================================================================
// Context construction
// ============================================================================

TEST(BatchResolverTest, OptionsOverrideConfig)
{
  ResolverConfig config;
  config.context.reference = 1500000000;
  config.context.utc_offset = 3600;

  ResolveOptions options;
  options.config = config;
  options.now = 0;

  DiagnosticBag diags;
  const auto ctx = BatchResolver::build_context(options, diags);
  ASSERT_TRUE(ctx.has_value());
  EXPECT_EQ(ctx->reference().start, Moment(0, 3600));
  EXPECT_TRUE(diags.empty());
}

TEST(BatchResolverTest, ConfigWindow)
{
  ResolverConfig config;
  config.context.reference = 100;
  config.context.utc_offset = 0;
  config.context.window = WindowConfig{0, 200};

  ResolveOptions options;
  options.config = config;

  DiagnosticBag diags;
  const auto ctx = BatchResolver::build_context(options, diags);
  ASSERT_TRUE(ctx.has_value());
  EXPECT_EQ(ctx->min().start, Moment(0));
  EXPECT_EQ(ctx->max().start, Moment(200));
}

TEST(BatchResolverTest, ReferenceOutsideWindowIsContextError)
{
  ResolverConfig config;
  config.context.window = WindowConfig{0, 200};

  ResolveOptions options = epoch_options();
  options.now = 500;
  options.config = config;

  const auto result = BatchResolver::resolve_document(json::array(), options);
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].code, diag_codes::k_invalid_context);
}

TEST(BatchResolverTest, ReferenceTooFarFromEpochIsContextError)
{
  ResolveOptions options = epoch_options();
  options.now = Context::k_max_abs_epoch_seconds + 1;

  const auto result = BatchResolver::resolve_document(json::array(), options);
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].code, diag_codes::k_invalid_context);
}

// ============================================================================
// Files
// ============================================================================

TEST(BatchResolverTest, ResolveFile)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "er_driver_file");
  const auto file = dir.path / "values.json";
  {
    std::ofstream f(file);
    f << "[" << k_next_monday << "]";
  }

  const auto result = BatchResolver::resolve_file(file, epoch_options());
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.outputs.size(), 1U);
  EXPECT_EQ(result.outputs[0]["datetime_kind"], "date");
}

TEST(BatchResolverTest, ResolveFileErrors)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "er_driver_errors");

  const auto missing = BatchResolver::resolve_file(dir.path / "missing.json", epoch_options());
  EXPECT_FALSE(missing.success);
  ASSERT_EQ(missing.diagnostics.size(), 1U);
  EXPECT_EQ(missing.diagnostics.all()[0].code, diag_codes::k_malformed_document);

  const auto file = dir.path / "broken.json";
  {
    std::ofstream f(file);
    f << "[{\"kind\": ";
  }
  const auto broken = BatchResolver::resolve_file(file, epoch_options());
  EXPECT_FALSE(broken.success);
  EXPECT_EQ(broken.diagnostics.all()[0].code, diag_codes::k_malformed_document);
}
