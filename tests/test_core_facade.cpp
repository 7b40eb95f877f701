#include "stumper/core/error.hpp"
#include "stumper/core/facade.hpp"
#include "stumper/core/log.hpp"
#include "stumper/core/sink.hpp"

#include "recording_sink.hpp"
#include "test_main.hpp"

#include <memory>
#include <string>
#include <utility>

namespace {

using stumper::core::CallOptions;
using stumper::core::errc;
using stumper::core::Facade;
using stumper::core::FacadeConfig;
using stumper::core::kAllSeverities;
using stumper::core::make_error_code;
using stumper::core::ordinal;
using stumper::core::set_minimum_severity;
using stumper::core::Severity;
using stumper::tests::RecordingSink;

std::unique_ptr<Facade> make_facade(FacadeConfig config) {
  std::unique_ptr<Facade> facade;
  TEST_EXPECT_OK(Facade::create(std::move(config), facade));
  TEST_EXPECT(facade != nullptr);
  return facade;
}

FacadeConfig app_config() {
  FacadeConfig cfg;
  cfg.prefix = "App";
  cfg.separator = ":";
  return cfg;
}

void test_format_notice_with_initial() {
  auto facade = make_facade(app_config());
  TEST_EXPECT_STR_EQ(facade->format(Severity::notice, "hi"), "[N] App: hi");
  TEST_EXPECT_STR_EQ(facade->format(Severity::trace, "hi"), "[T] App: hi");
  TEST_EXPECT_STR_EQ(facade->format(Severity::fault, "hi"), "[F] App: hi");
}

void test_format_without_level() {
  auto cfg = app_config();
  cfg.show_level = false;
  auto facade = make_facade(std::move(cfg));
  TEST_EXPECT_STR_EQ(facade->format(Severity::error, "boom"), "App: boom");
}

void test_format_with_icons() {
  auto cfg = app_config();
  cfg.use_icons = true;
  auto facade = make_facade(std::move(cfg));
  TEST_EXPECT_STR_EQ(facade->format(Severity::info, "x"), "[💙] App: x");
  TEST_EXPECT_STR_EQ(facade->format(Severity::fault, "x"), "[❤️] App: x");
}

void test_format_overrides_and_passthrough() {
  auto cfg = app_config();
  cfg.brackets = "<>";
  auto facade = make_facade(std::move(cfg));

  TEST_EXPECT_STR_EQ(facade->format(Severity::debug, "m", "Net", "|"), "<D> Net| m");
  TEST_EXPECT_STR_EQ(facade->format(Severity::debug, "m", "Net"), "<D> Net: m");
  TEST_EXPECT_STR_EQ(facade->format(Severity::debug, "m", "", "->"), "<D> App-> m");

  // 空消息照常输出前缀。
  TEST_EXPECT_STR_EQ(facade->format(Severity::debug, ""), "<D> App: ");

  // 前缀中的括号/分隔符字符不转义。
  TEST_EXPECT_STR_EQ(facade->format(Severity::debug, "m", "[a:b]"), "<D> [a:b]: m");
}

void test_invalid_brackets_rejected() {
  const char* bad[] = {"", "[", "[[]", "(((("};
  for (const char* brackets : bad) {
    FacadeConfig cfg;
    cfg.brackets = brackets;
    std::unique_ptr<Facade> out;
    TEST_EXPECT_EC(Facade::create(std::move(cfg), out), make_error_code(errc::invalid_brackets));
    TEST_EXPECT(out == nullptr);
  }

  // 非法 UTF-8 不算两个字符。
  FacadeConfig cfg;
  cfg.brackets = std::string("\xC3\x28", 2);
  std::unique_ptr<Facade> out;
  TEST_EXPECT_EC(Facade::create(std::move(cfg), out), make_error_code(errc::invalid_brackets));
}

void test_multibyte_brackets_accepted() {
  auto cfg = app_config();
  cfg.brackets = "«»";
  auto facade = make_facade(std::move(cfg));
  TEST_EXPECT_STR_EQ(facade->format(Severity::warning, "w"), "«W» App: w");
}

void test_brackets_counted_as_visible_characters() {
  // "❤️" 是 U+2764 U+FE0F 两个码点，但只算一个字符。
  auto cfg = app_config();
  cfg.brackets = "❤️❤️";
  auto facade = make_facade(std::move(cfg));
  TEST_EXPECT_STR_EQ(facade->format(Severity::notice, "hi"), "❤️N❤️ App: hi");

  // 基字符 + 组合重音各算一个字符。
  auto accented = app_config();
  accented.brackets = "e\xCC\x81o\xCC\x81";
  auto facade2 = make_facade(std::move(accented));
  TEST_EXPECT_STR_EQ(facade2->format(Severity::info, "x"), "e\xCC\x81Io\xCC\x81 App: x");

  // 单个带组合符号的字符不足两个。
  FacadeConfig single;
  single.brackets = "e\xCC\x81";
  std::unique_ptr<Facade> out;
  TEST_EXPECT_EC(Facade::create(std::move(single), out), make_error_code(errc::invalid_brackets));
  TEST_EXPECT(out == nullptr);

  FacadeConfig one_icon;
  one_icon.brackets = "❤️";
  TEST_EXPECT_EC(Facade::create(std::move(one_icon), out), make_error_code(errc::invalid_brackets));
}

void test_log_forwards_call_options() {
  auto facade = make_facade(app_config());
  RecordingSink sink;
  facade->log("direct", Severity::error, CallOptions{"Net", "", &sink});
  TEST_EXPECT_EQ(sink.records.size(), 1u);
  if (!sink.records.empty()) {
    TEST_EXPECT_STR_EQ(sink.records[0].text, "[E] Net: direct");
    TEST_EXPECT_EQ(sink.records[0].level, Severity::error);
  }
}

void test_threshold_gates_every_severity() {
  auto facade = make_facade(app_config());
  RecordingSink sink;
  const CallOptions opts{{}, {}, &sink};

  for (const auto threshold : kAllSeverities) {
    set_minimum_severity(threshold);
    for (const auto level : kAllSeverities) {
      sink.records.clear();

      switch (level) {
        case Severity::trace:
          facade->trace("m", opts);
          break;
        case Severity::debug:
          facade->debug("m", opts);
          break;
        case Severity::info:
          facade->info("m", opts);
          break;
        case Severity::notice:
          facade->notice("m", opts);
          break;
        case Severity::warning:
          facade->warning("m", opts);
          break;
        case Severity::error:
          facade->error("m", opts);
          break;
        case Severity::fault:
          facade->fault("m", opts);
          break;
      }

      const std::size_t expected = ordinal(level) >= ordinal(threshold) ? 1u : 0u;
      TEST_EXPECT_EQ(sink.records.size(), expected);
      if (expected == 1u) {
        TEST_EXPECT_EQ(sink.records[0].level, level);
      }
    }
  }
  set_minimum_severity(Severity::trace);
}

void test_log_routes_to_default_sink() {
  auto sink = std::make_shared<RecordingSink>();
  stumper::core::set_default_sink(sink);

  auto facade = make_facade(app_config());
  for (const auto level : kAllSeverities) {
    facade->log("routed", level);
  }

  TEST_EXPECT_EQ(sink->records.size(), kAllSeverities.size());
  for (std::size_t i = 0; i < sink->records.size() && i < kAllSeverities.size(); ++i) {
    TEST_EXPECT_EQ(sink->records[i].level, kAllSeverities[i]);
    TEST_EXPECT_STR_EQ(sink->records[i].text, facade->format(kAllSeverities[i], "routed"));
  }

  // 阈值之下不产生任何写入。
  sink->records.clear();
  set_minimum_severity(Severity::error);
  facade->log("quiet", Severity::warning);
  TEST_EXPECT(sink->records.empty());
  facade->log("loud", Severity::error);
  TEST_EXPECT_EQ(sink->records.size(), 1u);
  set_minimum_severity(Severity::trace);

  stumper::core::set_default_sink(nullptr);
}

void test_per_call_prefix_reaches_sink() {
  auto facade = make_facade(app_config());
  RecordingSink sink;
  facade->info("hello", CallOptions{"Other", "=", &sink});
  TEST_EXPECT_EQ(sink.records.size(), 1u);
  if (!sink.records.empty()) {
    TEST_EXPECT_STR_EQ(sink.records[0].text, "[I] Other= hello");
    TEST_EXPECT_EQ(sink.records[0].level, Severity::info);
  }
}

void test_instance_floor() {
  auto cfg = app_config();
  cfg.minimum_severity = Severity::warning;
  auto facade = make_facade(std::move(cfg));
  RecordingSink sink;
  const CallOptions opts{{}, {}, &sink};

  facade->info("dropped", opts);
  facade->warning("kept", opts);
  TEST_EXPECT_EQ(sink.records.size(), 1u);
}

void test_default_facade() {
  const auto& facade = stumper::core::default_facade();
  TEST_EXPECT_EQ(facade.config().prefix, std::string("stumper"));
  TEST_EXPECT_EQ(facade.config().separator, std::string(":"));
  TEST_EXPECT_EQ(facade.config().brackets, std::string("[]"));
  TEST_EXPECT(!facade.config().use_icons);
  TEST_EXPECT(facade.config().show_level);
  TEST_EXPECT_STR_EQ(facade.format(Severity::info, "hi"), "[I] stumper: hi");
  TEST_EXPECT_EQ(&facade, &stumper::core::default_facade());
}

}  // namespace

int main() {
  test_format_notice_with_initial();
  test_format_without_level();
  test_format_with_icons();
  test_format_overrides_and_passthrough();
  test_invalid_brackets_rejected();
  test_multibyte_brackets_accepted();
  test_brackets_counted_as_visible_characters();
  test_log_forwards_call_options();
  test_threshold_gates_every_severity();
  test_log_routes_to_default_sink();
  test_per_call_prefix_reaches_sink();
  test_instance_floor();
  test_default_facade();
  return ::stumper::tests::run_and_report();
}
