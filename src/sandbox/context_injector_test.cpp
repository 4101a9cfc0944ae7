#include "sandbox/context_injector.hpp"

#include <string>
#include "errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::StartsWith;

using runbox::sandbox::ContextInjector;

// Pulls the argument of the loads(...) call back out of a preamble.
std::string ExtractLiteral(const std::string& preamble) {
    const std::string open = "_runbox_json.loads(";
    const auto begin = preamble.find(open) + open.size();
    const auto end = preamble.find(")\n", begin);
    return preamble.substr(begin, end - begin);
}

// NOLINTNEXTLINE
TEST(ContextInjector, EmptyContextLeavesCodeUnchanged) {
    const std::string code = "print('hi')";
    EXPECT_EQ(ContextInjector::Inject(code, nlohmann::json::object()), code);
    EXPECT_EQ(ContextInjector::Inject(code, nullptr), code);
}

// NOLINTNEXTLINE
TEST(ContextInjector, PreambleBindsContextBeforeCode) {
    const std::string code = "print(x)";
    const auto injected = ContextInjector::Inject(code, {{"x", 42}});
    EXPECT_THAT(injected, StartsWith("import json as _runbox_json\n"));
    EXPECT_THAT(injected, HasSubstr("globals().update(_context)\n\n"));
    EXPECT_LT(injected.find("del _runbox_json\n"), injected.find("globals().update(_context)"));
    EXPECT_THAT(injected, EndsWith("\n" + code));
}

// NOLINTNEXTLINE
TEST(ContextInjector, PayloadSurvivesQuotesAndNewlines) {
    const nlohmann::json context = {
        {"msg", "he said \"hi\"\nthen left"},
        {"path", "C:\\temp"},
        {"nested", {{"list", {1, 2.5, nullptr, true}}}},
        {"unicode", "h\xc3\xa9llo"}};
    const auto preamble = ContextInjector::BuildPreamble(context);
    const auto literal = ExtractLiteral(preamble);

    const auto payload = nlohmann::json::parse(literal).get<std::string>();
    EXPECT_EQ(nlohmann::json::parse(payload), context);
}

// NOLINTNEXTLINE
TEST(ContextInjector, NonObjectContextThrows) {
    EXPECT_THROW(ContextInjector::Inject("x", nlohmann::json::array({1, 2})),  // NOLINT
                 runbox::ContextSerializationError);
    EXPECT_THROW(ContextInjector::Inject("x", "just a string"),  // NOLINT
                 runbox::ContextSerializationError);
}

// NOLINTNEXTLINE
TEST(ContextInjector, InvalidUtf8Throws) {
    const nlohmann::json context = {{"bad", std::string("\xff\xfe")}};
    EXPECT_THROW(ContextInjector::Inject("x", context), runbox::ContextSerializationError);  // NOLINT
}

}  // namespace
