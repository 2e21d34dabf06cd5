#include <array>
#include <gtest/gtest.h>
#include <invoker/utils.h>
#include <invoker/compare.h>

namespace {

// {program output, expected answer}
const std::pair<std::string, std::string> kCases[] = {
  {"123\n234\n", "123\n234\n"}, // match: AC for all
  {"123\n234", "123 \n234 \n\n"}, // trailing whitespaces / blank lines: AC except strict
  {" 123 234\n", "123 234\n"}, // preceding whitespaces: AC for white-diff/float
  {"123  234\n", "123 234\n"}, // additional whitespaces: AC for white-diff/float
  {" 1.0000001  1.0000001 ", "1.0 1.0\n"}, // AC for float >1e-7
  {" 1.0000001  1.0000001 \n a 1.0000001 -1", "1.0 1.0\na 1.0 -1\n"}, // AC for float >1e-7
  {" 1.00001  1.00001 ", "1.0 1.0\n"}, // AC for float >1e-5
  {" 100.00001  100.00001 ", "100.0 100.0\n"}, // AC for float (absolute>1e-5) (absolute-relative/relative>1e-7)
  {" 100.00001 0.0100001\n", "100.0 0.01\n"}, // AC for float (absolute-relative>1e-7) (absolute/relative>1e-5)
  {"1.0000001  1.0000001\n", "1.0 1\n"}, // unmatched on non-float: WA for all
};

struct CompareParam {
  CompareMode mode;
  double threshold;
  std::array<bool, 10> accepted;
};

std::string ParamName(const ::testing::TestParamInfo<CompareParam>& info) {
  std::string ret = CompareModeName(info.param.mode);
  for (auto& i : ret) {
    if (i == '-') i = '_';
  }
  if (info.param.threshold != 1e-6) ret += "_" + std::to_string(info.index);
  return ret;
}

} // namespace

class CompareOutputTest : public testing::TestWithParam<CompareParam> {};
TEST_P(CompareOutputTest, Mode) {
  auto& param = GetParam();
  for (size_t i = 0; i < std::size(kCases); i++) {
    std::string message;
    bool res = CompareOutput(kCases[i].first, kCases[i].second, param.mode, param.threshold, &message);
    EXPECT_EQ(res, param.accepted[i]) << "Case " << i << ": " << message;
    if (!res) EXPECT_FALSE(message.empty()) << "Case " << i;
  }
}

constexpr bool AC = true;
constexpr bool WA = false;

INSTANTIATE_TEST_SUITE_P(Modes, CompareOutputTest,
    testing::Values(
      (CompareParam){CompareMode::STRICT, 1e-6,
        {{AC, WA, WA, WA, WA, WA, WA, WA, WA, WA}}},
      (CompareParam){CompareMode::LINE, 1e-6,
        {{AC, AC, WA, WA, WA, WA, WA, WA, WA, WA}}},
      (CompareParam){CompareMode::WHITE_DIFF, 1e-6,
        {{AC, AC, AC, AC, WA, WA, WA, WA, WA, WA}}},
      (CompareParam){CompareMode::FLOAT_ABSOLUTE_RELATIVE, 1e-9,
        {{AC, AC, AC, AC, WA, WA, WA, WA, WA, WA}}},
      (CompareParam){CompareMode::FLOAT_ABSOLUTE, 1e-6,
        {{AC, AC, AC, AC, AC, AC, WA, WA, WA, WA}}},
      (CompareParam){CompareMode::FLOAT_RELATIVE, 1e-6,
        {{AC, AC, AC, AC, AC, AC, WA, AC, WA, WA}}},
      (CompareParam){CompareMode::FLOAT_ABSOLUTE_RELATIVE, 1e-6,
        {{AC, AC, AC, AC, AC, AC, WA, AC, AC, WA}}},
      (CompareParam){CompareMode::FLOAT_RELATIVE, 1e-4,
        {{AC, AC, AC, AC, AC, AC, AC, AC, AC, WA}}}
    ),
    ParamName);

TEST(CompareOutput, DifferenceMessage) {
  std::string message;
  EXPECT_FALSE(CompareOutput("1\n3\n", "1\n2\n", CompareMode::LINE, 1e-6, &message));
  EXPECT_EQ(message, "Line 2 differ.\nExpected: 2\nGot: 3");
  EXPECT_FALSE(CompareOutput("ab", "abc", CompareMode::STRICT, 1e-6, &message));
  EXPECT_EQ(message, "Length differ: expected 3 bytes, got 2 bytes");
  EXPECT_FALSE(CompareOutput("1\n", "1\n2\n", CompareMode::WHITE_DIFF, 1e-6, &message));
  EXPECT_EQ(message, "Unexpected EOL after line 2, word 0");
}

TEST(CompareOutput, EmptyOutput) {
  EXPECT_TRUE(CompareOutput("", "", CompareMode::LINE));
  EXPECT_TRUE(CompareOutput("\n\n", "", CompareMode::LINE));
  EXPECT_FALSE(CompareOutput("", "1\n", CompareMode::LINE));
  EXPECT_FALSE(CompareOutput("", "1\n", CompareMode::FLOAT_ABSOLUTE));
}
