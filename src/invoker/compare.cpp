#include <invoker/compare.h>

#include <cmath>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace {

class Comparer {
  std::istringstream ans_, usr_;
  std::stringstream message_;

  void EOFMessage_(bool ans_eof, size_t line, size_t user_lines) {
    if (ans_eof) message_ << "Unexpected line " << line;
    else message_ << "Unexpected EOF after line " << user_lines;
  }

  void DifferMessage_(const std::string& ans, const std::string& usr) {
    size_t pos = 0;
    for (; pos < ans.size() && pos < usr.size() && ans[pos] == usr[pos]; pos++);
    auto excerpt = [&](const std::string& str) {
      if (pos <= 40 || str.size() <= 80) {
        message_ << str;
      } else {
        message_ << "..." << str.substr(pos - 40, 80);
        if (str.size() > pos + 40) message_ << "...";
      }
    };
    message_ << "Expected: ";
    excerpt(ans);
    message_ << "\nGot: ";
    excerpt(usr);
  }

  // consume the rest of both streams; true if only whitespace is left
  bool TailEmpty_(const char* whites, size_t line, size_t user_lines) {
    while (!ans_.eof() || !usr_.eof()) {
      std::string s;
      if (!ans_.eof()) {
        getline(ans_, s);
      } else {
        getline(usr_, s);
      }
      if (s.find_last_not_of(whites) != std::string::npos) {
        EOFMessage_(ans_.eof(), line, user_lines);
        return false;
      }
      line++;
    }
    return true;
  }
 public:
  Comparer(const std::string& ans, const std::string& usr) : ans_(ans), usr_(usr) {}

  std::string Message() const { return message_.str(); }

  bool Strict() {
    const std::string& ans = ans_.str();
    const std::string& usr = usr_.str();
    if (ans.size() != usr.size()) {
      message_ << "Length differ: expected " << ans.size() << " bytes, got " << usr.size() << " bytes";
      return false;
    }
    auto diff = std::mismatch(ans.begin(), ans.end(), usr.begin());
    if (diff.first == ans.end()) return true;
    message_ << "Byte " << (diff.first - ans.begin()) << " differ: expected 0x"
        << std::hex << std::setfill('0') << std::setw(2) << (uint32_t)(uint8_t)*diff.first << ", got 0x"
        << std::setw(2) << (uint32_t)(uint8_t)*diff.second;
    return false;
  }

  // trailing whitespace of each line and trailing empty lines are ignored
  bool Line() {
    constexpr char kWhites[] = " \n\r\t";
    size_t line = 1;
    for (; ans_.eof() == usr_.eof(); line++) {
      if (ans_.eof()) return true;
      std::string s, t;
      getline(ans_, s);
      getline(usr_, t);
      // std::string::npos + 1 == 0
      s.erase(s.find_last_not_of(kWhites) + 1);
      t.erase(t.find_last_not_of(kWhites) + 1);
      if (s != t) {
        message_ << "Line " << line << " differ.\n";
        DifferMessage_(s, t);
        return false;
      }
    }
    return TailEmpty_(kWhites, line, line - 1);
  }

  // lines are split into words; func decides whether two words match
  template <class Func> bool Word(Func&& func) {
    constexpr char kWhites[] = " \n\r\t\x0b\x0c";
    size_t line = 1;
    for (; ans_.eof() == usr_.eof(); line++) {
      if (ans_.eof()) return true;
      std::string s, t;
      getline(ans_, s);
      getline(usr_, t);
      for (size_t i1 = 0, i2 = 0, word = 1;; word++) {
        i1 = s.find_first_not_of(kWhites, i1);
        i2 = t.find_first_not_of(kWhites, i2);
        if ((i1 == std::string::npos) != (i2 == std::string::npos)) {
          if (i1 == std::string::npos) message_ << "Unexpected word: line " << line << ", word " << word;
          else message_ << "Unexpected EOL after line " << line << ", word " << word - 1;
          return false;
        }
        if (i1 == std::string::npos) break;
        size_t j1 = std::min(s.find_first_of(kWhites, i1), s.size());
        size_t j2 = std::min(t.find_first_of(kWhites, i2), t.size());
        std::string a = s.substr(i1, j1 - i1), b = t.substr(i2, j2 - i2);
        if (!func(a, b)) {
          message_ << "Line " << line << ", word " << word << " differ.\n";
          DifferMessage_(a, b);
          return false;
        }
        i1 = j1, i2 = j2;
      }
    }
    return TailEmpty_(kWhites, line, line - 1);
  }
};

// false if str is not entirely a number
bool ParseNumber(const std::string& str, long double& val) {
  std::istringstream in(str);
  in.imbue(std::locale::classic());
  in >> val;
  return !in.fail() && in.eof();
}

template <class Func> auto FloatCheck(Func&& func) {
  return [func](const std::string& ans, const std::string& usr) {
    // integers in the answer are compared exactly
    if (ans.find_first_of(".eE") == std::string::npos) return ans == usr;
    long double fans, fusr;
    if (!ParseNumber(ans, fans) || !ParseNumber(usr, fusr)) return ans == usr;
    return func(fans, fusr);
  };
}

} // namespace

bool CompareOutput(const std::string& output, const std::string& answer,
                   CompareMode mode, double threshold, std::string* message) {
  Comparer cmp(answer, output);
  long double eps = threshold;
  bool res = false;
  switch (mode) {
    case CompareMode::STRICT:
      res = cmp.Strict();
      break;
    case CompareMode::LINE:
      res = cmp.Line();
      break;
    case CompareMode::WHITE_DIFF:
      res = cmp.Word([](const std::string& ans, const std::string& usr) { return ans == usr; });
      break;
    case CompareMode::FLOAT_ABSOLUTE:
      res = cmp.Word(FloatCheck([&](long double ans, long double usr) {
        return std::fabs(ans - usr) <= eps;
      }));
      break;
    case CompareMode::FLOAT_RELATIVE:
      res = cmp.Word(FloatCheck([&](long double ans, long double usr) {
        return std::fabs(ans - usr) <= eps * std::fabs(ans);
      }));
      break;
    case CompareMode::FLOAT_ABSOLUTE_RELATIVE:
      res = cmp.Word(FloatCheck([&](long double ans, long double usr) {
        return std::fabs(ans - usr) <= eps * std::max(1.0L, std::fabs(ans));
      }));
      break;
  }
  if (!res && message) *message = cmp.Message();
  return res;
}
