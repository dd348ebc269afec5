#include <gtest/gtest.h>

#include "Config.h"
#include "LineSource.h"
#include "Prompter.h"
#include "ScriptedSource.h"
#include "Types.h"

#include <cstddef>
#include <future>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using ask::ParseFailure;
using ask::Prompter;
using ask::Request;
using ask::StreamError;
using ask::StreamException;
using ask::test::ScriptedSource;

namespace {

struct Recorder {
  std::vector<ParseFailure> failures;

  ask::ErrorHandler handler() {
    return [this](const ParseFailure &failure) { failures.push_back(failure); };
  }
};

std::vector<std::string> malformedThenValid(std::size_t n,
                                            const std::string &valid) {
  std::vector<std::string> lines(n, "not a number");
  lines.push_back(valid);
  return lines;
}

} // namespace

TEST(PrompterTest, ValidFirstLineNeedsNoRetry) {
  ScriptedSource source{{"42"}};
  std::ostringstream diag;
  Prompter prompter{source, diag};
  Recorder recorder;

  EXPECT_EQ(prompter.request<int>("n: ", recorder.handler()), 42);
  EXPECT_TRUE(recorder.failures.empty());
  EXPECT_EQ(source.consumed(), 1u);
  EXPECT_TRUE(diag.str().empty());
}

TEST(PrompterTest, MalformedLineIsReportedOnceThenRetried) {
  ScriptedSource source{{"abc", "7"}};
  std::ostringstream diag;
  Prompter prompter{source, diag};
  Recorder recorder;

  EXPECT_EQ(prompter.request<int>("n: ", recorder.handler()), 7);
  ASSERT_EQ(recorder.failures.size(), 1u);
  EXPECT_EQ(recorder.failures[0].input, "abc");
  EXPECT_EQ(recorder.failures[0].type, "int");
  EXPECT_FALSE(recorder.failures[0].reason.empty());
}

class UnboundedRetryTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(UnboundedRetryTest, OneHandlerCallPerMalformedLine) {
  auto n = GetParam();
  ScriptedSource source{malformedThenValid(n, "-3")};
  std::ostringstream diag;
  Prompter prompter{source, diag};
  Recorder recorder;

  EXPECT_EQ(prompter.request<long>("n: ", recorder.handler()), -3);
  EXPECT_EQ(recorder.failures.size(), n);
  EXPECT_EQ(source.prompts.size(), n + 1);
}

INSTANTIATE_TEST_SUITE_P(Attempts, UnboundedRetryTest,
                         ::testing::Values(0u, 1u, 100u));

TEST(PrompterTest, EndOfInputIsFatalWithoutHandlerCall) {
  ScriptedSource source{std::vector<std::string>{}};
  std::ostringstream diag;
  Prompter prompter{source, diag};
  Recorder recorder;

  try {
    prompter.request<int>("n: ", recorder.handler());
    FAIL() << "expected a StreamException";
  } catch (const StreamException &ex) {
    EXPECT_EQ(ex.error(), StreamError::EndOfInput);
    EXPECT_STREQ(ex.what(), "end of input");
  }
  EXPECT_TRUE(recorder.failures.empty());
  EXPECT_EQ(source.prompts.size(), 1u);
}

TEST(PrompterTest, IOFailureIsFatal) {
  ScriptedSource source{{"oops"}, StreamError::IOFailure};
  std::ostringstream diag;
  Prompter prompter{source, diag};
  Recorder recorder;

  try {
    prompter.request<int>("n: ", recorder.handler());
    FAIL() << "expected a StreamException";
  } catch (const StreamException &ex) {
    EXPECT_EQ(ex.error(), StreamError::IOFailure);
  }
  EXPECT_EQ(recorder.failures.size(), 1u);
}

TEST(PrompterTest, StreamEndingAfterFailuresStillAborts) {
  ScriptedSource source{{"x", "y"}};
  std::ostringstream diag;
  Prompter prompter{source, diag};

  EXPECT_THROW(prompter.request<double>("d: "), StreamException);
  EXPECT_EQ(source.prompts.size(), 3u);
}

TEST(PrompterTest, SequentialRequestsKeepTheirOrderAndHandlers) {
  ScriptedSource source{{"abc", "5", "xyz", "2.5"}};
  std::ostringstream diag;
  Prompter prompter{source, diag};
  Recorder forInt;
  Recorder forFloat;

  auto [i, f] = prompter.requestAll(Request<int>{"int: ", forInt.handler()},
                                    Request<float>{"float: ",
                                                   forFloat.handler()});

  EXPECT_EQ(i, 5);
  EXPECT_FLOAT_EQ(f, 2.5f);
  ASSERT_EQ(forInt.failures.size(), 1u);
  EXPECT_EQ(forInt.failures[0].input, "abc");
  ASSERT_EQ(forFloat.failures.size(), 1u);
  EXPECT_EQ(forFloat.failures[0].input, "xyz");
  EXPECT_EQ(source.prompts,
            (std::vector<std::string>{"int: ", "int: ", "float: ", "float: "}));
}

TEST(PrompterTest, StreamFailureAbortsTheRestOfTheSequence) {
  ScriptedSource source{{"1"}};
  std::ostringstream diag;
  Prompter prompter{source, diag};
  int first{};
  int second{-1};

  EXPECT_THROW(prompter.read(first, "a: ").read(second, "b: "),
               StreamException);
  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, -1);
}

TEST(PrompterTest, ChainedReadsBindInOrder) {
  ScriptedSource source{{"x", "true", "hello world"}};
  std::ostringstream diag;
  Prompter prompter{source, diag};
  char c{};
  bool b{};
  std::string s;

  prompter.read(c, "c: ").read(b, "b: ").read(s, "s: ");

  EXPECT_EQ(c, 'x');
  EXPECT_TRUE(b);
  EXPECT_EQ(s, "hello world");
}

TEST(PrompterTest, DefaultHandlerNamesInputAndType) {
  ScriptedSource source{{"  4x2 ", "42"}};
  std::ostringstream diag;
  Prompter prompter{source, diag};

  EXPECT_EQ(prompter.request<unsigned>("n: "), 42u);
  EXPECT_EQ(diag.str(),
            "'4x2' is not a valid unsigned (unexpected character 'x'), try "
            "again\n");
}

TEST(PrompterTest, CustomHandlerReplacesDefaultForThatRequestOnly) {
  ScriptedSource source{{"no", "1", "no", "2"}};
  std::ostringstream diag;
  Prompter prompter{source, diag};
  Recorder recorder;

  EXPECT_EQ(prompter.request<int>("n: ", recorder.handler()), 1);
  EXPECT_TRUE(diag.str().empty());
  EXPECT_EQ(recorder.failures.size(), 1u);

  EXPECT_EQ(prompter.request<int>("n: "), 2);
  EXPECT_NE(diag.str().find("'no' is not a valid int"), std::string::npos);
  EXPECT_EQ(recorder.failures.size(), 1u);
}

TEST(PrompterTest, PromptIsShownUnchangedOnEveryAttempt) {
  ScriptedSource source{{"", "a", "3"}};
  std::ostringstream diag;
  Prompter prompter{source, diag};

  EXPECT_EQ(prompter.request<short>("Enter a number> "), 3);
  EXPECT_EQ(source.prompts, std::vector<std::string>(3, "Enter a number> "));
}

TEST(PrompterTest, DecoratedPromptNamesTheType) {
  ScriptedSource source{{"1.5"}};
  std::ostringstream diag;
  Prompter prompter{source, diag, ask::Options{.decorate = true}};
  EXPECT_TRUE(prompter.config().decorate);
  EXPECT_FALSE(prompter.config().trace);

  EXPECT_DOUBLE_EQ(prompter.request<double>("Weight"), 1.5);
  ASSERT_EQ(source.prompts.size(), 1u);
  EXPECT_EQ(source.prompts[0], "Weight (double): ");
}

TEST(PrompterTest, TraceReportsEveryAttempt) {
  ScriptedSource source{{"?", "9"}};
  std::ostringstream diag;
  Prompter prompter{source, diag, ask::Options{.trace = true}};
  Recorder recorder;

  EXPECT_EQ(prompter.request<int>("", recorder.handler()), 9);
  EXPECT_EQ(diag.str(), "REQUEST: int attempt 1\nREQUEST: int attempt 2\n");
}

TEST(PrompterTest, WorksOverStreams) {
  std::istringstream in{"twelve\n12\n"};
  std::ostringstream out;
  std::ostringstream diag;
  ask::StreamLineSource source{in, out};
  Prompter prompter{source, diag};

  EXPECT_EQ(prompter.request<int>("n? "), 12);
  EXPECT_EQ(out.str(), "n? n? ");
  EXPECT_FALSE(diag.str().empty());
  EXPECT_THROW(prompter.request<int>("n? "), StreamException);
}

TEST(PrompterTest, ConcurrentSafeRequestsGetWholeLines) {
  std::istringstream in{"10\n20\n30\n40\n"};
  std::ostringstream out;
  std::ostringstream diag;
  ask::StreamLineSource source{in, out};
  Prompter prompter{source, diag};

  std::vector<std::future<int>> results;
  for (int i = 0; i < 4; ++i) {
    results.push_back(prompter.requestAsync<int>("> "));
  }
  std::set<int> values;
  for (auto &result : results) {
    values.insert(result.get());
  }

  EXPECT_EQ(values, (std::set<int>{10, 20, 30, 40}));
  EXPECT_TRUE(diag.str().empty());
}

TEST(PrompterTest, AsyncRequestDeliversStreamFailure) {
  ScriptedSource source{std::vector<std::string>{}};
  std::ostringstream diag;
  Prompter prompter{source, diag};

  auto result = prompter.requestAsync<int>("n: ");
  EXPECT_THROW(result.get(), StreamException);
}
