#include <drip_json/drip_json.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace drip::json;

static Outcome run(ValueMachine &m, StringView text) {
  Outcome out;
  for (char32_t c : text) {
    out = m.feed(c);
    if (out.is_terminal())
      break;
  }
  return out;
}

static Outcome run(StringView text, ParseOptions options = {}) {
  ValueMachine m(0, options);
  return run(m, text);
}

TEST(ValueMachine, DispatchByFirstCharacter) {
  EXPECT_TRUE(run(U"-1").value().is_number());
  EXPECT_TRUE(run(U"7").value().is_number());
  EXPECT_TRUE(run(U"{}").value().is_object());
  EXPECT_TRUE(run(U"[]").value().is_array());
  EXPECT_TRUE(run(U"\"s\"").value().is_string());
  EXPECT_TRUE(run(U"null").value().is_null());
  EXPECT_TRUE(run(U"false").value().is_bool());
  EXPECT_TRUE(run(U"true").value().is_bool());
}

// null, false and 0 come back as values, distinct from "nothing yet"
TEST(ValueMachine, FalsyValuesAreNotPending) {
  Outcome n = run(U"null");
  ASSERT_TRUE(n.is_done());
  EXPECT_EQ(n.value(), Value(nullptr));

  Outcome f = run(U"false");
  ASSERT_TRUE(f.is_done());
  EXPECT_EQ(f.value(), Value(false));

  Outcome z = run(U"0");
  ASSERT_TRUE(z.is_partial());
  EXPECT_FALSE(z.is_pending());
  EXPECT_EQ(z.value(), Value(0));

  Outcome s = run(U"\"\"");
  ASSERT_TRUE(s.is_done());
  EXPECT_EQ(s.value(), Value(U""));
}

TEST(ValueMachine, FirstCharacterOutcomeForwarded) {
  ValueMachine digit;
  EXPECT_TRUE(digit.feed(U'5').is_partial());

  ValueMachine quote;
  EXPECT_TRUE(quote.feed(U'"').is_pending());

  ValueMachine letter;
  EXPECT_TRUE(letter.feed(U't').is_pending());
}

TEST(ValueMachine, NoMatchingGrammar) {
  for (char32_t c : StringView(U".+x}],: ")) {
    ValueMachine m;
    Outcome out = m.feed(c);
    ASSERT_TRUE(out.is_rejected());
    EXPECT_EQ(out.error(), Error::NoMatchingGrammar);
    EXPECT_EQ(out.character(), c);
  }
}

TEST(ValueMachine, SurvivorErrorsPropagate) {
  EXPECT_EQ(run(U"nul1").error(), Error::UnexpectedCharacter);
  EXPECT_EQ(run(U"fals").error(), Error::Ok); // still pending
  EXPECT_EQ(run(U"01").error(), Error::LeadingZeroViolation);
  EXPECT_EQ(run(U"\"\\x\"").error(), Error::InvalidEscape);
  EXPECT_EQ(run(U"[1,]").error(), Error::TrailingComma);
}

TEST(ValueMachine, TerminalAfterDone) {
  ValueMachine m;
  Outcome out = run(m, U"true");
  ASSERT_TRUE(out.is_done());
  EXPECT_TRUE(m.finished());
  EXPECT_THROW(m.feed(U' '), std::logic_error);
}

TEST(ValueMachine, TerminalAfterRejection) {
  ValueMachine m;
  EXPECT_TRUE(m.feed(U'?').is_rejected());
  EXPECT_THROW(m.feed(U'1'), std::logic_error);
}

TEST(ValueMachine, NestingTooDeepReported) {
  ParseOptions opts;
  opts.max_depth = 0;
  EXPECT_EQ(run(U"[]", opts).error(), Error::NestingTooDeep);
  EXPECT_EQ(run(U"{}", opts).error(), Error::NestingTooDeep);
  EXPECT_TRUE(run(U"\"flat\"", opts).is_done());
}

TEST(ValueMachine, TruncationError) {
  ValueMachine fresh;
  EXPECT_EQ(fresh.truncation_error(), Error::IncompleteInput);

  ValueMachine str;
  run(str, U"{\"key\":\"val");
  EXPECT_EQ(str.truncation_error(), Error::UnterminatedString);

  ValueMachine key;
  run(key, U"[{\"ke");
  EXPECT_EQ(key.truncation_error(), Error::UnterminatedString);

  ValueMachine arr;
  run(arr, U"[1,2");
  EXPECT_EQ(arr.truncation_error(), Error::IncompleteInput);
}

TEST(ValueMachine, DeepNestingWithinLimit) {
  const std::u32string open(200, U'[');
  const std::u32string close(200, U']');
  Outcome out = run(open + close);
  ASSERT_TRUE(out.is_done());

  const Value *v = &out.value();
  int depth = 1;
  while (!v->empty()) {
    v = &(*v)[0];
    ++depth;
  }
  EXPECT_EQ(depth, 200);
}
