// D1.2 - JSON object framing test
// Tests: brace tracking across chunks, braces inside strings, escapes,
//        invalid leading bytes, size cap.

#include "lp/protocol/JsonObjectAssembler.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

using State = lp::JsonObjectAssembler::State;

static State feedAll(lp::JsonObjectAssembler& a, const std::string& s) {
  return a.feed(s.data(), s.size());
}

int main() {
  // --- Test 1: whole object in one chunk ---
  {
    lp::JsonObjectAssembler a;
    std::string msg = R"({"command":"clear","params":{}})";
    requireTrue(feedAll(a, msg) == State::Complete, "complete");
    requireTrue(a.text() == msg, "text is the object");
    std::printf("  Single chunk PASS\n");
  }

  // --- Test 2: byte-at-a-time ---
  {
    lp::JsonObjectAssembler a;
    std::string msg = R"(  {"command":"show_symbol","params":{"symbol":"x"}})";
    State st = State::Incomplete;
    for (std::size_t i = 0; i < msg.size(); i++) {
      st = a.feed(&msg[i], 1);
      if (i + 1 < msg.size()) requireTrue(st == State::Incomplete, "incomplete until last byte");
    }
    requireTrue(st == State::Complete, "complete at last byte");
    requireTrue(a.text() == msg.substr(2), "leading whitespace skipped");
    std::printf("  Byte-at-a-time PASS\n");
  }

  // --- Test 3: braces and quotes inside strings ---
  {
    lp::JsonObjectAssembler a;
    std::string msg = R"({"command":"show_single_layout","params":{"project_name":"a}b{\"c\\"}})";
    requireTrue(feedAll(a, msg) == State::Complete, "string contents ignored");
    requireTrue(a.text() == msg, "whole text kept");
    std::printf("  Strings PASS\n");
  }

  // --- Test 4: trailing bytes ignored ---
  {
    lp::JsonObjectAssembler a;
    requireTrue(feedAll(a, R"({"a":[1,{"b":2}]}garbage)") == State::Complete, "complete");
    requireTrue(a.text() == R"({"a":[1,{"b":2}]})", "trailing bytes dropped");
    requireTrue(feedAll(a, "{}") == State::Complete, "state sticks after completion");
    std::printf("  Trailing bytes PASS\n");
  }

  // --- Test 5: invalid starts ---
  {
    lp::JsonObjectAssembler a;
    requireTrue(feedAll(a, "[1,2]") == State::Invalid, "array rejected");
    a.reset();
    requireTrue(feedAll(a, "hello") == State::Invalid, "bare word rejected");
    a.reset();
    requireTrue(feedAll(a, "{\"a\":1]") == State::Invalid || a.state() == State::Incomplete,
                "mismatched bracket not complete");
    std::printf("  Invalid input PASS\n");
  }

  // --- Test 6: size cap ---
  {
    lp::JsonObjectAssembler a(16);
    requireTrue(feedAll(a, R"({"command":"clear","params":{}})") == State::TooLarge,
                "over cap");
    a.reset();
    requireTrue(feedAll(a, "{\"a\":1}") == State::Complete, "under cap after reset");
    std::printf("  Size cap PASS\n");
  }

  std::printf("\nD1.2 frame assembler PASS\n");
  return 0;
}
