#include "term.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace sparqlkit {

TEST(TermTest, VariableRendersWithQuestionMark) {
  EXPECT_EQ(Variable("name").toString(), "?name");
  EXPECT_EQ(toString(var("s")), "?s");
}

TEST(TermTest, IriRendersInAngleBrackets) {
  EXPECT_EQ(toString(iri("http://xmlns.com/foaf/0.1/name")),
            "<http://xmlns.com/foaf/0.1/name>");
}

TEST(TermTest, BlankNodeRendersWithPrefix) {
  EXPECT_EQ(toString(blank("b1")), "_:b1");
}

TEST(TermTest, PlainLiteral) {
  EXPECT_EQ(toString(literal("Alice")), "\"Alice\"");
}

TEST(TermTest, LanguageTaggedLiteral) {
  EXPECT_EQ(toString(literal("chat", "fr")), "\"chat\"@fr");
}

TEST(TermTest, TypedLiteral) {
  EXPECT_EQ(
      toString(literal("42", "", "http://www.w3.org/2001/XMLSchema#integer")),
      "\"42\"^^<http://www.w3.org/2001/XMLSchema#integer>");
}

TEST(TermTest, LanguageTagWinsOverDatatype) {
  // a literal cannot carry both; the tag is rendered
  EXPECT_EQ(toString(literal("x", "en", "http://example.org/dt")), "\"x\"@en");
}

TEST(TermTest, LiteralEscaping) {
  EXPECT_EQ(toString(literal("say \"hi\"\n")), "\"say \\\"hi\\\"\\n\"");
  EXPECT_EQ(escape_string_literal("a\\b\tc\r"), "a\\\\b\\tc\\r");
  EXPECT_EQ(escape_string_literal("plain"), "plain");
}

TEST(TermTest, VariableName) {
  EXPECT_EQ(variable_name(var("x")), "x");
  EXPECT_FALSE(variable_name(iri("http://example.org/")).has_value());
  EXPECT_FALSE(variable_name(literal("x")).has_value());
}

TEST(TermTest, StreamOperator) {
  std::stringstream ss;
  ss << var("o") << " " << blank("z");
  EXPECT_EQ(ss.str(), "?o _:z");
}

TEST(TermTest, Equality) {
  EXPECT_EQ(var("a"), var("a"));
  EXPECT_NE(var("a"), var("b"));
  EXPECT_NE(var("a"), blank("a"));
  EXPECT_NE(literal("a", "en"), literal("a", "fr"));
}

}  // namespace sparqlkit
