#ifndef PATTERN_HPP
#define PATTERN_HPP

#include <arrow/result.h>

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "term.hpp"

namespace sparqlkit {

// Triple pattern (subject, predicate, object); any position may be a
// variable.
class Pattern {
 private:
  Term subject_;
  Term predicate_;
  Term object_;

 public:
  static constexpr size_t ARITY = 3;

  Pattern(Term subject, Term predicate, Term object)
      : subject_(std::move(subject)),
        predicate_(std::move(predicate)),
        object_(std::move(object)) {}

  // Builds a pattern from a flat [subject, predicate, object] list.
  static arrow::Result<Pattern> from_terms(const std::vector<Term>& terms);

  [[nodiscard]] const Term& subject() const { return subject_; }
  [[nodiscard]] const Term& predicate() const { return predicate_; }
  [[nodiscard]] const Term& object() const { return object_; }

  // Variable names in subject, predicate, object order. Repeats are kept.
  [[nodiscard]] std::vector<std::string> variables() const;

  // "S P O ."
  [[nodiscard]] std::string toString() const;

  bool operator==(const Pattern& other) const {
    return subject_ == other.subject_ && predicate_ == other.predicate_ &&
           object_ == other.object_;
  }

  friend std::ostream& operator<<(std::ostream& os, const Pattern& pattern) {
    os << pattern.toString();
    return os;
  }
};

}  // namespace sparqlkit

#endif  // PATTERN_HPP
