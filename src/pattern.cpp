#include "pattern.hpp"

#include <sstream>

namespace sparqlkit {

arrow::Result<Pattern> Pattern::from_terms(const std::vector<Term>& terms) {
  if (terms.size() != ARITY) {
    return arrow::Status::Invalid(
        "Pattern requires exactly 3 terms (subject, predicate, object), got ",
        terms.size());
  }
  return Pattern(terms[0], terms[1], terms[2]);
}

std::vector<std::string> Pattern::variables() const {
  std::vector<std::string> names;
  for (const Term* term : {&subject_, &predicate_, &object_}) {
    if (auto name = variable_name(*term)) {
      names.push_back(std::move(*name));
    }
  }
  return names;
}

std::string Pattern::toString() const {
  std::stringstream ss;
  ss << sparqlkit::toString(subject_) << " " << sparqlkit::toString(predicate_)
     << " " << sparqlkit::toString(object_) << " .";
  return ss.str();
}

}  // namespace sparqlkit
