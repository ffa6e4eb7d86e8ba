#include "term.hpp"

#include <sstream>

namespace sparqlkit {

std::string escape_string_literal(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string Literal::toString() const {
  std::stringstream ss;
  ss << "\"" << escape_string_literal(value) << "\"";
  if (!language.empty()) {
    ss << "@" << language;
  } else if (!datatype.empty()) {
    ss << "^^<" << datatype << ">";
  }
  return ss.str();
}

std::string toString(const Term& term) {
  return std::visit([](const auto& t) { return t.toString(); }, term);
}

std::optional<std::string> variable_name(const Term& term) {
  if (const auto* v = std::get_if<Variable>(&term)) {
    return v->name;
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Term& term) {
  os << toString(term);
  return os;
}

}  // namespace sparqlkit
