#ifndef TERM_HPP
#define TERM_HPP

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace sparqlkit {

// Named placeholder, rendered as "?name"
struct Variable {
  std::string name;  // without the '?' prefix

  Variable() = default;
  explicit Variable(std::string n) : name(std::move(n)) {}

  [[nodiscard]] std::string toString() const { return "?" + name; }
  bool operator==(const Variable& other) const { return name == other.name; }
};

// Absolute IRI, rendered as "<iri>"
struct IRI {
  std::string iri;

  IRI() = default;
  explicit IRI(std::string i) : iri(std::move(i)) {}

  [[nodiscard]] std::string toString() const { return "<" + iri + ">"; }
  bool operator==(const IRI& other) const { return iri == other.iri; }
};

/**
 * @brief RDF literal
 *
 * Renders as a quoted lexical form followed by "@lang" when a language tag
 * is set, otherwise by "^^<datatype>" when a datatype is set:
 *   "Alice"  "chat"@fr  "42"^^<http://www.w3.org/2001/XMLSchema#integer>
 */
struct Literal {
  std::string value;
  std::string language;
  std::string datatype;

  Literal() = default;
  explicit Literal(std::string v, std::string lang = "", std::string dt = "")
      : value(std::move(v)), language(std::move(lang)), datatype(std::move(dt)) {}

  [[nodiscard]] std::string toString() const;
  bool operator==(const Literal& other) const {
    return value == other.value && language == other.language &&
           datatype == other.datatype;
  }
};

// Blank node label, rendered as "_:id"
struct BlankNode {
  std::string id;

  BlankNode() = default;
  explicit BlankNode(std::string i) : id(std::move(i)) {}

  [[nodiscard]] std::string toString() const { return "_:" + id; }
  bool operator==(const BlankNode& other) const { return id == other.id; }
};

using Term = std::variant<Variable, IRI, Literal, BlankNode>;

std::string toString(const Term& term);

// Name of the variable when the term is one
std::optional<std::string> variable_name(const Term& term);

inline Term var(std::string name) { return Variable(std::move(name)); }
inline Term iri(std::string value) { return IRI(std::move(value)); }
inline Term literal(std::string value, std::string language = "",
                    std::string datatype = "") {
  return Literal(std::move(value), std::move(language), std::move(datatype));
}
inline Term blank(std::string id) { return BlankNode(std::move(id)); }

std::ostream& operator<<(std::ostream& os, const Term& term);

// Escapes '"', '\\', '\n', '\r' and '\t' for a double-quoted SPARQL string
std::string escape_string_literal(const std::string& value);

}  // namespace sparqlkit

#endif  // TERM_HPP
