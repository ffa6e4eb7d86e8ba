#ifndef QUERY_HPP
#define QUERY_HPP

#include <arrow/result.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hpp"
#include "pattern.hpp"
#include "term.hpp"

namespace sparqlkit {

// See http://www.w3.org/TR/rdf-sparql-query/#QueryForms
enum class QueryForm { ASK, SELECT };

std::string to_string(QueryForm form);

// Case-insensitive; "ask" and "select" are the only accepted names.
arrow::Result<QueryForm> parse_query_form(std::string_view text);

/**
 * @brief ASK / SELECT query builder
 *
 * Every mutator changes this instance and returns it, so calls chain:
 *
 *   auto q = select({"name"})
 *                .where({var("x"), var("name"), var("name")})
 *                .order({"name"})
 *                .limit(10);
 *   q.toString();
 *   // SELECT ?name WHERE { ?x ?name ?name . } ORDER BY ?name LIMIT 10
 *
 * Copy the query to branch into independent variants.
 */
class Query {
 private:
  QueryForm form_;
  std::vector<Variable> variables_;
  std::vector<Pattern> patterns_;
  QueryOptions options_;

  void warn_if_distinct_and_reduced() const;

 public:
  using Initializer = std::function<void(Query&)>;

  explicit Query(QueryForm form = QueryForm::ASK, QueryOptions options = {},
                 const Initializer& init = nullptr);

  // Form given as text ("ask", "SELECT", ...).
  static arrow::Result<Query> make(std::string_view form,
                                   QueryOptions options = {},
                                   const Initializer& init = nullptr);

  [[nodiscard]] QueryForm form() const { return form_; }
  [[nodiscard]] const std::vector<Variable>& variables() const {
    return variables_;
  }
  [[nodiscard]] const std::vector<Pattern>& patterns() const {
    return patterns_;
  }
  [[nodiscard]] const QueryOptions& options() const { return options_; }

  Query& ask();

  // Replaces the projection. An empty list projects "*".
  Query& select(const std::vector<std::string>& variables);

  Query& where(Pattern pattern);
  Query& where(std::vector<Pattern> patterns);

  // Throws std::invalid_argument unless `components` holds exactly a
  // subject, a predicate and an object.
  Query& where_terms(const std::vector<Term>& components);

  Query& order(std::vector<std::string> variables);
  Query& order_by(std::vector<std::string> variables) {
    return order(std::move(variables));
  }

  Query& distinct(bool state = true);
  Query& reduced(bool state = true);

  Query& offset(int64_t start);
  Query& offset(std::string_view start);
  Query& limit(int64_t length);
  Query& limit(std::string_view length);

  // Absent arguments leave the current offset / limit as they are.
  Query& slice(std::optional<int64_t> start, std::optional<int64_t> length);

  [[nodiscard]] std::string toString() const;

  // "#<sparqlkit::Query:0x...(ASK WHERE { ... })>"
  [[nodiscard]] std::string inspect() const;
  void inspect_to_stderr() const;

  friend std::ostream& operator<<(std::ostream& os, const Query& query) {
    os << query.toString();
    return os;
  }
};

inline Query ask(QueryOptions options = {}) {
  return Query(QueryForm::ASK, std::move(options));
}

Query select(std::vector<std::string> variables = {});
Query select(std::vector<std::string> variables, QueryOptions options);

}  // namespace sparqlkit

#endif  // QUERY_HPP
