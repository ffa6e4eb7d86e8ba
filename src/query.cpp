#include "query.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "logger.hpp"
#include "utils.hpp"

namespace sparqlkit {

namespace {
const ContextLogger& query_logger() {
  static const ContextLogger logger("Query");
  return logger;
}
}  // namespace

std::string to_string(QueryForm form) {
  switch (form) {
    case QueryForm::ASK:
      return "ask";
    case QueryForm::SELECT:
      return "select";
  }
  return "unknown";
}

arrow::Result<QueryForm> parse_query_form(std::string_view text) {
  const std::string name = to_lower(text);
  if (name == "ask") {
    return QueryForm::ASK;
  }
  if (name == "select") {
    return QueryForm::SELECT;
  }
  return arrow::Status::Invalid("Unsupported query form '", std::string(text),
                                "', expected 'ask' or 'select'");
}

Query::Query(QueryForm form, QueryOptions options, const Initializer& init)
    : form_(form), options_(std::move(options)) {
  if (init) {
    init(*this);
  }
}

arrow::Result<Query> Query::make(std::string_view form, QueryOptions options,
                                 const Initializer& init) {
  ARROW_ASSIGN_OR_RAISE(auto parsed, parse_query_form(form));
  return Query(parsed, std::move(options), init);
}

Query select(std::vector<std::string> variables) {
  return select(std::move(variables), QueryOptions{});
}

Query select(std::vector<std::string> variables, QueryOptions options) {
  Query query(QueryForm::SELECT, std::move(options));
  query.select(variables);
  return query;
}

Query& Query::ask() {
  form_ = QueryForm::ASK;
  return *this;
}

Query& Query::select(const std::vector<std::string>& variables) {
  form_ = QueryForm::SELECT;
  variables_.clear();
  for (const auto& name : variables) {
    auto it = std::find_if(variables_.begin(), variables_.end(),
                           [&](const Variable& v) { return v.name == name; });
    if (it == variables_.end()) {
      variables_.emplace_back(name);
    }
  }
  query_logger().debug("projection set to {} variable(s)", variables_.size());
  return *this;
}

Query& Query::where(Pattern pattern) {
  patterns_.push_back(std::move(pattern));
  return *this;
}

Query& Query::where(std::vector<Pattern> patterns) {
  patterns_.reserve(patterns_.size() + patterns.size());
  for (auto& pattern : patterns) {
    patterns_.push_back(std::move(pattern));
  }
  return *this;
}

Query& Query::where_terms(const std::vector<Term>& components) {
  auto pattern = Pattern::from_terms(components);
  if (!pattern.ok()) {
    query_logger().error("where_terms: {}", pattern.status().message());
    throw std::invalid_argument(pattern.status().message());
  }
  return where(pattern.MoveValueUnsafe());
}

Query& Query::order(std::vector<std::string> variables) {
  options_.order_by = std::move(variables);
  return *this;
}

void Query::warn_if_distinct_and_reduced() const {
  if (options_.is_distinct() && options_.is_reduced()) {
    query_logger().warn(
        "both DISTINCT and REDUCED are set; both will be rendered");
  }
}

Query& Query::distinct(bool state) {
  options_.distinct = state;
  warn_if_distinct_and_reduced();
  return *this;
}

Query& Query::reduced(bool state) {
  options_.reduced = state;
  warn_if_distinct_and_reduced();
  return *this;
}

Query& Query::offset(int64_t start) { return slice(start, std::nullopt); }

Query& Query::offset(std::string_view start) {
  const auto coerced = coerce_integer(start);
  if (!coerced.exact) {
    query_logger().warn("offset '{}' is not an integer, using {}", start,
                        coerced.value);
  }
  return slice(coerced.value, std::nullopt);
}

Query& Query::limit(int64_t length) { return slice(std::nullopt, length); }

Query& Query::limit(std::string_view length) {
  const auto coerced = coerce_integer(length);
  if (!coerced.exact) {
    query_logger().warn("limit '{}' is not an integer, using {}", length,
                        coerced.value);
  }
  return slice(std::nullopt, coerced.value);
}

Query& Query::slice(std::optional<int64_t> start,
                    std::optional<int64_t> length) {
  if (start) {
    if (*start < 0) {
      query_logger().warn("negative OFFSET {}", *start);
    }
    options_.offset = *start;
  }
  if (length) {
    if (*length < 0) {
      query_logger().warn("negative LIMIT {}", *length);
    }
    options_.limit = *length;
  }
  return *this;
}

std::string Query::toString() const {
  std::vector<std::string> buffer;
  buffer.push_back(to_upper(sparqlkit::to_string(form_)));

  if (form_ == QueryForm::SELECT) {
    if (options_.is_distinct()) buffer.emplace_back("DISTINCT");
    if (options_.is_reduced()) buffer.emplace_back("REDUCED");
    if (variables_.empty()) {
      buffer.emplace_back("*");
    } else {
      for (const auto& variable : variables_) {
        buffer.push_back(variable.toString());
      }
    }
  }

  buffer.emplace_back("WHERE {");
  for (const auto& pattern : patterns_) {
    buffer.push_back(pattern.toString());
  }
  buffer.emplace_back("}");

  if (options_.has_order_by()) {
    buffer.emplace_back("ORDER BY");
    for (const auto& name : *options_.order_by) {
      buffer.push_back(Variable(name).toString());
    }
  }

  if (options_.offset) {
    buffer.push_back("OFFSET " + std::to_string(*options_.offset));
  }
  if (options_.limit) {
    buffer.push_back("LIMIT " + std::to_string(*options_.limit));
  }

  return join(buffer, " ");
}

std::string Query::inspect() const {
  return spdlog::fmt_lib::format("#<sparqlkit::Query:{}({})>",
                                 static_cast<const void*>(this), toString());
}

void Query::inspect_to_stderr() const { std::cerr << inspect() << std::endl; }

}  // namespace sparqlkit
