#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sparqlkit {

// Solution modifiers of a query. Every field is optional; an absent field
// is never rendered.
struct QueryOptions {
  std::optional<bool> distinct;
  std::optional<bool> reduced;

  // Variable names without the leading '?'
  std::optional<std::vector<std::string>> order_by;

  std::optional<int64_t> offset;
  std::optional<int64_t> limit;

  [[nodiscard]] bool is_distinct() const { return distinct.value_or(false); }
  [[nodiscard]] bool is_reduced() const { return reduced.value_or(false); }
  [[nodiscard]] bool has_order_by() const {
    return order_by.has_value() && !order_by->empty();
  }
};

// Builder class for QueryOptions
class QueryOptionsBuilder {
 private:
  QueryOptions options;

 public:
  QueryOptionsBuilder() = default;

  QueryOptionsBuilder &with_distinct(bool state = true) {
    options.distinct = state;
    return *this;
  }

  QueryOptionsBuilder &with_reduced(bool state = true) {
    options.reduced = state;
    return *this;
  }

  QueryOptionsBuilder &with_order_by(std::vector<std::string> variables) {
    options.order_by = std::move(variables);
    return *this;
  }

  QueryOptionsBuilder &with_offset(int64_t offset) {
    options.offset = offset;
    return *this;
  }

  QueryOptionsBuilder &with_limit(int64_t limit) {
    options.limit = limit;
    return *this;
  }

  [[nodiscard]] QueryOptions build() const { return options; }
};

inline QueryOptionsBuilder make_options() { return {}; }

}  // namespace sparqlkit

#endif  // CONFIG_HPP
