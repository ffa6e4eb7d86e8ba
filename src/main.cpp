#include <iostream>
#include <string>

#include "../include/config.hpp"
#include "../include/logger.hpp"
#include "../include/query.hpp"

using namespace sparqlkit;

namespace {
const std::string FOAF = "http://xmlns.com/foaf/0.1/";
const std::string RDF_TYPE = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
}  // namespace

int main() {
  Logger::getInstance().setLevel(LogLevel::DEBUG);

  auto any_person = ask().where(
      {var("person"), iri(RDF_TYPE), iri(FOAF + "Person")});
  log_info(any_person.toString());

  auto names = sparqlkit::select({"name", "mbox"})
                   .distinct()
                   .where({var("person"), iri(FOAF + "name"), var("name")})
                   .where({var("person"), iri(FOAF + "mbox"), var("mbox")})
                   .order({"name"})
                   .offset(20)
                   .limit(10);
  log_info(names.toString());

  auto french = sparqlkit::select({}, make_options().with_limit(5).build())
                    .where({var("s"), iri(FOAF + "name"),
                            literal("Jean", "fr")});
  log_info(french.toString());

  auto typed = Query::make("SELECT", {}, [](Query& q) {
    q.select({"s"}).where({var("s"), var("p"), blank("b0")});
  });
  if (!typed.ok()) {
    log_error(typed.status().ToString());
    return 1;
  }
  typed->inspect_to_stderr();

  return 0;
}
