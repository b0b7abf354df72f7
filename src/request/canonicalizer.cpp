#include <notary/request/canonicalizer.hpp>
#include <notary/schema/transaction_schema.hpp>
#include <notary/schema/transaction_type.hpp>

#include <string>
#include <utility>

namespace notary::request {

canonical_request_t canonicalize(
    const std::string_view identifier,
    const std::string_view dest,
    const notary::validation::valid_payload_t& payload) {
  auto operation = Json::Value{Json::objectValue};
  const auto& fields = payload.fields();
  for (auto it = fields.begin(); it != fields.end(); ++it) {
    operation[it.name()] = *it;
  }
  // The validator rejects payloads that define envelope members, so nothing
  // is overwritten here.
  operation[std::string{notary::schema::kOperationTypeField}] =
      std::string{notary::schema::to_code(payload.type())};
  operation[std::string{notary::schema::kOperationDestField}] =
      std::string{dest};

  return canonical_request_t{.identifier = std::string{identifier},
                             .operation = std::move(operation)};
}

}  // namespace notary::request
