#include <boost/program_options.hpp>
#include <notary/common/critical.hpp>
#include <notary/encoding/json.hpp>
#include <notary/request/builder.hpp>
#include <notary/schema/registry.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <variant>

namespace {

namespace po = boost::program_options;

void configure_logging(const std::string& level) {
  // stdout carries the request, so logs go to stderr.
  auto logger = spdlog::stderr_color_mt("request_builder");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    notary::common::critical("unknown log level '{}'", level);
  }
  spdlog::set_level(parsed);
}

std::string get_required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    notary::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

std::string read_file(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    notary::common::critical("unable to open data file '{}'", path);
  }
  auto buffer = std::ostringstream{};
  buffer << input.rdbuf();
  return buffer.str();
}

std::string load_payload(const po::variables_map& vm) {
  if (vm.contains("data") && vm.contains("data-file")) {
    notary::common::critical("--data and --data-file are mutually exclusive");
  }
  if (vm.contains("data-file")) {
    return read_file(vm["data-file"].as<std::string>());
  }
  return get_required(vm, "data");
}

Json::Value describe_schema(
    const notary::schema::transaction_schema_t& schema) {
  auto root = Json::Value{Json::objectValue};
  root["name"] = std::string{schema.name()};
  root["code"] = std::string{schema.code()};

  auto fields = Json::Value{Json::arrayValue};
  for (const auto& field : schema.fields) {
    auto entry = Json::Value{Json::objectValue};
    entry["name"] = std::string{field.name};
    entry["required"] = field.required;
    entry["kind"] = std::string{notary::schema::to_string(field.kind)};
    if (field.kind == notary::schema::field_kind_t::string ||
        field.kind == notary::schema::field_kind_t::list) {
      entry["format"] = std::string{notary::schema::to_string(field.format)};
    }
    if (field.kind == notary::schema::field_kind_t::integer) {
      entry["minimum"] = static_cast<Json::Int64>(field.minimum);
      entry["maximum"] = static_cast<Json::Int64>(field.maximum);
    }
    if (!field.allowed.empty()) {
      auto allowed = Json::Value{Json::arrayValue};
      for (const auto value : field.allowed) {
        allowed.append(std::string{value});
      }
      entry["allowed"] = std::move(allowed);
    }
    if (field.nullable) {
      entry["nullable"] = true;
    }
    fields.append(std::move(entry));
  }
  root["fields"] = std::move(fields);
  return root;
}

const notary::schema::transaction_schema_t& resolve_schema(
    const po::variables_map& vm) {
  auto type = get_required(vm, "type");
  auto schema = notary::schema::try_schema_for(type);
  if (!schema) {
    notary::common::critical("unknown transaction type '{}'", type);
  }
  return schema->get();
}

int run_build(const po::variables_map& vm) {
  auto result = notary::request::build_request_from_json(
      get_required(vm, "type"), get_required(vm, "identifier"),
      get_required(vm, "dest"), load_payload(vm));

  return std::visit(
      overloaded{[&](const notary::request::canonical_request_t& request) {
                   if (vm.contains("pretty")) {
                     std::cout << notary::encoding::json::write_pretty(
                                      notary::request::to_json(request))
                               << '\n';
                   } else {
                     std::cout << notary::request::serialize(request) << '\n';
                   }
                   return 0;
                 },
                 [](const notary::request::request_error_t& error) {
                   std::cerr << notary::encoding::json::write_canonical(
                                    notary::request::to_json(error))
                             << '\n';
                   return static_cast<int>(error.code);
                 }},
      result);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  request_builder build --type <NAME|CODE> --identifier <DID> "
               "--dest <DID> (--data <JSON> | --data-file <path>)\n"
            << "  request_builder describe --type <NAME|CODE>\n"
            << "  request_builder types\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto log_level = std::string{};
  auto options = po::options_description{"request_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "build|describe|types")(
      "type,t", po::value<std::string>(), "transaction type name or code")(
      "identifier,i", po::value<std::string>(), "submitter DID")(
      "dest,d", po::value<std::string>(), "target DID")(
      "data", po::value<std::string>(), "payload JSON object")(
      "data-file", po::value<std::string>(), "file holding the payload JSON")(
      "pretty", "indent the request instead of printing canonical form")(
      "log-level", po::value<std::string>(&log_level)->default_value("warn"),
      "trace|debug|info|warn|err|critical|off");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  configure_logging(log_level);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "build") {
    return run_build(vm);
  }

  if (command == "describe") {
    std::cout << notary::encoding::json::write_pretty(
                     describe_schema(resolve_schema(vm)))
              << '\n';
    return 0;
  }

  if (command == "types") {
    for (const auto type : notary::schema::supported_types()) {
      std::cout << notary::schema::to_string(type) << ' '
                << notary::schema::to_code(type) << '\n';
    }
    return 0;
  }

  notary::common::critical("command must be build|describe|types");
}
