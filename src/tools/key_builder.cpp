#include <boost/program_options.hpp>
#include <lexkey/conversion/engine.hpp>
#include <lexkey/index/compiler.hpp>
#include <lexkey/index/render.hpp>
#include <lexkey/pattern/pattern_spec.hpp>
#include <lexkey/schema/primitives.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

namespace po = boost::program_options;

constexpr auto kDefaultFieldType = std::string_view{"string"};

void configure_logging(const bool verbose) {
  auto logger = spdlog::stderr_color_mt("key_builder");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  lexkey_key_builder --pattern 'ORDER#{tenant}#{id:%020d}' "
               "--field id=int64 --value tenant=acme --value id=42\n"
            << "  lexkey_key_builder --pattern '{ts:utc:rfc3339fixed}' "
               "--field ts=time.Time --sort-key --describe\n\n"
            << "Fields without --field are strings. Timestamp values are "
               "unix nanoseconds with an\noptional offset: "
               "1700000000000000000@+05:30.\n\n";
  std::cout << options << '\n';
}

std::optional<std::pair<std::string, std::string>> split_assignment(
    const std::string_view assignment) {
  auto separator = assignment.find('=');
  if (separator == std::string_view::npos || separator == 0) {
    return std::nullopt;
  }
  return std::pair{std::string{assignment.substr(0, separator)},
                   std::string{assignment.substr(separator + 1)}};
}

template <typename T>
std::optional<T> parse_number(const std::string_view text) {
  auto value = T{};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

// "<unix nanos>[@+HH:MM]"
std::optional<lexkey::schema::timestamp_t> parse_timestamp(
    const std::string_view text) {
  auto at = text.find('@');
  auto nanos = parse_number<int64_t>(text.substr(0, at));
  if (!nanos) {
    return std::nullopt;
  }
  auto timestamp = lexkey::schema::timestamp_t{.unix_nanos = *nanos};
  if (at == std::string_view::npos) {
    return timestamp;
  }
  auto offset = text.substr(at + 1);
  if (offset.size() != 6 || (offset[0] != '+' && offset[0] != '-') ||
      offset[3] != ':') {
    return std::nullopt;
  }
  auto hours = parse_number<int32_t>(offset.substr(1, 2));
  auto minutes = parse_number<int32_t>(offset.substr(4, 2));
  if (!hours || !minutes) {
    return std::nullopt;
  }
  auto seconds = (*hours * 60 + *minutes) * 60;
  timestamp.offset_seconds = offset[0] == '-' ? -seconds : seconds;
  return timestamp;
}

std::optional<lexkey::schema::field_value_t> parse_value(
    const std::string_view text,
    const lexkey::schema::semantic_type_t type) {
  switch (type) {
    case lexkey::schema::semantic_type_t::signed_integer:
      if (auto value = parse_number<int64_t>(text)) {
        return *value;
      }
      return std::nullopt;
    case lexkey::schema::semantic_type_t::unsigned_integer:
      if (auto value = parse_number<uint64_t>(text)) {
        return *value;
      }
      return std::nullopt;
    case lexkey::schema::semantic_type_t::floating_point:
      if (auto value = parse_number<double>(text)) {
        return *value;
      }
      return std::nullopt;
    case lexkey::schema::semantic_type_t::temporal:
      if (auto value = parse_timestamp(text)) {
        return *value;
      }
      return std::nullopt;
    default:
      return std::string{text};
  }
}

std::string describe(const lexkey::conversion::conversion_descriptor_t&
                         descriptor) {
  auto text = std::string{to_string(descriptor.expression.transform)};
  if (descriptor.expression.utc_normalize) {
    text += " utc";
  }
  if (descriptor.expression.format) {
    text += " " + *descriptor.expression.format;
  }
  return text;
}

std::string display(const lexkey::schema::attribute_value_t& value) {
  return std::visit(
      overloaded{[](const lexkey::schema::string_attribute_t& text) {
                   return text.value;
                 },
                 [](const lexkey::schema::number_attribute_t& number) {
                   return number.value;
                 },
                 [](const lexkey::schema::binary_attribute_t& bytes) {
                   return lexkey::schema::to_base64(
                       lexkey::schema::make_bytes_view(bytes.value));
                 },
                 [](const auto&) { return std::string{}; }},
      value.value);
}

}  // namespace

int main(int argc, const char** argv) {
  auto raw_pattern = std::string{};
  auto kind_name = std::string{};
  auto entity_label = std::string{};
  auto options = po::options_description{"lexkey_key_builder options"};
  options.add_options()("help,h", "show help")(
      "pattern,p", po::value<std::string>(&raw_pattern), "key pattern")(
      "kind,k", po::value<std::string>(&kind_name)->default_value("S"),
      "key attribute kind S|N|B")(
      "field,f", po::value<std::vector<std::string>>()->composing(),
      "field type, path=type (e.g. id=int64, ts=time.Time)")(
      "value", po::value<std::vector<std::string>>()->composing(),
      "field value, path=value")("sort-key", po::bool_switch(),
                                 "check the pattern for sort safety")(
      "entity,e", po::value<std::string>(&entity_label)->default_value("Entity"),
      "entity label used in diagnostics")(
      "describe", po::bool_switch(),
      "print the conversion chosen for each field reference")(
      "verbose,v", po::bool_switch(), "enable debug logging");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }
  configure_logging(vm["verbose"].as<bool>());

  if (vm.contains("help") || raw_pattern.empty()) {
    print_help(options);
    return vm.contains("help") ? 0 : 1;
  }

  auto kind = lexkey::common::try_from_string<lexkey::schema::attribute_kind_t>(
      kind_name);
  if (!kind) {
    spdlog::error("--kind must be S, N or B, got \"{}\"", kind_name);
    return 1;
  }

  auto parsed = lexkey::pattern::parse(raw_pattern, *kind);
  if (!lexkey::schema::is_ok(parsed)) {
    const auto& error = lexkey::schema::error_of(parsed);
    spdlog::error("invalid pattern ({}): {}", to_string(error.code),
                  error.message);
    return 1;
  }
  const auto& spec = lexkey::schema::value_of(parsed);

  auto field_types = lexkey::schema::field_type_table_t{};
  if (vm.contains("field")) {
    for (const auto& assignment : vm["field"].as<std::vector<std::string>>()) {
      auto field = split_assignment(assignment);
      if (!field) {
        spdlog::error("--field expects path=type, got \"{}\"", assignment);
        return 1;
      }
      field_types.insert_or_assign(field->first, field->second);
    }
  }
  for (const auto& path : spec.field_paths()) {
    if (!field_types.contains(path)) {
      field_types.emplace(path, kDefaultFieldType);
    }
  }

  auto key = lexkey::index::key_def_t{.name = "key", .kind = *kind};
  auto value_def = lexkey::index::val_def_t{
      .source = lexkey::index::format_source_t{spec}};
  auto diagnostics = std::vector<lexkey::sortability::diagnostic_t>{};
  auto compiled =
      lexkey::index::compile_key(key, value_def, field_types, entity_label,
                                 vm["sort-key"].as<bool>(), diagnostics);
  if (!lexkey::schema::is_ok(compiled)) {
    const auto& error = lexkey::schema::error_of(compiled);
    spdlog::error("cannot compile pattern ({}): {}", to_string(error.code),
                  error.message);
    return 1;
  }
  for (const auto& diagnostic : diagnostics) {
    spdlog::warn("{}", diagnostic.message());
  }
  const auto& compiled_key = lexkey::schema::value_of(compiled);
  spdlog::debug("compiled \"{}\": {} parts, prefix \"{}\"", spec.raw(),
                compiled_key.parts.size(), compiled_key.literal_prefix);

  if (vm["describe"].as<bool>()) {
    for (const auto& part : compiled_key.parts) {
      if (const auto* parameter =
              std::get_if<lexkey::index::parameter_part_t>(&part)) {
        std::cout << parameter->ref.path << '\t'
                  << field_types.find(parameter->ref.path)->second << '\t'
                  << describe(parameter->entity_side) << '\n';
      }
    }
  }

  auto values = lexkey::schema::field_values_t{};
  if (vm.contains("value")) {
    for (const auto& assignment : vm["value"].as<std::vector<std::string>>()) {
      auto field = split_assignment(assignment);
      if (!field) {
        spdlog::error("--value expects path=value, got \"{}\"", assignment);
        return 1;
      }
      auto type = field_types.find(field->first);
      auto semantic = type == std::end(field_types)
                          ? lexkey::schema::semantic_type_t::text
                          : lexkey::schema::classify(type->second);
      auto value = parse_value(field->second, semantic);
      if (!value) {
        spdlog::error("value \"{}\" for {} is not a valid {}", field->second,
                      field->first, to_string(semantic));
        return 1;
      }
      values.insert_or_assign(field->first, std::move(*value));
    }
  }

  if (values.empty() && !compiled_key.is_constant) {
    return 0;
  }
  auto rendered = lexkey::index::render(compiled_key, values,
                                        lexkey::index::render_side_t::entity);
  if (!lexkey::schema::is_ok(rendered)) {
    const auto& error = lexkey::schema::error_of(rendered);
    spdlog::error("cannot render key ({}): {}", to_string(error.code),
                  error.message);
    return 1;
  }
  std::cout << display(lexkey::schema::value_of(rendered)) << '\n';
  return 0;
}
