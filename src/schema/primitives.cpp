#include <lexkey/common/critical.hpp>
#include <lexkey/schema/primitives.hpp>

#include <array>
#include <cctype>
#include <iterator>

namespace lexkey::schema {

namespace {

constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

constexpr auto kInvalidSextet = uint8_t{0xFF};

constexpr std::array<uint8_t, 256> make_base64_reverse_table() {
  auto table = std::array<uint8_t, 256>{};
  for (auto& entry : table) {
    entry = kInvalidSextet;
  }
  for (size_t i = 0; i < kBase64Alphabet.size(); ++i) {
    table[static_cast<unsigned char>(kBase64Alphabet[i])] =
        static_cast<uint8_t>(i);
  }
  return table;
}

constexpr auto kBase64Reverse = make_base64_reverse_table();

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  for (size_t index = 0; index < bytes.size(); index += 3) {
    auto remaining = bytes.size() - index;
    auto group = static_cast<uint32_t>(bytes[index]) << 16u;
    if (remaining > 1) {
      group |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
    }
    if (remaining > 2) {
      group |= static_cast<uint32_t>(bytes[index + 2]);
    }
    out.push_back(kBase64Alphabet[(group >> 18u) & 0x3Fu]);
    out.push_back(kBase64Alphabet[(group >> 12u) & 0x3Fu]);
    out.push_back(remaining > 1 ? kBase64Alphabet[(group >> 6u) & 0x3Fu] : '=');
    out.push_back(remaining > 2 ? kBase64Alphabet[group & 0x3Fu] : '=');
  }
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  if ((encoded.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((encoded.size() / 4) * 3);

  for (size_t i = 0; i < encoded.size(); i += 4) {
    auto is_last_group = (i + 4) == encoded.size();
    auto padding = size_t{0};
    auto group = uint32_t{0};
    for (size_t j = 0; j < 4; ++j) {
      auto ch = encoded[i + j];
      if (ch == '=') {
        // Padding is only valid in the last two positions of the last group.
        if (!is_last_group || j < 2) {
          return std::nullopt;
        }
        ++padding;
        group <<= 6u;
        continue;
      }
      if (padding != 0) {
        return std::nullopt;
      }
      auto sextet = kBase64Reverse[static_cast<unsigned char>(ch)];
      if (sextet == kInvalidSextet) {
        return std::nullopt;
      }
      group = (group << 6u) | sextet;
    }
    out.push_back(static_cast<uint8_t>((group >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((group >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(group & 0xFFu));
    }
  }
  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    lexkey::common::critical("invalid base64 input");
  }
  return *decoded;
}

std::vector<std::string> split(const std::string_view input,
                               const char separator) {
  auto parts = std::vector<std::string>{};
  auto begin = size_t{0};
  while (true) {
    auto end = input.find(separator, begin);
    if (end == std::string_view::npos) {
      parts.emplace_back(input.substr(begin));
      break;
    }
    parts.emplace_back(input.substr(begin, end - begin));
    begin = end + 1;
  }
  return parts;
}

std::string join(const std::vector<std::string>& parts,
                 const std::string_view separator) {
  auto out = std::string{};
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) {
      out.append(separator);
    }
    out.append(parts[i]);
  }
  return out;
}

}  // namespace lexkey::schema
