#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace proto {

// JsonWriter — builds one flat JSON object into a string. Every outbound
// control frame and HTTP body is a handful of scalar fields, so this is all
// the serialization the server needs.
class JsonWriter {
public:
  JsonWriter() { out_.push_back('{'); }

  JsonWriter &Field(std::string_view key, std::string_view value) {
    Key(key);
    AppendQuoted(value);
    return *this;
  }

  JsonWriter &Field(std::string_view key, const char *value) {
    return Field(key, std::string_view{value});
  }

  template <std::integral T> JsonWriter &Field(std::string_view key, T value) {
    Key(key);
    if constexpr (std::is_same_v<T, bool>) {
      out_.append(value ? "true" : "false");
    } else {
      char buf[24];
      auto r = std::to_chars(buf, buf + sizeof(buf), value);
      out_.append(buf, r.ptr);
    }
    return *this;
  }

  // Fixed-point number with `precision` decimals.
  JsonWriter &Fixed(std::string_view key, double value, int precision) {
    Key(key);
    char buf[64];
    auto r = std::to_chars(buf, buf + sizeof(buf), value,
                           std::chars_format::fixed, precision);
    if (r.ec != std::errc()) {
      out_.append("null");
    } else {
      out_.append(buf, r.ptr);
    }
    return *this;
  }

  // Empty optional is written as null.
  JsonWriter &Fixed(std::string_view key, std::optional<double> value,
                    int precision) {
    if (!value.has_value()) {
      return Null(key);
    }
    return Fixed(key, *value, precision);
  }

  JsonWriter &Null(std::string_view key) {
    Key(key);
    out_.append("null");
    return *this;
  }

  // `json` must already be a serialized JSON value.
  JsonWriter &Raw(std::string_view key, std::string_view json) {
    Key(key);
    out_.append(json);
    return *this;
  }

  std::string Str() const { return out_ + '}'; }

private:
  void Key(std::string_view key) {
    if (!first_) {
      out_.push_back(',');
    }
    first_ = false;
    AppendQuoted(key);
    out_.push_back(':');
  }

  void AppendQuoted(std::string_view s) {
    static constexpr char kHex[] = "0123456789abcdef";
    out_.push_back('"');
    for (char c : s) {
      switch (c) {
      case '"':
        out_.append("\\\"");
        break;
      case '\\':
        out_.append("\\\\");
        break;
      case '\n':
        out_.append("\\n");
        break;
      case '\r':
        out_.append("\\r");
        break;
      case '\t':
        out_.append("\\t");
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out_.append("\\u00");
          out_.push_back(kHex[(c >> 4) & 0xf]);
          out_.push_back(kHex[c & 0xf]);
        } else {
          out_.push_back(c);
        }
      }
    }
    out_.push_back('"');
  }

  std::string out_;
  bool first_ = true;
};

} // namespace proto
