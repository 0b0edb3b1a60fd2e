#ifndef FRAMEWATCH_CORE_JSON_UTILS_HPP_
#define FRAMEWATCH_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace framewatch::core {

// Shared JSON string escaping for event/state writers.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// Fixed three-decimal rendering; non-finite values collapse to 0.0 because
// JSON has no representation for them.
inline std::string FormatJsonDouble(double value) {
  if (!std::isfinite(value)) {
    return "0.0";
  }

  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return out.str();
}

// Streaming object writer helpers. `first_field` tracks comma placement for
// the object currently being written.
inline void WriteFieldDelimiter(std::ostringstream& out, bool& first_field) {
  if (!first_field) {
    out << ",";
  }
  first_field = false;
}

inline void WriteJsonStringField(std::ostringstream& out, std::string_view key,
                                 std::string_view value, bool& first_field) {
  WriteFieldDelimiter(out, first_field);
  out << "\"" << key << "\":\"" << EscapeJson(value) << "\"";
}

inline void WriteJsonRawField(std::ostringstream& out, std::string_view key,
                              std::string_view raw_value, bool& first_field) {
  WriteFieldDelimiter(out, first_field);
  out << "\"" << key << "\":" << raw_value;
}

inline void WriteJsonBoolField(std::ostringstream& out, std::string_view key, bool value,
                               bool& first_field) {
  WriteJsonRawField(out, key, value ? "true" : "false", first_field);
}

} // namespace framewatch::core

#endif // FRAMEWATCH_CORE_JSON_UTILS_HPP_
