/**
 * @file json_helpers.h
 * @brief Minimal JSON writer and flat-object parser for CLI output and config files.
 */

#ifndef FRETVOICE_CORE_JSON_HELPERS_H
#define FRETVOICE_CORE_JSON_HELPERS_H

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <ostream>
#include <string>

namespace fretvoice {
namespace json {

/**
 * @brief Escapes quote, backslash, newline, carriage return and tab for JSON output.
 *
 * ```cpp
 * json::escape("X\"0");  // X\"0
 * ```
 */
inline std::string escape(const std::string& s) {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        result += c;
        break;
    }
  }
  return result;
}

/**
 * @brief Streaming JSON writer with optional pretty-printing.
 *
 * Fluent API with automatic comma handling:
 * ```cpp
 * std::ostringstream oss;
 * json::Writer w(oss);
 * w.beginObject()
 *     .write("chord", "Am")
 *     .beginArray("voicings")
 *         .value("X02210")
 *     .endArray()
 * .endObject();
 * // {"chord":"Am","voicings":["X02210"]}
 * ```
 */
class Writer {
 public:
  /**
   * @param os Output stream
   * @param pretty Newlines and indentation when true
   * @param indent_size Spaces per indentation level
   */
  explicit Writer(std::ostream& os, bool pretty = false, int indent_size = 2)
      : os_(os), pretty_(pretty), indent_size_(indent_size) {}

  /// @brief Begin an object, keyed when nested inside another object.
  Writer& beginObject(const char* key = nullptr) {
    writeCommaIfNeeded();
    if (key) {
      writeKey(key);
    } else if (depth_ > 0) {
      writeNewlineIndent();
    }
    os_ << "{";
    push();
    return *this;
  }

  Writer& endObject() {
    pop();
    writeNewlineIndent();
    os_ << "}";
    return *this;
  }

  /// @brief Begin an array, keyed when nested inside an object.
  Writer& beginArray(const char* key = nullptr) {
    writeCommaIfNeeded();
    if (key) {
      writeKey(key);
    } else if (depth_ > 0) {
      writeNewlineIndent();
    }
    os_ << "[";
    push();
    return *this;
  }

  Writer& endArray() {
    pop();
    writeNewlineIndent();
    os_ << "]";
    return *this;
  }

  /// @brief Write a numeric key-value pair.
  template <typename T>
  Writer& write(const char* key, T value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << value;
    return *this;
  }

  Writer& write(const char* key, bool value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << (value ? "true" : "false");
    return *this;
  }

  Writer& write(const char* key, const std::string& value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "\"" << escape(value) << "\"";
    return *this;
  }

  Writer& write(const char* key, const char* value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "\"" << escape(value) << "\"";
    return *this;
  }

  /// @brief Write a null-valued key.
  Writer& writeNull(const char* key) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "null";
    return *this;
  }

  /// @brief Write a numeric value into the current array.
  template <typename T>
  Writer& value(T v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << v;
    return *this;
  }

  Writer& value(bool v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << (v ? "true" : "false");
    return *this;
  }

  Writer& value(const std::string& v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << "\"" << escape(v) << "\"";
    return *this;
  }

  Writer& value(const char* v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << "\"" << escape(v) << "\"";
    return *this;
  }

 private:
  void writeKey(const char* key) {
    writeNewlineIndent();
    os_ << "\"" << key << "\":";
    if (pretty_) os_ << " ";
  }

  void writeCommaIfNeeded() {
    if (!first_) os_ << ",";
    first_ = false;
  }

  void writeNewlineIndent() {
    if (pretty_) {
      os_ << "\n";
      for (int i = 0; i < depth_ * indent_size_; ++i) os_ << " ";
    }
  }

  void push() {
    ++depth_;
    first_ = true;
  }

  void pop() {
    --depth_;
    first_ = false;
  }

  std::ostream& os_;
  bool pretty_;
  int indent_size_;
  int depth_ = 0;
  bool first_ = true;
};

/// @brief RAII object scope: beginObject() on construction, endObject() on destruction.
class ObjectScope {
 public:
  ObjectScope(Writer& w, const char* key = nullptr) : w_(w) { w_.beginObject(key); }
  ~ObjectScope() { w_.endObject(); }

  Writer& writer() { return w_; }

 private:
  Writer& w_;
};

/// @brief RAII array scope: beginArray() on construction, endArray() on destruction.
class ArrayScope {
 public:
  ArrayScope(Writer& w, const char* key = nullptr) : w_(w) { w_.beginArray(key); }
  ~ArrayScope() { w_.endArray(); }

  Writer& writer() { return w_; }

 private:
  Writer& w_;
};

// ============================================================================
// Flat object parser
// ============================================================================

/**
 * @brief Parser for flat JSON objects of string, number, boolean and null values.
 *
 * Nested objects and arrays are skipped. Malformed numbers fall back to the
 * caller's default.
 *
 * ```cpp
 * json::Parser p(R"({"max_fret_span":5,"root_in_bass":false})");
 * p.getInt("max_fret_span");    // 5
 * p.getBool("root_in_bass");    // false
 * ```
 */
class Parser {
 public:
  explicit Parser(const std::string& json) : json_(json) { parse(); }

  bool has(const std::string& key) const { return values_.find(key) != values_.end(); }

  /// @brief True when the input was an object that parsed to its closing brace.
  bool isValid() const { return valid_; }

  int getInt(const std::string& key, int default_val = 0) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) return default_val;
    const char* begin = it->second.c_str();
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(begin, &end, 10);
    if (errno != 0 || end == begin || *end != '\0') return default_val;
    return static_cast<int>(parsed);
  }

  bool getBool(const std::string& key, bool default_val = false) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    if (it->second == "true") return true;
    if (it->second == "false") return false;
    return default_val;
  }

  std::string getString(const std::string& key, const std::string& default_val = "") const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    return it->second;
  }

 private:
  void parse() {
    size_t pos = 0;
    skipWhitespace(pos);
    if (pos >= json_.size() || json_[pos] != '{') return;
    ++pos;

    while (pos < json_.size()) {
      skipWhitespace(pos);
      if (pos >= json_.size()) break;
      if (json_[pos] == '}') {
        valid_ = true;
        break;
      }
      if (json_[pos] == ',') {
        ++pos;
        continue;
      }

      std::string key = parseString(pos);
      if (key.empty()) break;

      skipWhitespace(pos);
      if (pos >= json_.size() || json_[pos] != ':') break;
      ++pos;
      skipWhitespace(pos);

      values_[key] = parseValue(pos);
    }
  }

  void skipWhitespace(size_t& pos) const {
    while (pos < json_.size() &&
           (json_[pos] == ' ' || json_[pos] == '\t' || json_[pos] == '\n' || json_[pos] == '\r')) {
      ++pos;
    }
  }

  std::string parseString(size_t& pos) {
    if (pos >= json_.size() || json_[pos] != '"') return "";
    ++pos;
    std::string result;
    while (pos < json_.size() && json_[pos] != '"') {
      if (json_[pos] == '\\' && pos + 1 < json_.size()) {
        ++pos;
        switch (json_[pos]) {
          case 'n':
            result += '\n';
            break;
          case 'r':
            result += '\r';
            break;
          case 't':
            result += '\t';
            break;
          default:
            result += json_[pos];
            break;
        }
      } else {
        result += json_[pos];
      }
      ++pos;
    }
    if (pos < json_.size()) ++pos;  // closing quote
    return result;
  }

  std::string parseValue(size_t& pos) {
    if (pos >= json_.size()) return "";

    if (json_[pos] == '"') return parseString(pos);

    if (json_[pos] == '{' || json_[pos] == '[') {
      skipNested(pos);
      return "";
    }

    // Number, boolean, or null
    std::string value;
    while (pos < json_.size() && json_[pos] != ',' && json_[pos] != '}' && json_[pos] != ' ' &&
           json_[pos] != '\t' && json_[pos] != '\n' && json_[pos] != '\r') {
      value += json_[pos];
      ++pos;
    }
    return value;
  }

  void skipNested(size_t& pos) {
    int depth = 0;
    while (pos < json_.size()) {
      char c = json_[pos];
      if (c == '"') {
        parseString(pos);
        continue;
      }
      if (c == '{' || c == '[') ++depth;
      if (c == '}' || c == ']') --depth;
      ++pos;
      if (depth == 0) return;
    }
  }

  std::string json_;
  std::map<std::string, std::string> values_;
  bool valid_ = false;
};

// ============================================================================
// Visitor-based serialization helpers
// ============================================================================

struct WriteVisitor {
  Writer& w;
  void operator()(const char* k, uint8_t v) { w.write(k, static_cast<int>(v)); }
  void operator()(const char* k, int v) { w.write(k, v); }
  void operator()(const char* k, bool v) { w.write(k, v); }
};

struct ReadVisitor {
  const Parser& p;
  void operator()(const char* k, uint8_t& v) {
    int value = p.getInt(k, v);
    if (value >= 0 && value <= 255) v = static_cast<uint8_t>(value);
  }
  void operator()(const char* k, int& v) { v = p.getInt(k, v); }
  void operator()(const char* k, bool& v) { v = p.getBool(k, v); }
};

}  // namespace json
}  // namespace fretvoice

#endif  // FRETVOICE_CORE_JSON_HELPERS_H
