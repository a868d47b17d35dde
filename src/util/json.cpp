#include "rapport/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace rapport::json {
namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hex_digit(char c) {
  if (is_digit(c)) return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void put_utf8(unsigned cp, std::string& out) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
    return;
  }
  if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
  } else {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  }
  out += static_cast<char>(0x80 | (cp & 0x3F));
}

// Recursive-descent reader over the whole document. Line and column are
// tracked as characters are consumed so errors can point at the input.
class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  Value document() {
    Value v = value();
    skip_space();
    if (!at_end()) error("unexpected trailing content");
    return v;
  }

 private:
  bool at_end() const { return pos_ >= text_.size(); }
  char current() const { return at_end() ? '\0' : text_[pos_]; }

  char advance() {
    if (at_end()) error("unexpected end of input");
    const char c = text_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  void skip_space() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(current()))) advance();
  }

  [[noreturn]] void error(const std::string& what) const {
    throw std::runtime_error("JSON parse error (line " + std::to_string(line_) + ", col " + std::to_string(col_) +
                             "): " + what);
  }

  void require(char c) {
    skip_space();
    if (current() != c) error(std::string("expected '") + c + "'");
    advance();
  }

  bool accept(char c) {
    skip_space();
    if (current() != c) return false;
    advance();
    return true;
  }

  Value value() {
    skip_space();
    switch (current()) {
      case '{': return object();
      case '[': return array();
      case '"': return string();
      case 't': return keyword("true", Value(true));
      case 'f': return keyword("false", Value(false));
      case 'n': return keyword("null", Value(nullptr));
      default: break;
    }
    if (current() == '-' || is_digit(current())) return number();
    error(at_end() ? "unexpected end of input" : std::string("unexpected '") + current() + "'");
  }

  Value keyword(const char* word, Value v) {
    for (const char* p = word; *p != '\0'; ++p) {
      if (current() != *p) error(std::string("expected '") + word + "'");
      advance();
    }
    return v;
  }

  void digit_run() {
    if (!is_digit(current())) error("malformed number");
    while (is_digit(current())) advance();
  }

  Value number() {
    const std::size_t begin = pos_;
    if (current() == '-') advance();
    digit_run();
    if (current() == '.') {
      advance();
      digit_run();
    }
    if (current() == 'e' || current() == 'E') {
      advance();
      if (current() == '+' || current() == '-') advance();
      digit_run();
    }
    const std::string lexeme = text_.substr(begin, pos_ - begin);
    const double d = std::strtod(lexeme.c_str(), nullptr);
    if (!std::isfinite(d)) error("number out of range: " + lexeme);
    return Value(d);
  }

  unsigned unicode_escape() {
    unsigned cp = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_digit(advance());
      if (h < 0) error("malformed \\u escape");
      cp = (cp << 4) | static_cast<unsigned>(h);
    }
    if (cp >= 0xD800 && cp <= 0xDFFF) error("surrogate pairs are not supported");
    return cp;
  }

  std::string string() {
    require('"');
    std::string out;
    for (char c = advance(); c != '"'; c = advance()) {
      if (c != '\\') {
        out += c;
        continue;
      }
      const char e = advance();
      switch (e) {
        case '"':
        case '\\':
        case '/': out += e; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': put_utf8(unicode_escape(), out); break;
        default: error(std::string("unknown escape '\\") + e + "'");
      }
    }
    return out;
  }

  Value array() {
    require('[');
    Array items;
    if (accept(']')) return Value(std::move(items));
    do {
      items.push_back(value());
    } while (accept(','));
    require(']');
    return Value(std::move(items));
  }

  Value object() {
    require('{');
    Object members;
    if (accept('}')) return Value(std::move(members));
    do {
      skip_space();
      if (current() != '"') error("object keys must be strings");
      std::string key = string();
      require(':');
      members[std::move(key)] = value();
    } while (accept(','));
    require('}');
    return Value(std::move(members));
  }

  const std::string& text_;
  std::size_t pos_{0};
  int line_{1};
  int col_{1};
};

} // namespace

// Serializes a tree into a string buffer. Declared a friend of Value so it
// can walk the variant directly.
class Writer {
 public:
  explicit Writer(int indent) : indent_(indent) {}

  std::string take() { return std::move(out_); }

  void write(const Value& v, int depth) {
    const auto& d = v.data_;
    if (std::holds_alternative<std::nullptr_t>(d)) {
      out_ += "null";
    } else if (const bool* b = std::get_if<bool>(&d)) {
      out_ += *b ? "true" : "false";
    } else if (const double* n = std::get_if<double>(&d)) {
      number(*n);
    } else if (const std::string* s = std::get_if<std::string>(&d)) {
      quoted(*s);
    } else if (const Array* a = std::get_if<Array>(&d)) {
      out_ += '[';
      for (std::size_t k = 0; k < a->size(); ++k) {
        if (k > 0) out_ += ',';
        break_line(depth + 1);
        write((*a)[k], depth + 1);
      }
      if (!a->empty()) break_line(depth);
      out_ += ']';
    } else {
      const Object& o = std::get<Object>(d);
      std::vector<Object::const_iterator> members;
      members.reserve(o.size());
      for (auto it = o.begin(); it != o.end(); ++it) members.push_back(it);
      std::sort(members.begin(), members.end(),
                [](Object::const_iterator x, Object::const_iterator y) { return x->first < y->first; });

      out_ += '{';
      for (std::size_t k = 0; k < members.size(); ++k) {
        if (k > 0) out_ += ',';
        break_line(depth + 1);
        quoted(members[k]->first);
        out_ += indent_ > 0 ? ": " : ":";
        write(members[k]->second, depth + 1);
      }
      if (!members.empty()) break_line(depth);
      out_ += '}';
    }
  }

 private:
  void break_line(int depth) {
    if (indent_ <= 0) return;
    out_ += '\n';
    out_.append(static_cast<std::size_t>(depth * indent_), ' ');
  }

  // Whole numbers print without a fraction; non-finite values become null.
  void number(double d) {
    if (!std::isfinite(d)) {
      out_ += "null";
      return;
    }
    char buf[32];
    if (d == std::trunc(d) && std::fabs(d) < 1e15) {
      std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
    } else {
      std::snprintf(buf, sizeof(buf), "%.12g", d);
    }
    out_ += buf;
  }

  void quoted(const std::string& s) {
    out_ += '"';
    for (const char c : s) {
      switch (c) {
        case '"': out_ += "\\\""; break;
        case '\\': out_ += "\\\\"; break;
        case '\n': out_ += "\\n"; break;
        case '\r': out_ += "\\r"; break;
        case '\t': out_ += "\\t"; break;
        default:
          if (static_cast<unsigned char>(c) < 0x20) {
            char esc[8];
            std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
            out_ += esc;
          } else {
            out_ += c;
          }
      }
    }
    out_ += '"';
  }

  int indent_;
  std::string out_;
};

const Value* Value::find(const std::string& key) const {
  const Object* o = std::get_if<Object>(&data_);
  if (o == nullptr) return nullptr;
  const auto it = o->find(key);
  return it != o->end() ? &it->second : nullptr;
}

const Value& Value::at(const std::string& key) const {
  if (const Value* v = find(key)) return *v;
  throw std::runtime_error(is_object() ? "JSON object has no key '" + key + "'"
                                       : "JSON lookup of '" + key + "' on a non-object");
}

bool Value::bool_value(bool fallback) const {
  const bool* b = std::get_if<bool>(&data_);
  return b ? *b : fallback;
}

double Value::number_value(double fallback) const {
  const double* d = std::get_if<double>(&data_);
  return d ? *d : fallback;
}

std::string Value::string_value(const std::string& fallback) const {
  const std::string* s = std::get_if<std::string>(&data_);
  return s ? *s : fallback;
}

const Object& Value::object() const {
  if (const Object* o = std::get_if<Object>(&data_)) return *o;
  throw std::runtime_error("JSON value is not an object");
}

const Array& Value::array() const {
  if (const Array* a = std::get_if<Array>(&data_)) return *a;
  throw std::runtime_error("JSON value is not an array");
}

Value parse(const std::string& text) { return Reader(text).document(); }

std::string stringify(const Value& v, int indent) {
  Writer w(indent);
  w.write(v, 0);
  return w.take();
}

} // namespace rapport::json
