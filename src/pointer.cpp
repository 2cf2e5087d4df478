#include "interview/pointer.hpp"

#include "interview/errors.hpp"

#include <cctype>
#include <limits>
#include <sstream>
#include <utility>

namespace interview {
namespace {

bool is_ident_start(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
}

bool is_ident_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '-';
}

bool is_identifier(const std::string& key) {
  if (key.empty() || !is_ident_start(key[0])) {
    return false;
  }
  for (char ch : key) {
    if (!is_ident_char(ch)) {
      return false;
    }
  }
  return true;
}

class PointerParser {
public:
  explicit PointerParser(std::string_view text) : text_(text) {}

  ValuePointer parse() {
    auto pointer = parse_path();
    if (pos_ != text_.size()) {
      fail("unexpected '" + std::string(1, text_[pos_]) + "'");
    }
    return pointer;
  }

private:
  [[noreturn]] void fail(const std::string& detail) const {
    std::ostringstream oss;
    oss << "Pointer: " << detail << " at position " << pos_ << " in '" << text_ << "'";
    throw PointerSyntaxError(oss.str());
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  // path := (ident | bracket) ('.' ident | bracket)*
  ValuePointer parse_path() {
    std::vector<PointerSegment> segments;
    if (at_end()) {
      fail("empty pointer");
    }
    if (peek() == '[') {
      segments.push_back(parse_bracket());
    } else {
      segments.emplace_back(parse_identifier());
    }
    while (!at_end()) {
      const char ch = peek();
      if (ch == '.') {
        ++pos_;
        segments.emplace_back(parse_identifier());
      } else if (ch == '[') {
        segments.push_back(parse_bracket());
      } else {
        break;
      }
    }
    return ValuePointer(std::move(segments));
  }

  std::string parse_identifier() {
    if (at_end() || !is_ident_start(peek())) {
      fail(at_end() ? "empty segment" : "invalid segment");
    }
    const std::size_t start = pos_;
    while (!at_end() && is_ident_char(peek())) {
      ++pos_;
    }
    return std::string(text_.substr(start, pos_ - start));
  }

  PointerSegment parse_bracket() {
    ++pos_; // '['
    if (at_end()) {
      fail("unbalanced '['");
    }
    PointerSegment segment;
    const char ch = peek();
    if (ch == ']') {
      fail("empty segment");
    }
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      segment = parse_index();
    } else if (ch == '"' || ch == '\'') {
      segment = parse_quoted();
    } else {
      segment = std::make_shared<const ValuePointer>(parse_path());
    }
    if (at_end() || peek() != ']') {
      fail("unbalanced '['");
    }
    ++pos_;
    return segment;
  }

  std::size_t parse_index() {
    std::size_t value = 0;
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
      const auto digit = static_cast<std::size_t>(peek() - '0');
      if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
        fail("index too large");
      }
      value = value * 10 + digit;
      ++pos_;
    }
    return value;
  }

  std::string parse_quoted() {
    const char quote = text_[pos_++];
    std::string out;
    while (!at_end() && peek() != quote) {
      char ch = text_[pos_++];
      if (ch == '\\') {
        if (at_end()) {
          break;
        }
        ch = text_[pos_++];
      }
      out.push_back(ch);
    }
    if (at_end()) {
      fail("unterminated string");
    }
    ++pos_;
    return out;
  }

  std::string_view text_;
  std::size_t pos_ = 0;
};

// Resolved form of a segment: a key or an index.
using Resolved = std::variant<std::string, std::size_t>;

std::optional<Resolved> resolve(const PointerSegment& segment, const nlohmann::json& context) {
  if (const auto* key = std::get_if<std::string>(&segment)) {
    return Resolved{*key};
  }
  if (const auto* index = std::get_if<std::size_t>(&segment)) {
    return Resolved{*index};
  }
  const auto& sub = std::get<std::shared_ptr<const ValuePointer>>(segment);
  auto value = get(*sub, context, context);
  if (!value.has_value()) {
    return std::nullopt;
  }
  if (value->is_string()) {
    return Resolved{value->get<std::string>()};
  }
  if (value->is_number_unsigned()) {
    return Resolved{value->get<std::size_t>()};
  }
  if (value->is_number_integer() && value->get<long long>() >= 0) {
    return Resolved{static_cast<std::size_t>(value->get<long long>())};
  }
  return std::nullopt;
}

void append_quoted(std::ostringstream& oss, const std::string& key) {
  oss << "[\"";
  for (char ch : key) {
    if (ch == '"' || ch == '\\') {
      oss << '\\';
    }
    oss << ch;
  }
  oss << "\"]";
}

} // namespace

bool ValuePointer::is_direct() const {
  for (const auto& segment : segments_) {
    if (std::holds_alternative<std::shared_ptr<const ValuePointer>>(segment)) {
      return false;
    }
  }
  return true;
}

std::optional<DirectPath> ValuePointer::direct_path() const {
  if (!is_direct()) {
    return std::nullopt;
  }
  DirectPath path;
  path.reserve(segments_.size());
  for (const auto& segment : segments_) {
    if (const auto* key = std::get_if<std::string>(&segment)) {
      path.emplace_back(*key);
    } else {
      path.emplace_back(std::get<std::size_t>(segment));
    }
  }
  return path;
}

std::string ValuePointer::to_string() const {
  std::ostringstream oss;
  bool first = true;
  for (const auto& segment : segments_) {
    if (const auto* key = std::get_if<std::string>(&segment)) {
      if (is_identifier(*key)) {
        if (!first) {
          oss << '.';
        }
        oss << *key;
      } else {
        append_quoted(oss, *key);
      }
    } else if (const auto* index = std::get_if<std::size_t>(&segment)) {
      oss << '[' << *index << ']';
    } else {
      oss << '[' << std::get<std::shared_ptr<const ValuePointer>>(segment)->to_string() << ']';
    }
    first = false;
  }
  return oss.str();
}

bool ValuePointer::operator==(const ValuePointer& other) const {
  if (segments_.size() != other.segments_.size()) {
    return false;
  }
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    const auto& lhs = segments_[i];
    const auto& rhs = other.segments_[i];
    if (lhs.index() != rhs.index()) {
      return false;
    }
    if (const auto* sub = std::get_if<std::shared_ptr<const ValuePointer>>(&lhs)) {
      if (!(**sub == *std::get<std::shared_ptr<const ValuePointer>>(rhs))) {
        return false;
      }
    } else if (lhs != rhs) {
      return false;
    }
  }
  return true;
}

ValuePointer parse_pointer(std::string_view text) {
  return PointerParser(text).parse();
}

std::optional<nlohmann::json> get(const ValuePointer& pointer, const nlohmann::json& data,
                                  const nlohmann::json& context) {
  const nlohmann::json* current = &data;
  for (const auto& segment : pointer.segments()) {
    auto resolved = resolve(segment, context);
    if (!resolved.has_value()) {
      return std::nullopt;
    }
    if (const auto* key = std::get_if<std::string>(&*resolved)) {
      if (!current->is_object()) {
        return std::nullopt;
      }
      auto it = current->find(*key);
      if (it == current->end()) {
        return std::nullopt;
      }
      current = &*it;
    } else {
      const auto index = std::get<std::size_t>(*resolved);
      if (!current->is_array() || index >= current->size()) {
        return std::nullopt;
      }
      current = &(*current)[index];
    }
  }
  return *current;
}

nlohmann::json set(const ValuePointer& pointer, const nlohmann::json& data, nlohmann::json value,
                   const nlohmann::json& context) {
  if (pointer.empty()) {
    return value;
  }
  nlohmann::json result = data;
  nlohmann::json* current = &result;
  const auto& segments = pointer.segments();
  for (std::size_t i = 0; i < segments.size(); ++i) {
    auto resolved = resolve(segments[i], context);
    if (!resolved.has_value()) {
      throw PointerError("Pointer: cannot resolve segment " + std::to_string(i) + " of '" +
                         pointer.to_string() + "'");
    }
    const bool last = i + 1 == segments.size();
    if (const auto* key = std::get_if<std::string>(&*resolved)) {
      if (current->is_null()) {
        *current = nlohmann::json::object();
      }
      if (!current->is_object()) {
        throw PointerError("Pointer: expected an object at key '" + *key + "' of '" +
                           pointer.to_string() + "'");
      }
      auto& child = (*current)[*key];
      if (last) {
        child = std::move(value);
        return result;
      }
      current = &child;
    } else {
      const auto index = std::get<std::size_t>(*resolved);
      if (current->is_null()) {
        *current = nlohmann::json::array();
      }
      if (!current->is_array()) {
        throw PointerError("Pointer: expected an array at index " + std::to_string(index) +
                           " of '" + pointer.to_string() + "'");
      }
      if (index > current->size()) {
        throw PointerError("Pointer: index " + std::to_string(index) + " out of range of '" +
                           pointer.to_string() + "'");
      }
      if (index == current->size()) {
        current->push_back(nullptr);
      }
      auto& child = (*current)[index];
      if (last) {
        child = std::move(value);
        return result;
      }
      current = &child;
    }
  }
  return result;
}

} // namespace interview
