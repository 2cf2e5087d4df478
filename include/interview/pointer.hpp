#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace interview {

class ValuePointer;

// One step of a pointer: a literal key, a literal index, or a sub-pointer
// whose value (read from the evaluation context) becomes the key or index.
using PointerSegment =
    std::variant<std::string, std::size_t, std::shared_ptr<const ValuePointer>>;

// A literal-only path, as reported by QuestionTemplate::provides().
using PathKey = std::variant<std::string, std::size_t>;
using DirectPath = std::vector<PathKey>;

/**
 * ValuePointer addresses a location inside nested answer data, e.g.
 * `registration.email`, `items[0].name` or `item[n][0]` where `n` is looked up
 * in the evaluation context right before the pointer is used.
 */
class ValuePointer {
public:
  ValuePointer() = default;
  explicit ValuePointer(std::vector<PointerSegment> segments)
      : segments_(std::move(segments)) {}

  const std::vector<PointerSegment>& segments() const { return segments_; }
  bool empty() const { return segments_.empty(); }

  // True when no segment is indirect.
  bool is_direct() const;
  std::optional<DirectPath> direct_path() const;

  std::string to_string() const;

  bool operator==(const ValuePointer& other) const;
  bool operator!=(const ValuePointer& other) const { return !(*this == other); }

private:
  std::vector<PointerSegment> segments_;
};

// Throws PointerSyntaxError.
ValuePointer parse_pointer(std::string_view text);

// Reads the value at `pointer`. Missing containers, out-of-range indices and
// unresolvable indirect segments yield std::nullopt.
std::optional<nlohmann::json> get(const ValuePointer& pointer, const nlohmann::json& data,
                                  const nlohmann::json& context);

// Returns a copy of `data` with `value` written at `pointer`, creating
// intermediate objects/arrays on demand. Throws PointerError.
nlohmann::json set(const ValuePointer& pointer, const nlohmann::json& data,
                   nlohmann::json value, const nlohmann::json& context);

} // namespace interview
