#include "value.hpp"

#include <cmath>
#include <cstdio>

#include "script_error.hpp"

namespace arena::script {

namespace {

constexpr int kMaxDisplayDepth = 16;

std::string FormatNumber(double number) {
  if (std::isnan(number)) return "nan";
  if (std::isinf(number)) return number > 0 ? "inf" : "-inf";

  char buffer[32];
  if (number == std::floor(number) && std::fabs(number) < 1e15) {
    std::snprintf(buffer, sizeof(buffer), "%.0f", number);
  } else {
    std::snprintf(buffer, sizeof(buffer), "%.12g", number);
  }
  return buffer;
}

// Walks a value once, reporting every appended piece to the meter. Containers
// on the current path are tracked so self-referencing lists terminate.
class Renderer {
 public:
  Renderer(std::string& out, const DisplayMeter& meter) : out_(out), meter_(meter) {
  }

  void Render(const Value& value, int depth) {
    if (depth > kMaxDisplayDepth) {
      Append("...");
      return;
    }
    if (std::holds_alternative<std::monostate>(value)) {
      Append("none");
    } else if (const auto* b = std::get_if<bool>(&value)) {
      Append(*b ? "true" : "false");
    } else if (const auto* d = std::get_if<double>(&value)) {
      Append(FormatNumber(*d));
    } else if (const auto* s = std::get_if<Text>(&value)) {
      Append(**s);
    } else if (const auto* list = std::get_if<List*>(&value)) {
      if (OnPath(*list)) {
        Append("[...]");
        return;
      }
      path_.push_back(*list);
      Append("[");
      bool first = true;
      for (const auto& item : (*list)->items) {
        if (!first) Append(", ");
        first = false;
        Render(item, depth + 1);
      }
      Append("]");
      path_.pop_back();
    } else if (const auto* map = std::get_if<const Map*>(&value)) {
      if (OnPath(*map)) {
        Append("{...}");
        return;
      }
      path_.push_back(*map);
      Append("{");
      bool first = true;
      for (const auto& [key, item] : (*map)->entries) {
        if (!first) Append(", ");
        first = false;
        Append(key);
        Append(": ");
        Render(item, depth + 1);
      }
      Append("}");
      path_.pop_back();
    }
  }

 private:
  void Append(std::string_view piece) {
    if (meter_) meter_(piece.size());
    out_.append(piece);
  }

  bool OnPath(const void* container) const {
    for (const void* p : path_) {
      if (p == container) return true;
    }
    return false;
  }

  std::string&             out_;
  const DisplayMeter&      meter_;
  std::vector<const void*> path_;
};

} // namespace

Heap::Heap(std::uint64_t limit_bytes) : limit_(limit_bytes) {
}

void Heap::Charge(std::uint64_t bytes) {
  if (limit_ != 0 && (bytes > limit_ || used_ > limit_ - bytes)) {
    throw ScriptError(ScriptError::Kind::kResourceExceeded,
                      "memory limit of " + std::to_string(limit_) + " bytes exceeded");
  }
  used_ += bytes;
}

List* Heap::NewList() {
  Charge(sizeof(List));
  return &lists_.emplace_back();
}

Map* Heap::NewMap() {
  Charge(sizeof(Map));
  return &maps_.emplace_back();
}

Value Heap::String(std::string text) {
  Charge(text.size());
  return AdoptString(std::move(text));
}

Value Heap::AdoptString(std::string text) {
  return Value(std::make_shared<const std::string>(std::move(text)));
}

std::string_view TypeName(const Value& value) {
  switch (value.index()) {
    case 0: return "none";
    case 1: return "bool";
    case 2: return "number";
    case 3: return "string";
    case 4: return "list";
    case 5: return "map";
  }
  return "value";
}

bool Truthy(const Value& value) {
  if (std::holds_alternative<std::monostate>(value)) return false;
  if (const auto* b = std::get_if<bool>(&value)) return *b;
  if (const auto* d = std::get_if<double>(&value)) return *d != 0.0 && !std::isnan(*d);
  if (const auto* s = std::get_if<Text>(&value)) return !(*s)->empty();
  if (const auto* list = std::get_if<List*>(&value)) return !(*list)->items.empty();
  return !std::get<const Map*>(value)->entries.empty();
}

std::string Display(const Value& value, const DisplayMeter& meter) {
  std::string out;
  Renderer(out, meter).Render(value, 0);
  return out;
}

} // namespace arena::script
