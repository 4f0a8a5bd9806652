#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace arena::script {

struct List;
struct Map;

// Strings are immutable and shared: copying a Value never copies the
// characters, so the bytes charged when the string was made stay exact.
using Text = std::shared_ptr<const std::string>;

// Maps are only built by the host (auction context, state view) and are
// read-only to scripts.
using Value = std::variant<std::monostate, bool, double, Text, List*, const Map*>;

struct List {
  std::vector<Value> items;
};

struct Map {
  std::map<std::string, Value> entries;
};

/*
  Per-invocation arena for script containers.

  Every list, map entry and string the script (or the host building its
  arguments) creates is charged against the byte budget. Crossing the budget
  raises ScriptError(kResourceExceeded) before the allocation happens.
  Everything is released when the Heap is destroyed.
*/
class Heap {
 public:
  // 0 means unlimited.
  explicit Heap(std::uint64_t limit_bytes = 0);

  Heap(const Heap&)            = delete;
  Heap& operator=(const Heap&) = delete;

  List* NewList();
  Map*  NewMap();

  Value String(std::string text);

  // Wraps text whose bytes the caller has already charged.
  Value AdoptString(std::string text);

  void Charge(std::uint64_t bytes);

  std::uint64_t used() const {
    return used_;
  }

  std::uint64_t limit() const {
    return limit_;
  }

 private:
  std::uint64_t    limit_;
  std::uint64_t    used_ = 0;
  std::deque<List> lists_;
  std::deque<Map>  maps_;
};

constexpr std::uint64_t kValueCost = sizeof(Value);

std::string_view TypeName(const Value& value);

bool Truthy(const Value& value);

// Receives the byte count of every rendered piece before it is appended.
// Throwing from the meter aborts the rendering.
using DisplayMeter = std::function<void(std::size_t bytes)>;

// Python-flavoured rendering used by str(): integers print without a
// fraction, lists as "[a, b]". A list that contains itself renders as
// "[...]".
std::string Display(const Value& value, const DisplayMeter& meter = nullptr);

} // namespace arena::script
