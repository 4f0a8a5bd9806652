#include "internal/replay/impression_source.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

#include "internal/util/errors.hpp"

namespace arena::replay {

namespace {

std::string Trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return {};
  const auto end = text.find_last_not_of(" \t\r");
  return text.substr(begin, end - begin + 1);
}

std::optional<double> ParseNumber(const std::string& text) {
  if (text.empty()) return std::nullopt;
  double value = 0.0;
  const auto* first = text.data();
  const auto* last  = text.data() + text.size();
  if (*first == '+') ++first;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || !std::isfinite(value)) return std::nullopt;
  return value;
}

std::optional<std::int64_t> ParseInteger(const std::string& text) {
  if (text.empty()) return std::nullopt;
  std::int64_t value = 0;
  auto [ptr, ec]     = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec == std::errc() && ptr == text.data() + text.size()) return value;
  // Pandas writes integer columns with a trailing ".0" once a value is missing.
  auto number = ParseNumber(text);
  if (number && std::floor(*number) == *number) return static_cast<std::int64_t>(*number);
  return std::nullopt;
}

bool ParseFlag(const std::string& text, bool& out) {
  if (text.empty() || text == "0" || text == "false" || text == "False" || text == "0.0") {
    out = false;
    return true;
  }
  if (text == "1" || text == "true" || text == "True" || text == "1.0") {
    out = true;
    return true;
  }
  return false;
}

double Percentile(const std::vector<double>& sorted, double p) {
  if (sorted.empty()) return 0.0;
  const double rank  = p / 100.0 * static_cast<double>(sorted.size() - 1);
  const auto   lower = static_cast<std::size_t>(std::floor(rank));
  const auto   upper = std::min(lower + 1, sorted.size() - 1);
  const double frac  = rank - static_cast<double>(lower);
  return sorted[lower] + (sorted[upper] - sorted[lower]) * frac;
}

} // namespace

VectorImpressionSource::VectorImpressionSource(std::vector<arena::core::v1::ImpressionRecord> records)
    : records_(std::move(records)) {
}

std::optional<arena::core::v1::ImpressionRecord> VectorImpressionSource::Next() {
  if (position_ >= records_.size()) return std::nullopt;
  return records_[position_++];
}

void VectorImpressionSource::Rewind() {
  position_ = 0;
}

std::vector<std::string> SplitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string              field;
  bool                     quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        field.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        field.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(Trim(field));
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  if (quoted) {
    throw util::InvalidArgument("unterminated quoted field");
  }
  fields.push_back(Trim(field));
  return fields;
}

CsvImpressionSource::CsvImpressionSource(std::string path) : path_(std::move(path)) {
  Open();
}

void CsvImpressionSource::Open() {
  in_.close();
  in_.clear();
  in_.open(path_);
  if (!in_) {
    throw util::InfrastructureError("cannot open impression file " + path_);
  }

  std::string header;
  if (!std::getline(in_, header)) {
    throw util::InfrastructureError("impression file " + path_ + " has no header row");
  }
  try {
    header_ = SplitCsvLine(header);
  } catch (const util::InvalidArgument& e) {
    throw util::InfrastructureError(path_ + ":1: " + e.what());
  }
  if (std::find(header_.begin(), header_.end(), "floor_price") == header_.end()) {
    throw util::InfrastructureError("impression file " + path_ + " has no floor_price column");
  }
  line_ = 1;
  row_  = 0;
}

void CsvImpressionSource::Rewind() {
  Open();
}

std::optional<arena::core::v1::ImpressionRecord> CsvImpressionSource::Next() {
  std::string line;
  while (std::getline(in_, line)) {
    ++line_;
    if (Trim(line).empty()) continue;

    const auto where = path_ + ":" + std::to_string(line_) + ": ";
    std::vector<std::string> fields;
    try {
      fields = SplitCsvLine(line);
    } catch (const util::InvalidArgument& e) {
      throw util::InfrastructureError(where + e.what());
    }
    if (fields.size() != header_.size()) {
      throw util::InfrastructureError(where + "expected " + std::to_string(header_.size()) + " fields, got " +
                                      std::to_string(fields.size()));
    }

    arena::core::v1::ImpressionRecord record;
    record.set_sequence(row_);
    bool has_floor = false;

    for (std::size_t i = 0; i < header_.size(); ++i) {
      const auto& column = header_[i];
      const auto& value  = fields[i];

      if (column == "sequence") {
        auto sequence = ParseInteger(value);
        if (!sequence || *sequence < 0) throw util::InfrastructureError(where + "bad sequence '" + value + "'");
        record.set_sequence(static_cast<std::uint64_t>(*sequence));
      } else if (column == "timestamp") {
        auto timestamp = ParseInteger(value);
        if (!timestamp) throw util::InfrastructureError(where + "bad timestamp '" + value + "'");
        record.set_timestamp(*timestamp);
      } else if (column == "floor_price") {
        auto floor = ParseNumber(value);
        if (!floor || *floor < 0.0) throw util::InfrastructureError(where + "bad floor_price '" + value + "'");
        record.set_floor_price(*floor);
        has_floor = true;
      } else if (column == "market_price" || column == "winner_price") {
        if (value.empty()) continue;
        auto market = ParseNumber(value);
        if (!market || *market < 0.0) throw util::InfrastructureError(where + "bad " + column + " '" + value + "'");
        record.set_market_price(*market);
      } else if (column == "is_conversion") {
        bool converted = false;
        if (!ParseFlag(value, converted)) throw util::InfrastructureError(where + "bad is_conversion '" + value + "'");
        record.set_is_conversion(converted);
      } else {
        auto& feature = (*record.mutable_features())[column];
        if (auto number = ParseNumber(value)) {
          feature.set_number(*number);
        } else {
          feature.set_text(value);
        }
      }
    }

    if (!has_floor) throw util::InfrastructureError(where + "missing floor_price");
    ++row_;
    return record;
  }

  if (in_.bad()) {
    throw util::InfrastructureError("read error on impression file " + path_);
  }
  return std::nullopt;
}

arena::core::v1::MarketSummary ComputeMarketSummary(ImpressionSource& source) {
  source.Rewind();

  std::vector<double> prices;
  std::uint64_t       count       = 0;
  std::uint64_t       conversions = 0;
  std::int64_t        first       = 0;
  std::int64_t        last        = 0;

  while (auto record = source.Next()) {
    if (count == 0) {
      first = last = record->timestamp();
    } else {
      first = std::min(first, record->timestamp());
      last  = std::max(last, record->timestamp());
    }
    ++count;
    if (record->is_conversion()) ++conversions;
    if (record->has_market_price()) prices.push_back(record->market_price());
  }
  source.Rewind();

  std::sort(prices.begin(), prices.end());

  arena::core::v1::MarketSummary summary;
  for (std::uint32_t p = 10; p <= 90; p += 10) {
    (*summary.mutable_price_percentiles())[p] = Percentile(prices, p);
  }
  summary.set_conversion_rate(count == 0 ? 0.0 : static_cast<double>(conversions) / static_cast<double>(count));
  summary.set_first_timestamp(first);
  summary.set_last_timestamp(last);
  summary.set_impression_count(count);
  return summary;
}

} // namespace arena::replay
