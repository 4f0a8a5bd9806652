#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "arena/core/v1/types.pb.h"

namespace arena::replay {

/*
  Lazy, ordered, finite and restartable sequence of impression records.

  Next() and Rewind() throw util::InfrastructureError when the underlying
  data can not be read; the replay engine turns that into an aborted run.
*/
class ImpressionSource {
 public:
  virtual ~ImpressionSource() = default;

  // std::nullopt once the sequence is exhausted.
  virtual std::optional<arena::core::v1::ImpressionRecord> Next() = 0;

  virtual void Rewind() = 0;
};

class VectorImpressionSource : public ImpressionSource {
 public:
  explicit VectorImpressionSource(std::vector<arena::core::v1::ImpressionRecord> records);

  std::optional<arena::core::v1::ImpressionRecord> Next() override;
  void                                             Rewind() override;

 private:
  std::vector<arena::core::v1::ImpressionRecord> records_;
  std::size_t                                    position_ = 0;
};

/*
  Reads impressions from a CSV file with a header row.

  Recognised columns:
      sequence        defaults to the row number (0-based)
      timestamp       integer
      floor_price     number, required
      market_price    number, empty when unknown (alias: winner_price)
      is_conversion   1/0/true/false

  Every other column becomes a feature, numeric when it parses as a number.
*/
class CsvImpressionSource : public ImpressionSource {
 public:
  explicit CsvImpressionSource(std::string path);

  std::optional<arena::core::v1::ImpressionRecord> Next() override;
  void                                             Rewind() override;

 private:
  void Open();

  std::string              path_;
  std::ifstream            in_;
  std::vector<std::string> header_;
  std::size_t              line_ = 0;
  std::uint64_t            row_  = 0;
};

std::vector<std::string> SplitCsvLine(const std::string& line);

/*
  Pre-pass over the whole source: market price percentiles (10..90, linear
  interpolation), conversion rate and timestamp range. The source is rewound
  before and after.
*/
arena::core::v1::MarketSummary ComputeMarketSummary(ImpressionSource& source);

} // namespace arena::replay
