#ifndef FINSIGHT_IO_JSON_WRITER_HPP
#define FINSIGHT_IO_JSON_WRITER_HPP

#include "../insight.hpp"
#include "../period_aggregator.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace finsight {
namespace io {

// JSON views of the insight model. Optional fields are omitted when empty,
// dates are written as "YYYY-MM-DD" and enums by name.
nlohmann::json to_json(const PeriodBucket& bucket);
nlohmann::json to_json(const Insight& insight);
nlohmann::json to_json(const InsightDetail& detail);
nlohmann::json to_json(const HealthScore& score);

nlohmann::json insights_to_json(const std::vector<Insight>& insights);
nlohmann::json buckets_to_json(const std::vector<PeriodBucket>& buckets);

// Write a JSON document (2-space indent when pretty printing)
void write_json(std::ostream& os, const nlohmann::json& document, bool pretty_print = true);

// Write a JSON document to a file
// @throws std::runtime_error if the file cannot be opened
void write_json(const std::string& filepath, const nlohmann::json& document, bool pretty_print = true);

} // namespace io
} // namespace finsight

#endif // FINSIGHT_IO_JSON_WRITER_HPP
