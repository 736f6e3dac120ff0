#pragma once

#include <nlohmann/json.hpp>

#include "model/feedback.hpp"
#include "model/optimization_action.hpp"
#include "model/snapshot.hpp"
#include "reasoning/classifier.hpp"

namespace pwr_agent::store {

using json = nlohmann::json;

json snapshot_to_json(const model::system_snapshot& snapshot);

// Missing metrics get the monitor defaults and set their bit in
// system_snapshot::unavailable. A stored "unavailable" mask wins.
// Throws std::runtime_error when the document is not an object or a field
// has the wrong type.
model::system_snapshot snapshot_from_json(const json& doc);

json action_to_json(const model::optimization_action& action);
model::optimization_action action_from_json(const json& doc);

json feedback_to_json(const model::feedback_record& feedback);
model::feedback_record feedback_from_json(const json& doc);

json outcome_to_json(const model::decision_outcome& outcome);
model::decision_outcome outcome_from_json(const json& doc);

json classifier_to_json(const reasoning::SeverityClassifier& classifier);
reasoning::SeverityClassifier classifier_from_json(const json& doc);

}  // namespace pwr_agent::store
