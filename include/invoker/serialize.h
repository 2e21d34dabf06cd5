#ifndef INCLUDE_INVOKER_SERIALIZE_H_
#define INCLUDE_INVOKER_SERIALIZE_H_

#include <nlohmann/json.hpp>

#include "request.h"

// throws nlohmann::json::exception on malformed input and EngineError on invalid values
ExecutionRequest RequestFromJSON(const nlohmann::json&);
nlohmann::json RequestJSON(const ExecutionRequest&);

nlohmann::json StageResultJSON(const StageResult&);
nlohmann::json ReportJSON(const ExecutionReport&);

#endif  // INCLUDE_INVOKER_SERIALIZE_H_
