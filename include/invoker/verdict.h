#ifndef INCLUDE_INVOKER_VERDICT_H_
#define INCLUDE_INVOKER_VERDICT_H_

#include <string>
#include <vector>

#include "request.h"

// Deterministic; results must be in stage order. message is set to a short explanation
// of the deciding stage (if any).
Verdict EvaluateVerdict(const std::vector<StageResult>& results, std::string* message = nullptr);

// cpu & wall time summed and memory maxed over the run stages
RunMetrics SummarizeMetrics(const std::vector<StageResult>& results);

#endif  // INCLUDE_INVOKER_VERDICT_H_
