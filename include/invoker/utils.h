#ifndef INCLUDE_INVOKER_UTILS_H_
#define INCLUDE_INVOKER_UTILS_H_

#include <string>

#include "errors.h"
#include "request.h"

const char* VerdictToDesc(Verdict);
const char* VerdictToAbr(Verdict);
Verdict AbrToVerdict(const std::string&);

const char* StageKindName(StageKind);
// returns false if the name is unknown
bool GetStageKind(const std::string&, StageKind&);

const char* CompareModeName(CompareMode);
bool GetCompareMode(const std::string&, CompareMode&);

// logging
const char* LimitKindName(LimitKind);
const char* ErrorCodeName(ErrorCode);

#endif  // INCLUDE_INVOKER_UTILS_H_
