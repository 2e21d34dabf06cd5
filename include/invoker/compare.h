#ifndef INCLUDE_INVOKER_COMPARE_H_
#define INCLUDE_INVOKER_COMPARE_H_

#include <string>

#include "request.h"

// true if the program output is accepted against the expected answer;
// message (if not null) is set to the first difference otherwise
bool CompareOutput(const std::string& output, const std::string& answer,
                   CompareMode mode, double threshold = 1e-6, std::string* message = nullptr);

#endif  // INCLUDE_INVOKER_COMPARE_H_
