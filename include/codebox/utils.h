#ifndef INCLUDE_CODEBOX_UTILS_H_
#define INCLUDE_CODEBOX_UTILS_H_

#include <string>

#include "execution.h"

// 8 hex digits, drawn independently by every thread
std::string NewExecutionId();

const char* StatusToDesc(ExecutionStatus);
const char* StatusToAbr(ExecutionStatus);
ExecutionStatus AbrToStatus(const std::string&);

// drop bytes that are not part of a valid UTF-8 sequence
std::string SanitizeUtf8(const std::string&);

#endif  // INCLUDE_CODEBOX_UTILS_H_
