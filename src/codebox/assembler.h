#ifndef CODEBOX_ASSEMBLER_H_
#define CODEBOX_ASSEMBLER_H_

#include <map>
#include <string>

#include <codebox/execution.h>
#include "runner.h"
#include "environment.h"

// Regular files directly inside workdir, except the script itself.
// A file that cannot be read is recorded as "<Error reading file: ...>".
std::map<std::string, std::string> CollectProducedFiles(const ExecutionEnvironment&);

// Collects the produced files and releases env before returning, whatever happens.
ExecutionResult AssembleResult(const RawExecutionOutcome&, ExecutionEnvironment& env, const ExecutionLimits&);
ExecutionResult AssembleRejection(const std::string& id, const FilterVerdict&);
ExecutionResult AssembleEnvironmentError(const std::string& id);

#endif  // CODEBOX_ASSEMBLER_H_
