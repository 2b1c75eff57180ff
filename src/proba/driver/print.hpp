#pragma once

#include <string>

#include "proba/common/diagnostic.hpp"

namespace proba::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace proba::driver
