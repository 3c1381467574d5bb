#pragma once

#include <string>

namespace powersim {

// Log lines go to stderr; stdout carries protocol responses only.
void setLogQuiet(bool quiet);

void logInfo(const std::string& message);
void logWarning(const std::string& message);
void logError(const std::string& message);

}  // namespace powersim
