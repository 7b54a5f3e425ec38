#pragma once

namespace sc {

// Diagnostics are written to stderr, prefixed with the subsystem tag:
//   [Serialization] skipping record ...
void setLogEnabled(bool enabled);
bool logEnabled();

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
void logMessage(const char* tag, const char* fmt, ...);

} // namespace sc
