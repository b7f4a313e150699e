#pragma once

// Console logging. Every line carries a bracketed subsystem tag, e.g.
//   logPrintf("[boot] ui ready\n");
// stdout is captured by the journal when running as a service.

void logPrintf(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
void logErrorf(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

void setVerboseLogging(bool enabled);
bool verboseLogging();
