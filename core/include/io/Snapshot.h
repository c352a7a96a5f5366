#ifndef KERNEL_SNAPSHOT_H
#define KERNEL_SNAPSHOT_H

#include "kernel/Kernel.h"
#include <string>
#include <iosfwd>

// JSON export of the run summary: config, latest metrics, event logs
std::string historyToJson(const Kernel& kernel);

// CSV metrics logging, one row for the current state
void logMetrics(const Kernel& kernel, std::ostream& out);
void logMetricsHeader(std::ostream& out);

// Whole recorded history as CSV with header
void writeHistoryCsv(const Kernel& kernel, std::ostream& out);

#endif
