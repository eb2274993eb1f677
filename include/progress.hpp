#pragma once

#include <chrono>
#include <cstdint>
#include <string>

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 */
std::string formatBytes(std::int64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s")
 */
std::string formatDuration(long seconds);

/**
 * Progress output for a single download.
 * On a terminal the line is redrawn in place (at most 5 times per second);
 * otherwise one line is printed per second or per whole percent.
 */
class ProgressMeter
{
public:
    explicit ProgressMeter(std::string label);

    void update(std::int64_t total, std::int64_t received);

    /**
     * Terminate the progress line if one was drawn.
     */
    void finish();

private:
    std::string label_;
    bool isTerminalOutput_ = true;
    bool drewLine_ = false;
    double lastPrintedPercentage_ = -1.0;
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastPrintedTime_;
};
