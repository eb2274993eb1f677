#include "progress.hpp"

#include <cstdio>
#include <utility>
#include <unistd.h>

#include <fmt/core.h>

std::string formatBytes(std::int64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes >= GB)
    {
        return fmt::format("{:.2f} GB", bytes / GB);
    }
    else if (bytes >= MB)
    {
        return fmt::format("{:.2f} MB", bytes / MB);
    }
    else if (bytes >= KB)
    {
        return fmt::format("{:.2f} KB", bytes / KB);
    }
    return fmt::format("{} B", bytes);
}

std::string formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
}

ProgressMeter::ProgressMeter(std::string label)
    : label_(std::move(label)),
      startTime_(std::chrono::steady_clock::now()),
      lastPrintedTime_(startTime_)
{
    isTerminalOutput_ = ::isatty(fileno(stdout));
}

void ProgressMeter::update(std::int64_t total, std::int64_t received)
{
    auto now = std::chrono::steady_clock::now();
    auto sinceStart = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_).count();
    auto sinceLastPrint = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastPrintedTime_).count();
    bool isComplete = total > 0 && received >= total;

    if (!isComplete)
    {
        // Don't flash a bar for instant downloads
        if (sinceStart < 500)
        {
            return;
        }
        if (sinceLastPrint < (isTerminalOutput_ ? 200 : 1000))
        {
            return;
        }
    }
    else if (lastPrintedPercentage_ >= 100.0)
    {
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
    double speed = elapsed > 0 ? static_cast<double>(received) / elapsed : 0.0;

    std::string line;
    if (total <= 0)
    {
        line = fmt::format("{}: {} | {}/s", label_, formatBytes(received),
                           formatBytes(static_cast<std::int64_t>(speed)));
    }
    else
    {
        double percentage = (static_cast<double>(received) / total) * 100.0;
        if (!isTerminalOutput_ && !isComplete && lastPrintedPercentage_ >= 0.0 &&
            percentage < lastPrintedPercentage_ + 1.0)
        {
            return;
        }

        long eta = speed > 0 ? static_cast<long>((total - received) / speed) : -1;

        constexpr int barWidth = 40;
        int filled = static_cast<int>((percentage / 100.0) * barWidth);
        std::string bar = "[";
        for (int i = 0; i < barWidth; ++i)
        {
            bar += i < filled ? '=' : (i == filled ? '>' : ' ');
        }
        bar += "]";

        line = fmt::format("{} {:.1f}% | {} / {} | {}/s | ETA: {}",
                           bar, percentage, formatBytes(received), formatBytes(total),
                           formatBytes(static_cast<std::int64_t>(speed)), formatDuration(eta));
        lastPrintedPercentage_ = percentage;
    }

    // Runs inside the transfer callback: stdio reports errors, it doesn't throw
    const std::string output = isTerminalOutput_ ? fmt::format("\r{}\033[K", line) : line + "\n";
    std::fputs(output.c_str(), stdout);
    std::fflush(stdout);
    drewLine_ = true;
    lastPrintedTime_ = now;
}

void ProgressMeter::finish()
{
    if (drewLine_ && isTerminalOutput_)
    {
        std::fputc('\n', stdout);
    }
    drewLine_ = false;
}
