#pragma once

#include "progress/progress.hpp"

#include <mutex>
#include <string>

namespace ovaup {

// Rewrites a small JSON status document (tmp file + rename) on every event.
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::mutex mu_;
    std::string path_;
};

// Single self-overwriting line on stderr: bar, percentages, speed and ETA.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::mutex mu_;
    std::string last_item_;
    bool item_finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace ovaup
