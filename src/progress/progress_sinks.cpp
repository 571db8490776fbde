#include "progress/progress_sinks.hpp"

#include "util/format.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <string>

namespace ovaup {

namespace {

std::atomic_bool g_progress_line_active{false};

constexpr int kBarWidth = 30;

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    int pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}

} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressEvent& e) {
    nlohmann::json j = {
        {"item", std::string(e.item)},
        {"item_percent", Percent(e.item_done, e.item_total)},
        {"item_uploaded", e.item_done},
        {"item_total", e.item_total},
        {"overall_percent", Percent(e.overall_done, e.overall_total)},
        {"overall_uploaded", e.overall_done},
        {"overall_total", e.overall_total},
        {"bytes_per_second", static_cast<std::uint64_t>(e.bytes_per_second)},
        {"eta_seconds", e.eta.count()},
    };

    std::lock_guard<std::mutex> lk(mu_);
    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good()) {
        LogDebug("progress: cannot write %s", tmp_path.c_str());
        return;
    }

    os << j.dump();
    os.close();

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0)
        LogDebug("progress: cannot replace %s", path_.c_str());
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    std::lock_guard<std::mutex> lk(mu_);

    const int item_pct = Percent(e.item_done, e.item_total);
    const int overall_pct = Percent(e.overall_done, e.overall_total);

    const std::string cur_item(e.item);
    if (cur_item != last_item_) {
        item_finished_ = false;
        last_item_ = cur_item;
    }
    if (item_finished_) return;

    const int filled = e.item_total > 0 ? (item_pct * kBarWidth) / 100 : 0;
    std::string bar(static_cast<size_t>(filled), '=');
    if (filled < kBarWidth) {
        bar += '>';
        bar.append(static_cast<size_t>(kBarWidth - filled - 1), ' ');
    }

    const std::string done = FormatBytes(e.item_done);
    const std::string total = FormatBytes(e.item_total);
    const std::string speed = FormatBytes(static_cast<std::uint64_t>(e.bytes_per_second));

    if (e.overall_total > 0) {
        std::fprintf(stderr,
                     "\r%s [%s] %3d%% %s/%s | %s/s | ETA %s | total %3d%%   ",
                     cur_item.c_str(), bar.c_str(), item_pct, done.c_str(), total.c_str(),
                     speed.c_str(), FormatDuration(e.eta).c_str(), overall_pct);
    } else {
        std::fprintf(stderr,
                     "\r%s [%s] %3d%% %s/%s | %s/s   ",
                     cur_item.c_str(), bar.c_str(), item_pct, done.c_str(), total.c_str(),
                     speed.c_str());
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.item_total > 0 && e.item_done >= e.item_total) {
        std::fprintf(stderr, "\n");
        item_finished_ = true;
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace ovaup
