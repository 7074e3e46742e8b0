#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "sift/command_line_parser.h"
#include "sift/config.h"
#include "sift/digest_cache.h"
#include "sift/history_store.h"
#include "sift/renderer.h"
#include "sift/visit_result.h"

namespace sift {

class App {
public:
    int run(int argc, char** argv);

private:
    const Config& options() const { return *config_; }
    Renderer& renderer() { return *renderer_; }

    VisitResult dispatch();

    VisitResult runList();
    VisitResult runFind();
    VisitResult runHash();
    VisitResult runDupes();
    VisitResult runLarge();
    VisitResult runOld();
    VisitResult runOpen();
    VisitResult runRecent();
    VisitResult runFrequent();
    VisitResult runSuggest();
    VisitResult runFileOperation();
    VisitResult runSpace();

    HistoryStore& history();
    // Serious when `root` is not a usable directory.
    VisitResult checkScanRoot(const std::filesystem::path& root) const;
    std::size_t limitOr(std::size_t fallback) const;

    CommandLineParser parser_{};
    Config* config_{nullptr};
    std::unique_ptr<Renderer> renderer_{};
    std::unique_ptr<HistoryStore> history_{};
    std::unique_ptr<DigestCache> cache_{};
};

}  // namespace sift
