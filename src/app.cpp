#include "sift/app.h"

#include <chrono>
#include <csignal>
#include <exception>
#include <future>
#include <iostream>
#include <stop_token>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

#include "sift/directory.h"
#include "sift/duplicates.h"
#include "sift/file_operations.h"
#include "sift/logger.h"
#include "sift/metadata.h"
#include "sift/path_utils.h"
#include "sift/perf.h"
#include "sift/platform.h"
#include "sift/resources.h"
#include "sift/scanners.h"
#include "sift/search.h"
#include "sift/suggestions.h"

namespace fs = std::filesystem;

namespace sift {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void HandleInterrupt(int) {
    g_interrupted = 1;
}

void ReportError(std::string_view message) {
    std::cerr << "sift: " << message << "\n";
}

VisitResult ResultFor(const Status& status) {
    if (status.ok()) {
        return VisitResult::Ok;
    }
    ReportError(status.message());
    return VisitResult::Minor;
}

// Runs `scan` on a worker thread. SIGINT is turned into a stop request;
// `interrupted` tells whether that happened before the scan finished.
template <typename Scan>
auto RunInterruptible(Scan scan, bool& interrupted) -> std::invoke_result_t<Scan&, std::stop_token> {
    using Result = std::invoke_result_t<Scan&, std::stop_token>;
    using namespace std::chrono_literals;

    std::promise<Result> promise;
    std::future<Result> future = promise.get_future();

    g_interrupted = 0;
    auto previous = std::signal(SIGINT, HandleInterrupt);

    std::jthread worker([&scan, &promise](std::stop_token stop) {
        try {
            promise.set_value(scan(stop));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    });

    while (future.wait_for(50ms) != std::future_status::ready) {
        if (g_interrupted != 0 && !worker.get_stop_source().stop_requested()) {
            Logger::instance().info("interrupt received, stopping scan");
            worker.request_stop();
        }
    }
    worker.join();
    std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous);

    interrupted = worker.get_stop_source().stop_requested();
    if (interrupted) {
        ReportError("scan interrupted, results are partial");
    }
    return future.get();
}

} // namespace

int App::run(int argc, char** argv) {
    Platform::enableVirtualTerminal();
    ResourceManager::initPaths();

    config_ = &parser_.Parse(argc, argv);
    Logger::instance().set_level(options().log_level());

    perf::Manager& perf_manager = perf::Manager::Instance();
    perf_manager.set_enabled(options().perf_logging());
    std::optional<perf::Timer> run_timer;
    if (perf_manager.enabled()) {
        run_timer.emplace("app::run");
    }

    renderer_ = std::make_unique<Renderer>(std::cout, Renderer::OptionsFromConfig(options()));

    VisitResult rc = VisitResult::Ok;
    try {
        rc = dispatch();
    } catch (const std::exception& e) {
        ReportError(std::string("error: ") + e.what());
        rc = VisitResult::Serious;
    }
    std::cout.flush();

    renderer_.reset();
    cache_.reset();
    history_.reset();
    config_ = nullptr;

    if (perf_manager.enabled()) {
        run_timer.reset();
        perf_manager.Report(std::cerr);
    }

    return static_cast<int>(rc);
}

VisitResult App::dispatch() {
    using Command = Config::Command;
    switch (options().command()) {
        case Command::List:
            return runList();
        case Command::Find:
            return runFind();
        case Command::Hash:
            return runHash();
        case Command::Dupes:
            return runDupes();
        case Command::Large:
            return runLarge();
        case Command::Old:
            return runOld();
        case Command::Open:
            return runOpen();
        case Command::Recent:
            return runRecent();
        case Command::Frequent:
            return runFrequent();
        case Command::Suggest:
            return runSuggest();
        case Command::Copy:
        case Command::Move:
        case Command::Remove:
        case Command::MakeDir:
        case Command::Rename:
            return runFileOperation();
        case Command::Space:
            return runSpace();
        case Command::None:
            break;
    }
    ReportError("no command given");
    return VisitResult::Serious;
}

HistoryStore& App::history() {
    if (!history_) {
        history_ = std::make_unique<HistoryStore>(options().history_file());
        if (!history_->Load()) {
            ReportError("history file was unreadable and has been reset: " + options().history_file().string());
        }
    }
    return *history_;
}

VisitResult App::checkScanRoot(const fs::path& root) const {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        ReportError(MakeError(ErrorKind::NotFound, root, "no such directory").message);
        return VisitResult::Serious;
    }
    if (!fs::is_directory(root, ec)) {
        ReportError(MakeError(ErrorKind::NotADirectory, root, "not a directory").message);
        return VisitResult::Serious;
    }
    if (!Platform::canTraverse(root)) {
        ReportError(MakeError(ErrorKind::PermissionDenied, root, "permission denied").message);
        return VisitResult::Serious;
    }
    return VisitResult::Ok;
}

std::size_t App::limitOr(std::size_t fallback) const {
    return options().result_limit().value_or(fallback);
}

VisitResult App::runList() {
    const fs::path path = options().paths().front();
    Listing listing = ListDirectory(path);
    if (!listing.ok()) {
        ReportError(listing.error->message);
        return VisitResult::Serious;
    }
    if (options().by_category()) {
        renderer().RenderGroups(CategorizeItems(listing.items));
    } else {
        renderer().RenderItems(listing.items);
    }
    return VisitResult::Ok;
}

VisitResult App::runFind() {
    const fs::path root = options().paths().front();
    if (VisitResult rc = checkScanRoot(root); rc != VisitResult::Ok) {
        return rc;
    }

    SearchCriteria criteria;
    criteria.keyword = options().argument();
    criteria.mode = options().search_mode();
    criteria.case_sensitive = options().case_sensitive();
    criteria.min_size = options().search_min_size();
    criteria.max_size = options().search_max_size();
    criteria.min_age_days = options().search_min_age_days();

    bool interrupted = false;
    auto results = RunInterruptible(
        [&](std::stop_token stop) { return Search(root, criteria, stop); }, interrupted);
    renderer().RenderItems(results, true);
    return interrupted ? VisitResult::Minor : VisitResult::Ok;
}

VisitResult App::runHash() {
    VisitResult rc = VisitResult::Ok;
    for (const auto& name : options().paths()) {
        const fs::path path = name;
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            ReportError(MakeError(ErrorKind::InvalidTarget, path, "is a directory").message);
            rc = VisitResultAggregator::Combine(rc, VisitResult::Minor);
            continue;
        }
        auto digest = Digest(path, options().algorithm(), options().chunk_size());
        if (!digest) {
            ReportError(MakeError(ErrorKind::IOFailure, path, "cannot read file").message);
            rc = VisitResultAggregator::Combine(rc, VisitResult::Minor);
            continue;
        }
        renderer().RenderDigest(*digest, path);
    }
    return rc;
}

VisitResult App::runDupes() {
    const fs::path root = options().paths().front();
    if (VisitResult rc = checkScanRoot(root); rc != VisitResult::Ok) {
        return rc;
    }

    if (options().use_cache()) {
        cache_ = DigestCache::Open(options().digest_cache());
        if (!cache_) {
            Logger::instance().warn("digest cache unavailable, hashing everything");
        }
    }

    DuplicateOptions dup_options;
    dup_options.algorithm = options().algorithm();
    dup_options.min_size = options().duplicate_min_size();
    dup_options.jobs = options().jobs();
    dup_options.chunk_size = options().chunk_size();
    dup_options.cache = cache_.get();

    bool interrupted = false;
    auto groups = RunInterruptible(
        [&](std::stop_token stop) { return FindDuplicates(root, dup_options, stop); }, interrupted);
    if (interrupted) {
        return VisitResult::Minor;
    }
    renderer().RenderDuplicates(groups);
    return VisitResult::Ok;
}

VisitResult App::runLarge() {
    const fs::path root = options().paths().front();
    if (VisitResult rc = checkScanRoot(root); rc != VisitResult::Ok) {
        return rc;
    }
    const std::uintmax_t min_size = options().large_min_size();
    const std::size_t limit = limitOr(kDefaultScanLimit);

    bool interrupted = false;
    auto results = RunInterruptible(
        [&](std::stop_token stop) { return FindLargeFiles(root, min_size, limit, stop); }, interrupted);
    renderer().RenderItems(results, true);
    return interrupted ? VisitResult::Minor : VisitResult::Ok;
}

VisitResult App::runOld() {
    const fs::path root = options().paths().front();
    if (VisitResult rc = checkScanRoot(root); rc != VisitResult::Ok) {
        return rc;
    }
    const unsigned days = options().old_min_age_days();
    const std::size_t limit = limitOr(kDefaultScanLimit);

    bool interrupted = false;
    auto results = RunInterruptible(
        [&](std::stop_token stop) { return FindOldFiles(root, days, limit, stop); }, interrupted);
    renderer().RenderItems(results, true);
    return interrupted ? VisitResult::Minor : VisitResult::Ok;
}

VisitResult App::runOpen() {
    HistoryStore& store = history();
    VisitResult rc = VisitResult::Ok;
    for (const auto& name : options().paths()) {
        const fs::path path = name;
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            ReportError(MakeError(ErrorKind::NotFound, path, "no such file or directory").message);
            rc = VisitResultAggregator::Combine(rc, VisitResult::Minor);
            continue;
        }
        store.RecordAccess(path);
    }
    return rc;
}

VisitResult App::runRecent() {
    renderer().RenderItems(history().RecentItems(), true);
    return VisitResult::Ok;
}

VisitResult App::runFrequent() {
    HistoryStore& store = history();
    auto items = store.FrequentItems(limitOr(HistoryStore::kDefaultFrequentLimit));
    renderer().RenderFrequent(items, store.Snapshot());
    return VisitResult::Ok;
}

VisitResult App::runSuggest() {
    const fs::path current = PathUtils::Normalize(options().paths().front());
    std::error_code ec;
    if (!fs::is_directory(current, ec)) {
        ReportError(MakeError(ErrorKind::NotADirectory, current, "not a directory").message);
        return VisitResult::Serious;
    }
    auto suggestions = ContextualSuggestions(history().Snapshot(), current, limitOr(kDefaultSuggestionLimit));
    renderer().RenderItems(suggestions, true);
    return VisitResult::Ok;
}

VisitResult App::runFileOperation() {
    using Command = Config::Command;
    const auto& paths = options().paths();
    const std::string& argument = options().argument();

    switch (options().command()) {
        case Command::Copy:
            return ResultFor(CopyItem(paths.front(), argument));
        case Command::Move:
            return ResultFor(MoveItem(paths.front(), argument));
        case Command::MakeDir:
            return ResultFor(CreateFolder(paths.front(), argument));
        case Command::Rename:
            return ResultFor(RenameItem(paths.front(), argument));
        case Command::Remove: {
            VisitResult rc = VisitResult::Ok;
            for (const auto& path : paths) {
                rc = VisitResultAggregator::Combine(rc, ResultFor(DeleteItem(path)));
            }
            return rc;
        }
        default:
            break;
    }
    return VisitResult::Serious;
}

VisitResult App::runSpace() {
    const fs::path path = options().paths().front();
    auto info = QuerySpace(path);
    if (!info) {
        ReportError(MakeError(ErrorKind::IOFailure, path, "cannot query filesystem space").message);
        return VisitResult::Serious;
    }
    renderer().RenderSpace(path, *info);
    return VisitResult::Ok;
}

}  // namespace sift
