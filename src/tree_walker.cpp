#include "sift/tree_walker.h"

#include "sift/logger.h"
#include "sift/path_utils.h"
#include "sift/perf.h"
#include "sift/platform.h"

#include <optional>
#include <system_error>
#include <utility>

namespace sift {

namespace fs = std::filesystem;

struct TreeWalker::iterator::State {
    std::vector<fs::directory_iterator> stack;
    fs::path current;
    std::stop_token stop;
    bool finished = false;

    bool open(const fs::path& dir) {
        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            Logger::instance().debug("walk: cannot open {}: {}", dir.string(), ec.message());
            return false;
        }
        stack.push_back(std::move(it));
        return true;
    }

    void advance() {
        auto& perf_manager = perf::Manager::Instance();
        while (!stack.empty()) {
            if (stop.stop_requested()) {
                Logger::instance().debug("walk: stop requested");
                break;
            }
            auto& top = stack.back();
            if (top == fs::directory_iterator{}) {
                stack.pop_back();
                continue;
            }

            const fs::directory_entry entry = *top;
            std::error_code ec;
            top.increment(ec);
            if (ec) {
                Logger::instance().debug("walk: error reading {}: {}",
                                         entry.path().parent_path().string(), ec.message());
                stack.pop_back();
            }

            fs::file_status link_status = entry.symlink_status(ec);
            if (ec) {
                // Vanished between enumeration and inspection.
                Logger::instance().debug("walk: dropped {}: {}", entry.path().string(), ec.message());
                continue;
            }

            current = entry.path();
            perf_manager.IncrementCounter("walker::entries");
            if (fs::is_directory(link_status)) {
                if (Platform::canTraverse(current)) {
                    open(current);
                } else {
                    perf_manager.IncrementCounter("walker::skipped_dirs");
                    Logger::instance().debug("walk: not descending into {}", current.string());
                }
            }
            return;
        }
        stack.clear();
        current.clear();
        finished = true;
    }
};

TreeWalker::iterator::iterator(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

TreeWalker::iterator::reference TreeWalker::iterator::operator*() const {
    return state_->current;
}

TreeWalker::iterator& TreeWalker::iterator::operator++() {
    if (state_ && !state_->finished) {
        state_->advance();
    }
    return *this;
}

bool TreeWalker::iterator::done() const noexcept {
    return !state_ || state_->finished;
}

TreeWalker::TreeWalker(fs::path root, std::stop_token stop)
    : root_(PathUtils::Normalize(root)),
      stop_(std::move(stop)) {}

TreeWalker::iterator TreeWalker::begin() const {
    auto state = std::make_shared<iterator::State>();
    state->stop = stop_;

    std::error_code ec;
    if (!fs::is_directory(root_, ec) || !Platform::canTraverse(root_) || !state->open(root_)) {
        Logger::instance().debug("walk: root {} is not a traversable directory", root_.string());
        state->finished = true;
        return iterator(std::move(state));
    }
    state->advance();
    return iterator(std::move(state));
}

} // namespace sift
