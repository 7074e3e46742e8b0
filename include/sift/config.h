#pragma once

#include "sift/digest.h"
#include "sift/logger.h"
#include "sift/search.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sift {

class Config {
public:
    enum class Command {
        None,
        List,
        Find,
        Hash,
        Dupes,
        Large,
        Old,
        Open,
        Recent,
        Frequent,
        Suggest,
        Copy,
        Move,
        Remove,
        MakeDir,
        Rename,
        Space
    };

    static Config& Instance();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void Reset();

    Command command() const;
    void set_command(Command value);

    const std::vector<std::string>& paths() const;
    std::vector<std::string>& mutable_paths();
    void set_paths(std::vector<std::string> value);

    // Second positional argument: search keyword, folder name or new name.
    const std::string& argument() const;
    void set_argument(std::string value);

    bool by_category() const;
    void set_by_category(bool value);

    SearchMode search_mode() const;
    void set_search_mode(SearchMode value);

    bool case_sensitive() const;
    void set_case_sensitive(bool value);

    std::uintmax_t search_min_size() const;
    void set_search_min_size(std::uintmax_t value);

    std::uintmax_t search_max_size() const;
    void set_search_max_size(std::uintmax_t value);

    unsigned search_min_age_days() const;
    void set_search_min_age_days(unsigned value);

    DigestAlgorithm algorithm() const;
    void set_algorithm(DigestAlgorithm value);

    std::size_t chunk_size() const;
    void set_chunk_size(std::size_t value);

    std::uintmax_t duplicate_min_size() const;
    void set_duplicate_min_size(std::uintmax_t value);

    unsigned jobs() const;
    void set_jobs(unsigned value);

    bool use_cache() const;
    void set_use_cache(bool value);

    std::uintmax_t large_min_size() const;
    void set_large_min_size(std::uintmax_t value);

    unsigned old_min_age_days() const;
    void set_old_min_age_days(unsigned value);

    // Explicit --limit or configured result_limit; commands fall back to
    // their own default when unset.
    const std::optional<std::size_t>& result_limit() const;
    void set_result_limit(std::optional<std::size_t> value);

    const std::filesystem::path& history_file() const;
    void set_history_file(std::filesystem::path value);

    const std::filesystem::path& digest_cache() const;
    void set_digest_cache(std::filesystem::path value);

    bool no_icons() const;
    void set_no_icons(bool value);

    bool bytes() const;
    void set_bytes(bool value);

    const std::string& time_style() const;
    void set_time_style(std::string value);

    Logger::Level log_level() const;
    void set_log_level(Logger::Level value);

    bool perf_logging() const;
    void set_perf_logging(bool value);

private:
    Config() { Reset(); }

    Command command_ = Command::None;
    std::vector<std::string> paths_{};
    std::string argument_{};
    bool by_category_ = false;

    SearchMode search_mode_ = SearchMode::Name;
    bool case_sensitive_ = false;
    std::uintmax_t search_min_size_ = 0;
    std::uintmax_t search_max_size_ = 0;
    unsigned search_min_age_days_ = 0;

    DigestAlgorithm algorithm_ = DigestAlgorithm::Md5;
    std::size_t chunk_size_ = kDefaultChunkSize;
    std::uintmax_t duplicate_min_size_ = 0;
    unsigned jobs_ = 0;
    bool use_cache_ = true;

    std::uintmax_t large_min_size_ = 0;
    unsigned old_min_age_days_ = 0;
    std::optional<std::size_t> result_limit_{};

    std::filesystem::path history_file_{};
    std::filesystem::path digest_cache_{};

    bool no_icons_ = false;
    bool bytes_ = false;
    std::string time_style_{};
    Logger::Level log_level_ = Logger::Level::Error;
    bool perf_logging_ = false;
};

} // namespace sift
