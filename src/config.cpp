#include "sift/config.h"

#include "sift/duplicates.h"
#include "sift/perf.h"
#include "sift/resources.h"
#include "sift/scanners.h"

#include <utility>

namespace sift {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

void Config::Reset() {
    perf::Timer timer("config::reset");

    command_ = Command::None;
    paths_.clear();
    argument_.clear();
    by_category_ = false;

    search_mode_ = SearchMode::Name;
    case_sensitive_ = false;
    search_min_size_ = 0;
    search_max_size_ = 0;
    search_min_age_days_ = 0;

    algorithm_ = DigestAlgorithm::Md5;
    chunk_size_ = kDefaultChunkSize;
    duplicate_min_size_ = DuplicateOptions{}.min_size;
    jobs_ = 0;
    use_cache_ = true;

    large_min_size_ = kDefaultLargeFileSize;
    old_min_age_days_ = kDefaultOldFileDays;
    result_limit_.reset();

    history_file_ = ResourceManager::defaultHistoryPath();
    digest_cache_ = ResourceManager::defaultCachePath();

    no_icons_ = false;
    bytes_ = false;
    time_style_ = "long-iso";
    log_level_ = Logger::Level::Error;
    perf_logging_ = false;
}

Config::Command Config::command() const { return command_; }
void Config::set_command(Command value) { command_ = value; }

const std::vector<std::string>& Config::paths() const { return paths_; }
std::vector<std::string>& Config::mutable_paths() { return paths_; }
void Config::set_paths(std::vector<std::string> value) { paths_ = std::move(value); }

const std::string& Config::argument() const { return argument_; }
void Config::set_argument(std::string value) { argument_ = std::move(value); }

bool Config::by_category() const { return by_category_; }
void Config::set_by_category(bool value) { by_category_ = value; }

SearchMode Config::search_mode() const { return search_mode_; }
void Config::set_search_mode(SearchMode value) { search_mode_ = value; }

bool Config::case_sensitive() const { return case_sensitive_; }
void Config::set_case_sensitive(bool value) { case_sensitive_ = value; }

std::uintmax_t Config::search_min_size() const { return search_min_size_; }
void Config::set_search_min_size(std::uintmax_t value) { search_min_size_ = value; }

std::uintmax_t Config::search_max_size() const { return search_max_size_; }
void Config::set_search_max_size(std::uintmax_t value) { search_max_size_ = value; }

unsigned Config::search_min_age_days() const { return search_min_age_days_; }
void Config::set_search_min_age_days(unsigned value) { search_min_age_days_ = value; }

DigestAlgorithm Config::algorithm() const { return algorithm_; }
void Config::set_algorithm(DigestAlgorithm value) { algorithm_ = value; }

std::size_t Config::chunk_size() const { return chunk_size_; }
void Config::set_chunk_size(std::size_t value) { chunk_size_ = value; }

std::uintmax_t Config::duplicate_min_size() const { return duplicate_min_size_; }
void Config::set_duplicate_min_size(std::uintmax_t value) { duplicate_min_size_ = value; }

unsigned Config::jobs() const { return jobs_; }
void Config::set_jobs(unsigned value) { jobs_ = value; }

bool Config::use_cache() const { return use_cache_; }
void Config::set_use_cache(bool value) { use_cache_ = value; }

std::uintmax_t Config::large_min_size() const { return large_min_size_; }
void Config::set_large_min_size(std::uintmax_t value) { large_min_size_ = value; }

unsigned Config::old_min_age_days() const { return old_min_age_days_; }
void Config::set_old_min_age_days(unsigned value) { old_min_age_days_ = value; }

const std::optional<std::size_t>& Config::result_limit() const { return result_limit_; }
void Config::set_result_limit(std::optional<std::size_t> value) { result_limit_ = value; }

const std::filesystem::path& Config::history_file() const { return history_file_; }
void Config::set_history_file(std::filesystem::path value) { history_file_ = std::move(value); }

const std::filesystem::path& Config::digest_cache() const { return digest_cache_; }
void Config::set_digest_cache(std::filesystem::path value) { digest_cache_ = std::move(value); }

bool Config::no_icons() const { return no_icons_; }
void Config::set_no_icons(bool value) { no_icons_ = value; }

bool Config::bytes() const { return bytes_; }
void Config::set_bytes(bool value) { bytes_ = value; }

const std::string& Config::time_style() const { return time_style_; }
void Config::set_time_style(std::string value) { time_style_ = std::move(value); }

Logger::Level Config::log_level() const { return log_level_; }
void Config::set_log_level(Logger::Level value) { log_level_ = value; }

bool Config::perf_logging() const { return perf_logging_; }
void Config::set_perf_logging(bool value) { perf_logging_ = value; }

} // namespace sift
