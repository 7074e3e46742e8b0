#include "sift/command_line_parser.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>

#include "sift/logger.h"
#include "sift/resources.h"
#include "sift/string_utils.h"
#include "sift/time_formatter.h"
#include "sift/version.h"

namespace sift {

namespace {

using Command = Config::Command;

class ConfigBuilder {
public:
    std::vector<std::string>& paths() { return paths_; }
    std::string& argument() { return argument_; }

    void SetCommand(Command command)
    {
        actions_.emplace_back([command](Config& cfg) { cfg.set_command(command); });
    }

    void SetByCategory(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_by_category(value); });
    }

    void SetSearchMode(SearchMode mode)
    {
        actions_.emplace_back([mode](Config& cfg) { cfg.set_search_mode(mode); });
    }

    void SetCaseSensitive(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_case_sensitive(value); });
    }

    void SetSearchMinSize(std::uintmax_t value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_search_min_size(value); });
    }

    void SetSearchMaxSize(std::uintmax_t value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_search_max_size(value); });
    }

    void SetSearchMinAgeDays(unsigned value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_search_min_age_days(value); });
    }

    void SetAlgorithm(DigestAlgorithm value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_algorithm(value); });
    }

    void SetChunkSize(std::size_t value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_chunk_size(value); });
    }

    void SetDuplicateMinSize(std::uintmax_t value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_duplicate_min_size(value); });
    }

    void SetJobs(unsigned value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_jobs(value); });
    }

    void SetUseCache(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_use_cache(value); });
    }

    void SetLargeMinSize(std::uintmax_t value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_large_min_size(value); });
    }

    void SetOldMinAgeDays(unsigned value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_old_min_age_days(value); });
    }

    void SetResultLimit(std::size_t value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_result_limit(value); });
    }

    void SetHistoryFile(std::string value)
    {
        actions_.emplace_back([value = std::move(value)](Config& cfg) { cfg.set_history_file(value); });
    }

    void SetDigestCache(std::string value)
    {
        actions_.emplace_back([value = std::move(value)](Config& cfg) { cfg.set_digest_cache(value); });
    }

    void SetNoIcons(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_no_icons(value); });
    }

    void SetBytes(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_bytes(value); });
    }

    void SetTimeStyle(std::string value)
    {
        actions_.emplace_back([value = std::move(value)](Config& cfg) { cfg.set_time_style(value); });
    }

    void SetLogLevel(Logger::Level value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_log_level(value); });
    }

    void SetPerfLogging(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_perf_logging(value); });
    }

    // Settings from the configuration file. They are applied before any
    // command-line action so that the command line wins.
    void AddDefault(std::function<void(Config&)> action)
    {
        defaults_.push_back(std::move(action));
    }

    Config& Build()
    {
        Config& cfg = Config::Instance();
        cfg.Reset();
        for (const auto& action : defaults_) {
            action(cfg);
        }
        for (const auto& action : actions_) {
            action(cfg);
        }
        cfg.set_paths(paths_);
        cfg.set_argument(argument_);
        if (cfg.paths().empty()) {
            const Command command = cfg.command();
            if (command == Command::List || command == Command::Suggest || command == Command::Space) {
                cfg.mutable_paths().push_back(".");
            }
        }
        return cfg;
    }

private:
    std::vector<std::function<void(Config&)>> defaults_{};
    std::vector<std::function<void(Config&)>> actions_{};
    std::vector<std::string> paths_{};
    std::string argument_{};
};

Logger::Level LevelForVerbosity(std::int64_t count)
{
    if (count >= 2) return Logger::Level::Debug;
    if (count == 1) return Logger::Level::Info;
    return Logger::Level::Error;
}

std::optional<bool> ParseBool(const std::string& text)
{
    const std::string lowered = StringUtils::ToLower(text);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") return true;
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") return false;
    return std::nullopt;
}

std::optional<unsigned long long> ParseCount(const std::string& text)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                      [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }
    try {
        return std::stoull(text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void ApplyConfigFile(const YamlLoader::Map& entries, ConfigBuilder& builder)
{
    auto& logger = Logger::instance();
    auto invalid = [&](const std::string& key, const std::string& value) {
        logger.warn("config: invalid value '{}' for {}, keeping the default", value, key);
    };

    for (const auto& [key, value] : entries) {
        if (key == "history_file") {
            builder.AddDefault([value](Config& cfg) { cfg.set_history_file(value); });
        } else if (key == "digest_cache") {
            builder.AddDefault([value](Config& cfg) { cfg.set_digest_cache(value); });
        } else if (key == "hash_algorithm") {
            if (auto algorithm = ParseAlgorithm(value)) {
                builder.AddDefault([a = *algorithm](Config& cfg) { cfg.set_algorithm(a); });
            } else {
                invalid(key, value);
            }
        } else if (key == "duplicate_min_size" || key == "large_min_size") {
            auto spec = CommandLineParser::ParseSizeSpec(value);
            if (!spec) {
                invalid(key, value);
            } else if (key == "duplicate_min_size") {
                builder.AddDefault([v = spec->value](Config& cfg) { cfg.set_duplicate_min_size(v); });
            } else {
                builder.AddDefault([v = spec->value](Config& cfg) { cfg.set_large_min_size(v); });
            }
        } else if (key == "old_min_age_days" || key == "jobs") {
            auto count = ParseCount(value);
            if (!count || *count > std::numeric_limits<unsigned>::max()) {
                invalid(key, value);
            } else if (key == "jobs") {
                builder.AddDefault([v = static_cast<unsigned>(*count)](Config& cfg) { cfg.set_jobs(v); });
            } else {
                builder.AddDefault([v = static_cast<unsigned>(*count)](Config& cfg) { cfg.set_old_min_age_days(v); });
            }
        } else if (key == "result_limit") {
            auto count = ParseCount(value);
            if (!count || *count == 0) {
                invalid(key, value);
            } else {
                builder.AddDefault([v = static_cast<std::size_t>(*count)](Config& cfg) { cfg.set_result_limit(v); });
            }
        } else if (key == "log_level") {
            if (auto level = Logger::ParseLevel(value)) {
                builder.AddDefault([l = *level](Config& cfg) { cfg.set_log_level(l); });
            } else {
                invalid(key, value);
            }
        } else if (key == "time_style") {
            if (TimeFormatter::IsValidStyle(value)) {
                builder.AddDefault([value](Config& cfg) { cfg.set_time_style(value); });
            } else {
                invalid(key, value);
            }
        } else if (key == "no_icons") {
            if (auto flag = ParseBool(value)) {
                builder.AddDefault([f = *flag](Config& cfg) { cfg.set_no_icons(f); });
            } else {
                invalid(key, value);
            }
        } else {
            logger.warn("config: unknown key '{}' ignored", key);
        }
    }
}

} // namespace

bool CommandLineParser::MultiplyWithOverflow(std::uintmax_t a, std::uintmax_t b, std::uintmax_t& result) {
    if (a == 0 || b == 0) {
        result = 0;
        return true;
    }
    if (a > std::numeric_limits<std::uintmax_t>::max() / b) {
        return false;
    }
    result = a * b;
    return true;
}

bool CommandLineParser::PowWithOverflow(std::uintmax_t base, unsigned exponent, std::uintmax_t& result) {
    result = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        if (!MultiplyWithOverflow(result, base, result)) {
            return false;
        }
    }
    return true;
}

std::optional<CommandLineParser::SizeSpec> CommandLineParser::ParseSizeSpec(const std::string& input) {
    const std::string text = StringUtils::Trim(input);
    if (text.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }

    std::string number_part = text.substr(0, pos);
    std::string suffix_part = StringUtils::Trim(std::string_view(text).substr(pos));
    if (number_part.empty()) {
        return std::nullopt;
    }

    std::uintmax_t number = 0;
    try {
        size_t idx = 0;
        unsigned long long parsed = std::stoull(number_part, &idx, 10);
        if (idx != number_part.size()) {
            return std::nullopt;
        }
        number = static_cast<std::uintmax_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::uintmax_t multiplier = 1;
    if (!suffix_part.empty()) {
        std::string upper;
        upper.reserve(suffix_part.size());
        for (char ch : suffix_part) {
            upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
        }

        bool binary = true;
        std::string base = upper;
        if (base == "B") {
            base.clear();
        } else if (!base.empty() && base.back() == 'B') {
            if (base.size() >= 2 && base[base.size() - 2] == 'I') {
                binary = true;
                base.erase(base.end() - 2, base.end());
            } else {
                binary = false;
                base.pop_back();
            }
        }

        if (!base.empty()) {
            const std::string letters = "KMGTPE";
            if (base.size() != 1) {
                return std::nullopt;
            }
            auto it = letters.find(base);
            if (it == std::string::npos) {
                return std::nullopt;
            }
            unsigned exponent = static_cast<unsigned>(it) + 1;
            std::uintmax_t base_value = binary ? 1024u : 1000u;
            if (!PowWithOverflow(base_value, exponent, multiplier)) {
                return std::nullopt;
            }
        }
    }

    std::uintmax_t scaled = 0;
    if (!MultiplyWithOverflow(number, multiplier, scaled)) {
        return std::nullopt;
    }

    SizeSpec spec;
    spec.value = scaled;
    spec.suffix = suffix_part;
    return spec;
}

Config& CommandLineParser::Parse(int argc, char** argv) {

    ConfigBuilder builder;

    CLI::App program{"Scan, search and deduplicate files; track what you open.", "sift"};
    program.set_version_flag("--version", Version::FullString());
    program.require_subcommand(1);
    program.fallthrough();
    program.footer(R"(The SIZE argument is an integer and optional unit (example: 10K is 10*1024).
Units are K,M,G,T,P,E (powers of 1024) or KB,MB,... (powers of 1000).
Binary prefixes can be used, too: KiB=K, MiB=M, and so on.

Defaults are read from sift.yaml in $SIFT_CONFIG_DIR, $XDG_CONFIG_HOME/sift
or ~/.config/sift.

Exit status:
 0  if OK,
 1  if minor problems (e.g., some targets failed, scan interrupted),
 2  if serious trouble (e.g., bad arguments, unusable root).)");

    auto size_option = [&](CLI::App* app, const std::string& name,
                           std::function<void(std::uintmax_t)> apply, const std::string& help) {
        auto* option = app->add_option_function<std::string>(name,
            [name, apply = std::move(apply)](const std::string& text) {
                auto spec = ParseSizeSpec(text);
                if (!spec) {
                    throw CLI::ValidationError(name, "invalid size '" + text + "'");
                }
                apply(spec->value);
            },
            help);
        option->type_name("SIZE");
        return option;
    };

    auto limit_option = [&](CLI::App* app) {
        app->add_option_function<std::size_t>("-n,--limit",
            [&](const std::size_t& value) { builder.SetResultLimit(value); },
            "show at most N results")
            ->type_name("N")
            ->check(CLI::PositiveNumber);
    };

    std::map<std::string, DigestAlgorithm> algorithm_map{
        {"md5", DigestAlgorithm::Md5},
        {"sha1", DigestAlgorithm::Sha1},
        {"sha256", DigestAlgorithm::Sha256},
    };
    auto algorithm_option = [&](CLI::App* app) {
        app->add_option_function<DigestAlgorithm>("-a,--algorithm",
            [&](const DigestAlgorithm& value) { builder.SetAlgorithm(value); },
            "digest algorithm: md5, sha1 or sha256")
            ->transform(CLI::CheckedTransformer(algorithm_map, CLI::ignore_case))
            ->type_name("ALGO");
    };

    auto global = program.add_option_group("Global options");
    global->add_option_function<std::string>("--history",
        [&](const std::string& value) { builder.SetHistoryFile(value); },
        "access history file")->type_name("FILE");
    global->add_option_function<std::string>("--cache",
        [&](const std::string& value) { builder.SetDigestCache(value); },
        "digest cache database")->type_name("FILE");
    global->add_flag_callback("--no-icons", [&]() { builder.SetNoIcons(true); },
        "do not print category icons");
    global->add_flag_callback("--bytes", [&]() { builder.SetBytes(true); },
        "show sizes in bytes");
    global->add_option_function<std::string>("--time-style",
        [&](const std::string& value) {
            if (!TimeFormatter::IsValidStyle(value)) {
                throw CLI::ValidationError("--time-style", "invalid style '" + value + "'");
            }
            builder.SetTimeStyle(value);
        },
        "long-iso, full-iso, iso or +FORMAT")->type_name("STYLE");
    std::int64_t verbosity = 0;
    global->add_flag("-v,--verbose", verbosity, "log progress; repeat for debug output");
    global->add_flag_callback("--perf-debug", [&]() { builder.SetPerfLogging(true); },
        "enable performance diagnostics");

    auto* ls = program.add_subcommand("ls", "list a directory, directories first");
    ls->add_option("path", builder.paths(), "directory to list")->type_name("PATH")->expected(0, 1);
    ls->add_flag_callback("--by-category", [&]() { builder.SetByCategory(true); },
        "group entries by category");
    ls->callback([&]() { builder.SetCommand(Command::List); });

    auto* find = program.add_subcommand("find", "search a tree by name, extension or content");
    find->add_option("root", builder.paths(), "directory to search")->required()->expected(1);
    find->add_option("keyword", builder.argument(), "text to look for")->required();
    std::map<std::string, SearchMode> mode_map{
        {"name", SearchMode::Name},
        {"extension", SearchMode::Extension},
        {"content", SearchMode::Content},
    };
    find->add_option_function<SearchMode>("-m,--mode",
        [&](const SearchMode& mode) { builder.SetSearchMode(mode); },
        "name, extension or content")
        ->transform(CLI::CheckedTransformer(mode_map, CLI::ignore_case))
        ->type_name("MODE");
    find->add_flag_callback("-c,--case-sensitive", [&]() { builder.SetCaseSensitive(true); },
        "match case exactly");
    size_option(find, "--min-size", [&](std::uintmax_t v) { builder.SetSearchMinSize(v); },
        "only files of at least SIZE");
    size_option(find, "--max-size", [&](std::uintmax_t v) { builder.SetSearchMaxSize(v); },
        "only files of at most SIZE");
    find->add_option_function<unsigned>("--older-than",
        [&](const unsigned& days) { builder.SetSearchMinAgeDays(days); },
        "only files not modified for DAYS days")->type_name("DAYS");
    find->callback([&]() { builder.SetCommand(Command::Find); });

    auto* hash = program.add_subcommand("hash", "print file digests");
    hash->add_option("files", builder.paths(), "files to digest")->required();
    algorithm_option(hash);
    size_option(hash, "--chunk-size", [&](std::uintmax_t v) {
        if (v == 0) {
            throw CLI::ValidationError("--chunk-size", "must be positive");
        }
        builder.SetChunkSize(static_cast<std::size_t>(v));
    }, "read SIZE bytes at a time");
    hash->callback([&]() { builder.SetCommand(Command::Hash); });

    auto* dupes = program.add_subcommand("dupes", "find files with identical content");
    dupes->add_option("root", builder.paths(), "directory to scan")->required()->expected(1);
    algorithm_option(dupes);
    size_option(dupes, "--min-size", [&](std::uintmax_t v) { builder.SetDuplicateMinSize(v); },
        "ignore files smaller than SIZE (default 1M)");
    dupes->add_option_function<unsigned>("-j,--jobs",
        [&](const unsigned& value) { builder.SetJobs(value); },
        "digest worker threads (default: one per core)")->type_name("N");
    dupes->add_flag_callback("--no-cache", [&]() { builder.SetUseCache(false); },
        "do not read or update the digest cache");
    dupes->callback([&]() { builder.SetCommand(Command::Dupes); });

    auto* large = program.add_subcommand("large", "list the largest files");
    large->add_option("root", builder.paths(), "directory to scan")->required()->expected(1);
    size_option(large, "--min-size", [&](std::uintmax_t v) { builder.SetLargeMinSize(v); },
        "threshold (default 100M)");
    limit_option(large);
    large->callback([&]() { builder.SetCommand(Command::Large); });

    auto* old = program.add_subcommand("old", "list files not modified for a long time");
    old->add_option("root", builder.paths(), "directory to scan")->required()->expected(1);
    old->add_option_function<unsigned>("-d,--days",
        [&](const unsigned& days) { builder.SetOldMinAgeDays(days); },
        "minimum age in days (default 365)")->type_name("DAYS");
    limit_option(old);
    old->callback([&]() { builder.SetCommand(Command::Old); });

    auto* open = program.add_subcommand("open", "record that paths were accessed");
    open->add_option("paths", builder.paths(), "accessed paths")->required();
    open->callback([&]() { builder.SetCommand(Command::Open); });

    auto* recent = program.add_subcommand("recent", "show recently accessed paths");
    recent->callback([&]() { builder.SetCommand(Command::Recent); });

    auto* frequent = program.add_subcommand("frequent", "show the most accessed paths");
    limit_option(frequent);
    frequent->callback([&]() { builder.SetCommand(Command::Frequent); });

    auto* suggest = program.add_subcommand("suggest", "suggest paths related to a directory");
    suggest->add_option("path", builder.paths(), "current directory")->expected(0, 1);
    limit_option(suggest);
    suggest->callback([&]() { builder.SetCommand(Command::Suggest); });

    auto* cp = program.add_subcommand("cp", "copy a file or directory into DESTDIR");
    cp->add_option("source", builder.paths(), "item to copy")->required()->expected(1);
    cp->add_option("destdir", builder.argument(), "destination directory")->required();
    cp->callback([&]() { builder.SetCommand(Command::Copy); });

    auto* mv = program.add_subcommand("mv", "move a file or directory into DESTDIR");
    mv->add_option("source", builder.paths(), "item to move")->required()->expected(1);
    mv->add_option("destdir", builder.argument(), "destination directory")->required();
    mv->callback([&]() { builder.SetCommand(Command::Move); });

    auto* rm = program.add_subcommand("rm", "delete files or directory trees");
    rm->add_option("paths", builder.paths(), "items to delete")->required();
    rm->callback([&]() { builder.SetCommand(Command::Remove); });

    auto* mkdir = program.add_subcommand("mkdir", "create a folder NAME inside PARENT");
    mkdir->add_option("parent", builder.paths(), "parent directory")->required()->expected(1);
    mkdir->add_option("name", builder.argument(), "folder name")->required();
    mkdir->callback([&]() { builder.SetCommand(Command::MakeDir); });

    auto* rename = program.add_subcommand("rename", "rename an item in place");
    rename->add_option("path", builder.paths(), "item to rename")->required()->expected(1);
    rename->add_option("new_name", builder.argument(), "new name")->required();
    rename->callback([&]() { builder.SetCommand(Command::Rename); });

    auto* space = program.add_subcommand("space", "show capacity and free space");
    space->add_option("path", builder.paths(), "any path on the filesystem")->expected(0, 1);
    space->callback([&]() { builder.SetCommand(Command::Space); });

    try {
        program.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(program.exit(e));
    }

    const Logger::Level cli_level = LevelForVerbosity(verbosity);
    Logger::instance().set_level(cli_level);

    const auto config_file = ResourceManager::findConfig();
    if (config_file.empty()) {
        for (const auto& candidate : ResourceManager::configCandidates()) {
            Logger::instance().debug("config: no {}", candidate.string());
        }
    } else {
        if (auto entries = YamlLoader::LoadSimpleMap(config_file)) {
            Logger::instance().info("config: loaded {}", config_file.string());
            ApplyConfigFile(*entries, builder);
        } else {
            Logger::instance().warn("config: cannot read {}", config_file.string());
        }
    }
    if (verbosity > 0) {
        builder.SetLogLevel(cli_level);
    }

    return builder.Build();
}

} // namespace sift
