#pragma once

#include "sift/duplicates.h"
#include "sift/file_descriptor.h"
#include "sift/file_operations.h"
#include "sift/history_store.h"
#include "sift/metadata.h"
#include "sift/size_formatter.h"
#include "sift/time_formatter.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace sift {

class Config;

// Plain-text tables for command results: icon and name (or path), size and
// modification time. The first column is shrunk to fit the output width.
class Renderer {
public:
    struct Options {
        bool no_icons = false;
        bool bytes = false;
        std::string time_style;
        // 0 means unlimited.
        std::size_t width = 0;
        // Replace control characters in names with '?'.
        bool hide_control_chars = false;
    };

    // Width and control-character hiding follow whether stdout is a terminal.
    static Options OptionsFromConfig(const Config& config);

    Renderer(std::ostream& os, Options options);

    void RenderItems(const std::vector<FileDescriptor>& items, bool full_paths = false) const;
    void RenderGroups(const CategoryGroups& groups) const;
    void RenderFrequent(const std::vector<FileDescriptor>& items, const HistorySnapshot& history) const;
    void RenderDuplicates(const std::vector<DuplicateGroup>& groups) const;
    void RenderDigest(const std::string& digest, const std::filesystem::path& path) const;
    void RenderSpace(const std::filesystem::path& path, const SpaceInfo& info) const;

    [[nodiscard]] std::string FormatName(const FileDescriptor& item, bool full_path) const;

    // Terminal columns taken by `text`; each UTF-8 sequence counts as one.
    static std::size_t PrintableWidth(const std::string& text);
    // Shortens `text` to `width` columns by replacing its middle with "~".
    static std::string ElideMiddle(const std::string& text, std::size_t width);

private:
    using Row = std::vector<std::string>;

    void RenderTable(const std::vector<Row>& rows, const std::vector<bool>& right_aligned) const;
    std::vector<std::size_t> ComputeColumnWidths(const std::vector<Row>& rows) const;
    Row ItemRow(const FileDescriptor& item, bool full_path) const;
    std::string Sanitize(const std::string& text) const;

    std::ostream& os_;
    Options options_;
    SizeFormatter size_formatter_;
    TimeFormatter time_formatter_;
};

} // namespace sift
