#include "sift/renderer.h"

#include <algorithm>
#include <format>
#include <utility>

#include "sift/config.h"
#include "sift/perf.h"
#include "sift/platform.h"

namespace sift {

namespace {

constexpr std::size_t kGap = 2;
constexpr std::size_t kMinNameWidth = 12;

std::size_t Utf8SequenceLength(unsigned char c, std::size_t remaining) {
    if ((c & 0x80u) == 0x00u) return 1;
    if ((c & 0xE0u) == 0xC0u && remaining >= 2) return 2;
    if ((c & 0xF0u) == 0xE0u && remaining >= 3) return 3;
    if ((c & 0xF8u) == 0xF0u && remaining >= 4) return 4;
    return 1;
}

} // namespace

Renderer::Options Renderer::OptionsFromConfig(const Config& config) {
    Options options;
    options.no_icons = config.no_icons();
    options.bytes = config.bytes();
    options.time_style = config.time_style();
    if (Platform::isOutputTerminal()) {
        const int width = Platform::terminalWidth();
        options.width = width > 0 ? static_cast<std::size_t>(width) : 0;
        options.hide_control_chars = true;
    }
    return options;
}

Renderer::Renderer(std::ostream& os, Options options)
    : os_(os),
      options_(std::move(options)),
      size_formatter_(SizeFormatter::Options{options_.bytes}),
      time_formatter_(TimeFormatter::Options{options_.time_style}) {}

std::size_t Renderer::PrintableWidth(const std::string& text) {
    std::size_t width = 0;
    for (std::size_t i = 0; i < text.size();) {
        i += Utf8SequenceLength(static_cast<unsigned char>(text[i]), text.size() - i);
        ++width;
    }
    return width;
}

std::string Renderer::ElideMiddle(const std::string& text, std::size_t width) {
    if (PrintableWidth(text) <= width) {
        return text;
    }
    if (width == 0) {
        return {};
    }
    if (width == 1) {
        return "~";
    }

    // Split on sequence boundaries so multibyte names stay valid UTF-8.
    std::vector<std::pair<std::size_t, std::size_t>> units;
    for (std::size_t i = 0; i < text.size();) {
        const std::size_t len = Utf8SequenceLength(static_cast<unsigned char>(text[i]), text.size() - i);
        units.emplace_back(i, len);
        i += len;
    }

    const std::size_t keep = width - 1;
    const std::size_t head = (keep + 1) / 2;
    const std::size_t tail = keep - head;

    std::string out;
    for (std::size_t i = 0; i < head; ++i) {
        out.append(text, units[i].first, units[i].second);
    }
    out.push_back('~');
    for (std::size_t i = units.size() - tail; i < units.size(); ++i) {
        out.append(text, units[i].first, units[i].second);
    }
    return out;
}

std::string Renderer::Sanitize(const std::string& text) const {
    if (!options_.hide_control_chars) {
        return text;
    }
    std::string out = text;
    for (char& ch : out) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7f) {
            ch = '?';
        }
    }
    return out;
}

std::string Renderer::FormatName(const FileDescriptor& item, bool full_path) const {
    std::string name = Sanitize(full_path ? item.path.string() : item.name);
    if (item.is_directory && !full_path) {
        name.push_back('/');
    }
    if (options_.no_icons) {
        return name;
    }
    return std::format("{} {}", item.icon(), name);
}

Renderer::Row Renderer::ItemRow(const FileDescriptor& item, bool full_path) const {
    Row row;
    row.reserve(4);
    row.push_back(FormatName(item, full_path));
    row.push_back(item.is_directory ? std::string("-") : size_formatter_.FormatSize(item.size));
    row.push_back(time_formatter_.Format(item.modified));
    row.emplace_back(ToString(item.category));
    return row;
}

std::vector<std::size_t> Renderer::ComputeColumnWidths(const std::vector<Row>& rows) const {
    std::size_t column_count = 0;
    for (const auto& row : rows) {
        column_count = std::max(column_count, row.size());
    }

    std::vector<std::size_t> widths(column_count, 0);
    for (const auto& row : rows) {
        for (std::size_t col = 0; col < row.size(); ++col) {
            widths[col] = std::max(widths[col], PrintableWidth(row[col]));
        }
    }

    if (options_.width == 0 || column_count == 0) {
        return widths;
    }

    std::size_t total = kGap * (column_count - 1);
    for (auto w : widths) {
        total += w;
    }
    if (total > options_.width) {
        // Only the name column gives way; the others are short and fixed.
        const std::size_t excess = total - options_.width;
        const std::size_t floor = std::min(widths[0], kMinNameWidth);
        widths[0] = widths[0] > floor + excess ? widths[0] - excess : floor;
    }
    return widths;
}

void Renderer::RenderTable(const std::vector<Row>& rows, const std::vector<bool>& right_aligned) const {
    const std::vector<std::size_t> widths = ComputeColumnWidths(rows);
    const std::string gap(kGap, ' ');

    for (const auto& row : rows) {
        std::string line;
        for (std::size_t col = 0; col < row.size(); ++col) {
            std::string cell = col == 0 ? ElideMiddle(row[col], widths[col]) : row[col];
            const std::size_t cell_width = PrintableWidth(cell);
            const std::size_t pad = widths[col] > cell_width ? widths[col] - cell_width : 0;
            const bool last = col + 1 == row.size();
            const bool right = col < right_aligned.size() && right_aligned[col];
            if (right) {
                line.append(pad, ' ');
                line += cell;
            } else {
                line += cell;
                if (!last) {
                    line.append(pad, ' ');
                }
            }
            if (!last) {
                line += gap;
            }
        }
        os_ << line << '\n';
    }
}

void Renderer::RenderItems(const std::vector<FileDescriptor>& items, bool full_paths) const {
    perf::Timer timer("renderer::items");
    std::vector<Row> rows;
    rows.reserve(items.size());
    for (const auto& item : items) {
        rows.push_back(ItemRow(item, full_paths));
    }
    RenderTable(rows, {false, true, false, false});
}

void Renderer::RenderGroups(const CategoryGroups& groups) const {
    perf::Timer timer("renderer::groups");
    bool first = true;
    for (const auto& [category, items] : groups) {
        if (items.empty()) {
            continue;
        }
        if (!first) {
            os_ << '\n';
        }
        first = false;
        if (options_.no_icons) {
            os_ << std::format("{} ({}):\n", ToString(category), items.size());
        } else {
            os_ << std::format("{} {} ({}):\n", IconFor(category), ToString(category), items.size());
        }
        RenderItems(items);
    }
}

void Renderer::RenderFrequent(const std::vector<FileDescriptor>& items, const HistorySnapshot& history) const {
    std::vector<Row> rows;
    rows.reserve(items.size());
    for (const auto& item : items) {
        Row row = ItemRow(item, true);
        row.insert(row.begin() + 1, std::to_string(history.CountOf(item.path)));
        rows.push_back(std::move(row));
    }
    RenderTable(rows, {false, true, true, false, false});
}

void Renderer::RenderDuplicates(const std::vector<DuplicateGroup>& groups) const {
    perf::Timer timer("renderer::duplicates");
    for (const auto& group : groups) {
        os_ << std::format("{}  {} x{}  wasted {}\n",
                           group.digest,
                           size_formatter_.FormatSize(group.size),
                           group.paths.size(),
                           size_formatter_.FormatSize(group.WastedBytes()));
        for (const auto& path : group.paths) {
            os_ << "  " << Sanitize(path.string()) << '\n';
        }
    }
    os_ << std::format("{} duplicate group{}, {} reclaimable\n",
                       groups.size(),
                       groups.size() == 1 ? "" : "s",
                       size_formatter_.FormatSize(TotalWastedBytes(groups)));
}

void Renderer::RenderDigest(const std::string& digest, const std::filesystem::path& path) const {
    os_ << digest << "  " << Sanitize(path.string()) << '\n';
}

void Renderer::RenderSpace(const std::filesystem::path& path, const SpaceInfo& info) const {
    const std::uintmax_t used = info.capacity >= info.free ? info.capacity - info.free : 0;
    const double percent = info.capacity == 0
        ? 0.0
        : 100.0 * static_cast<double>(used) / static_cast<double>(info.capacity);
    std::vector<Row> rows{
        {"Path", Sanitize(path.string())},
        {"Capacity", size_formatter_.FormatSize(info.capacity)},
        {"Used", std::format("{} ({:.1f}%)", size_formatter_.FormatSize(used), percent)},
        {"Free", size_formatter_.FormatSize(info.free)},
        {"Available", size_formatter_.FormatSize(info.available)},
    };
    RenderTable(rows, {false, false});
}

} // namespace sift
