#pragma once

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <stop_token>
#include <vector>

namespace sift {

// Lazy depth-first traversal of everything below `root` (the root itself is
// not yielded). Each begin() starts a fresh traversal.
//
// Directories are yielded but only descended into when the current user can
// both read and search them. Directory symlinks are yielded and never
// followed. Entries that vanish or cannot be inspected are dropped and logged
// at debug level. A stop request ends the sequence at the next entry.
class TreeWalker {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::filesystem::path;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::filesystem::path*;
        using reference = const std::filesystem::path&;

        iterator() = default;

        reference operator*() const;
        pointer operator->() const { return &**this; }

        iterator& operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return it.done();
        }

    private:
        friend class TreeWalker;
        struct State;

        explicit iterator(std::shared_ptr<State> state);
        [[nodiscard]] bool done() const noexcept;

        std::shared_ptr<State> state_;
    };

    explicit TreeWalker(std::filesystem::path root, std::stop_token stop = {});

    [[nodiscard]] iterator begin() const;
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::stop_token stop_;
};

} // namespace sift
