/**
 * \file CandidateDirectories.hpp
 * \brief Ordered, lazily checked directories that may host the lock/socket pair.
 * \ingroup coordination
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace coordination {

/** \brief One directory eligible to host `<name>.lock` / `<name>.sock`. */
struct CandidateDirectory {
    std::filesystem::path path;
    bool is_home = false;   ///< Files get a leading dot here to stay out of sight

    /** \brief `path/[.]<name>.lock` */
    std::filesystem::path lock_path(const std::string& name) const;
    /** \brief Lock path with the `.lock` suffix replaced by `.sock`. */
    std::filesystem::path socket_path(const std::string& name) const;

    bool operator==(const CandidateDirectory&) const = default;
};

/** \brief Finite, restartable, lazily filtered sequence of candidate directories.
 *  \ingroup coordination
 *  \details Iteration applies the liveness check (writable, readable and searchable
 *  by this process) to each configured directory only when the iterator reaches it;
 *  directories failing the check are skipped. A directory can still become unusable
 *  between enumeration and use; the filesystem coordinator treats that as a reason to
 *  advance, not as an error.
 */
class CandidateDirectories {
public:
    using LivenessCheck = std::function<bool(const std::filesystem::path&)>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = CandidateDirectory;
        using difference_type = std::ptrdiff_t;
        using pointer = const CandidateDirectory*;
        using reference = const CandidateDirectory&;

        iterator() = default;

        reference operator*() const { return (*owner_->entries_)[index_]; }
        pointer operator->() const { return &(*owner_->entries_)[index_]; }
        iterator& operator++() { ++index_; skip_dead(); return *this; }
        iterator operator++(int) { iterator tmp = *this; ++*this; return tmp; }
        bool operator==(const iterator& other) const { return index_ == other.index_; }

    private:
        friend class CandidateDirectories;
        iterator(const CandidateDirectories* owner, std::size_t index) : owner_(owner), index_(index) { skip_dead(); }
        void skip_dead();

        const CandidateDirectories* owner_ = nullptr;
        std::size_t index_ = 0;
    };

    /** \brief Platform order: macOS user cache then /Library/Caches; elsewhere the temp dir then $HOME. */
    static CandidateDirectories platform_default();

    /** \brief Explicit directories in the given order; entries equal to $HOME are flagged as home.
     *  \details Relative entries are made absolute against the current directory; entries
     *  that cannot be resolved are dropped.
     */
    static CandidateDirectories from_paths(const std::vector<std::filesystem::path>& paths);

    /** \brief Replace the liveness predicate (defaults to ProcessUtils::is_accessible_dir). */
    CandidateDirectories& with_liveness_check(LivenessCheck check);

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, entries_->size()); }

    /** \brief Configured directories before filtering. */
    const std::vector<CandidateDirectory>& configured() const noexcept { return *entries_; }

private:
    explicit CandidateDirectories(std::vector<CandidateDirectory> entries);

    // Shared so copies of the sequence (and their iterators) stay cheap
    std::shared_ptr<const std::vector<CandidateDirectory>> entries_;
    LivenessCheck is_live_;
};

} // namespace coordination
