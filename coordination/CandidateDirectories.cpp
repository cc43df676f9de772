#include "CandidateDirectories.hpp"
#include "processUtils.hpp"

#include <optional>
#include <system_error>

namespace coordination {

namespace {

std::filesystem::path normalized(const std::filesystem::path& p) {
    auto n = p.lexically_normal();
    // "/tmp/" and "/tmp" name the same directory
    if (n.has_filename() || n == n.root_path()) return n;
    return n.parent_path();
}

bool same_directory(const std::filesystem::path& a, const std::optional<std::filesystem::path>& b) {
    return b && normalized(a) == normalized(*b);
}

} // namespace

std::filesystem::path CandidateDirectory::lock_path(const std::string& name) const {
    return path / ((is_home ? "." : "") + name + ".lock");
}

std::filesystem::path CandidateDirectory::socket_path(const std::string& name) const {
    auto p = lock_path(name);
    p.replace_extension(".sock");
    return p;
}

CandidateDirectories::CandidateDirectories(std::vector<CandidateDirectory> entries)
    : entries_(std::make_shared<const std::vector<CandidateDirectory>>(std::move(entries))),
      is_live_(&ProcessUtils::is_accessible_dir) {}

CandidateDirectories CandidateDirectories::platform_default() {
    std::vector<CandidateDirectory> entries;
#if defined(__APPLE__)
    if (auto cache = ProcessUtils::get_user_cache_dir()) entries.push_back({*cache, false});
    entries.push_back({"/Library/Caches", false});
#else
    const auto home = ProcessUtils::get_home_dir();
    if (auto tmp = ProcessUtils::get_temp_dir()) entries.push_back({*tmp, same_directory(*tmp, home)});
    if (home) entries.push_back({*home, true});
#endif
    return CandidateDirectories(std::move(entries));
}

CandidateDirectories CandidateDirectories::from_paths(const std::vector<std::filesystem::path>& paths) {
    const auto home = ProcessUtils::get_home_dir();
    std::vector<CandidateDirectory> entries;
    entries.reserve(paths.size());
    for (const auto& p : paths) {
        // Every process of one identity must derive the same rendezvous path,
        // whatever its working directory
        std::error_code ec;
        auto abs = std::filesystem::absolute(p, ec);
        if (ec || abs.empty()) continue;
        abs = normalized(abs);
        entries.push_back({abs, same_directory(abs, home)});
    }
    return CandidateDirectories(std::move(entries));
}

CandidateDirectories& CandidateDirectories::with_liveness_check(LivenessCheck check) {
    is_live_ = std::move(check);
    return *this;
}

void CandidateDirectories::iterator::skip_dead() {
    if (!owner_) return;
    const auto& entries = *owner_->entries_;
    while (index_ < entries.size() && !owner_->is_live_(entries[index_].path)) {
        ++index_;
    }
}

} // namespace coordination
