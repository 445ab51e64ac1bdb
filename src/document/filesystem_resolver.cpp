#include "document/filesystem_resolver.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace docgate {

namespace fs = std::filesystem;

namespace {

fs::path normalize(const fs::path& p) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(p, ec);
    if (ec) {
        return p.lexically_normal();
    }
    return canonical;
}

} // anonymous namespace

FilesystemResolver::FilesystemResolver(const Config& config)
    : config_(config) {
    const fs::path root = normalize(fs::absolute(config_.root));
    bases_.reserve(config_.allowed_base_dirs.size());
    for (const auto& dir : config_.allowed_base_dirs) {
        bases_.push_back(normalize(root / dir));
    }
}

bool FilesystemResolver::is_within(const fs::path& candidate, const fs::path& base) {
    auto c = candidate.begin();
    for (auto b = base.begin(); b != base.end(); ++b, ++c) {
        // Trailing separator on base yields an empty final element
        if (b->empty()) continue;
        if (c == candidate.end() || *c != *b) return false;
    }
    return true;
}

ResolvedDocument FilesystemResolver::resolve(const std::string& path) const {
    ResolvedDocument result;
    result.requested_path = path;

    if (path.empty() || path.find('\0') != std::string::npos) {
        result.error = "Invalid document path";
        return result;
    }

    bool any_allowed = false;
    for (const auto& base : bases_) {
        const fs::path candidate = normalize(base / fs::path(path));
        if (!is_within(candidate, base)) {
            continue;
        }
        any_allowed = true;

        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && !ec) {
            result.exists = true;
            result.resolved_location = candidate.string();
            return result;
        }
    }

    if (!any_allowed) {
        utils::log::warn(std::format("Refused document path outside allowed directories: {}", path));
        result.error = "Path escapes allowed directories";
    } else {
        result.error = "File not found in allowed directories";
    }
    return result;
}

Result<std::string> FilesystemResolver::read(const ResolvedDocument& resolved) const {
    if (!resolved.exists) {
        return Result<std::string>::error(ErrorCategory::NOT_FOUND,
            std::format("Document does not exist: {}", resolved.error.value_or("unknown error")));
    }

    const fs::path location(resolved.resolved_location);
    const bool allowed = std::any_of(bases_.begin(), bases_.end(),
        [&location](const fs::path& base) { return is_within(normalize(location), base); });
    if (!allowed) {
        return Result<std::string>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Resolved location outside allowed directories: {}", resolved.requested_path));
    }

    std::error_code ec;
    const auto size = fs::file_size(location, ec);
    if (ec) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot stat {}: {}", resolved.requested_path, ec.message()));
    }
    if (size > config_.max_file_size_bytes) {
        return Result<std::string>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Document {} exceeds {} bytes", resolved.requested_path,
                        config_.max_file_size_bytes));
    }

    std::ifstream in(location, std::ios::binary);
    if (!in) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Failed to open {}", resolved.requested_path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return Result<std::string>::ok(buffer.str());
}

bool FilesystemResolver::is_path_allowed(const std::string& path) const {
    if (path.empty()) return false;
    return std::any_of(bases_.begin(), bases_.end(), [&path](const fs::path& base) {
        return is_within(normalize(base / fs::path(path)), base);
    });
}

std::vector<std::string> FilesystemResolver::allowed_directories() const {
    std::vector<std::string> out;
    out.reserve(bases_.size());
    for (const auto& base : bases_) {
        out.push_back(base.string());
    }
    return out;
}

} // namespace docgate
