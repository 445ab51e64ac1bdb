#pragma once

#include "document/document_resolver.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace docgate {

/**
 * @brief Resolves relative document paths under a fixed set of base
 *        directories.
 *
 * Each base directory is tried in order. A candidate that normalizes to a
 * location outside its base directory (via "..", an absolute path, or a
 * symlink) is refused for that base.
 */
class FilesystemResolver : public IDocumentResolver {
public:
    struct Config {
        std::string root = ".";
        std::vector<std::string> allowed_base_dirs = {"docs", "integration/docs", "examples"};
        size_t max_file_size_bytes = 10 * 1024 * 1024;
    };

    FilesystemResolver() : FilesystemResolver(Config{}) {}
    explicit FilesystemResolver(const Config& config);

    [[nodiscard]] ResolvedDocument resolve(const std::string& path) const override;
    [[nodiscard]] Result<std::string> read(const ResolvedDocument& resolved) const override;

    /// True if @p path stays inside at least one base directory (existence not checked).
    [[nodiscard]] bool is_path_allowed(const std::string& path) const;

    [[nodiscard]] std::vector<std::string> allowed_directories() const;

private:
    [[nodiscard]] static bool is_within(const std::filesystem::path& candidate,
                                        const std::filesystem::path& base);

    Config config_;
    std::vector<std::filesystem::path> bases_;
};

} // namespace docgate
