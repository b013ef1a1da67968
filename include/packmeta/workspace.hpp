#pragma once

#include <packmeta/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace packmeta {

inline constexpr const char* kDefaultManifestName = "Package.toml";

struct WorkspaceMember {
    std::string name;
    std::string version;
    std::filesystem::path manifest_path;
    std::filesystem::path root_dir;
};

// A set of packages sharing a root manifest.
//
// Discovery starts at the nearest manifest above the working directory (the
// current manifest). That manifest is the root when it has a [workspace]
// table; otherwise the nearest ancestor whose [workspace] members/exclude
// globs include it is the root; failing that the package stands alone.
class Workspace {
public:
    Workspace() = default;

    // In-memory workspace; `current` indexes into `members`, `virtual_root`
    // marks a root manifest without [package]
    Workspace(std::filesystem::path root_dir,
              std::vector<WorkspaceMember> members,
              std::optional<size_t> current = std::nullopt,
              bool virtual_root = false);

    static Result<Workspace> discover(const std::filesystem::path& cwd,
                                      const std::string& manifest_name = kDefaultManifestName);

    const std::vector<WorkspaceMember>& members() const { return members_; }
    size_t member_count() const { return members_.size(); }

    // Member for the current manifest; nullptr for a virtual root
    const WorkspaceMember* current() const;

    const std::filesystem::path& root_dir() const { return root_dir_; }
    const std::filesystem::path& root_manifest_path() const { return root_manifest_path_; }
    const std::string& manifest_name() const { return manifest_name_; }

    // Root manifest has [workspace] but no [package]
    bool is_virtual() const { return virtual_; }

private:
    std::filesystem::path root_dir_;
    std::filesystem::path root_manifest_path_;
    std::string manifest_name_ = kDefaultManifestName;
    std::vector<WorkspaceMember> members_;
    std::optional<size_t> current_;
    bool virtual_ = false;
};

// Walk up from start_dir to the nearest directory holding `manifest_name`
Result<std::filesystem::path> find_manifest(const std::filesystem::path& start_dir,
                                            const std::string& manifest_name = kDefaultManifestName);

} // namespace packmeta
