#pragma once

#include <packmeta/config.hpp>
#include <packmeta/pack_config.hpp>
#include <packmeta/pipeline.hpp>
#include <packmeta/result.hpp>
#include <packmeta/workspace.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace packmeta {

// Where to start looking for the workspace
struct WorkingContext {
    std::filesystem::path cwd;
    std::string manifest_name = kDefaultManifestName;

    // Process working directory, default manifest name
    static WorkingContext current();
    static WorkingContext from_config(const Config& cfg, std::filesystem::path cwd);
};

// Entry point for packers: a discovered workspace, the selected package and
// its decoded [package.metadata.pack] table.
//
//   auto ctx = PackContext::open(WorkingContext::current(), "server");
//   if (ctx.is_err()) { ... ctx.error().format() ... }
//   for (const auto& f : ctx.value().files()) { ... }
class PackContext {
public:
    // Discovers the workspace, resolves the package and decodes PackConfig.
    // A manifest without [package.metadata.pack] yields an all-unset config.
    static Result<PackContext> open(const WorkingContext& ctx,
                                    std::optional<std::string> package_name = std::nullopt);

    // Same, over an already discovered workspace
    static Result<PackContext> open(Workspace ws,
                                    std::optional<std::string> package_name = std::nullopt);

    const Workspace& workspace() const { return ws_; }
    const PackConfig& config() const { return config_; }
    const std::optional<std::string>& package_name() const { return package_name_; }

    // Re-resolved on every call against the owned workspace
    Result<const WorkspaceMember*> package() const;

    // config().files, or empty when unspecified
    const std::vector<std::string>& files() const;

    // Decode [package.metadata.pack] again into a caller-defined type.
    // Re-reads the manifest; a missing table decodes as empty.
    template<typename T>
    Result<T> decode() const {
        auto member = package();
        if (member.is_err()) return std::move(member).error();
        return decode_or_default<T>(*member.value(), pack_metadata_path());
    }

    // Decode the subtree at `path` of the package manifest. A missing
    // subtree is MetadataNotFound.
    template<typename T>
    Result<T> decode_at(const KeyPath& path) const {
        auto member = package();
        if (member.is_err()) return std::move(member).error();
        return packmeta::decode_at<T>(*member.value(), path);
    }

private:
    PackContext(Workspace ws, std::optional<std::string> package_name, PackConfig config)
        : ws_(std::move(ws)),
          package_name_(std::move(package_name)),
          config_(std::move(config)) {}

    Workspace ws_;
    std::optional<std::string> package_name_;
    PackConfig config_;
};

} // namespace packmeta
