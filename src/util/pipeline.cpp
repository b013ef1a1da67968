#include <packmeta/pipeline.hpp>
#include <packmeta/log.hpp>
#include <packmeta/lookup.hpp>
#include <packmeta/manifest.hpp>

namespace packmeta {

const KeyPath& pack_metadata_path() {
    static const KeyPath path{"package", "metadata", "pack"};
    return path;
}

Result<Value> load_manifest_value(const WorkspaceMember& member) {
    log::debug("reading manifest: %s", member.manifest_path.string().c_str());

    auto root = load_manifest(member.manifest_path);
    if (root.is_err()) return std::move(root).error();

    if (log::enabled(log::Debug)) {
        log::debug("root: %s", root.value().dump().c_str());
    }
    return root;
}

Result<std::optional<Value>> locate(const WorkspaceMember& member, const KeyPath& path) {
    auto root = load_manifest_value(member);
    if (root.is_err()) return std::move(root).error();

    auto found = lookup(std::move(root).value(), path);
    if (found) {
        log::debug("found %s in %s", path.to_string().c_str(),
                   member.manifest_path.string().c_str());
    } else {
        log::debug("no %s in %s", path.to_string().c_str(),
                   member.manifest_path.string().c_str());
    }
    return Result<std::optional<Value>>::ok(std::move(found));
}

PackError metadata_not_found(const WorkspaceMember& member, const KeyPath& path) {
    return PackError{PackError::MetadataNotFound,
        "no " + path.to_string() + " found in manifest of package " + member.name}
        .with_subject(path.to_string())
        .at(member.manifest_path.string());
}

} // namespace packmeta
