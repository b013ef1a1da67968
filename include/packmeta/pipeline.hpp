#pragma once

#include <packmeta/decode.hpp>
#include <packmeta/key_path.hpp>
#include <packmeta/resolver.hpp>
#include <packmeta/result.hpp>
#include <packmeta/value.hpp>
#include <packmeta/workspace.hpp>
#include <optional>
#include <string>

namespace packmeta {

// package.metadata.pack
const KeyPath& pack_metadata_path();

// Read and parse the member's manifest
Result<Value> load_manifest_value(const WorkspaceMember& member);

// Subtree at `path` in the member's manifest, std::nullopt when absent
Result<std::optional<Value>> locate(const WorkspaceMember& member, const KeyPath& path);

PackError metadata_not_found(const WorkspaceMember& member, const KeyPath& path);

template<typename T>
Result<T> decode_located(const WorkspaceMember& member, const KeyPath& path,
                         const Value& subtree) {
    auto decoded = decode<T>(subtree, path.to_string());
    if (decoded.is_err()) {
        return std::move(decoded).error().at(member.manifest_path.string());
    }
    return decoded;
}

// Decode the subtree at `path`; absence is MetadataNotFound
template<typename T>
Result<T> decode_at(const WorkspaceMember& member, const KeyPath& path) {
    auto found = locate(member, path);
    if (found.is_err()) return std::move(found).error();
    if (!found.value()) return metadata_not_found(member, path);
    return decode_located<T>(member, path, *found.value());
}

// Decode the subtree at `path`; absence decodes as an empty table, leaving
// every optional field of T unspecified
template<typename T>
Result<T> decode_or_default(const WorkspaceMember& member, const KeyPath& path) {
    auto found = locate(member, path);
    if (found.is_err()) return std::move(found).error();
    const Value subtree = found.value() ? std::move(*found.value()) : Value(Table{});
    return decode_located<T>(member, path, subtree);
}

// Resolve the package, then decode_at
template<typename T>
Result<T> run(const Workspace& ws, const std::optional<std::string>& package_name,
              const KeyPath& path) {
    auto member = resolve_package(ws, package_name);
    if (member.is_err()) return std::move(member).error();
    return decode_at<T>(*member.value(), path);
}

} // namespace packmeta
