#include <packmeta/resolver.hpp>

namespace packmeta {

static std::string member_names(const std::vector<WorkspaceMember>& members) {
    std::string out;
    for (const auto& m : members) {
        if (!out.empty()) out += ", ";
        out += m.name;
    }
    return out;
}

Result<const WorkspaceMember*> resolve_package(
    const std::vector<WorkspaceMember>& members,
    const std::optional<std::string>& name,
    const WorkspaceMember* current)
{
    if (!name) {
        if (!current) {
            return PackError{PackError::NoCurrentPackage,
                "the workspace root has no [package] and no package name was given",
                "pass a package name to select a workspace member"};
        }
        return Result<const WorkspaceMember*>::ok(current);
    }

    std::vector<const WorkspaceMember*> matches;
    for (const auto& m : members) {
        if (m.name == *name) matches.push_back(&m);
    }

    if (matches.empty()) {
        std::string hint;
        if (!members.empty()) hint = "workspace members: " + member_names(members);
        return PackError{PackError::UnknownPackage,
            "unknown package " + *name, hint}.with_subject(*name);
    }
    if (matches.size() > 1) {
        return PackError{PackError::AmbiguousPackage,
            "ambiguous package name " + *name + " (" +
            std::to_string(matches.size()) + " workspace members share it)"}
            .with_subject(*name);
    }
    return Result<const WorkspaceMember*>::ok(matches.front());
}

Result<const WorkspaceMember*> resolve_package(
    const Workspace& ws,
    const std::optional<std::string>& name)
{
    return resolve_package(ws.members(), name, ws.current());
}

} // namespace packmeta
