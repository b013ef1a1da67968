#pragma once

#include <packmeta/result.hpp>
#include <packmeta/workspace.hpp>
#include <optional>
#include <string>
#include <vector>

namespace packmeta {

// Pick the member to operate on.
//   no name    -> `current` (NoCurrentPackage when there is none)
//   name given -> exact, case-sensitive match among `members`;
//                 none is UnknownPackage, several is AmbiguousPackage
Result<const WorkspaceMember*> resolve_package(
    const std::vector<WorkspaceMember>& members,
    const std::optional<std::string>& name,
    const WorkspaceMember* current);

Result<const WorkspaceMember*> resolve_package(
    const Workspace& ws,
    const std::optional<std::string>& name);

} // namespace packmeta
