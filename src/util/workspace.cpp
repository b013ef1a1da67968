#include <packmeta/workspace.hpp>
#include <packmeta/decode.hpp>
#include <packmeta/glob.hpp>
#include <packmeta/log.hpp>
#include <packmeta/manifest.hpp>
#include <algorithm>
#include <unordered_map>

namespace packmeta {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

// The parts of a manifest that discovery cares about
struct ManifestHeader {
    fs::path path;
    bool has_package = false;
    bool has_workspace = false;
    std::optional<std::string> name;
    std::string version;
    std::vector<std::string> members;
    std::vector<std::string> exclude;
};

} // namespace

static Result<ManifestHeader> read_header(const fs::path& manifest_path) {
    auto doc = load_manifest(manifest_path);
    if (doc.is_err()) return std::move(doc).error();

    ManifestHeader h;
    h.path = manifest_path;
    Table& root = *doc.value().as_table();

    if (auto pkg = root.remove("package")) {
        h.has_package = true;
        TableDecoder td(*pkg, "package");
        td.optional("name", h.name).or_default("version", h.version);
        auto st = td.finish();
        if (st.is_err()) return std::move(st).error().at(manifest_path.string());
    }

    if (auto ws = root.remove("workspace")) {
        h.has_workspace = true;
        TableDecoder td(*ws, "workspace");
        td.or_default("members", h.members).or_default("exclude", h.exclude);
        auto st = td.finish();
        if (st.is_err()) return std::move(st).error().at(manifest_path.string());
    }

    return Result<ManifestHeader>::ok(std::move(h));
}

static bool workspace_includes(const ManifestHeader& root, const std::string& rel_dir) {
    bool included = std::any_of(root.members.begin(), root.members.end(),
        [&](const std::string& pat) { return glob_match(pat, rel_dir); });
    if (!included) return false;

    return std::none_of(root.exclude.begin(), root.exclude.end(),
        [&](const std::string& pat) { return glob_match(pat, rel_dir); });
}

static Result<WorkspaceMember> make_member(const ManifestHeader& h) {
    if (!h.has_package || !h.name || h.name->empty()) {
        return PackError{PackError::WorkspaceDiscovery,
            "manifest has no package name: " + h.path.string(),
            "add a [package] table with a `name` key"}.at(h.path.string());
    }

    WorkspaceMember m;
    m.name = *h.name;
    m.version = h.version;
    m.manifest_path = h.path;
    m.root_dir = h.path.parent_path();
    return Result<WorkspaceMember>::ok(std::move(m));
}

static bool same_file(const fs::path& a, const fs::path& b) {
    if (a.lexically_normal() == b.lexically_normal()) return true;
    std::error_code ec;
    return fs::equivalent(a, b, ec);
}

Result<fs::path> find_manifest(const fs::path& start_dir, const std::string& manifest_name) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        return PackError{PackError::WorkspaceDiscovery,
            "cannot resolve working directory " + start_dir.string() + ": " + ec.message()};
    }

    while (true) {
        fs::path candidate = dir / manifest_name;
        if (fs::is_regular_file(candidate, ec)) {
            return Result<fs::path>::ok(candidate);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return PackError{PackError::WorkspaceDiscovery,
                "could not find " + manifest_name + " in " + start_dir.string() +
                " or any parent directory"};
        }
        dir = parent;
    }
}

// ---------------------------------------------------------------------------
// Workspace
// ---------------------------------------------------------------------------

Workspace::Workspace(fs::path root_dir,
                     std::vector<WorkspaceMember> members,
                     std::optional<size_t> current,
                     bool virtual_root)
    : root_dir_(std::move(root_dir)),
      members_(std::move(members)),
      current_(current),
      virtual_(virtual_root) {
    root_manifest_path_ = root_dir_ / manifest_name_;
    if (current_ && *current_ >= members_.size()) current_.reset();
}

const WorkspaceMember* Workspace::current() const {
    return current_ ? &members_[*current_] : nullptr;
}

static Status collect_members(const ManifestHeader& root_hdr,
                              const fs::path& root_dir,
                              const std::string& manifest_name,
                              std::vector<WorkspaceMember>& out) {
    if (root_hdr.has_package) {
        auto m = make_member(root_hdr);
        if (m.is_err()) return std::move(m).error();
        out.push_back(std::move(m).value());
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(root_dir,
        fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return PackError{PackError::WorkspaceDiscovery,
            "cannot scan workspace root " + root_dir.string() + ": " + ec.message()};
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return PackError{PackError::WorkspaceDiscovery,
                "error scanning workspace " + root_dir.string() + ": " + ec.message()};
        }

        const fs::directory_entry& entry = *it;
        if (!entry.is_directory(ec)) continue;

        std::string dirname = entry.path().filename().string();
        if (!dirname.empty() && dirname[0] == '.') {
            it.disable_recursion_pending();
            continue;
        }

        std::string rel = entry.path().lexically_relative(root_dir).generic_string();
        if (!workspace_includes(root_hdr, rel)) continue;

        fs::path manifest_path = entry.path() / manifest_name;
        if (!fs::is_regular_file(manifest_path, ec)) {
            log::debug("workspace member directory %s has no %s, skipping",
                      rel.c_str(), manifest_name.c_str());
            continue;
        }

        auto hdr = read_header(manifest_path);
        if (hdr.is_err()) return std::move(hdr).error();
        if (hdr.value().has_workspace) {
            return PackError{PackError::WorkspaceDiscovery,
                "member " + rel + " is itself a workspace root",
                "nested workspaces are not supported"}.at(manifest_path.string());
        }

        auto m = make_member(hdr.value());
        if (m.is_err()) return std::move(m).error();
        out.push_back(std::move(m).value());
    }

    std::stable_sort(out.begin(), out.end(),
        [](const WorkspaceMember& a, const WorkspaceMember& b) {
            if (a.name != b.name) return a.name < b.name;
            return a.manifest_path < b.manifest_path;
        });

    std::unordered_map<std::string, int> seen;
    for (const auto& m : out) {
        if (++seen[m.name] == 2) {
            log::warn("workspace %s has more than one member named '%s'",
                      root_dir.string().c_str(), m.name.c_str());
        }
    }

    return ok_status();
}

Result<Workspace> Workspace::discover(const fs::path& cwd, const std::string& manifest_name) {
    auto found = find_manifest(cwd, manifest_name);
    if (found.is_err()) return std::move(found).error();
    fs::path current_path = found.value();

    auto current_hdr = read_header(current_path);
    if (current_hdr.is_err()) return std::move(current_hdr).error();

    fs::path current_dir = current_path.parent_path();
    std::optional<ManifestHeader> root_hdr;
    fs::path root_dir = current_dir;

    if (current_hdr.value().has_workspace) {
        root_hdr = current_hdr.value();
    } else {
        std::error_code ec;
        fs::path dir = current_dir;
        while (!root_hdr) {
            fs::path parent = dir.parent_path();
            if (parent == dir) break;
            dir = parent;

            fs::path candidate = dir / manifest_name;
            if (!fs::is_regular_file(candidate, ec)) continue;

            auto hdr = read_header(candidate);
            if (hdr.is_err()) return std::move(hdr).error();
            if (!hdr.value().has_workspace) continue;

            std::string rel = current_dir.lexically_relative(dir).generic_string();
            if (workspace_includes(hdr.value(), rel)) {
                root_hdr = std::move(hdr).value();
                root_dir = dir;
            } else {
                log::warn("%s is not a member of the workspace at %s, treating it as standalone",
                          current_path.string().c_str(), candidate.string().c_str());
            }
            break;
        }
    }

    Workspace ws;
    ws.manifest_name_ = manifest_name;
    ws.root_dir_ = root_dir;
    ws.root_manifest_path_ = root_dir / manifest_name;

    if (!root_hdr) {
        auto m = make_member(current_hdr.value());
        if (m.is_err()) return std::move(m).error();
        ws.members_.push_back(std::move(m).value());
        ws.current_ = 0;
    } else {
        ws.virtual_ = !root_hdr->has_package;
        auto st = collect_members(*root_hdr, root_dir, manifest_name, ws.members_);
        if (st.is_err()) return std::move(st).error();

        for (size_t i = 0; i < ws.members_.size(); i++) {
            if (same_file(ws.members_[i].manifest_path, current_path)) {
                ws.current_ = i;
                break;
            }
        }
    }

    log::debug("workspace root %s with %zu member(s)",
               ws.root_dir_.string().c_str(), ws.members_.size());
    return Result<Workspace>::ok(std::move(ws));
}

} // namespace packmeta
