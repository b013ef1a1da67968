#include <packmeta/pack.hpp>
#include <packmeta/log.hpp>

namespace packmeta {

namespace fs = std::filesystem;

WorkingContext WorkingContext::current() {
    WorkingContext ctx;
    std::error_code ec;
    ctx.cwd = fs::current_path(ec);
    if (ec) ctx.cwd = ".";
    return ctx;
}

WorkingContext WorkingContext::from_config(const Config& cfg, fs::path cwd) {
    WorkingContext ctx;
    ctx.cwd = std::move(cwd);
    ctx.manifest_name = cfg.manifest_file();
    return ctx;
}

Result<PackContext> PackContext::open(const WorkingContext& ctx,
                                      std::optional<std::string> package_name) {
    auto ws = Workspace::discover(ctx.cwd, ctx.manifest_name);
    if (ws.is_err()) return std::move(ws).error();
    return open(std::move(ws).value(), std::move(package_name));
}

Result<PackContext> PackContext::open(Workspace ws,
                                      std::optional<std::string> package_name) {
    auto member = resolve_package(ws, package_name);
    if (member.is_err()) return std::move(member).error();

    auto config = decode_or_default<PackConfig>(*member.value(), pack_metadata_path());
    if (config.is_err()) return std::move(config).error();

    log::debug("config: %s", config.value().to_string().c_str());
    return Result<PackContext>::ok(PackContext(std::move(ws), std::move(package_name),
                                               std::move(config).value()));
}

Result<const WorkspaceMember*> PackContext::package() const {
    return resolve_package(ws_, package_name_);
}

const std::vector<std::string>& PackContext::files() const {
    static const std::vector<std::string> none;
    return config_.files ? *config_.files : none;
}

} // namespace packmeta
