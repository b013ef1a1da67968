#include <packmeta/pack.hpp>
#include <packmeta/log.hpp>
#include <iostream>
#include <string>

using namespace packmeta;

static void usage() {
    std::cerr << "Usage: packmeta-show [-p <package>] [--path <dotted.key>] [-v]\n"
                 "\n"
                 "Without --path, prints the selected package and the files listed in\n"
                 "[package.metadata.pack]. With --path, prints the manifest value found\n"
                 "at that key path, e.g. --path package.metadata.pack.files\n";
}

int main(int argc, char* argv[]) {
    std::optional<std::string> package;
    std::optional<std::string> path_text;
    int verbosity = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-p" || arg == "--package") && i + 1 < argc) {
            package = argv[++i];
        } else if (arg == "--path" && i + 1 < argc) {
            path_text = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbosity++;
        } else if (arg == "-h" || arg == "--help") {
            usage();
            return 0;
        } else {
            std::cerr << "error: unexpected argument '" << arg << "'\n";
            usage();
            return 1;
        }
    }

    auto cfg = load_effective_config();
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply_logging();
    if (verbosity == 1) log::set_level(log::Debug);
    if (verbosity > 1) log::set_level(log::Trace);

    auto ctx = PackContext::open(WorkingContext::from_config(cfg.value(),
                                     WorkingContext::current().cwd),
                                 package);
    if (ctx.is_err()) {
        std::cerr << ctx.error().format() << "\n";
        return 1;
    }
    const PackContext& pack = ctx.value();

    if (path_text) {
        auto path = KeyPath::parse(*path_text);
        if (path.is_err()) {
            std::cerr << path.error().format() << "\n";
            return 1;
        }
        auto value = pack.decode_at<Value>(path.value());
        if (value.is_err()) {
            std::cerr << value.error().format() << "\n";
            return 1;
        }
        std::cout << value.value().dump() << "\n";
        return 0;
    }

    auto member = pack.package();
    if (member.is_err()) {
        std::cerr << member.error().format() << "\n";
        return 1;
    }

    std::cout << "package:  " << member.value()->name;
    if (!member.value()->version.empty()) std::cout << " " << member.value()->version;
    std::cout << "\n";
    std::cout << "manifest: " << member.value()->manifest_path.string() << "\n";
    std::cout << "files:\n";
    for (const auto& f : pack.files()) {
        std::cout << "  " << f << "\n";
    }
    return 0;
}
