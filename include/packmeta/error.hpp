#pragma once

#include <string>

namespace packmeta {

struct PackError {
    enum Code {
        WorkspaceDiscovery,
        NoCurrentPackage,
        UnknownPackage,
        AmbiguousPackage,
        ManifestRead,
        ManifestParse,
        MetadataNotFound,
        DecodeShape,
        InvalidPath,
        Config
    };

    Code code = WorkspaceDiscovery;
    std::string message;
    std::string hint;
    std::string subject;   // offending package name or key path
    std::string file;
    int line = 0;
    int column = 0;

    PackError() = default;
    PackError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PackError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    PackError& with_subject(std::string s) {
        subject = std::move(s);
        return *this;
    }
    PackError& at(std::string f, int l = 0, int col = 0) {
        file = std::move(f);
        line = l;
        column = col;
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace packmeta
