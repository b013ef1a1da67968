#include <packmeta/error.hpp>

namespace packmeta {

const char* PackError::code_name(Code c) {
    switch (c) {
        case WorkspaceDiscovery: return "WorkspaceDiscovery";
        case NoCurrentPackage:   return "NoCurrentPackage";
        case UnknownPackage:     return "UnknownPackage";
        case AmbiguousPackage:   return "AmbiguousPackage";
        case ManifestRead:       return "ManifestRead";
        case ManifestParse:      return "ManifestParse";
        case MetadataNotFound:   return "MetadataNotFound";
        case DecodeShape:        return "DecodeShape";
        case InvalidPath:        return "InvalidPath";
        case Config:             return "Config";
    }
    return "Unknown";
}

std::string PackError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":" + std::to_string(line);
            if (column > 0) result += ":" + std::to_string(column);
        }
    }

    return result;
}

} // namespace packmeta
