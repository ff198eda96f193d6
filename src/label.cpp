#include "protoplan/label.hpp"

#include "protoplan/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace protoplan {

namespace {

std::string trim_trailing_slash(std::string s) {
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

std::string source_absolute_dir(std::string_view dir) {
    std::string rel = source_relative(dir);
    if (rel == ".")
        return "//";
    return "//" + rel;
}

} // namespace

std::string source_relative(std::string_view path) {
    if (path.starts_with("//")) {
        path.remove_prefix(2);
    }
    if (path.empty()) {
        return ".";
    }
    std::string norm = trim_trailing_slash(fs::path(path).lexically_normal().generic_string());
    if (norm.empty() || norm == "/") {
        return ".";
    }
    return norm;
}

std::string rebase_path(std::string_view path, std::string_view base) {
    const fs::path from = source_relative(path);
    const fs::path to = source_relative(base);
    fs::path rel = from.lexically_relative(to);
    if (rel.empty()) {
        // Not expressible relative to base (e.g. differing roots); keep as-is.
        return from.generic_string();
    }
    std::string out = trim_trailing_slash(rel.lexically_normal().generic_string());
    return out.empty() ? "." : out;
}

std::string join_path(std::string_view lhs, std::string_view rhs) {
    std::string left = source_relative(lhs);
    std::string right = source_relative(rhs);
    if (left == ".")
        return right;
    if (right == ".")
        return left;
    return source_relative((fs::path(left) / right).generic_string());
}

SourceParts split_source(std::string_view source, std::string_view directory) {
    SourceParts parts;
    if (source.starts_with("//")) {
        parts.path = source_relative(source);
    } else {
        parts.path = join_path(directory, source);
    }

    const fs::path p(parts.path);
    parts.dir = p.has_parent_path() ? p.parent_path().generic_string() : ".";
    parts.file_part = p.filename().generic_string();
    parts.name_part = p.stem().generic_string();
    return parts;
}

Result<Label> Label::parse(std::string_view text, std::string_view current_dir) {
    if (text.empty()) {
        return fail(ErrorKind::MalformedLabel, "Empty label");
    }

    Label label;
    std::string_view body = text;

    if (size_t open = body.find('('); open != std::string_view::npos) {
        if (!body.ends_with(')')) {
            return fail(ErrorKind::MalformedLabel, "Unterminated toolchain in label: {}", text);
        }
        std::string_view toolchain = body.substr(open + 1, body.size() - open - 2);
        if (toolchain.empty()) {
            return fail(ErrorKind::MalformedLabel, "Empty toolchain in label: {}", text);
        }
        label.toolchain_ = toolchain;
        body = body.substr(0, open);
    }

    std::string_view dir_part;
    std::string_view name_part;
    size_t colon = body.find(':');
    if (body.starts_with("//")) {
        dir_part = body.substr(0, colon);
        if (colon != std::string_view::npos) {
            name_part = body.substr(colon + 1);
            if (name_part.empty()) {
                return fail(ErrorKind::MalformedLabel, "Empty name in label: {}", text);
            }
        }
        label.dir_ = source_absolute_dir(dir_part);
    } else if (body.starts_with(":")) {
        name_part = body.substr(1);
        if (name_part.empty()) {
            return fail(ErrorKind::MalformedLabel, "Empty name in label: {}", text);
        }
        label.dir_ = source_absolute_dir(current_dir);
    } else {
        return fail(ErrorKind::MalformedLabel, "Label must start with '//' or ':': {}", text);
    }

    if (name_part.empty()) {
        if (label.dir_ == "//") {
            return fail(ErrorKind::MalformedLabel, "Root label needs an explicit name: {}", text);
        }
        label.name_ = fs::path(label.dir_.substr(2)).filename().generic_string();
    } else {
        label.name_ = name_part;
    }
    return label;
}

Label Label::with_toolchain(std::string_view toolchain) const {
    Label copy = *this;
    copy.toolchain_ = toolchain;
    return copy;
}

std::string Label::str() const {
    std::string out = dir_ + ":" + name_;
    if (!toolchain_.empty()) {
        out += "(" + toolchain_ + ")";
    }
    return out;
}

} // namespace protoplan
