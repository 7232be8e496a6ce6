#include "qapp/unit_file.hpp"

#include <cctype>
#include <cstddef>

namespace qapp {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(0, end);
}

std::string leading_whitespace(const std::string& s) {
    size_t n = 0;
    while (n < s.size() && (s[n] == ' ' || s[n] == '\t')) ++n;
    return s.substr(0, n);
}

bool ends_with_continuation(const std::string& line) {
    std::string r = rtrim(line);
    return !r.empty() && r.back() == '\\';
}

// Line without its trailing backslash
std::string strip_continuation(const std::string& line) {
    std::string r = rtrim(line);
    r.pop_back();
    return r;
}

std::vector<std::string> split_lines(const std::string& text, bool& trailing_newline) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            start = text.size();
            trailing_newline = false;
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
        trailing_newline = true;
    }
    return lines;
}

Error preprocess_error(const std::string& source_name, size_t line_no, const std::string& msg) {
    return Error(ErrorCode::PREPROCESS_ERROR,
                 source_name + ":" + std::to_string(line_no) + ": " + msg);
}

} // namespace

Result<UnitFile> UnitFile::parse(const std::string& text, const std::string& source_name) {
    UnitFile unit;
    auto physical = split_lines(text, unit.trailing_newline_);

    std::string current_section;
    bool in_section = false;

    for (size_t i = 0; i < physical.size(); ++i) {
        const std::string& line = physical[i];
        std::string stripped = trim(line);
        size_t line_no = i + 1;

        UnitLine ul;
        ul.raw = line;

        if (stripped.empty()) {
            ul.kind = UnitLineKind::Blank;
            unit.lines_.push_back(ul);
            continue;
        }

        if (stripped[0] == '#' || stripped[0] == ';') {
            ul.kind = UnitLineKind::Comment;
            unit.lines_.push_back(ul);
            continue;
        }

        if (stripped[0] == '[') {
            if (stripped.back() != ']' || stripped.size() < 3) {
                return Result<UnitFile>::err(preprocess_error(
                    source_name, line_no, "unterminated section header '" + stripped + "'"));
            }
            ul.kind = UnitLineKind::Section;
            ul.section = stripped.substr(1, stripped.size() - 2);
            current_section = ul.section;
            in_section = true;
            unit.lines_.push_back(ul);
            continue;
        }

        auto eq = stripped.find('=');
        if (eq == std::string::npos) {
            return Result<UnitFile>::err(preprocess_error(
                source_name, line_no, "expected key=value, got '" + stripped + "'"));
        }
        if (!in_section) {
            return Result<UnitFile>::err(preprocess_error(
                source_name, line_no, "directive outside of any section: '" + stripped + "'"));
        }

        ul.kind = UnitLineKind::Entry;
        ul.section = current_section;
        ul.key = trim(stripped.substr(0, eq));

        // Fold continuation lines: "a \" + "b" -> "a b"
        std::string value = stripped.substr(eq + 1);
        while (ends_with_continuation(value) && i + 1 < physical.size()) {
            value = strip_continuation(value);
            ++i;
            ul.raw += "\n" + physical[i];
            value = rtrim(value) + " " + trim(physical[i]);
        }
        ul.value = trim(value);

        if (ul.key.empty()) {
            return Result<UnitFile>::err(preprocess_error(
                source_name, line_no, "empty directive name"));
        }

        unit.lines_.push_back(ul);
    }

    return Result<UnitFile>::ok(unit);
}

std::string UnitFile::serialize() const {
    std::string out;
    for (size_t i = 0; i < lines_.size(); ++i) {
        const auto& line = lines_[i];
        if (i > 0) out += '\n';

        if (line.kind == UnitLineKind::Entry && line.modified) {
            out += leading_whitespace(line.raw) + line.key + "=" + line.value;
        } else {
            out += line.raw;
        }
    }
    if (trailing_newline_ && !lines_.empty()) {
        out += '\n';
    }
    return out;
}

bool UnitFile::hasSection(const std::string& section) const {
    for (const auto& line : lines_) {
        if (line.kind == UnitLineKind::Section && line.section == section) return true;
    }
    return false;
}

bool UnitFile::hasKey(const std::string& section, const std::string& key) const {
    for (const auto& line : lines_) {
        if (line.kind == UnitLineKind::Entry && line.section == section && line.key == key) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> UnitFile::values(const std::string& section, const std::string& key) const {
    std::vector<std::string> result;
    for (const auto& line : lines_) {
        if (line.kind == UnitLineKind::Entry && line.section == section && line.key == key) {
            result.push_back(line.value);
        }
    }
    return result;
}

void UnitFile::setValue(size_t index, const std::string& value) {
    auto& line = lines_.at(index);
    if (line.value == value) return;
    line.value = value;
    line.modified = true;
}

void UnitFile::insertAfterHeader(const std::string& section,
                                 const std::string& key,
                                 const std::string& value) {
    UnitLine entry;
    entry.kind = UnitLineKind::Entry;
    entry.section = section;
    entry.key = key;
    entry.value = value;
    entry.raw = key + "=" + value;

    for (size_t i = 0; i < lines_.size(); ++i) {
        if (lines_[i].kind == UnitLineKind::Section && lines_[i].section == section) {
            lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(i + 1), entry);
            return;
        }
    }

    UnitLine header;
    header.kind = UnitLineKind::Section;
    header.section = section;
    header.raw = "[" + section + "]";

    if (!lines_.empty() && lines_.back().kind != UnitLineKind::Blank) {
        UnitLine blank;
        lines_.push_back(blank);
    }
    lines_.push_back(header);
    lines_.push_back(entry);
    trailing_newline_ = true;
}

} // namespace qapp
