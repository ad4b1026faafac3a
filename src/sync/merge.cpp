#include "syncmd/sync/merge.hpp"

#include <cctype>
#include <sstream>
#include <vector>

namespace syncmd::sync {
namespace {

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string strip_cr(const std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        return line.substr(0, line.size() - 1);
    }
    return line;
}

bool is_blank(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) {
            return false;
        }
    }
    return true;
}

std::string trim_leading_whitespace(const std::string& text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    return text.substr(start);
}

std::string with_trailing_newline(const std::string& text) {
    if (text.empty() || text.back() == '\n') {
        return text;
    }
    return text + '\n';
}

std::size_t line_delta(const std::string& side, const std::string& base) {
    const auto a = count_lines(side);
    const auto b = count_lines(base);
    return a > b ? a - b : b - a;
}

} // namespace

DocumentParts split_preamble(const std::string& content) {
    const auto lines = split_lines(content);
    if (lines.empty() || strip_cr(lines.front()) != kPreambleMarker) {
        return DocumentParts{{}, content};
    }

    std::size_t closing = 0;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        if (strip_cr(lines[i]) == kPreambleMarker) {
            closing = i;
            break;
        }
    }
    if (closing == 0) {
        return DocumentParts{{}, content};
    }

    DocumentParts parts;
    for (std::size_t i = 1; i < closing; ++i) {
        parts.preamble += lines[i];
        parts.preamble += '\n';
    }

    // Body starts after the closing marker line.
    std::size_t offset = 0;
    for (std::size_t i = 0; i <= closing; ++i) {
        offset = content.find('\n', offset);
        if (offset == std::string::npos) {
            offset = content.size();
            break;
        }
        ++offset;
    }
    parts.body = trim_leading_whitespace(content.substr(offset));
    return parts;
}

std::size_t count_lines(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    std::size_t lines = 0;
    for (char c : text) {
        if (c == '\n') {
            ++lines;
        }
    }
    return text.back() == '\n' ? lines : lines + 1;
}

MergeOutcome merge_bodies(const std::string& local, const std::string& remote, const std::string& base) {
    if (local == remote) {
        return MergeOutcome{local, false};
    }

    const auto local_delta = line_delta(local, base);
    const auto remote_delta = line_delta(remote, base);

    if (local_delta > kMaterialLineDelta && remote_delta > kMaterialLineDelta) {
        std::string merged = "<<<<<<< local\n";
        merged += with_trailing_newline(local);
        merged += "=======\n";
        merged += with_trailing_newline(remote);
        merged += ">>>>>>> remote\n";
        return MergeOutcome{merged, true};
    }

    if (local == base) {
        return MergeOutcome{remote, false};
    }
    if (remote == base) {
        return MergeOutcome{local, false};
    }
    if (local_delta > kMaterialLineDelta) {
        return MergeOutcome{local, false};
    }
    if (remote_delta > kMaterialLineDelta) {
        return MergeOutcome{remote, false};
    }
    return MergeOutcome{local + "\n\n" + remote, false};
}

MergeOutcome merge_document(const std::string& local, const std::string& remote, const std::string& base) {
    const auto local_parts = split_preamble(local);
    const auto remote_parts = split_preamble(remote);
    const auto base_parts = split_preamble(base);

    const std::string& preamble = is_blank(remote_parts.preamble) ? local_parts.preamble : remote_parts.preamble;
    auto body = merge_bodies(local_parts.body, remote_parts.body, base_parts.body);

    MergeOutcome outcome;
    outcome.has_conflict_markers = body.has_conflict_markers;
    if (!is_blank(preamble)) {
        outcome.content = std::string(kPreambleMarker) + "\n" + preamble + kPreambleMarker + "\n\n";
    }
    outcome.content += body.content;
    return outcome;
}

} // namespace syncmd::sync
