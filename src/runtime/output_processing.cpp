/*
 * output_processing.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "output_processing.hpp"

#include <vector>

namespace runstep::runtime {

namespace {

constexpr char ESC = '\x1b';
constexpr char BEL = '\x07';

auto splitLines(const std::string& text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::string_view view(text);
    size_t start = 0;
    while (true) {
        auto nl = view.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(view.substr(start));
            break;
        }
        lines.push_back(view.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

}  // namespace

auto stripAnsi(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != ESC) {
            result += text[i++];
            continue;
        }
        if (i + 1 >= text.size()) {
            break;
        }

        char kind = text[i + 1];
        i += 2;
        if (kind == '[') {
            // CSI: parameter bytes, intermediate bytes, one final byte.
            while (i < text.size() && text[i] >= 0x30 && text[i] <= 0x3f) ++i;
            while (i < text.size() && text[i] >= 0x20 && text[i] <= 0x2f) ++i;
            if (i < text.size() && text[i] >= 0x40 && text[i] <= 0x7e) ++i;
        } else if (kind == ']') {
            // OSC: terminated by BEL or ESC backslash.
            while (i < text.size()) {
                if (text[i] == BEL) {
                    ++i;
                    break;
                }
                if (text[i] == ESC && i + 1 < text.size() && text[i + 1] == '\\') {
                    i += 2;
                    break;
                }
                ++i;
            }
        } else if (kind >= 0x20 && kind <= 0x2f) {
            // nF, e.g. ESC ( B: more intermediate bytes, then one final byte.
            while (i < text.size() && text[i] >= 0x20 && text[i] <= 0x2f) ++i;
            if (i < text.size() && text[i] >= 0x30 && text[i] <= 0x7e) ++i;
        }
    }
    return result;
}

auto stripRefreshingFromPlanOutput(
    const std::string& output, const std::optional<terraform::Version>& version)
    -> std::string {
    static const terraform::Version MIN_STRIP_VERSION{0, 14, 0};
    if (!version || *version < MIN_STRIP_VERSION) {
        return output;
    }

    auto lines = splitLines(output);
    std::optional<size_t> lastRefresh;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].find(REFRESH_KEYWORD) != std::string_view::npos) {
            lastRefresh = i;
        }
    }
    if (!lastRefresh) {
        return output;
    }

    std::string result;
    for (size_t i = *lastRefresh + 1; i < lines.size(); ++i) {
        if (i > *lastRefresh + 1) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

auto postProcessOutput(PostProcessRunOutput mode, std::string output,
                       const std::optional<terraform::Version>& version)
    -> std::string {
    switch (mode) {
        case PostProcessRunOutput::Hide:
            return "";
        case PostProcessRunOutput::StripRefreshing:
            return stripRefreshingFromPlanOutput(output, version);
        case PostProcessRunOutput::Show:
            break;
    }
    return output;
}

}  // namespace runstep::runtime
