#include "cleaner.hpp"
#include <algorithm>
#include <unordered_set>

namespace uneff {

std::size_t ChangeReport::countFor(const std::string& name) const {
    for (const auto& p : charCounts) {
        if (p.first == name) return p.second;
    }
    return 0;
}

std::size_t ChangeReport::totalRemoved() const {
    std::size_t total = 0;
    for (const auto& p : charCounts) total += p.second;
    return total;
}

std::size_t ReplaceAll(std::u32string& text, char32_t ch, const std::u32string& replacement) {
    std::size_t count = static_cast<std::size_t>(std::count(text.begin(), text.end(), ch));
    if (count == 0) return 0;
    if (replacement.empty()) {
        text.erase(std::remove(text.begin(), text.end(), ch), text.end());
        return count;
    }
    std::u32string out;
    out.reserve(text.size() + count * (replacement.size() - 1));
    for (char32_t c : text) {
        if (c == ch) out += replacement;
        else out.push_back(c);
    }
    text.swap(out);
    return count;
}

std::vector<CharacterLocations> Locate(const std::u32string& text, const MappingSet& mappings,
                                       std::size_t sampleLimit, std::size_t contextWidth) {
    std::vector<std::u32string> lines;
    std::size_t start = 0;
    while (true) {
        std::size_t nl = text.find(U'\n', start);
        if (nl == std::u32string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }

    std::vector<CharacterLocations> result;
    std::unordered_set<char32_t> seen;
    for (const auto& entry : mappings) {
        if (!seen.insert(entry.character).second) continue;
        if (text.find(entry.character) == std::u32string::npos) continue;

        CharacterLocations loc;
        loc.character = entry.character;
        loc.name = entry.name;
        loc.total = static_cast<std::size_t>(std::count(text.begin(), text.end(), entry.character));

        std::size_t line_offset = 0;
        for (std::size_t ln = 0; ln < lines.size() && loc.samples.size() < sampleLimit; ++ln) {
            const std::u32string& line = lines[ln];
            for (std::size_t col = 0; col < line.size(); ++col) {
                if (line[col] != entry.character) continue;
                if (loc.samples.size() >= sampleLimit) break;
                Location l;
                l.line = ln + 1;
                l.column = col + 1;
                l.offset = line_offset + col;
                // contextWidth - 1 before, contextWidth after
                std::size_t ctx_begin = col + 1 > contextWidth ? col + 1 - contextWidth : 0;
                std::size_t ctx_end = std::min(line.size(), col + 1 + contextWidth);
                l.context = line.substr(ctx_begin, ctx_end - ctx_begin);
                loc.samples.push_back(std::move(l));
            }
            line_offset += line.size() + 1;
        }
        result.push_back(std::move(loc));
    }
    return result;
}

CleanOutput Clean(const std::u32string& text, const MappingSet& mappings, const CleanOptions& opts) {
    CleanOutput out;
    out.text = text;
    if (!out.text.empty() && out.text.front() == kBomChar) {
        out.text.erase(0, 1);
        out.report.bomInText = true;
    }

    // positions are taken before any mapped character shifts them
    if (opts.locate) {
        out.report.locations = Locate(out.text, mappings, opts.sampleLimit, opts.contextWidth);
    }

    std::u32string mapped;
    for (const auto& entry : mappings) mapped.push_back(entry.character);

    for (const auto& entry : mappings) {
        // a replacement holding a mapped character is treated as deletion
        const bool conflicting = entry.replacement.find_first_of(mapped) != std::u32string::npos;
        std::size_t count = ReplaceAll(out.text, entry.character,
                                       conflicting ? std::u32string() : entry.replacement);
        if (count == 0) continue;
        auto it = std::find_if(out.report.charCounts.begin(), out.report.charCounts.end(),
                               [&](const std::pair<std::string, std::size_t>& p) { return p.first == entry.name; });
        if (it != out.report.charCounts.end()) it->second += count;
        else out.report.charCounts.emplace_back(entry.name, count);
    }
    return out;
}

} // namespace uneff
