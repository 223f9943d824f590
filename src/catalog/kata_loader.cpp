#include "kata_loader.hpp"
#include "../sandbox/utf8.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static std::string unquote(const std::string& v) {
    if (v.size() < 2) return v;
    char q = v.front();
    if ((q != '"' && q != '\'') || v.back() != q) return v;

    std::string inner = v.substr(1, v.size() - 2);
    if (q == '\'') {
        // YAML single quotes escape themselves by doubling.
        std::string out;
        for (size_t i = 0; i < inner.size(); ++i) {
            out.push_back(inner[i]);
            if (inner[i] == '\'' && i + 1 < inner.size() && inner[i + 1] == '\'') ++i;
        }
        return out;
    }

    std::string out;
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '\\' && i + 1 < inner.size()) {
            char n = inner[++i];
            switch (n) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                default: out.push_back('\\'); out.push_back(n); break;
            }
        } else {
            out.push_back(c);
        }
    }
    return out;
}

static std::vector<std::string> split_inline_list(const std::string& v) {
    std::vector<std::string> items;
    std::string inner = v.substr(1, v.size() - 2);
    std::string cur;
    char quote = 0;
    for (char c : inner) {
        if (quote) {
            cur.push_back(c);
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
            cur.push_back(c);
        } else if (c == ',') {
            items.push_back(unquote(trim(cur)));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!trim(cur).empty()) items.push_back(unquote(trim(cur)));
    return items;
}

Frontmatter parse_frontmatter(const std::string& text) {
    Frontmatter fm;
    std::string list_key;
    std::istringstream in(text);
    std::string raw;

    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '-' && (line.size() == 1 || line[1] == ' ')) {
            if (!list_key.empty()) {
                fm.lists[list_key].push_back(unquote(trim(line.substr(1))));
            }
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));

        if (value.empty()) {
            list_key = key;
            fm.lists[key];
        } else if (value.front() == '[' && value.back() == ']') {
            list_key.clear();
            fm.lists[key] = split_inline_list(value);
        } else {
            list_key.clear();
            fm.scalars[key] = unquote(value);
        }
    }
    return fm;
}

std::string extract_section(const std::string& body, const std::string& heading) {
    const std::string marker = "## " + heading;
    auto start = body.find(marker);
    if (start == std::string::npos) return "";

    std::string after = body.substr(start + marker.size());
    auto end = after.find("\n## ");
    if (end != std::string::npos) after = after.substr(0, end);
    return trim(after);
}

std::string extract_code_block(const std::string& body, const std::string& heading) {
    std::string section = extract_section(body, heading);
    auto start = section.find("```");
    if (start == std::string::npos) return section;

    std::string after = section.substr(start + 3);
    auto nl = after.find('\n');
    std::string code = nl == std::string::npos ? after : after.substr(nl + 1);
    auto end = code.find("```");
    if (end != std::string::npos) code = code.substr(0, end);
    return trim(code);
}

static bool parse_u32(const std::string& s, uint32_t& out) {
    if (s.empty() || s.size() > 9) return false;
    uint32_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint32_t>(c - '0');
    }
    out = v;
    return true;
}

KataParseResult parse_kata(const std::string& content, const std::string& origin) {
    KataParseResult r;

    if (!is_valid_utf8(content)) {
        r.error = origin + ": stream did not contain valid UTF-8";
        return r;
    }

    auto first = content.find("---");
    auto second = first == std::string::npos ? std::string::npos : content.find("---", first + 3);
    if (second == std::string::npos) {
        r.error = "Invalid frontmatter in " + origin;
        return r;
    }

    Frontmatter fm = parse_frontmatter(content.substr(first + 3, second - first - 3));
    std::string body = content.substr(second + 3);

    for (const char* required : {"id", "phase", "phase_title", "sequence", "title"}) {
        if (!fm.scalars.count(required)) {
            r.error = origin + ": missing field `" + required + "`";
            return r;
        }
    }

    Kata k;
    k.id = fm.scalars["id"];
    k.phase_title = fm.scalars["phase_title"];
    k.title = fm.scalars["title"];
    if (!parse_u32(fm.scalars["phase"], k.phase)) {
        r.error = origin + ": phase must be a non-negative integer";
        return r;
    }
    if (!parse_u32(fm.scalars["sequence"], k.sequence)) {
        r.error = origin + ": sequence must be a non-negative integer";
        return r;
    }
    auto hints = fm.lists.find("hints");
    if (hints != fm.lists.end()) k.hints = hints->second;

    k.description = extract_section(body, "Description");
    k.broken_code = extract_code_block(body, "Broken Code");
    k.correct_code = extract_code_block(body, "Correct Code");
    k.explanation = extract_section(body, "Explanation");
    k.compiler_error_interpretation = extract_section(body, "Compiler Error Interpretation");

    r.kata = std::move(k);
    return r;
}

KataParseResult parse_kata_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        KataParseResult r;
        r.error = "cannot open " + path.string();
        return r;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_kata(ss.str(), path.string());
}

static std::vector<fs::path> sorted_entries(const fs::path& dir, bool want_dirs) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (want_dirs) {
            if (it->is_directory(type_ec)) out.push_back(it->path());
        } else if (it->is_regular_file(type_ec) && it->path().extension() == ".md") {
            out.push_back(it->path());
        }
    }
    if (ec) {
        std::cerr << "[catalog] Failed to list " << dir << ": " << ec.message() << std::endl;
    }
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename() < b.filename();
    });
    return out;
}

std::vector<Kata> load_all_katas(const fs::path& katas_dir) {
    std::vector<Kata> katas;

    std::error_code ec;
    if (!fs::exists(katas_dir, ec)) {
        std::cerr << "[catalog] Katas directory not found: " << katas_dir << std::endl;
        return katas;
    }

    for (const auto& phase_dir : sorted_entries(katas_dir, true)) {
        for (const auto& file : sorted_entries(phase_dir, false)) {
            auto parsed = parse_kata_file(file);
            if (!parsed.kata) {
                std::cerr << "[catalog] Failed to parse " << file << ": " << parsed.error << std::endl;
                continue;
            }
            std::cout << "[catalog] Loaded kata: " << parsed.kata->title
                      << " (phase " << parsed.kata->phase << ")" << std::endl;
            katas.push_back(std::move(*parsed.kata));
        }
    }

    std::stable_sort(katas.begin(), katas.end(), [](const Kata& a, const Kata& b) {
        if (a.phase != b.phase) return a.phase < b.phase;
        return a.sequence < b.sequence;
    });
    std::cout << "[catalog] Loaded " << katas.size() << " katas total" << std::endl;
    return katas;
}
