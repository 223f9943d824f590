#pragma once
#include "kata.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Kata files are markdown with a frontmatter header between "---" lines:
//
//   ---
//   id: ownership-01
//   phase: 1
//   phase_title: Ownership
//   sequence: 1
//   title: Use after move
//   hints:
//     - Look at where the value moves
//   ---
//   ## Description
//   ...
//   ## Broken Code
//   ```rust
//   ...
//   ```
//
// Recognised sections: Description, Broken Code, Correct Code, Explanation,
// Compiler Error Interpretation.

struct Frontmatter {
    std::map<std::string, std::string> scalars;
    std::map<std::string, std::vector<std::string>> lists;
};

struct KataParseResult {
    std::optional<Kata> kata;
    std::string error;
};

// Parses the key/value subset used by kata headers: scalars, quoted scalars,
// block lists ("- item") and inline lists ("[a, b]").
Frontmatter parse_frontmatter(const std::string& text);

// Text after "## <heading>" up to the next "## " heading, trimmed.
std::string extract_section(const std::string& body, const std::string& heading);

// Content of the first fenced block in a section, without the fence and the
// language tag. Falls back to the whole section when it has no fence.
std::string extract_code_block(const std::string& body, const std::string& heading);

KataParseResult parse_kata(const std::string& content, const std::string& origin);
KataParseResult parse_kata_file(const std::filesystem::path& path);

// Reads every <dir>/<phase dir>/*.md, skipping files that fail to parse.
// A missing directory gives an empty list. Sorted by (phase, sequence).
std::vector<Kata> load_all_katas(const std::filesystem::path& katas_dir);
