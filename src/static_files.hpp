#pragma once
#include <filesystem>
#include <optional>
#include <string>

// MIME type from the file extension; application/octet-stream when unknown.
std::string mime_type(const std::filesystem::path& path);

// Decodes %XX escapes. Returns nullopt on a malformed escape or an embedded NUL.
std::optional<std::string> percent_decode(const std::string& s);

// Maps a URL path (no query) onto a file under `root`. Directories map to
// their index.html. Returns nullopt for anything that would leave `root`.
std::optional<std::filesystem::path> resolve_static_path(const std::filesystem::path& root,
                                                         const std::string& url_path);

// Reads a whole file. Returns nullopt when it cannot be read.
std::optional<std::string> read_file(const std::filesystem::path& path);
