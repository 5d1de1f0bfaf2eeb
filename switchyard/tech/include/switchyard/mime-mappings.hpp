#pragma once

#include <string_view>

namespace switchyard {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
};

// Sorted by extension (checked at compile time), lower case only.
inline constexpr MIMEMapping kMIMEMappings[] = {
    {"avif", "image/avif"},
    {"bmp", "image/bmp"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"hbs", "text/x-handlebars-template"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"map", "application/json"},
    {"md", "text/markdown"},
    {"mjs", "text/javascript"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"otf", "font/otf"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"svg", "image/svg+xml"},
    {"ttf", "font/ttf"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xml", "application/xml"},
    {"zip", "application/zip"},
};

// Returns the MIME type matching the extension of 'path' (case insensitive), or an empty string_view
// if the extension is unknown or absent. Non-allocating.
std::string_view DetermineMIMETypeStr(std::string_view path);

}  // namespace switchyard
