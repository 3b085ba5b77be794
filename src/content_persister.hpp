#pragma once

#include "crawl_config.hpp"
#include "html_document.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

class PersistError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Artifact names longer than this fall back to "<hash>.<ext>".
constexpr std::size_t kMaxArtifactName = 200;
constexpr std::size_t kUrlHashLength = 10;

std::string sha1_hex(const std::string& data);
std::string sanitize_filename(const std::string& name);

// "<last path segment>_<sha1(url)[0:10]>.<ext>", "root" standing in for an
// empty segment.
std::string artifact_name(const std::string& url, const std::string& ext);

// Writes fetched bodies to <out_dir>/raw and extracted text (or a copy of the
// HTML) to <out_dir>/text.
class ContentPersister {
public:
    explicit ContentPersister(const CrawlConfig& cfg);

    // Creates raw/ and text/. Throws PersistError.
    void prepare() const;

    const std::filesystem::path& raw_dir() const { return raw_dir_; }
    const std::filesystem::path& text_dir() const { return text_dir_; }

    // Returns the written path. Throws PersistError when the body is over
    // max_bytes or the file cannot be written.
    std::string save_raw(const std::string& url, const std::string& content_type, const std::string& bytes) const;

    // Text mode writes readable text as .txt, html mode the HTML itself as
    // .html. Nothing is written (std::nullopt) for mode none or empty text.
    std::optional<std::string> extract_and_save_text(const std::string& url,
                                                     const HtmlDocument& doc,
                                                     const std::string& html,
                                                     ExtractMode mode) const;

private:
    void write_file(const std::filesystem::path& path, const std::string& bytes) const;

    std::size_t max_bytes_;
    std::filesystem::path raw_dir_;
    std::filesystem::path text_dir_;
};
