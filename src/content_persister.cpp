#include "content_persister.hpp"

#include "page_fetcher.hpp"
#include "url.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

// -------------------- naming --------------------
std::string sha1_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw PersistError("EVP_MD_CTX_new failed");
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) throw PersistError("SHA-1 digest failed");

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; i++) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::string sanitize_filename(const std::string& name) {
    std::string s = name;
    for (char& c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '.' && c != '-' && c != '_') c = '_';
    }
    if (s.find_first_not_of('.') == std::string::npos) return {};
    return s;
}

std::string artifact_name(const std::string& url, const std::string& ext) {
    std::string path = "/";
    if (auto parts = parse_url(url)) path = parts->path;

    auto end = path.find_last_not_of('/');
    std::string segment;
    if (end != std::string::npos) {
        std::string trimmed = path.substr(0, end + 1);
        segment = trimmed.substr(trimmed.rfind('/') + 1);
    }
    std::string base = sanitize_filename(segment);
    if (base.empty()) base = "root";

    const std::string hash = sha1_hex(url).substr(0, kUrlHashLength);
    std::string name = base + "_" + hash + "." + ext;
    if (name.size() > kMaxArtifactName) name = hash + "." + ext;
    return name;
}

// -------------------- persister --------------------
ContentPersister::ContentPersister(const CrawlConfig& cfg)
    : max_bytes_(cfg.max_bytes),
      raw_dir_(fs::path(cfg.out_dir) / "raw"),
      text_dir_(fs::path(cfg.out_dir) / "text") {}

void ContentPersister::prepare() const {
    for (const auto& dir : {raw_dir_, text_dir_}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) throw PersistError("cannot create " + dir.string() + ": " + ec.message());
        if (!fs::is_directory(dir, ec)) throw PersistError("cannot create " + dir.string() + ": not a directory");
    }
}

void ContentPersister::write_file(const fs::path& path, const std::string& bytes) const {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) throw PersistError("cannot open " + path.string() + " for writing");
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.close();
    if (!ofs) throw PersistError("write to " + path.string() + " failed");
}

std::string ContentPersister::save_raw(const std::string& url, const std::string& content_type, const std::string& bytes) const {
    if (max_bytes_ > 0 && bytes.size() > max_bytes_) {
        throw PersistError("body of " + std::to_string(bytes.size()) + " bytes exceeds the limit of " +
                           std::to_string(max_bytes_) + " bytes");
    }
    fs::path path = raw_dir_ / artifact_name(url, extension_for(content_type));
    write_file(path, bytes);
    return path.string();
}

std::optional<std::string> ContentPersister::extract_and_save_text(const std::string& url,
                                                                   const HtmlDocument& doc,
                                                                   const std::string& html,
                                                                   ExtractMode mode) const {
    if (mode == ExtractMode::None) return std::nullopt;

    if (mode == ExtractMode::Html) {
        fs::path path = text_dir_ / artifact_name(url, "html");
        write_file(path, html);
        return path.string();
    }

    std::string text = doc.readable_text();
    if (text.empty()) return std::nullopt;
    fs::path path = text_dir_ / artifact_name(url, "txt");
    write_file(path, text);
    return path.string();
}
