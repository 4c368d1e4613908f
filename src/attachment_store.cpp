#include "attachment_store.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <fstream>
#include <iostream>

namespace switchboard {

nlohmann::json AttachmentRef::to_json() const {
    return {
        {"id", id},
        {"session_id", session_id},
        {"url", url},
        {"mime_type", mime_type},
        {"filename", filename},
        {"size", size},
        {"created_at", created_at},
    };
}

AttachmentRef AttachmentRef::from_json(const nlohmann::json& j) {
    AttachmentRef r;
    r.id = j.value("id", "");
    r.session_id = j.value("session_id", "");
    r.url = j.value("url", "");
    r.mime_type = j.value("mime_type", "");
    r.filename = j.value("filename", "");
    r.size = j.value("size", int64_t(0));
    r.created_at = j.value("created_at", "");
    return r;
}

std::string extension_for_mime(const std::string& mime_type) {
    std::string m = to_lower(mime_type);
    if (m == "image/png") return ".png";
    if (m == "image/jpeg" || m == "image/jpg") return ".jpg";
    if (m == "image/gif") return ".gif";
    if (m == "image/webp") return ".webp";
    if (m == "application/pdf") return ".pdf";
    if (m == "text/plain") return ".txt";
    return ".bin";
}

FileAttachmentStore::FileAttachmentStore(const std::string& dir, const std::string& base_url)
    : dir_(expand_path(dir)), base_url_(base_url) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw StorageError("Failed to create attachment dir " + dir_ + ": " + ec.message());
    load_index();
}

void FileAttachmentStore::load_index() {
    std::string path = dir_ + "/index.json";
    if (!fs::exists(path)) return;
    try {
        auto j = nlohmann::json::parse(read_file(path));
        for (auto& item : j.value("attachments", nlohmann::json::array())) {
            auto ref = AttachmentRef::from_json(item);
            if (ref.id.empty()) continue;
            files_[ref.id] = item.value("file", "");
            index_[ref.id] = std::move(ref);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[attachments] Ignoring unreadable index " << path << ": " << e.what() << "\n";
    }
}

void FileAttachmentStore::save_index() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& [id, ref] : index_) {
        auto item = ref.to_json();
        auto it = files_.find(id);
        item["file"] = it != files_.end() ? it->second : "";
        arr.push_back(std::move(item));
    }
    std::string tmp = dir_ + "/index.json.tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw StorageError("Failed to write attachment index " + tmp);
        f << nlohmann::json{{"attachments", arr}}.dump(2) << "\n";
    }
    std::error_code ec;
    fs::rename(tmp, dir_ + "/index.json", ec);
    if (ec) throw StorageError("Failed to replace attachment index: " + ec.message());
}

AttachmentRef FileAttachmentStore::store(const std::string& session_id, const std::string& bytes,
                                         const std::string& mime_type, const std::string& filename) {
    AttachmentRef ref;
    ref.id = generate_id("att_");
    ref.session_id = session_id;
    ref.mime_type = mime_type.empty() ? "application/octet-stream" : mime_type;
    ref.filename = filename;
    ref.size = static_cast<int64_t>(bytes.size());
    ref.created_at = iso_now();
    ref.url = base_url_ + "/" + ref.id;

    std::string file = ref.id + extension_for_mime(ref.mime_type);
    {
        std::ofstream f(dir_ + "/" + file, std::ios::binary | std::ios::trunc);
        if (!f) throw StorageError("Failed to write attachment " + file);
        f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    index_[ref.id] = ref;
    files_[ref.id] = file;
    save_index();
    return ref;
}

std::optional<AttachmentRef> FileAttachmentStore::resolve(const std::string& attachment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(attachment_id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::string FileAttachmentStore::blob_path(const std::string& attachment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(attachment_id);
    if (it == files_.end() || it->second.empty()) return "";
    return dir_ + "/" + it->second;
}

} // namespace switchboard
