#pragma once
#include <string>
#include <map>
#include <mutex>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace switchboard {

struct AttachmentRef {
    std::string id;
    std::string session_id;
    std::string url;
    std::string mime_type;
    std::string filename;
    int64_t size = 0;
    std::string created_at;

    nlohmann::json to_json() const;
    static AttachmentRef from_json(const nlohmann::json& j);
};

// "Store bytes, get a reference back."
class AttachmentStore {
public:
    virtual ~AttachmentStore() = default;
    virtual AttachmentRef store(const std::string& session_id, const std::string& bytes,
                                const std::string& mime_type, const std::string& filename) = 0;
    virtual std::optional<AttachmentRef> resolve(const std::string& attachment_id) const = 0;
};

// Blobs under <dir>/<id><ext>, metadata in <dir>/index.json. URLs are
// <base_url>/<id>.
class FileAttachmentStore : public AttachmentStore {
public:
    FileAttachmentStore(const std::string& dir, const std::string& base_url);

    AttachmentRef store(const std::string& session_id, const std::string& bytes,
                        const std::string& mime_type, const std::string& filename) override;
    std::optional<AttachmentRef> resolve(const std::string& attachment_id) const override;

    // Absolute path of a stored blob, empty when unknown.
    std::string blob_path(const std::string& attachment_id) const;

private:
    std::string dir_;
    std::string base_url_;
    mutable std::mutex mutex_;
    std::map<std::string, AttachmentRef> index_;
    std::map<std::string, std::string> files_;

    void load_index();
    void save_index() const;
};

std::string extension_for_mime(const std::string& mime_type);

} // namespace switchboard
