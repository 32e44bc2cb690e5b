#pragma once
#include <optional>
#include <string>

namespace chatmux {

// Image files received through POST /api/upload. Files are named
// <random id>.<ext> inside one flat directory.
class UploadStore {
public:
    explicit UploadStore(const std::string& dir);

    const std::string& dir() const { return dir_; }

    // File extension for an accepted image MIME type (jpeg, png, gif, webp).
    static std::optional<std::string> extension_for(const std::string& mime_type);

    // MIME type served for a stored file name.
    static std::string mime_type_for(const std::string& name);

    // Writes the image and returns its file name. Throws std::runtime_error
    // when the file cannot be written.
    std::string save(const std::string& data, const std::string& extension);

    // Local path for an image reference ("/uploads/<name>", "<name>" or a
    // URL ending in the name). Only the last path segment is used.
    std::optional<std::string> resolve(const std::string& image_ref) const;

    // Public URL of a stored file name.
    static std::string url_for(const std::string& name) { return "/uploads/" + name; }

private:
    std::string dir_;
};

} // namespace chatmux
