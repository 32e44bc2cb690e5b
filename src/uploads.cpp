#include "uploads.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace chatmux {

UploadStore::UploadStore(const std::string& dir) : dir_(dir) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create upload directory " + dir_ + ": " + ec.message());
    }
}

std::optional<std::string> UploadStore::extension_for(const std::string& mime_type) {
    std::string mime = to_lower(trim(mime_type));
    auto semi = mime.find(';');
    if (semi != std::string::npos) mime = trim(mime.substr(0, semi));
    if (mime == "image/jpeg" || mime == "image/jpg") return std::string("jpg");
    if (mime == "image/png") return std::string("png");
    if (mime == "image/gif") return std::string("gif");
    if (mime == "image/webp") return std::string("webp");
    return std::nullopt;
}

std::string UploadStore::mime_type_for(const std::string& name) {
    auto dot = name.rfind('.');
    std::string ext = dot == std::string::npos ? "" : to_lower(name.substr(dot + 1));
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "png") return "image/png";
    if (ext == "gif") return "image/gif";
    if (ext == "webp") return "image/webp";
    return "application/octet-stream";
}

std::string UploadStore::save(const std::string& data, const std::string& extension) {
    std::string name = generate_id() + "." + extension;
    fs::path path = fs::path(dir_) / name;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write upload " + path.string());
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Short write on upload " + path.string());
    }
    return name;
}

std::optional<std::string> UploadStore::resolve(const std::string& image_ref) const {
    std::string ref = image_ref;
    auto query = ref.find_first_of("?#");
    if (query != std::string::npos) ref.resize(query);
    auto slash = ref.rfind('/');
    std::string name = slash == std::string::npos ? ref : ref.substr(slash + 1);
    if (name.empty() || name == "." || name == ".." ||
        name.find('\\') != std::string::npos) {
        return std::nullopt;
    }

    fs::path path = fs::path(dir_) / name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    return path.string();
}

} // namespace chatmux
