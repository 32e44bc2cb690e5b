#include "canned.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace chatmux {

std::unordered_map<std::string, std::string> load_canned_responses(const std::string& path) {
    std::ifstream file(expand_home(path));
    if (!file) {
        throw std::runtime_error("Cannot open canned responses file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid canned responses file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Canned responses file must hold a JSON object: " + path);
    }

    std::unordered_map<std::string, std::string> responses;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) continue;
        responses[to_lower(trim(it.key()))] = it.value().get<std::string>();
    }
    return responses;
}

std::vector<std::string> split_word_fragments(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    bool in_word = false;
    for (char c : text) {
        bool space = c == ' ' || c == '\t' || c == '\n' || c == '\r';
        if (space && in_word) {
            out.push_back(std::move(current));
            current.clear();
            in_word = false;
        }
        if (!space) in_word = true;
        current += c;
    }
    if (!current.empty()) out.push_back(std::move(current));
    return out;
}

StreamItem CannedFragmentStream::next() {
    if (abandoned_.load()) return StreamItem::abandoned();
    if (index_ < fragments_.size()) return StreamItem::fragment(fragments_[index_++]);
    return StreamItem::done();
}

CannedStreamClient::CannedStreamClient(std::unordered_map<std::string, std::string> responses,
                                       std::unique_ptr<StreamClient> fallback)
    : responses_(std::move(responses)), fallback_(std::move(fallback)) {}

std::string CannedStreamClient::client_name() const {
    return fallback_ ? "canned+" + fallback_->client_name() : "canned";
}

const std::string* CannedStreamClient::lookup(const std::string& prompt) const {
    auto it = responses_.find(to_lower(trim(prompt)));
    return it == responses_.end() ? nullptr : &it->second;
}

std::unique_ptr<FragmentStream> CannedStreamClient::start_stream(const StreamRequest& request) {
    if (request.image_path.empty()) {
        if (const auto* reply = lookup(request.prompt)) {
            return std::make_unique<CannedFragmentStream>(split_word_fragments(*reply));
        }
    }
    if (!fallback_) {
        throw ChatError(ErrorKind::Upstream, "no canned response and no fallback client");
    }
    return fallback_->start_stream(request);
}

} // namespace chatmux
