#include "thread_store.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include "util.hpp"

namespace chatmux {

std::string thread_title_for(const Message& first_user_message) {
    std::string text = trim(first_user_message.content);
    if (text.empty()) return "Image message";
    return utf8_prefix(text, 30);
}

std::unique_ptr<ThreadStore> create_thread_store(const Config& config) {
    return PluginRegistry::instance().create_store(config.store.backend, config);
}

} // namespace chatmux
