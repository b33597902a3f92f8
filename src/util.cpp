#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>

namespace runbus {

uint64_t epoch_millis() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::string format_for_log(const nlohmann::json& error, size_t max_len) {
    std::string text;
    if (error.is_string()) {
        text = error.get<std::string>();
    } else if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        std::string name = json_string_field(error, "name");
        text = error["message"].get<std::string>();
        if (!name.empty()) text = name + ": " + text;
    } else if (!error.is_null()) {
        text = error.dump();
    }

    // Collapse to a single line
    std::replace(text.begin(), text.end(), '\n', ' ');
    std::replace(text.begin(), text.end(), '\r', ' ');
    text = trim(text);

    if (text.size() > max_len) {
        text = text.substr(0, max_len) + "...";
    }
    return text;
}

std::string json_string_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // namespace runbus
