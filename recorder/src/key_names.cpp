#include "key_names.hpp"

#include <linux/input-event-codes.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace {

// Name -> code. The first entry for a code is its canonical name.
const std::vector<std::pair<std::string, int>>& key_table() {
    static const std::vector<std::pair<std::string, int>> table = {
        {"a", KEY_A}, {"b", KEY_B}, {"c", KEY_C}, {"d", KEY_D}, {"e", KEY_E},
        {"f", KEY_F}, {"g", KEY_G}, {"h", KEY_H}, {"i", KEY_I}, {"j", KEY_J},
        {"k", KEY_K}, {"l", KEY_L}, {"m", KEY_M}, {"n", KEY_N}, {"o", KEY_O},
        {"p", KEY_P}, {"q", KEY_Q}, {"r", KEY_R}, {"s", KEY_S}, {"t", KEY_T},
        {"u", KEY_U}, {"v", KEY_V}, {"w", KEY_W}, {"x", KEY_X}, {"y", KEY_Y},
        {"z", KEY_Z},
        {"0", KEY_0}, {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4},
        {"5", KEY_5}, {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9},
        {"space", KEY_SPACE}, {"enter", KEY_ENTER}, {"esc", KEY_ESC},
        {"tab", KEY_TAB}, {"backspace", KEY_BACKSPACE},
        {"shift", KEY_LEFTSHIFT}, {"shift", KEY_RIGHTSHIFT},
        {"ctrl", KEY_LEFTCTRL}, {"ctrl", KEY_RIGHTCTRL},
        {"alt", KEY_LEFTALT}, {"alt", KEY_RIGHTALT},
        {"up", KEY_UP}, {"down", KEY_DOWN}, {"left", KEY_LEFT}, {"right", KEY_RIGHT},
        {"f1", KEY_F1}, {"f2", KEY_F2}, {"f3", KEY_F3}, {"f4", KEY_F4},
        {"f5", KEY_F5}, {"f6", KEY_F6}, {"f7", KEY_F7}, {"f8", KEY_F8},
        {"f9", KEY_F9}, {"f10", KEY_F10}, {"f11", KEY_F11}, {"f12", KEY_F12},
    };
    return table;
}

const std::unordered_map<int, std::string>& names_by_code() {
    static const std::unordered_map<int, std::string> by_code = [] {
        std::unordered_map<int, std::string> m;
        for (const auto& entry : key_table()) {
            m.emplace(entry.second, entry.first);
        }
        return m;
    }();
    return by_code;
}

std::string trim_lower(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    std::string out = s.substr(begin, end - begin);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

int key_code_from_name(const std::string& name) {
    const std::string key = trim_lower(name);
    for (const auto& entry : key_table()) {
        if (entry.first == key) {
            return entry.second;
        }
    }
    return UNKNOWN_KEY_CODE;
}

std::string key_name_from_code(int code) {
    const auto& by_code = names_by_code();
    auto it = by_code.find(code);
    return it == by_code.end() ? std::string() : it->second;
}

bool is_known_key(const std::string& name) {
    return key_code_from_name(name) != UNKNOWN_KEY_CODE;
}

std::string normalize_key_name(const std::string& name) {
    return trim_lower(name);
}

std::vector<std::string> split_key_list(const std::string& list) {
    std::vector<std::string> keys;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        std::string key = normalize_key_name(list.substr(start, comma - start));
        if (!key.empty()) {
            keys.push_back(key);
        }
        start = comma + 1;
    }
    return keys;
}

bool KeyStateFilter::apply(int device, int code, bool down, std::string& name) {
    name = key_name_from_code(code);
    if (name.empty()) {
        return false;
    }

    const std::pair<int, int> physical(device, code);
    if (down) {
        if (!held_.insert(physical).second) {
            return false;
        }
        return ++held_per_name_[name] == 1;
    }

    if (held_.erase(physical) == 0) {
        // Released without a press we saw, let the merge policy decide
        return held_per_name_[name] == 0;
    }
    return --held_per_name_[name] == 0;
}

void KeyStateFilter::clear() {
    held_.clear();
    held_per_name_.clear();
}
