#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Key code value returned for names that are not known.
constexpr int UNKNOWN_KEY_CODE = -1;

// Maps a lower-case key name ("w", "space", "left", "f5") to its evdev code.
int key_code_from_name(const std::string& name);

// Maps an evdev code to its key name. Left and right modifiers share a name.
// Returns an empty string for codes without a name.
std::string key_name_from_code(int code);

bool is_known_key(const std::string& name);

// Trims and lower-cases a key name as typed by the user.
std::string normalize_key_name(const std::string& name);

// Splits "w,a,s,d" into {"w","a","s","d"}, lower-casing and trimming each name.
std::vector<std::string> split_key_list(const std::string& list);

/*
    Collapses physical key transitions into per-name transitions. Left and
    right modifiers, or the same key on two devices, share one name: the name
    goes down when the first of its keys is pressed and up when the last one
    is released. Repeated downs or ups of one physical key are ignored.
*/
class KeyStateFilter {
    private:
        std::set<std::pair<int, int>> held_;  // (device, code)
        std::map<std::string, int> held_per_name_;

    public:
        // Returns true with `name` set if the transition changes the state of that name.
        bool apply(int device, int code, bool down, std::string& name);

        void clear();
};
