#pragma once

#include <string>
#include <format>
#include <string_view>

// Loads l10n/<lang>.txt for the language named by LANG (English otherwise).
void init_localization();
// Unknown keys map to a visible placeholder rather than failing.
const std::string& get_string(const std::string& key);

// Catalog entries use std::format placeholders. A template that does not
// match its arguments yields a diagnostic line instead of throwing.
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return get_string("error.format_failed") + " [" + key + "]: " + e.what();
    }
}
