#include "model/window.hpp"

#include <algorithm>
#include <cctype>
#include <string>

std::string_view window_type_name(WindowType type) {
    switch (type) {
        case WindowType::Application: return "APPLICATION";
        case WindowType::System: return "SYSTEM";
        case WindowType::InputMethod: return "INPUT_METHOD";
        case WindowType::AccessibilityOverlay: return "ACCESSIBILITY_OVERLAY";
        case WindowType::Other: return "OTHER";
    }
    return "OTHER";
}

WindowType parse_window_type(std::string_view raw) {
    std::string key;
    key.reserve(raw.size());
    for (char c : raw) {
        if (c == '-' || c == ' ') key.push_back('_');
        else key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (key.starts_with("TYPE_")) key.erase(0, 5);

    if (key == "APPLICATION") return WindowType::Application;
    if (key == "SYSTEM") return WindowType::System;
    if (key == "INPUT_METHOD") return WindowType::InputMethod;
    if (key == "ACCESSIBILITY_OVERLAY") return WindowType::AccessibilityOverlay;
    return WindowType::Other;
}

std::string_view orientation_name(Orientation o) {
    return o == Orientation::Landscape ? "landscape" : "portrait";
}
