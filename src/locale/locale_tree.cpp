#include <keyrescue/locale/locale_tree.h>
#include <keyrescue/locale/translation_key.h>

#include <spdlog/spdlog.h>

namespace keyrescue::locale {

std::optional<LocaleTree> parseLocaleTree(std::string_view text) {
    try {
        auto tree = LocaleTree::parse(text.begin(), text.end());
        if (!tree.is_object()) {
            return std::nullopt;
        }
        return tree;
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("[LocaleTree] Parse failure: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> getNestedValue(const LocaleTree& tree, std::string_view key) {
    if (!tree.is_object()) {
        return std::nullopt;
    }
    auto parts = splitKeySegments(key);
    if (parts.empty()) {
        return std::nullopt;
    }

    const LocaleTree* node = &tree;
    for (const auto& part : parts) {
        if (!node->is_object()) {
            node = nullptr;
            break;
        }
        auto it = node->find(part);
        if (it == node->end()) {
            node = nullptr;
            break;
        }
        node = &(*it);
    }
    if (node && node->is_string()) {
        return node->get<std::string>();
    }

    auto flat = tree.find(std::string(key));
    if (flat != tree.end() && flat->is_string()) {
        return flat->get<std::string>();
    }
    return std::nullopt;
}

bool setNestedValue(LocaleTree& tree, std::string_view key, std::string value) {
    auto parts = splitKeySegments(key);
    if (parts.empty()) {
        return false;
    }
    if (tree.is_null()) {
        tree = LocaleTree::object();
    }
    if (!tree.is_object()) {
        return false;
    }

    LocaleTree* node = &tree;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& child = (*node)[parts[i]];
        if (child.is_null()) {
            child = LocaleTree::object();
        }
        if (!child.is_object()) {
            return false;
        }
        node = &child;
    }
    (*node)[parts.back()] = std::move(value);
    return true;
}

std::string serializeLocaleTree(const LocaleTree& tree) {
    return tree.dump(2) + "\n";
}

} // namespace keyrescue::locale
