#include "tenant/tenant_namespace.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace sqlsandbox {

namespace {

bool is_word_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '$' || uc >= 0x80;
}

} // anonymous namespace

std::string TenantNamespace::physical_name(const std::string& logical, int64_t problem_id) {
    return std::format("{}_{}", utils::to_lower(logical), problem_id);
}

void TenantNamespace::add(const std::string& logical, const std::string& physical) {
    const auto logical_lower = utils::to_lower(logical);
    logical_names_.push_back(logical);
    physical_names_.push_back(physical);
    allowed_lower_.insert(logical_lower);
    logical_to_physical_[logical_lower] = physical;
    physical_to_logical_[utils::to_lower(physical)] = logical;
}

std::optional<std::string> TenantNamespace::physical_for(const std::string& logical) const {
    const auto it = logical_to_physical_.find(utils::to_lower(logical));
    if (it == logical_to_physical_.end()) return std::nullopt;
    return it->second;
}

bool TenantNamespace::contains(const std::string& logical) const {
    return logical_to_physical_.contains(utils::to_lower(logical));
}

std::string TenantNamespace::to_logical_text(const std::string& text) const {
    if (physical_to_logical_.empty()) return text;

    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (!is_word_char(text[i])) {
            result += text[i++];
            continue;
        }
        size_t end = i;
        while (end < text.size() && is_word_char(text[end])) ++end;
        const std::string word = text.substr(i, end - i);
        const auto it = physical_to_logical_.find(utils::to_lower(word));
        result += (it != physical_to_logical_.end()) ? it->second : word;
        i = end;
    }
    return result;
}

std::string TenantNamespace::to_logical_column(const std::string& name) const {
    for (const char c : name) {
        if (!is_word_char(c)) return to_logical_text(name);
    }
    return name;
}

} // namespace sqlsandbox
