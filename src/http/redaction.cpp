#include "stumper/http/redaction.hpp"

#include "stumper/utils/text.hpp"

#include <algorithm>

namespace stumper::http {

void RedactionSet::add(std::string_view name) {
    std::lock_guard<std::mutex> lk(mu_);
    names_.emplace_back(name);
}

bool RedactionSet::contains(std::string_view name) const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::any_of(names_.begin(), names_.end(), [name](const std::string &n) {
        return stumper::utils::iequals(n, name);
    });
}

std::size_t RedactionSet::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return names_.size();
}

RedactionSet &global_redactions() {
    static RedactionSet set;
    return set;
}

} // namespace stumper::http
