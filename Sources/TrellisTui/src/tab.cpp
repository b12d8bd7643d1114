#include "trellis/tui/tab.hpp"
#include <trellis/log.hpp>

namespace trellis::tui {

void tab_catalog::register_kind(std::string name, factory create) {
    if (find(name)) {
        throw configuration_error("tab kind already registered: " + name);
    }
    LOG_DEBUG("tui", "Registered tab kind %s", name.c_str());
    kinds_.push_back(kind{std::move(name), std::move(create)});
}

const tab_catalog::kind* tab_catalog::find(const std::string& name) const {
    for (const auto& k : kinds_) {
        if (k.name == name) return &k;
    }
    return nullptr;
}

} // namespace trellis::tui
