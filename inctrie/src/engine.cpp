#include <inctrie/engine.hpp>
#include <inctrie/types.hpp>
#include <functional>

namespace inctrie {

Engine::Engine(EngineConfig config)
    : config_(config) {
    DEBUG_LOG("engine created, mode=%s",
              config_.mode == EngineMode::INCREMENTAL ? "incremental" : "naive");
}

void Engine::reset() {
    table_.clear();
    in_progress_.clear();
    namespaces_.clear();
    stats_ = EngineStats{};
}

Name Engine::qualify(const Name& name) const {
    if (namespaces_.empty()) {
        return name;
    }
    return Name::pair(namespaces_.back(), name);
}

std::optional<Name> Engine::current_namespace() const {
    if (namespaces_.empty()) {
        return std::nullopt;
    }
    return namespaces_.back();
}

std::size_t Engine::KeyHash::operator()(const Key& key) const {
    uint64_t h = fnv_hash(FNV_OFFSET, key.name.hash());
    h = fnv_hash(h, std::hash<std::string>{}(key.prog_pt));
    return static_cast<std::size_t>(h);
}

Engine::NamespaceScope::NamespaceScope(Engine& engine, const Name& name)
    : engine_(engine) {
    engine_.namespaces_.push_back(engine_.qualify(name));
}

Engine::NamespaceScope::~NamespaceScope() {
    engine_.namespaces_.pop_back();
}

Engine::InProgressGuard::InProgressGuard(Engine& engine, const Key& key)
    : engine_(engine), key_(key) {
    if (!engine_.in_progress_.insert(key_).second) {
        throw EngineError("memo entry " + key_.name.to_string() + " @ " + key_.prog_pt +
                          " re-entered while it is being computed");
    }
}

Engine::InProgressGuard::~InProgressGuard() {
    engine_.in_progress_.erase(key_);
}

} // namespace inctrie
