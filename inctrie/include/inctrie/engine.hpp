#ifndef INCTRIE_ENGINE_HPP
#define INCTRIE_ENGINE_HPP

#include <inctrie/art.hpp>
#include <inctrie/debug_log.hpp>
#include <inctrie/errors.hpp>
#include <inctrie/name.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace inctrie {

// Execution mode, selected once per engine
enum class EngineMode {
    NAIVE,        // Every memo call recomputes, every cell is fresh
    INCREMENTAL   // Memo results and cells are reused by name
};

#ifndef INCTRIE_DEFAULT_ENGINE_MODE
#define INCTRIE_DEFAULT_ENGINE_MODE ::inctrie::EngineMode::INCREMENTAL
#endif

struct EngineConfig {
    EngineMode mode = INCTRIE_DEFAULT_ENGINE_MODE;
};

struct EngineStats {
    std::size_t memo_hits = 0;
    std::size_t memo_misses = 0;
    std::size_t cells_created = 0;
    std::size_t cells_reused = 0;
};

/**
 * Minimal nominal-memoization engine.
 *
 * Owns a table keyed by (namespace-qualified name, program point). memo()
 * returns the stored result when the name, program point and argument all
 * match; cell() hands back the existing articulation when the name and value
 * match. There is no dependency graph: a stale entry is simply replaced when
 * the same name is reused with a different argument or value.
 *
 * Each Engine is independent, so naive and incremental runs can coexist in
 * one process. Not thread-safe.
 */
class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    EngineMode mode() const { return config_.mode; }
    bool is_incremental() const { return config_.mode == EngineMode::INCREMENTAL; }

    const EngineStats& stats() const { return stats_; }
    std::size_t table_size() const { return table_.size(); }

    // Drop every memo entry and cell, zero the counters
    void reset();

    // name prefixed by the current namespace, if any
    Name qualify(const Name& name) const;

    std::optional<Name> current_namespace() const;

    /**
     * Run fn with name appended to the current namespace.
     * memo() and cell() keys created inside are qualified by it.
     */
    template<typename Fn>
    auto ns(const Name& name, Fn&& fn) -> decltype(fn()) {
        NamespaceScope scope(*this, name);
        return fn();
    }

    /**
     * Named articulation holding value.
     * Incremental mode returns the previously registered cell when its value
     * equals value, so tries that embed it keep sharing it.
     */
    template<typename T>
    Art<T> cell(const Name& name, T value) {
        Name qualified = qualify(name);
        if (!is_incremental()) {
            ++stats_.cells_created;
            return Art<T>::named(std::move(qualified), std::move(value));
        }

        Key key{qualified, "cell"};
        auto it = table_.find(key);
        if (it != table_.end()) {
            if (auto* entry = dynamic_cast<CellEntry<T>*>(it->second.get())) {
                if (entry->art.force() == value) {
                    ++stats_.cells_reused;
                    DEBUG_LOG("cell reuse %s", qualified.to_string().c_str());
                    return entry->art;
                }
            }
        }

        Art<T> art = Art<T>::named(std::move(qualified), std::move(value));
        table_[key] = std::make_unique<CellEntry<T>>(art);
        ++stats_.cells_created;
        return art;
    }

    /**
     * Nominal memoization: result of fn() for (name, prog_pt), reused while
     * eq(stored_arg, arg) holds. prog_pt must identify the computation fn
     * performs; two different computations under one (name, prog_pt) would
     * read each other's results.
     * @throws EngineError if the same key is re-entered while computing
     */
    template<typename Res, typename Arg, typename Eq, typename Fn>
    Res memo(const Name& name, const std::string& prog_pt, const Arg& arg, Eq&& eq, Fn&& fn) {
        if (!is_incremental()) {
            ++stats_.memo_misses;
            return fn();
        }

        Key key{qualify(name), prog_pt};
        auto it = table_.find(key);
        if (it != table_.end()) {
            if (auto* entry = dynamic_cast<MemoEntry<Arg, Res>*>(it->second.get())) {
                if (eq(entry->arg, arg)) {
                    ++stats_.memo_hits;
                    DEBUG_LOG("memo hit %s @ %s", key.name.to_string().c_str(), prog_pt.c_str());
                    return entry->result;
                }
            }
        }

        InProgressGuard guard(*this, key);
        Res result = fn();
        ++stats_.memo_misses;
        DEBUG_LOG("memo miss %s @ %s", key.name.to_string().c_str(), prog_pt.c_str());
        table_[key] = std::make_unique<MemoEntry<Arg, Res>>(arg, result);
        return result;
    }

private:
    struct Key {
        Name name;
        std::string prog_pt;

        bool operator==(const Key& other) const {
            return prog_pt == other.prog_pt && name == other.name;
        }
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const;
    };

    struct EntryBase {
        virtual ~EntryBase() = default;
    };

    template<typename T>
    struct CellEntry : EntryBase {
        Art<T> art;
        explicit CellEntry(Art<T> a) : art(std::move(a)) {}
    };

    template<typename Arg, typename Res>
    struct MemoEntry : EntryBase {
        Arg arg;
        Res result;
        MemoEntry(const Arg& a, const Res& r) : arg(a), result(r) {}
    };

    class NamespaceScope {
    public:
        NamespaceScope(Engine& engine, const Name& name);
        ~NamespaceScope();
    private:
        Engine& engine_;
    };

    class InProgressGuard {
    public:
        InProgressGuard(Engine& engine, const Key& key);
        ~InProgressGuard();
    private:
        Engine& engine_;
        Key key_;
    };

    EngineConfig config_;
    EngineStats stats_;
    std::unordered_map<Key, std::unique_ptr<EntryBase>, KeyHash> table_;
    std::unordered_set<Key, KeyHash> in_progress_;
    std::vector<Name> namespaces_;  // Fully qualified, innermost last
};

} // namespace inctrie

#endif // INCTRIE_ENGINE_HPP
